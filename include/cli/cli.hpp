// cli.hpp: Command-line parsing interface (cxxopts)
#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "selection/select.hpp"

namespace cli {

struct Options {
    // Selection method for the persona scenario
    selection::Method method = selection::Method::min_energy_within_time_budget;

    // Master seed (SEED env overrides the default when --seed is absent)
    std::uint64_t seed = 123456789ULL;

    // Typical travel time anchor and tolerance [min]; typical < 0 => persona's own
    double typical_time = -1.0;
    double tolerance = core::kDefaultTimeTolerance;
    selection::TimeBound bound = selection::TimeBound::upper;
    core::count_t max_repeats = 0;

    // Modes excluded from selection
    std::vector<std::string> unavailable_modes;

    // Size of the replicated population evaluated in parallel
    std::size_t agents = 1000;

    // Number of threads (0 => tbb default)
    int threads = 0;

    std::string log_level = "info";
};

// Parse CLI arguments with cxxopts.
// Sets want_help/help_text for --help; invalid values throw core::Error
// (UnsupportedMethod for --method, InvalidArgument otherwise).
Options parse_args(int argc, char** argv, bool& want_help, std::string& help_text);

} // namespace cli
