// cli.cpp: Command-line parsing implementation using cxxopts

#include "cli/cli.hpp"

#include <cxxopts.hpp>
#include <charconv>
#include <cstdlib>
#include <string>
#include <string_view>

#include "core/error.hpp"

namespace cli {

static inline bool parse_u64(std::string_view s, std::uint64_t& out) {
    const char* b = s.data();
    const char* e = b + s.size();
    auto res = std::from_chars(b, e, out);
    return res.ec == std::errc{} && res.ptr == e;
}

static selection::TimeBound parse_bound(std::string_view s) {
    if (s == "band")  return selection::TimeBound::band;
    if (s == "upper") return selection::TimeBound::upper;
    core::fail(core::ErrorKind::InvalidArgument,
               "invalid --bound '" + std::string(s) + "'; expected 'band' or 'upper'");
}

Options parse_args(int argc, char** argv, bool& want_help, std::string& help_text) {
    Options opt;
    want_help = false;

    std::string method_s;
    std::string bound_s;
    std::string seed_s;

    cxxopts::Options desc("dmob", "Decent mobility: evaluate plans and select trips");
    desc.add_options()
        ("h,help", "Show this help")
        ("m,method", "Selection method: uniform-random | min-energy-within-time-budget",
            cxxopts::value<std::string>(method_s)->default_value("min-energy-within-time-budget"))
        ("s,seed", "Master seed (default: SEED env or 123456789)", cxxopts::value<std::string>(seed_s))
        ("typical-time", "Typical travel time anchor [min] (default: persona's own)",
            cxxopts::value<double>(opt.typical_time)->default_value("-1"))
        ("tolerance", "Allowed deviation from the typical time [min]",
            cxxopts::value<double>(opt.tolerance)->default_value("10"))
        ("bound", "Time window shape: band | upper", cxxopts::value<std::string>(bound_s)->default_value("upper"))
        ("max-repeats", "Cap on repeats of one alternative per destination (0 = none)",
            cxxopts::value<core::count_t>(opt.max_repeats)->default_value("0"))
        ("u,unavailable", "Mode excluded from selection (repeatable)",
            cxxopts::value<std::vector<std::string>>(opt.unavailable_modes))
        ("a,agents", "Population size for the parallel evaluation",
            cxxopts::value<std::size_t>(opt.agents)->default_value("1000"))
        ("threads", "Number of threads (default: tbb max)", cxxopts::value<int>(opt.threads)->default_value("0"))
        ("log-level", "trace|debug|info|warn|error|critical|off",
            cxxopts::value<std::string>(opt.log_level)->default_value("info"))
    ;
    help_text = desc.help();
    auto result = desc.parse(argc, argv);
    if (result.count("help")) { want_help = true; return opt; }

    opt.method = selection::parse_method(method_s);
    opt.bound = parse_bound(bound_s);

    // Seed: --seed wins, then SEED env, then the compiled default
    if (!seed_s.empty()) {
        DM_ENSURE(parse_u64(seed_s, opt.seed), core::ErrorKind::InvalidArgument,
                  "invalid --seed '" + seed_s + "'; expected an unsigned integer");
    } else if (const char* es = std::getenv("SEED")) {
        std::uint64_t v = 0;
        if (parse_u64(es, v) && v != 0ULL) opt.seed = v;
    }

    DM_ENSURE(opt.tolerance >= 0.0, core::ErrorKind::InvalidArgument, "--tolerance must be non-negative");
    DM_ENSURE(opt.max_repeats >= 0, core::ErrorKind::InvalidArgument, "--max-repeats must be non-negative");
    return opt;
}

} // namespace cli
