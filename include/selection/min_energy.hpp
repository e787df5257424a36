// min_energy.hpp: exact integer program: minimum energy under a time window
#pragma once
#include <cstdint>
#include <limits>
#include <optional>
#include <vector>

#include "core/config.hpp"

namespace selection {

/**
 * @brief Integer program for one destination.
 * @details minimize  sum_i energy[i] * x[i]
 *          subject to sum_i x[i] == count
 *                     low <= sum_i time[i] * x[i] <= high
 *                     0 <= x[i] <= max_repeats   (x integer)
 */
struct MinEnergyProblem {
    std::vector<double> energy;
    std::vector<double> time;
    core::count_t count{0};
    double low{-std::numeric_limits<double>::infinity()};
    double high{std::numeric_limits<double>::infinity()};
    /// Per-candidate cap; 0 means count (free repetition), 1 gives 0/1 indicators.
    core::count_t max_repeats{0};
    /// Search nodes allowed before giving up (0 => unbounded).
    std::uint64_t node_limit{core::kDefaultNodeLimit};
};

struct MinEnergySolution {
    /// Selection count per candidate, in problem order; empty when infeasible.
    std::vector<core::count_t> counts;
    double energy{0.0};
    double time{0.0};
    std::uint64_t nodes{0};
    /// node_limit was hit; counts (if any) is the best found, not proven optimal.
    bool exhausted{false};

    bool feasible() const noexcept { return !counts.empty(); }
};

/**
 * @brief Solve by depth-first branch-and-bound.
 * @details Candidates are visited by ascending energy (catalog order among
 *          equal energies), larger multiplicities first, so the first
 *          incumbent is the greedy choice. A branch is cut when its energy
 *          lower bound cannot strictly improve the incumbent or when the
 *          remaining picks cannot bring the summed time into [low, high].
 *          Among equal-energy optima the first one reached is returned.
 * @note Callers handle a zero count themselves.
 */
MinEnergySolution solve_min_energy(const MinEnergyProblem& problem);

} // namespace selection
