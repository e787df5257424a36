// select.hpp: choosing concrete alternatives to fill per-destination demand
#pragma once
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "core/config.hpp"
#include "model/alternative.hpp"
#include "model/location.hpp"

namespace selection {

enum class Method {
    uniform_random,                ///< draw with replacement, uniform over candidates
    min_energy_within_time_budget, ///< exact minimum total energy inside the time window
};

/**
 * @brief Parse a method name.
 * @details Accepts "uniform-random" / "random" and
 *          "min-energy-within-time-budget" / "min_energy_typ_time".
 * @throws core::Error UnsupportedMethod naming the string.
 */
Method parse_method(std::string_view name);
std::string_view to_string(Method m) noexcept;

/// Shape of the window on a destination's summed time.
enum class TimeBound {
    band,  ///< [typical_time - tolerance, typical_time + tolerance]
    upper, ///< (-inf, typical_time + tolerance]
};

struct TimeWindow {
    double low;
    double high;
};

struct SelectOptions {
    Method method{Method::uniform_random};
    std::set<std::string> unavailable_modes;
    /// Master seed; destination j draws from its own stream derived from it.
    std::uint64_t seed{0x5EEDULL};
    /// Anchor of the time window [min].
    double typical_time{0.0};
    /// Allowed deviation from typical_time [min].
    double tolerance{core::kDefaultTimeTolerance};
    TimeBound bound{TimeBound::band};
    /// Cap on repeats of one alternative within a destination (0 => no cap).
    core::count_t max_repeats{0};
    /// Solver nodes per destination (0 => unbounded); hitting it is InfeasibleSelection.
    std::uint64_t node_limit{core::kDefaultNodeLimit};
    /// Select destinations concurrently with TBB.
    bool parallel{false};
    int  threads{0}; // 0 -> tbb default
};

using Demand    = std::map<model::Location, core::count_t>;
using Selection = std::map<model::Location, std::vector<model::Alternative>>;

TimeWindow time_window(const SelectOptions& opt) noexcept;

/// Catalog entries ending at destination whose mode is not excluded, in catalog order.
std::vector<model::Alternative> candidates_for(const model::Location& destination,
                                               const std::vector<model::Alternative>& catalog,
                                               const std::set<std::string>& unavailable_modes);

/**
 * @brief Fill one destination's demand.
 * @param seed Seed of this destination's random stream (uniform_random only).
 * @throws core::Error NoFeasibleAlternative, InfeasibleSelection.
 */
std::vector<model::Alternative> select_destination(const model::Location& destination,
                                                   core::count_t count,
                                                   const std::vector<model::Alternative>& catalog,
                                                   const SelectOptions& opt,
                                                   std::uint64_t seed);

/**
 * @brief Choose exactly demand[d] alternatives for every destination d.
 * @details Destinations with zero demand map to an empty list. The call is
 *          atomic: if any destination fails nothing is returned.
 *          Results are identical for sequential and parallel runs.
 * @throws core::Error InvalidArgument, NoFeasibleAlternative, InfeasibleSelection.
 */
Selection select_trips(const Demand& demand,
                       const std::vector<model::Alternative>& catalog,
                       const SelectOptions& opt);

/**
 * @brief As above with the method given by name.
 * @throws core::Error UnsupportedMethod before looking at demand or catalog.
 */
Selection select_trips(const Demand& demand,
                       const std::vector<model::Alternative>& catalog,
                       std::string_view method,
                       const std::set<std::string>& unavailable_modes,
                       SelectOptions opt = {});

} // namespace selection
