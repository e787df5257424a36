// travel_persona.hpp: persona with a typical travel time and per-destination demand
#pragma once
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "selection/select.hpp"

namespace selection {

/**
 * @brief Persona whose mobility behaviour is computed from a catalog.
 * @details trips() holds, per destination of the demand, the alternatives
 *          chosen by the last successful compute_trips call.
 */
class TravelPersona {
public:
    /**
     * @param typical_travel_time Anchor of the time window [min].
     * @param demand Number of trips wanted per destination.
     * @throws core::Error InvalidArgument for negative demand or travel time.
     */
    TravelPersona(std::string name, double typical_travel_time, Demand demand);

    const std::string& name() const noexcept { return name_; }
    double typical_travel_time() const noexcept { return typical_travel_time_; }
    const Demand& demand() const noexcept { return demand_; }
    const Selection& trips() const noexcept { return trips_; }

    /**
     * @brief Select trips fulfilling the demand and store them.
     * @details opt.typical_time is replaced by this persona's typical travel
     *          time. On failure the stored trips are left as they were.
     * @throws core::Error UnsupportedMethod, NoFeasibleAlternative, InfeasibleSelection.
     */
    void compute_trips(const std::vector<model::Alternative>& catalog, SelectOptions opt);

    void compute_trips(const std::vector<model::Alternative>& catalog,
                       std::string_view method,
                       const std::set<std::string>& unavailable_modes = {},
                       SelectOptions opt = {});

private:
    std::string name_;
    double      typical_travel_time_;
    Demand      demand_;
    Selection   trips_;
};

} // namespace selection
