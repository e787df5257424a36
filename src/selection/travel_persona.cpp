// travel_persona.cpp
#include "selection/travel_persona.hpp"

#include <utility>
#include <spdlog/fmt/fmt.h>

#include "core/error.hpp"
#include "core/log.hpp"

namespace selection {

TravelPersona::TravelPersona(std::string name, double typical_travel_time, Demand demand)
    : name_(std::move(name)), typical_travel_time_(typical_travel_time), demand_(std::move(demand))
{
    DM_ENSURE(typical_travel_time_ >= 0.0, core::ErrorKind::InvalidArgument,
              fmt::format("persona '{}' has negative typical travel time {}", name_, typical_travel_time_));
    for (const auto& [dest, count] : demand_) {
        DM_ENSURE(count >= 0, core::ErrorKind::InvalidArgument,
                  fmt::format("persona '{}' has negative demand {} for {}", name_, count, model::to_string(dest)));
        trips_.emplace(dest, std::vector<model::Alternative>{});
    }
}

void TravelPersona::compute_trips(const std::vector<model::Alternative>& catalog, SelectOptions opt) {
    opt.typical_time = typical_travel_time_;
    Selection chosen = select_trips(demand_, catalog, opt);
    for (auto& [dest, alts] : chosen) trips_[dest] = std::move(alts);
    core::log::get()->debug("persona '{}': trips computed for {} destinations", name_, chosen.size());
}

void TravelPersona::compute_trips(const std::vector<model::Alternative>& catalog,
                                  std::string_view method,
                                  const std::set<std::string>& unavailable_modes,
                                  SelectOptions opt) {
    opt.method = parse_method(method);
    opt.unavailable_modes = unavailable_modes;
    compute_trips(catalog, std::move(opt));
}

} // namespace selection
