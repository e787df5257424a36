// travel_plan.cpp
#include "model/travel_plan.hpp"

#include <algorithm>
#include <numeric>
#include <spdlog/fmt/fmt.h>

#include "core/error.hpp"

namespace model {

double period_days(const TravelPlan& plan) {
    DM_ENSURE(plan.period_covered > 0, core::ErrorKind::InvalidArgument,
              fmt::format("travel plan period must be positive, got {}", plan.period_covered));
    return static_cast<double>(plan.period_covered);
}

double travel_distance(const TravelPlan& plan, Base base) {
    const double d = std::accumulate(plan.trips.begin(), plan.trips.end(), 0.0,
                                     [](double acc, const Trip& t) { return acc + t.distance; });
    switch (base) {
        case Base::total: return d;
        case Base::day:   return d / period_days(plan);
        case Base::year:  return d / (period_days(plan) / core::kDaysPerYear);
    }
    return d;
}

double travel_time(const TravelPlan& plan) noexcept {
    return std::accumulate(plan.trips.begin(), plan.trips.end(), 0.0,
                           [](double acc, const Trip& t) { return acc + t.time; });
}

core::count_t trip_count(const TravelPlan& plan, Purpose purpose) noexcept {
    return static_cast<core::count_t>(std::count_if(plan.trips.begin(), plan.trips.end(),
        [purpose](const Trip& t) { return t.destination.needs_served == purpose; }));
}

TravelPlan make_travel_plan(const std::map<Purpose, TripAggregate>& data, int period_covered) {
    DM_ENSURE(period_covered > 0, core::ErrorKind::InvalidArgument,
              fmt::format("travel plan period must be positive, got {}", period_covered));
    TravelPlan plan;
    plan.period_covered = period_covered;
    for (const auto& [purpose, agg] : data) {
        DM_ENSURE(agg.count >= 0 && agg.distance >= 0.0 && agg.time >= 0.0, core::ErrorKind::InvalidArgument,
                  fmt::format("invalid aggregate for {}: count={} distance={} time={}",
                              to_string(purpose), agg.count, agg.distance, agg.time));
        const Trip trip{agg.distance, agg.time, Poi{purpose}};
        plan.trips.insert(plan.trips.end(), static_cast<std::size_t>(agg.count), trip);
    }
    return plan;
}

} // namespace model
