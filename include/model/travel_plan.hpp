// travel_plan.hpp: concrete, time-bounded plans and their summary measures
#pragma once
#include <map>
#include <vector>

#include "core/config.hpp"
#include "model/categories.hpp"

namespace model {

/// A point of interest and the purpose a visit to it serves.
struct Poi {
    Purpose needs_served{Purpose::work};
    friend bool operator==(const Poi&, const Poi&) = default;
};

/// A single trip of the travel-plan model.
struct Trip {
    double distance{0.0}; ///< [km]
    double time{0.0};     ///< [h]
    Poi    destination;
    friend bool operator==(const Trip&, const Trip&) = default;
};

struct TravelPlan {
    /// Days covered by the plan.
    int period_covered{core::kDefaultPeriodDays};
    std::vector<Trip> trips;
};

enum class Base { total, day, year };

/// plan.period_covered as a divisor [days]; InvalidArgument unless positive.
double period_days(const TravelPlan& plan);

/**
 * @brief Travel distance of plan [km / base].
 * @param base total: plain sum; day: divided by period_covered;
 *             year: divided by period_covered / 365.
 * @throws core::Error InvalidArgument for day or year bases of a plan whose
 *         period is not positive.
 */
double travel_distance(const TravelPlan& plan, Base base = Base::total);

/// Sum of trip durations [h].
double travel_time(const TravelPlan& plan) noexcept;

/// Number of trips in plan serving purpose.
core::count_t trip_count(const TravelPlan& plan, Purpose purpose) noexcept;

/// Aggregate description of identical trips: {count, distance [km], time [h]}.
struct TripAggregate {
    core::count_t count{0};
    double        distance{0.0};
    double        time{0.0};
};

/**
 * @brief Plan with count identical trips per purpose (aggregates read as averages).
 * @throws core::Error InvalidArgument for negative counts, distances or times.
 */
TravelPlan make_travel_plan(const std::map<Purpose, TripAggregate>& data,
                            int period_covered = core::kDefaultPeriodDays);

} // namespace model
