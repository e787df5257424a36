// decent.hpp: decent mobility predicates and plan measures
#pragma once
#include <vector>

#include "core/config.hpp"
#include "matching/matcher.hpp"
#include "model/agent.hpp"
#include "model/persona.hpp"
#include "model/travel_plan.hpp"

namespace eval {

/// How strictly an agent's plan is checked against its needs.
enum class Strictness {
    matched,    ///< every need with a positive count has an alternative on the same (origin, destination)
    count_only, ///< plan holds at least as many alternatives as there are needs
};

/**
 * @brief True if the agent has decent mobility under the given strictness.
 * @throws core::Error UnresolvedLocationRole (matched strictness only).
 */
bool is_decent(const model::Agent& agent, Strictness strictness = Strictness::matched);

/// Same predicate applied to an already computed pairing.
bool is_decent(const std::vector<matching::Pairing>& pairing) noexcept;

struct PopulationOptions {
    Strictness strictness{Strictness::matched};
    bool       parallel{false};
    int        threads{0}; // 0 -> tbb default
};

/**
 * @brief Logical AND of is_decent over all agents.
 * @details Sequential evaluation stops at the first failing agent; parallel
 *          evaluation stops handing out work once any agent fails. Errors
 *          raised for an agent propagate to the caller.
 */
bool is_decent_population(const std::vector<model::Agent>& agents, const PopulationOptions& opt = {});
bool is_decent_population(const model::Model& model, const PopulationOptions& opt = {});

/**
 * @brief Sum of need.count * alternative.distance over fully matched pairs.
 */
double total_distance(const model::Agent& agent);

/**
 * @brief Time-budgeted criterion for a person and a concrete travel plan.
 * @details Holds iff for every purpose the plan has at least as many trips as
 *          the person needs, and travel_time / period_covered <= time_budget.
 * @param time_budget [h / day].
 * @throws core::Error InvalidArgument when plan.period_covered is not positive.
 */
bool has_decent_mobility(const model::Person& person, const model::TravelPlan& plan,
                         double time_budget = core::kTimeBudgetHoursPerDay);

} // namespace eval
