// decent.cpp
#include "eval/decent.hpp"

#include <algorithm>
#include <atomic>
#include <optional>
#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/parallel_reduce.h>

#include "core/log.hpp"

namespace eval {

bool is_decent(const std::vector<matching::Pairing>& pairing) noexcept {
    return std::all_of(pairing.begin(), pairing.end(), [](const matching::Pairing& p) {
        // No alternative for this need -> it cannot be met
        return !p.need.has_value() || p.need->count == 0 || p.alternative.has_value();
    });
}

bool is_decent(const model::Agent& agent, Strictness strictness) {
    switch (strictness) {
        case Strictness::count_only:
            std::for_each(agent.needs.begin(), agent.needs.end(),
                          [](const model::Need& n) { model::validate(n); });
            return agent.plan.size() >= agent.needs.size();
        case Strictness::matched:
            break;
    }
    return is_decent(matching::match(agent));
}

bool is_decent_population(const std::vector<model::Agent>& agents, const PopulationOptions& opt) {
    if (!opt.parallel || agents.size() < 2) {
        return std::all_of(agents.begin(), agents.end(),
                           [&](const model::Agent& a) { return is_decent(a, opt.strictness); });
    }

    std::optional<tbb::global_control> cap;
    if (opt.threads > 0) cap.emplace(tbb::global_control::max_allowed_parallelism,
                                     static_cast<std::size_t>(opt.threads));

    std::atomic<bool> failed{false};
    const bool all = tbb::parallel_reduce(
        tbb::blocked_range<std::size_t>(0, agents.size()),
        true,
        [&](const tbb::blocked_range<std::size_t>& r, bool init) {
            for (std::size_t i = r.begin(); i != r.end() && init; ++i) {
                if (failed.load(std::memory_order_relaxed)) return false;
                init = is_decent(agents[i], opt.strictness);
            }
            if (!init) failed.store(true, std::memory_order_relaxed);
            return init;
        },
        [](bool a, bool b) { return a && b; });

    core::log::get()->debug("population of {} agents: decent={}", agents.size(), all);
    return all;
}

bool is_decent_population(const model::Model& model, const PopulationOptions& opt) {
    return is_decent_population(model.agents, opt);
}

double total_distance(const model::Agent& agent) {
    double result = 0.0;
    for (const matching::Pairing& p : matching::match(agent)) {
        if (!p.matched()) continue;
        result += static_cast<double>(p.need->count) * p.alternative->distance();
    }
    return result;
}

bool has_decent_mobility(const model::Person& person, const model::TravelPlan& plan,
                         double time_budget) {
    const double days = model::period_days(plan);
    const bool needs_met = std::all_of(model::kAllPurposes.begin(), model::kAllPurposes.end(),
        [&](model::Purpose p) {
            auto it = person.trip_needs.find(p);
            const core::count_t need = (it == person.trip_needs.end()) ? 0 : it->second;
            return model::trip_count(plan, p) >= need;
        });
    // Travel time [hours / day] = total travel time [hours] / period covered [days]
    const double daily_time = model::travel_time(plan) / days;
    return needs_met && daily_time <= time_budget;
}

} // namespace eval

namespace model {

bool Model::universal_decent_mobility() const {
    return eval::is_decent_population(agents);
}

} // namespace model
