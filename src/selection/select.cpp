// select.cpp
#include "selection/select.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <utility>
#include <spdlog/fmt/fmt.h>
#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/parallel_for.h>

#include "core/error.hpp"
#include "core/log.hpp"
#include "core/rng.hpp"
#include "selection/min_energy.hpp"

namespace selection {

Method parse_method(std::string_view name) {
    if (name == "uniform-random" || name == "random") return Method::uniform_random;
    if (name == "min-energy-within-time-budget" || name == "min_energy_typ_time")
        return Method::min_energy_within_time_budget;
    core::fail(core::ErrorKind::UnsupportedMethod,
               fmt::format("'{}' is not a valid method; choose 'uniform-random' or 'min-energy-within-time-budget'",
                           name));
}

std::string_view to_string(Method m) noexcept {
    switch (m) {
        case Method::uniform_random:                return "uniform-random";
        case Method::min_energy_within_time_budget: return "min-energy-within-time-budget";
    }
    return "unknown";
}

TimeWindow time_window(const SelectOptions& opt) noexcept {
    const double high = opt.typical_time + opt.tolerance;
    if (opt.bound == TimeBound::upper) return {-std::numeric_limits<double>::infinity(), high};
    return {opt.typical_time - opt.tolerance, high};
}

std::vector<model::Alternative> candidates_for(const model::Location& destination,
                                               const std::vector<model::Alternative>& catalog,
                                               const std::set<std::string>& unavailable_modes) {
    std::vector<model::Alternative> out;
    for (const model::Alternative& a : catalog) {
        if (a.destination() == destination && !unavailable_modes.contains(a.mode())) out.push_back(a);
    }
    return out;
}

static std::vector<model::Alternative> pick_uniform(const std::vector<model::Alternative>& candidates,
                                                    core::count_t count, std::uint64_t seed) {
    core::SplitMix64 rng(seed);
    std::vector<model::Alternative> out;
    out.reserve(static_cast<std::size_t>(count));
    for (core::count_t i = 0; i < count; ++i) {
        out.push_back(candidates[core::uniform_bounded(rng, candidates.size())]);
    }
    return out;
}

static std::vector<model::Alternative> pick_min_energy(const model::Location& destination,
                                                       const std::vector<model::Alternative>& candidates,
                                                       core::count_t count, const SelectOptions& opt) {
    const TimeWindow w = time_window(opt);
    MinEnergyProblem p;
    p.count = count;
    p.low = w.low;
    p.high = w.high;
    p.max_repeats = opt.max_repeats;
    p.node_limit = opt.node_limit;
    p.energy.reserve(candidates.size());
    p.time.reserve(candidates.size());
    for (const model::Alternative& a : candidates) {
        p.energy.push_back(a.energy());
        p.time.push_back(a.time());
    }

    const MinEnergySolution s = solve_min_energy(p);
    // An incumbent cut off by the node limit is not proven optimal; report it like infeasibility.
    if (!s.feasible() || s.exhausted) {
        const std::string msg =
            s.exhausted
                ? fmt::format("search node limit {} reached before a minimum-energy selection of {} trips to {} "
                              "with total time within [{}, {}] was proven",
                              opt.node_limit, count, model::to_string(destination), w.low, w.high)
                : fmt::format("no selection of {} trips to {} has total time within [{}, {}]",
                              count, model::to_string(destination), w.low, w.high);
        core::log::get()->warn("{}", msg);
        core::fail(core::ErrorKind::InfeasibleSelection, msg);
    }

    DM_ASSERT_H(s.counts.size() == candidates.size(), "min-energy solution does not cover every candidate");
    std::vector<model::Alternative> out;
    out.reserve(static_cast<std::size_t>(count));
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        out.insert(out.end(), static_cast<std::size_t>(s.counts[i]), candidates[i]);
    }
    return out;
}

std::vector<model::Alternative> select_destination(const model::Location& destination,
                                                   core::count_t count,
                                                   const std::vector<model::Alternative>& catalog,
                                                   const SelectOptions& opt,
                                                   std::uint64_t seed) {
    DM_ENSURE(count >= 0, core::ErrorKind::InvalidArgument,
              fmt::format("negative demand {} for destination {}", count, model::to_string(destination)));
    if (count == 0) return {};

    const std::vector<model::Alternative> candidates = candidates_for(destination, catalog, opt.unavailable_modes);
    if (candidates.empty()) {
        const std::string msg = fmt::format("no alternative found for destination: {}", model::to_string(destination));
        core::log::get()->warn("{}", msg);
        core::fail(core::ErrorKind::NoFeasibleAlternative, msg);
    }

    switch (opt.method) {
        case Method::uniform_random:
            return pick_uniform(candidates, count, seed);
        case Method::min_energy_within_time_budget:
            return pick_min_energy(destination, candidates, count, opt);
    }
    core::fail(core::ErrorKind::UnsupportedMethod,
               fmt::format("method id {}", static_cast<int>(opt.method)));
}

Selection select_trips(const Demand& demand,
                       const std::vector<model::Alternative>& catalog,
                       const SelectOptions& opt) {
    DM_ENSURE(std::isfinite(opt.tolerance) && opt.tolerance >= 0.0, core::ErrorKind::InvalidArgument,
              fmt::format("time tolerance must be non-negative, got {}", opt.tolerance));
    DM_ENSURE(opt.max_repeats >= 0, core::ErrorKind::InvalidArgument,
              fmt::format("max_repeats must be non-negative, got {}", opt.max_repeats));

    std::vector<std::pair<model::Location, core::count_t>> jobs(demand.begin(), demand.end());
    const std::vector<std::uint64_t> seeds = core::seed_jobs(jobs.size(), opt.seed);
    std::vector<std::vector<model::Alternative>> chosen(jobs.size());

    auto run = [&](std::size_t j) {
        chosen[j] = select_destination(jobs[j].first, jobs[j].second, catalog, opt, seeds[j]);
        DM_ASSERT_H(chosen[j].size() == static_cast<std::size_t>(jobs[j].second),
                    "selection size differs from demand");
    };

    if (opt.parallel && jobs.size() > 1) {
        std::optional<tbb::global_control> cap;
        if (opt.threads > 0) cap.emplace(tbb::global_control::max_allowed_parallelism,
                                         static_cast<std::size_t>(opt.threads));
        tbb::parallel_for(tbb::blocked_range<std::size_t>(0, jobs.size()),
                          [&](const tbb::blocked_range<std::size_t>& r) {
                              for (std::size_t j = r.begin(); j != r.end(); ++j) run(j);
                          });
    } else {
        for (std::size_t j = 0; j < jobs.size(); ++j) run(j);
    }

    Selection out;
    for (std::size_t j = 0; j < jobs.size(); ++j) out.emplace(std::move(jobs[j].first), std::move(chosen[j]));
    core::log::get()->debug("selected trips for {} destinations with {}", out.size(), to_string(opt.method));
    return out;
}

Selection select_trips(const Demand& demand,
                       const std::vector<model::Alternative>& catalog,
                       std::string_view method,
                       const std::set<std::string>& unavailable_modes,
                       SelectOptions opt) {
    opt.method = parse_method(method);
    opt.unavailable_modes = unavailable_modes;
    return select_trips(demand, catalog, opt);
}

} // namespace selection
