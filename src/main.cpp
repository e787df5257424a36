// Main entry: evaluate decent mobility for demonstration scenarios and select
// trips for a persona from a small catalog.
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include <cxxopts.hpp>

#include "cli/cli.hpp"
#include "core/error.hpp"
#include "core/log.hpp"
#include "eval/decent.hpp"
#include "model/agent.hpp"
#include "model/persona.hpp"
#include "model/travel_plan.hpp"
#include "selection/travel_persona.hpp"

namespace {

using model::LocationRole;
using model::TripPurpose;

model::Agent commuter(double x) {
    const model::Location home = model::grid(x, 0.0);
    const model::Location work = model::grid(x + 1.0, 0.0);
    model::Agent a;
    a.location = {{LocationRole::home, home}, {LocationRole::work, work}};
    a.needs = {model::make_need(TripPurpose::commute, LocationRole::home, LocationRole::work, 5),
               model::make_need(TripPurpose::commute, LocationRole::work, LocationRole::home, 5)};
    a.plan = {model::Alternative(home, work, "bus"), model::Alternative(work, home, "bus")};
    return a;
}

void run_agent_scenario(const cli::Options& opt) {
    auto log = core::log::get();
    model::Agent a = commuter(0.0);
    const auto plan = a.plan;
    a.plan.clear();
    log->info("agent without alternatives: decent={}", eval::is_decent(a));
    a.plan = plan;
    log->info("agent with bus alternatives: decent={} total_distance={}", eval::is_decent(a), eval::total_distance(a));

    model::Model population;
    population.agents.reserve(opt.agents);
    for (std::size_t i = 0; i < opt.agents; ++i) population.agents.push_back(commuter(static_cast<double>(i)));
    eval::PopulationOptions popt;
    popt.parallel = true;
    popt.threads = opt.threads;
    log->info("population of {} agents: universal decent mobility={}", population.agents.size(),
              eval::is_decent_population(population, popt));
}

void run_person_scenario() {
    auto log = core::log::get();
    model::Person person{model::Gender::flint, {}};
    model::adopt_trip_needs(person, model::default_personas());

    using model::Purpose;
    const model::TravelPlan plans[] = {
        model::make_travel_plan({{Purpose::work, {4, 1.0, 0.1}}, {Purpose::leisure, {1, 2.0, 0.2}}}),
        model::make_travel_plan({{Purpose::work, {3, 1.0, 0.1}}, {Purpose::leisure, {10, 2.0, 0.2}}}),
    };
    for (const model::TravelPlan& tp : plans) {
        log->info("travel plan with {} trips in {} days: decent={} distance={} km ({:.0f} km / year)",
                  tp.trips.size(), tp.period_covered, eval::has_decent_mobility(person, tp),
                  model::travel_distance(tp), model::travel_distance(tp, model::Base::year));
    }
}

void run_persona_scenario(const cli::Options& opt) {
    auto log = core::log::get();
    const selection::Demand demand{{model::place("work"), 1}, {model::place("home"), 4},
                                   {model::place("grocery_store"), 1}, {model::place("leisure"), 2}};
    std::vector<model::Alternative> catalog;
    const struct { const char* mode; double energy; double time; } modes[] = {
        {"car", 1.0, 10.0}, {"bicycle", 0.0, 18.0}, {"bus", 0.2, 12.0}};
    for (const auto& entry : demand) {
        for (const auto& m : modes) {
            catalog.emplace_back(model::place("origin"), entry.first, m.mode,
                                 model::Alternative::Attributes{0.0, 1.5, m.energy, m.time});
        }
    }

    selection::TravelPersona persona("John", opt.typical_time >= 0.0 ? opt.typical_time : 30.5, demand);
    selection::SelectOptions sopt;
    sopt.method = opt.method;
    sopt.seed = opt.seed;
    sopt.tolerance = opt.tolerance;
    sopt.bound = opt.bound;
    sopt.max_repeats = opt.max_repeats;
    sopt.unavailable_modes = std::set<std::string>(opt.unavailable_modes.begin(), opt.unavailable_modes.end());
    sopt.parallel = true;
    sopt.threads = opt.threads;
    persona.compute_trips(catalog, sopt);

    for (const auto& [dest, alts] : persona.trips()) {
        for (const model::Alternative& a : alts) {
            log->info("persona '{}' -> {}: {}", persona.name(), model::to_string(dest), model::to_string(a));
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        // Parse CLI
        bool want_help = false; std::string help_text;
        cli::Options opt = cli::parse_args(argc, argv, want_help, help_text);
        if (want_help) { std::cout << help_text; return 0; }

        core::log::init(core::log::parse_level(opt.log_level));

        run_agent_scenario(opt);
        run_person_scenario();
        run_persona_scenario(opt);
    } catch (const core::Error& e) {
        core::log::get()->error("{}", e.what());
        return 1;
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }
    return 0;
}
