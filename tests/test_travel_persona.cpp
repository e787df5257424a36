// test_travel_persona.cpp: persona-driven trip computation
#include <doctest/doctest.h>

#include <string>
#include <vector>

#include "selection/travel_persona.hpp"
#include "testutil.hpp"

namespace {

struct PersonaFixture {
    selection::Demand demand{{model::place("work"), 1}, {model::place("home"), 4},
                             {model::place("grocery_store"), 1}, {model::place("leisure"), 2}};
    selection::TravelPersona persona{"John", 30.5, demand};
    std::vector<model::Alternative> alternatives;

    PersonaFixture() {
        const struct { const char* mode; double energy; } modes[] = {{"car", 1.0}, {"bicycle", 0.0}, {"bus", 0.2}};
        for (const auto& entry : demand) {
            for (const auto& m : modes) {
                alternatives.push_back(testutil::alt(model::place("origin"), entry.first, m.mode, m.energy, 10.0, 1.5));
            }
        }
    }

    void check_trips() const {
        for (const auto& [dest, count] : demand) {
            CAPTURE(model::to_string(dest));
            const auto& chosen = persona.trips().at(dest);
            CHECK(static_cast<int>(chosen.size()) == count);
            for (const auto& a : chosen) CHECK(a.destination() == dest);
        }
    }
};

} // namespace

TEST_CASE_FIXTURE(PersonaFixture, "Persona exposes name, typical travel time and demand") {
    CHECK(persona.name() == "John");
    CHECK(persona.typical_travel_time() == doctest::Approx(30.5));
    CHECK(persona.demand() == demand);
    for (const auto& [dest, trips] : persona.trips()) CHECK(trips.empty());
}

TEST_CASE_FIXTURE(PersonaFixture, "Random trips cover the demand") {
    persona.compute_trips(alternatives, "random");
    check_trips();
}

TEST_CASE_FIXTURE(PersonaFixture, "Random trips avoid an unavailable mode") {
    persona.compute_trips(alternatives, "random", {"car"});
    check_trips();
    for (const auto& [dest, trips] : persona.trips())
        for (const auto& a : trips) CHECK(a.mode() != "car");
}

TEST_CASE_FIXTURE(PersonaFixture, "All modes unavailable fails and keeps earlier trips") {
    persona.compute_trips(alternatives, "random");
    const auto before = persona.trips();
    CHECK(testutil::error_kind([&] { persona.compute_trips(alternatives, "random", {"car", "bicycle", "bus"}); })
          == core::ErrorKind::NoFeasibleAlternative);
    CHECK(persona.trips() == before);
}

TEST_CASE_FIXTURE(PersonaFixture, "Min energy within the typical time uses the zero-energy mode") {
    selection::SelectOptions opt;
    opt.bound = selection::TimeBound::upper;
    persona.compute_trips(alternatives, "min_energy_typ_time", {}, opt);
    check_trips();
    for (const auto& [dest, trips] : persona.trips())
        for (const auto& a : trips) CHECK(a.mode() == "bicycle");
}

TEST_CASE_FIXTURE(PersonaFixture, "Min energy in a band around the typical time can be infeasible") {
    // band [20.5, 40.5] cannot hold a single 10-minute trip to work
    CHECK(testutil::error_kind([&] { persona.compute_trips(alternatives, "min_energy_typ_time"); })
          == core::ErrorKind::InfeasibleSelection);
}

TEST_CASE_FIXTURE(PersonaFixture, "Wrong method name is rejected") {
    CHECK(testutil::error_kind([&] { persona.compute_trips(alternatives, "blabla"); })
          == core::ErrorKind::UnsupportedMethod);
}

TEST_CASE("Persona rejects negative demand and travel time") {
    CHECK(testutil::error_kind([] { selection::TravelPersona("x", -1.0, {}); }) == core::ErrorKind::InvalidArgument);
    CHECK(testutil::error_kind([] { selection::TravelPersona("x", 1.0, {{model::place("home"), -2}}); })
          == core::ErrorKind::InvalidArgument);
}
