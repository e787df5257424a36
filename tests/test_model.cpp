// test_model.cpp: entity construction invariants
#include <doctest/doctest.h>

#include <cmath>
#include <stdexcept>
#include <unordered_set>

#include "core/config.hpp"
#include "model/alternative.hpp"
#include "model/location.hpp"
#include "model/need.hpp"
#include "testutil.hpp"

TEST_CASE("Grid distance is Euclidean, symmetric and zero for coincident points") {
    const model::GridLocation a{0.0, 0.0};
    const model::GridLocation b{3.0, 4.0};
    CHECK(a.distance_to(b) == doctest::Approx(5.0));
    CHECK(b.distance_to(a) == doctest::Approx(a.distance_to(b)));
    CHECK(a.distance_to(a) == 0.0);
}

TEST_CASE("Alternative derives distance between grid locations and keeps it otherwise") {
    const auto g = testutil::alt(model::grid(0, 0), model::grid(1, 1), "walk", 0.0, 0.0, 99.0);
    CHECK(g.distance() == doctest::Approx(std::sqrt(2.0)));

    const auto p = testutil::alt(model::place("home"), model::place("work"), "bus", 0.2, 10.0, 1.5);
    CHECK(p.distance() == doctest::Approx(1.5));
    CHECK(p.energy() == doctest::Approx(0.2));
    CHECK(p.time() == doctest::Approx(10.0));
    CHECK(p.mode() == "bus");
}

TEST_CASE("Alternative rejects negative or non-finite attributes") {
    CHECK(testutil::error_kind([] { testutil::alt(model::place("a"), model::place("b"), "car", -1.0); })
          == core::ErrorKind::InvalidArgument);
    CHECK(testutil::error_kind([] { testutil::alt(model::place("a"), model::place("b"), "car", 0.0, NAN); })
          == core::ErrorKind::InvalidArgument);
    CHECK_FALSE(testutil::error_kind([] { testutil::alt(model::place("a"), model::place("b"), "car"); }).has_value());
}

TEST_CASE("Need rejects negative counts; zero is allowed") {
    using model::LocationRole;
    CHECK(testutil::error_kind([] {
        model::make_need(model::TripPurpose::other, LocationRole::home, LocationRole::work, -1);
    }) == core::ErrorKind::InvalidArgument);
    CHECK(model::make_need(model::TripPurpose::other, LocationRole::home, LocationRole::work, 0).count == 0);
}

TEST_CASE("Locations compare structurally and hash consistently") {
    CHECK(model::grid(1, 2) == model::grid(1, 2));
    CHECK(model::grid(1, 2) != model::grid(2, 1));
    CHECK(model::place("work") == model::place("work"));
    CHECK(model::place("work") != model::grid(0, 0));

    std::unordered_set<model::Location, model::LocationHash> seen;
    seen.insert(model::grid(0.0, 0.0));
    seen.insert(model::grid(-0.0, 0.0));
    seen.insert(model::place("home"));
    seen.insert(model::place("home"));
    CHECK(seen.size() == 2);

    CHECK(model::to_string(model::place("grocery_store")) == "grocery_store");
}

TEST_CASE("Invariant checks throw only in hardened builds") {
#if DM_HARDENED
    CHECK_THROWS_AS([] { DM_ASSERT_H(1 + 1 == 3, "arithmetic"); }(), std::logic_error);
#else
    CHECK_NOTHROW([] { DM_ASSERT_H(1 + 1 == 3, "arithmetic"); }());
#endif
    CHECK_NOTHROW([] { DM_ASSERT_H(1 + 1 == 2, "arithmetic"); }());
}
