// test_min_energy_bruteforce.cpp
// Branch-and-bound optimum checked against exhaustive enumeration of every
// count-sized multiset on small random catalogs.

#include <doctest/doctest.h>

#include <cstdint>
#include <functional>
#include <limits>
#include <random>
#include <vector>

#include "core/error.hpp"
#include "selection/min_energy.hpp"

namespace {

// Generate all compositions of m into `parts` non-negative parts, each <= cap.
inline void compositions(int m, std::size_t parts, int cap, const std::function<void(const std::vector<int>&)>& f) {
    std::vector<int> a(parts, 0);
    std::function<void(std::size_t, int)> rec = [&](std::size_t i, int rem) {
        if (i + 1 == parts) {
            if (rem <= cap) { a[i] = rem; f(a); }
            return;
        }
        for (int x = 0; x <= rem && x <= cap; ++x) { a[i] = x; rec(i + 1, rem - x); }
    };
    if (parts == 0) return;
    rec(0, m);
}

struct Brute {
    bool   feasible{false};
    double energy{std::numeric_limits<double>::infinity()};
};

Brute brute_force(const selection::MinEnergyProblem& p) {
    Brute b;
    const int cap = p.max_repeats > 0 ? p.max_repeats : p.count;
    compositions(p.count, p.energy.size(), cap, [&](const std::vector<int>& x) {
        double e = 0.0, t = 0.0;
        for (std::size_t i = 0; i < x.size(); ++i) { e += p.energy[i] * x[i]; t += p.time[i] * x[i]; }
        if (t < p.low || t > p.high) return;
        b.feasible = true;
        if (e < b.energy) b.energy = e;
    });
    return b;
}

void check_solution(const selection::MinEnergyProblem& p, const selection::MinEnergySolution& s) {
    REQUIRE(s.counts.size() == p.energy.size());
    int total = 0;
    double e = 0.0, t = 0.0;
    const int cap = p.max_repeats > 0 ? p.max_repeats : p.count;
    for (std::size_t i = 0; i < s.counts.size(); ++i) {
        CHECK(s.counts[i] >= 0);
        CHECK(s.counts[i] <= cap);
        total += s.counts[i];
        e += p.energy[i] * s.counts[i];
        t += p.time[i] * s.counts[i];
    }
    CHECK(total == p.count);
    CHECK(t >= p.low - 1e-9);
    CHECK(t <= p.high + 1e-9);
    CHECK(e == doctest::Approx(s.energy));
    CHECK(t == doctest::Approx(s.time));
}

} // namespace

TEST_CASE("Branch-and-bound matches exhaustive enumeration on small catalogs") {
    std::mt19937_64 rng(0xD3C3A7ULL);
    std::uniform_int_distribution<int> n_dist(1, 5);
    std::uniform_int_distribution<int> count_dist(1, 6);
    std::uniform_int_distribution<int> time_dist(5, 40);      // integral minutes keep window edges exact
    std::uniform_real_distribution<double> energy_dist(0.0, 5.0);
    std::uniform_int_distribution<int> tol_dist(0, 25);
    std::uniform_int_distribution<int> repeats_dist(0, 2);

    int feasible = 0, infeasible = 0;
    for (int trial = 0; trial < 600; ++trial) {
        selection::MinEnergyProblem p;
        const int n = n_dist(rng);
        for (int i = 0; i < n; ++i) {
            p.energy.push_back(energy_dist(rng));
            p.time.push_back(static_cast<double>(time_dist(rng)));
        }
        p.count = count_dist(rng);
        p.max_repeats = repeats_dist(rng);
        const double typical = static_cast<double>(time_dist(rng) * p.count);
        const double tol = static_cast<double>(tol_dist(rng));
        p.low = typical - tol;
        p.high = typical + tol;
        if (trial % 5 == 0) p.low = -std::numeric_limits<double>::infinity();

        CAPTURE(trial);
        CAPTURE(n);
        CAPTURE(p.count);
        CAPTURE(p.max_repeats);

        const Brute b = brute_force(p);
        const selection::MinEnergySolution s = selection::solve_min_energy(p);
        CHECK_FALSE(s.exhausted);
        CHECK(s.feasible() == b.feasible);
        if (b.feasible && s.feasible()) {
            ++feasible;
            CHECK(s.energy == doctest::Approx(b.energy));
            check_solution(p, s);
        } else {
            ++infeasible;
        }
    }
    // the generator must exercise both outcomes
    CHECK(feasible > 20);
    CHECK(infeasible > 20);
}

TEST_CASE("Equal-energy optima resolve to the earliest candidate") {
    selection::MinEnergyProblem p;
    p.energy = {1.0, 1.0, 1.0};
    p.time = {10.0, 10.0, 10.0};
    p.count = 2;
    const auto s = selection::solve_min_energy(p);
    REQUIRE(s.feasible());
    CHECK(s.counts == std::vector<int>{2, 0, 0});

    p.max_repeats = 1;
    CHECK(selection::solve_min_energy(p).counts == std::vector<int>{1, 1, 0});
}

TEST_CASE("Node limit stops the search and is reported") {
    selection::MinEnergyProblem p;
    for (int i = 0; i < 12; ++i) {
        p.energy.push_back(static_cast<double>(12 - i));
        p.time.push_back(static_cast<double>(3 + 7 * i));
    }
    p.count = 8;
    p.low = 200.0;
    p.high = 260.0;

    p.node_limit = 1;
    auto s = selection::solve_min_energy(p);
    CHECK(s.exhausted);
    CHECK_FALSE(s.feasible());
    CHECK(s.nodes == 1);

    p.node_limit = 0;
    s = selection::solve_min_energy(p);
    CHECK(s.feasible());
    CHECK_FALSE(s.exhausted);
    check_solution(p, s);
}

TEST_CASE("Node limit hit after the first incumbent keeps it but flags the search") {
    selection::MinEnergyProblem p;
    p.energy = {0.0, 1.0};
    p.time = {18.0, 10.0};
    p.count = 2;
    p.high = 40.0;
    p.node_limit = 2; // root, then the greedy leaf (2 x first candidate)
    const auto s = selection::solve_min_energy(p);
    CHECK(s.exhausted);
    REQUIRE(s.feasible());
    CHECK(s.counts == std::vector<core::count_t>{2, 0});
    CHECK(s.nodes == 2);
}

TEST_CASE("Window beyond every reachable total is infeasible at the root") {
    selection::MinEnergyProblem p;
    p.energy = {1.0, 2.0};
    p.time = {10.0, 80.0};
    p.count = 8;
    p.low = 1000.0; // at most 8 * 80
    p.high = 1001.0;
    const auto s = selection::solve_min_energy(p);
    CHECK_FALSE(s.feasible());
    CHECK_FALSE(s.exhausted);
    CHECK(s.nodes == 1);
}

TEST_CASE("Mismatched problem vectors are rejected") {
    selection::MinEnergyProblem p;
    p.energy = {1.0};
    p.count = 1;
    CHECK_THROWS_AS(selection::solve_min_energy(p), core::Error);
}
