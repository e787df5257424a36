// min_energy.cpp: branch-and-bound over selection counts
#include "selection/min_energy.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

#include "core/error.hpp"
#include "core/log.hpp"

namespace selection {

namespace {

// Slack for float comparisons against the window and incumbent.
inline double slack(double v) noexcept { return 1e-9 * std::max(1.0, std::fabs(v)); }

class BranchAndBound {
public:
    explicit BranchAndBound(const MinEnergyProblem& p) : p_(p) {
        const std::size_t n = p_.energy.size();
        order_.resize(n);
        std::iota(order_.begin(), order_.end(), std::size_t{0});
        std::stable_sort(order_.begin(), order_.end(),
                         [&](std::size_t a, std::size_t b) { return p_.energy[a] < p_.energy[b]; });

        cap_ = (p_.max_repeats > 0) ? std::min(p_.max_repeats, p_.count) : p_.count;

        // Suffix extrema of time over the energy-sorted order.
        tmin_.assign(n + 1, std::numeric_limits<double>::infinity());
        tmax_.assign(n + 1, -std::numeric_limits<double>::infinity());
        for (std::size_t k = n; k-- > 0;) {
            tmin_[k] = std::min(tmin_[k + 1], p_.time[order_[k]]);
            tmax_[k] = std::max(tmax_[k + 1], p_.time[order_[k]]);
        }
        lo_ = p_.low  - slack(p_.low);
        hi_ = p_.high + slack(p_.high);
        x_.assign(n, 0);
    }

    MinEnergySolution run() {
        descend(0, p_.count, 0.0, 0.0);
        sol_.nodes = nodes_;
        sol_.exhausted = stop_;
        return sol_;
    }

private:
    bool can_reach_window(std::size_t k, core::count_t r, double t) const noexcept {
        if (r == 0) return t >= lo_ && t <= hi_;
        const std::size_t left = order_.size() - k;
        if (left == 0) return false;
        if (static_cast<long long>(r) > static_cast<long long>(cap_) * static_cast<long long>(left)) return false;
        const double rd = static_cast<double>(r);
        return t + rd * tmin_[k] <= hi_ && t + rd * tmax_[k] >= lo_;
    }

    void descend(std::size_t k, core::count_t r, double e, double t) {
        if (stop_) return;
        if (p_.node_limit != 0 && nodes_ >= p_.node_limit) { stop_ = true; return; }
        ++nodes_;

        if (r == 0) {
            DM_ASSERT_H(std::accumulate(x_.begin(), x_.end(), core::count_t{0}) == p_.count,
                        "min-energy leaf does not select exactly count trips");
            if (t < lo_ || t > hi_) return;
            if (have_ && !(e < best_ - slack(best_))) return;
            have_ = true; best_ = e;
            sol_.counts.assign(order_.size(), 0);
            for (std::size_t j = 0; j < order_.size(); ++j) sol_.counts[order_[j]] = x_[j];
            sol_.energy = e;
            sol_.time = t;
            return;
        }
        if (!can_reach_window(k, r, t)) return;

        // order_ is energy-ascending, so every remaining pick costs at least energy[order_[k]]
        const double ek = p_.energy[order_[k]];
        const double tk = p_.time[order_[k]];
        if (have_ && e + static_cast<double>(r) * ek >= best_ - slack(best_)) return;

        DM_ASSERT_H(k < x_.size(), "min-energy descent past the last candidate");
        for (core::count_t xk = std::min(cap_, r); xk >= 0; --xk) {
            x_[k] = xk;
            descend(k + 1, r - xk, e + ek * xk, t + tk * xk);
            if (stop_) break;
        }
        x_[k] = 0;
    }

    const MinEnergyProblem& p_;
    std::vector<std::size_t> order_;
    std::vector<double> tmin_, tmax_;
    std::vector<core::count_t> x_;
    core::count_t cap_{0};
    double lo_{0.0}, hi_{0.0};
    bool have_{false};
    double best_{0.0};
    bool stop_{false};
    std::uint64_t nodes_{0};
    MinEnergySolution sol_;
};

} // namespace

MinEnergySolution solve_min_energy(const MinEnergyProblem& problem) {
    DM_ENSURE(problem.energy.size() == problem.time.size(), core::ErrorKind::InvalidArgument,
              "min-energy problem: energy and time vectors differ in length");
    DM_ENSURE(problem.count >= 0 && problem.max_repeats >= 0, core::ErrorKind::InvalidArgument,
              "min-energy problem: count and max_repeats must be non-negative");

    MinEnergySolution sol = BranchAndBound(problem).run();
    core::log::get()->debug("min-energy solve: n={} count={} window=[{}, {}] nodes={} feasible={}{}",
                            problem.energy.size(), problem.count, problem.low, problem.high,
                            sol.nodes, sol.feasible(), sol.exhausted ? " (node limit)" : "");
    return sol;
}

} // namespace selection
