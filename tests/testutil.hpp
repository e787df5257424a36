// testutil.hpp: shared builders for the test suite
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/error.hpp"
#include "model/agent.hpp"

namespace testutil {

// Kind of the core::Error thrown by fn, or nullopt when nothing is thrown.
inline std::optional<core::ErrorKind> error_kind(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const core::Error& e) {
        return e.kind();
    }
    return std::nullopt;
}

inline std::string error_message(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const core::Error& e) {
        return e.message();
    }
    return {};
}

inline model::Alternative alt(const model::Location& o, const model::Location& d, const std::string& mode,
                              double energy = 0.0, double time = 0.0, double distance = 0.0) {
    return model::Alternative(o, d, mode, model::Alternative::Attributes{0.0, distance, energy, time});
}

// One agent, A=(0,0) home, B=(1,0) work, commute A->B x5 and B->A x5, empty plan.
inline model::Agent two_location_agent() {
    using model::LocationRole;
    model::Agent a;
    a.location = {{LocationRole::home, model::grid(0, 0)}, {LocationRole::work, model::grid(1, 0)}};
    a.needs = {
        model::make_need(model::TripPurpose::commute, LocationRole::home, LocationRole::work, 5),
        model::make_need(model::TripPurpose::commute, LocationRole::work, LocationRole::home, 5),
    };
    return a;
}

} // namespace testutil
