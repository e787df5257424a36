// need.hpp: declared mobility need between two location roles
#pragma once
#include "core/config.hpp"
#include "model/categories.hpp"

namespace model {

/**
 * @brief (Derived) need for mobility.
 * @details Refers to roles, not concrete places; the owning agent's location
 *          mapping resolves them. A zero count is vacuously satisfied.
 */
struct Need {
    TripPurpose   purpose{TripPurpose::commute};
    LocationRole  origin{LocationRole::home};
    LocationRole  destination{LocationRole::work};
    /// Number of times the trip must be made in a typical week.
    core::count_t count{0};

    friend bool operator==(const Need&, const Need&) = default;
};

/// Throw InvalidArgument when the need's count is negative.
void validate(const Need& need);

/// Build a need, rejecting negative counts with InvalidArgument.
Need make_need(TripPurpose purpose, LocationRole origin, LocationRole destination, core::count_t count);

} // namespace model
