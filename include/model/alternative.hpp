// alternative.hpp: concrete, mode-specific trip between resolved locations
#pragma once
#include <string>

#include "model/location.hpp"

namespace model {

/// Externally supplied attributes of an alternative; all must be >= 0.
struct AlternativeAttributes {
    double cost{0.0};
    double distance{0.0};
    double energy{0.0};
    double time{0.0};
};

/**
 * @brief Specific transport/mobility alternative for a trip.
 * @details Immutable once constructed. distance is derived from the endpoints
 *          when both are grid locations; otherwise the supplied value is kept.
 *          Units follow the catalog (distance [km], time [min], energy [kJ]).
 */
class Alternative {
public:
    using Attributes = AlternativeAttributes;

    /**
     * @brief Construct and validate.
     * @throws core::Error InvalidArgument when any attribute is negative or not finite.
     */
    Alternative(Location origin, Location destination, std::string mode, Attributes attrs = {});

    const Location&    origin()      const noexcept { return origin_; }
    const Location&    destination() const noexcept { return destination_; }
    const std::string& mode()        const noexcept { return mode_; }
    double cost()     const noexcept { return cost_; }
    double distance() const noexcept { return distance_; }
    double energy()   const noexcept { return energy_; }
    double time()     const noexcept { return time_; }

    friend bool operator==(const Alternative&, const Alternative&) = default;

private:
    Location    origin_;
    Location    destination_;
    std::string mode_;
    double cost_;
    double distance_;
    double energy_;
    double time_;
};

std::string to_string(const Alternative& a);

} // namespace model
