// location.hpp: immutable location values (grid coordinates or named places)
#pragma once
#include <cmath>
#include <compare>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <variant>

namespace model {

/**
 * @brief A location denoted as (x, y) coordinates on a square grid.
 */
struct GridLocation {
    double x{0.0};
    double y{0.0};

    /** @brief Euclidean (straight-line) distance; symmetric and non-negative. */
    double distance_to(const GridLocation& other) const noexcept {
        return std::hypot(other.x - x, other.y - y);
    }

    friend bool operator==(const GridLocation&, const GridLocation&) = default;
    friend auto operator<=>(const GridLocation&, const GridLocation&) = default;
};

/**
 * @brief A place known only by name (e.g. a destination category in a catalog).
 */
struct PlaceLocation {
    std::string name;

    friend bool operator==(const PlaceLocation&, const PlaceLocation&) = default;
    friend auto operator<=>(const PlaceLocation&, const PlaceLocation&) = default;
};

using Location = std::variant<GridLocation, PlaceLocation>;

inline Location place(std::string name) { return PlaceLocation{std::move(name)}; }
inline Location grid(double x, double y) { return GridLocation{x, y}; }

/**
 * @brief Straight-line distance when both ends are grid locations.
 * @return Distance, or a negative value when it cannot be derived.
 */
inline double derived_distance(const Location& a, const Location& b) noexcept {
    const auto* ga = std::get_if<GridLocation>(&a);
    const auto* gb = std::get_if<GridLocation>(&b);
    if (ga == nullptr || gb == nullptr) return -1.0;
    return ga->distance_to(*gb);
}

std::string to_string(const Location& loc);

struct LocationHash {
    std::size_t operator()(const Location& loc) const noexcept;
};

} // namespace model
