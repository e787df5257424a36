// categories.hpp: closed enumerations of the entity model
#pragma once
#include <array>
#include <string_view>

namespace model {

/// Index into an agent's location mapping; not itself a location.
enum class LocationRole { home, work };

enum class TripPurpose { commute, other };

enum class Gender { flint, male };

/// Purpose served by a point of interest in the travel-plan model.
enum class Purpose { work, leisure };

inline constexpr std::array<Purpose, 2> kAllPurposes{Purpose::work, Purpose::leisure};

inline constexpr std::string_view to_string(LocationRole r) noexcept {
    return r == LocationRole::home ? "home" : "work";
}

inline constexpr std::string_view to_string(TripPurpose p) noexcept {
    return p == TripPurpose::commute ? "commute" : "other";
}

inline constexpr std::string_view to_string(Gender g) noexcept {
    return g == Gender::flint ? "FLINT*" : "male";
}

inline constexpr std::string_view to_string(Purpose p) noexcept {
    return p == Purpose::work ? "work" : "leisure";
}

} // namespace model
