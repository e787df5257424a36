// location.cpp
#include "model/location.hpp"

#include <spdlog/fmt/fmt.h>

namespace model {

std::string to_string(const Location& loc) {
    if (const auto* g = std::get_if<GridLocation>(&loc)) {
        return fmt::format("({}, {})", g->x, g->y);
    }
    return std::get<PlaceLocation>(loc).name;
}

std::size_t LocationHash::operator()(const Location& loc) const noexcept {
    std::size_t h = loc.index() * 0x9E3779B97F4A7C15ULL;
    auto mix = [&h](std::size_t v) { h ^= v + 0x9E3779B97F4A7C15ULL + (h << 6) + (h >> 2); };
    if (const auto* g = std::get_if<GridLocation>(&loc)) {
        // +0.0 and -0.0 compare equal, so they must hash equal
        mix(std::hash<double>{}(g->x == 0.0 ? 0.0 : g->x));
        mix(std::hash<double>{}(g->y == 0.0 ? 0.0 : g->y));
    } else {
        mix(std::hash<std::string>{}(std::get<PlaceLocation>(loc).name));
    }
    return h;
}

} // namespace model
