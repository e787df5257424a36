// entities.cpp: invariant-checking construction for the entity model
#include "model/alternative.hpp"
#include "model/need.hpp"

#include <cmath>
#include <utility>
#include <spdlog/fmt/fmt.h>

#include "core/error.hpp"

namespace model {

void validate(const Need& need) {
    DM_ENSURE(need.count >= 0, core::ErrorKind::InvalidArgument,
              fmt::format("need {} {}->{} has negative count {}", to_string(need.purpose),
                          to_string(need.origin), to_string(need.destination), need.count));
}

Need make_need(TripPurpose purpose, LocationRole origin, LocationRole destination, core::count_t count) {
    Need n{purpose, origin, destination, count};
    validate(n);
    return n;
}

static void check_attribute(const char* name, double v, const std::string& mode) {
    DM_ENSURE(std::isfinite(v) && v >= 0.0, core::ErrorKind::InvalidArgument,
              fmt::format("alternative '{}' has invalid {} {}", mode, name, v));
}

Alternative::Alternative(Location origin, Location destination, std::string mode, Attributes attrs)
    : origin_(std::move(origin)), destination_(std::move(destination)), mode_(std::move(mode)),
      cost_(attrs.cost), distance_(attrs.distance), energy_(attrs.energy), time_(attrs.time)
{
    const double d = derived_distance(origin_, destination_);
    if (d >= 0.0) distance_ = d;
    check_attribute("cost", cost_, mode_);
    check_attribute("distance", distance_, mode_);
    check_attribute("energy", energy_, mode_);
    check_attribute("time", time_, mode_);
}

std::string to_string(const Alternative& a) {
    return fmt::format("{} {}->{} (time={}, energy={}, distance={})",
                       a.mode(), to_string(a.origin()), to_string(a.destination()),
                       a.time(), a.energy(), a.distance());
}

} // namespace model
