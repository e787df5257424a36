// agent.hpp: agents and the population model
#pragma once
#include <map>
#include <vector>

#include "model/alternative.hpp"
#include "model/categories.hpp"
#include "model/location.hpp"
#include "model/need.hpp"

namespace model {

/**
 * @brief Agent representative of an individual, a persona, or a population share.
 * @details plan is replaced wholesale by planning code, never edited in place.
 */
struct Agent {
    /// Locations by role; unique per role.
    std::map<LocationRole, Location> location;
    /// Trip needs of this agent.
    std::vector<Need> needs;
    /// Realized trips meant to satisfy the needs; may be empty or partial.
    std::vector<Alternative> plan;
};

/**
 * @brief A collection of agents.
 */
struct Model {
    std::vector<Agent> agents;

    /// True iff every agent has decent mobility (strict matching criterion).
    bool universal_decent_mobility() const;
};

} // namespace model
