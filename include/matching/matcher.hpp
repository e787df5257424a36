// matcher.hpp: pairing declared needs with planned alternatives
#pragma once
#include <optional>
#include <utility>
#include <vector>

#include "model/agent.hpp"

namespace matching {

/// Resolved (origin, destination) pair used as the matching key.
using Key = std::pair<model::Location, model::Location>;

/**
 * @brief One entry of the need/alternative pairing; either side may be absent.
 */
struct Pairing {
    std::optional<model::Need>        need;
    std::optional<model::Alternative> alternative;

    bool matched() const noexcept { return need.has_value() && alternative.has_value(); }
};

/**
 * @brief Resolve a need's roles through the agent's location mapping.
 * @throws core::Error UnresolvedLocationRole naming the missing role.
 */
Key resolve(const model::Agent& agent, const model::Need& need);

/**
 * @brief Pair the agent's needs with the alternatives of its plan.
 * @details Keyed by resolved (origin, destination), in first-seen key order:
 *          needs first, then alternatives whose key no need claimed.
 *          Needs sharing a key: the later need replaces the earlier one.
 *          Alternatives sharing a key: the last one is kept.
 *          Pure; repeated calls on the same agent give identical results.
 * @throws core::Error UnresolvedLocationRole, or InvalidArgument for a negative
 *         need count, before any pairing is produced.
 */
std::vector<Pairing> match(const model::Agent& agent);

} // namespace matching
