// matcher.cpp
#include "matching/matcher.hpp"

#include <map>
#include <spdlog/fmt/fmt.h>

#include "core/error.hpp"

namespace matching {

static const model::Location& resolve_role(const model::Agent& agent, model::LocationRole role) {
    auto it = agent.location.find(role);
    DM_ENSURE(it != agent.location.end(), core::ErrorKind::UnresolvedLocationRole,
              fmt::format("location role '{}' is not in the agent's location mapping", model::to_string(role)));
    return it->second;
}

Key resolve(const model::Agent& agent, const model::Need& need) {
    return Key{resolve_role(agent, need.origin), resolve_role(agent, need.destination)};
}

std::vector<Pairing> match(const model::Agent& agent) {
    std::vector<Pairing> table;
    std::map<Key, std::size_t> slot; // key -> index into table (first-seen order)
    table.reserve(agent.needs.size() + agent.plan.size());

    for (const model::Need& n : agent.needs) {
        model::validate(n);
        auto [it, inserted] = slot.try_emplace(resolve(agent, n), table.size());
        if (inserted) table.push_back(Pairing{n, std::nullopt});
        else          table[it->second].need = n; // last write wins
    }

    for (const model::Alternative& a : agent.plan) {
        auto [it, inserted] = slot.try_emplace(Key{a.origin(), a.destination()}, table.size());
        if (inserted) table.push_back(Pairing{std::nullopt, a});
        else          table[it->second].alternative = a;
    }
    return table;
}

} // namespace matching
