/// @file battle_state.cpp
/// @brief Combatant lookup and liveness queries over BattleState.

#include "tbc/game/battle_state.hpp"

#include <algorithm>

namespace tbc::game {

Combatant* BattleState::FindCombatant(std::string_view id) {
    for (auto* side : {&allies, &enemies}) {
        for (auto& c : *side) {
            if (c.instanceId == id) {
                return &c;
            }
        }
    }
    return nullptr;
}

const Combatant* BattleState::FindCombatant(std::string_view id) const {
    return const_cast<BattleState*>(this)->FindCombatant(id);
}

std::vector<const Combatant*> BattleState::Living(Side side) const {
    std::vector<const Combatant*> out;
    for (const auto& c : SideMembers(side)) {
        if (c.IsAlive()) {
            out.push_back(&c);
        }
    }
    return out;
}

bool BattleState::AnyAlive(Side side) const {
    const auto& members = SideMembers(side);
    return std::any_of(members.begin(), members.end(),
                       [](const Combatant& c) { return c.IsAlive(); });
}

}  // namespace tbc::game
