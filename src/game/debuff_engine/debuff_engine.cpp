/// @file debuff_engine.cpp
/// @brief DebuffEngine implementation: no-stack application and round expiry.

#include "tbc/game/debuff_engine.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "tbc/foundation/game_logger.hpp"

namespace tbc::game {

using foundation::LogCategory;

bool DebuffEngine::ApplyNoStack(Combatant& target, DebuffType type, int32_t amount,
                                int32_t expiresAtRound) {
    const bool active = std::any_of(target.debuffs.begin(), target.debuffs.end(),
                                    [type](const ActiveDebuff& d) { return d.type == type; });
    if (active || !target.IsAlive()) {
        return false;
    }
    target.debuffs.push_back(ActiveDebuff{type, amount, expiresAtRound});
    return true;
}

static int32_t penaltyOf(const std::vector<ActiveDebuff>& debuffs, DebuffType type) {
    int32_t total = 0;
    for (const auto& d : debuffs) {
        if (d.type == type) {
            total += d.amount;
        }
    }
    return total;
}

int32_t DebuffEngine::EffectiveAttack(int32_t attack, const std::vector<ActiveDebuff>& debuffs) {
    return std::max(1, attack - penaltyOf(debuffs, DebuffType::AttackDown));
}

int32_t DebuffEngine::EffectiveDefense(int32_t defense, const std::vector<ActiveDebuff>& debuffs) {
    return std::max(0, defense - penaltyOf(debuffs, DebuffType::DefenseDown));
}

BattleEvents DebuffEngine::ExpireDebuffs(BattleState& battle) const {
    BattleEvents events;
    for (auto* side : {&battle.allies, &battle.enemies}) {
        for (auto& c : *side) {
            if (c.debuffs.empty()) {
                continue;
            }
            std::vector<ActiveDebuff> remaining;
            for (const auto& d : c.debuffs) {
                if (d.expiresAtRound > battle.roundIndex) {
                    remaining.push_back(d);
                    continue;
                }
                if (c.IsAlive()) {
                    events.emplace_back(DebuffExpired{c.instanceId, c.displayName, d.type});
                    TBC_LOG_DEBUG(LogCategory::Combat,
                                  std::string(debuffTypeName(d.type)) + " expired on " + c.instanceId);
                }
            }
            c.debuffs = std::move(remaining);
        }
    }
    return events;
}

}  // namespace tbc::game
