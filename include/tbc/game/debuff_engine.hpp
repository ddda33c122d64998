#pragma once

/// @file debuff_engine.hpp
/// @brief Round-scoped stat penalties: no-stack application, effective
///        stats, and expiry at round boundaries.

#include <cstdint>
#include <vector>

#include "tbc/game/battle_events.hpp"
#include "tbc/game/battle_state.hpp"
#include "tbc/game/combat_tuning.hpp"
#include "tbc/game/combatant.hpp"

namespace tbc::game {

class DebuffEngine {
public:
    explicit DebuffEngine(const DebuffTuning& tuning) : tuning_(tuning) {}

    /// Add a debuff unless one of the same type is already active.
    /// @return false (and no change) when blocked by an active debuff.
    static bool ApplyNoStack(Combatant& target, DebuffType type, int32_t amount,
                             int32_t expiresAtRound);

    /// attack - sum(attack_down), floored at 1.
    [[nodiscard]] static int32_t EffectiveAttack(int32_t attack,
                                                 const std::vector<ActiveDebuff>& debuffs);

    /// defense - sum(defense_down), floored at 0.
    [[nodiscard]] static int32_t EffectiveDefense(int32_t defense,
                                                  const std::vector<ActiveDebuff>& debuffs);

    /// Round at which a debuff applied now expires.
    [[nodiscard]] int32_t ExpiryRound(const BattleState& battle) const {
        return battle.roundIndex + tuning_.durationRounds;
    }

    /// Drop every debuff whose expiry round has been reached.
    ///
    /// Only called at a round boundary. Living combatants report each
    /// removal; dead ones already lost their debuffs and report nothing.
    BattleEvents ExpireDebuffs(BattleState& battle) const;

private:
    DebuffTuning tuning_;
};

}  // namespace tbc::game
