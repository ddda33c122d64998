#pragma once

/// @file threat_engine.hpp
/// @brief Damage-driven threat tables for enemy and ally AI targeting.

#include <cstdint>
#include <string>
#include <vector>

#include "tbc/foundation/game_result.hpp"
#include "tbc/game/battle_state.hpp"
#include "tbc/game/combat_tuning.hpp"
#include "tbc/game/combatant.hpp"
#include "tbc/game/rng.hpp"

namespace tbc::game {

/// Outcome of an enemy targeting decision.
struct TargetChoice {
    std::string targetId;
    int32_t topValue = 0;           ///< Threat toward the chosen target.
    bool antiRepeatApplied = false; ///< Switched away from the last target.
};

/// Threat bookkeeping and target selection.
///
/// Each enemy holds a threat score per ally, seeded from BaseThreat() and
/// raised by every point of damage that ally deals to it. Allies mirror this
/// with a score per enemy. Exact ties are broken with the shared RNG, so a
/// given seed always produces the same choices.
class ThreatEngine {
public:
    explicit ThreatEngine(const ThreatTuning& tuning) : tuning_(tuning) {}

    /// max(1, (maxHp + defense) / divisor), plus a bonus for the player.
    [[nodiscard]] int32_t BaseThreat(const BattleState& battle, const Combatant& target) const;

    /// Reset every table from the current living combatants.
    void InitializeThreat(BattleState& battle) const;

    /// Add an ally that joined mid-setup (a summon) to every enemy's table.
    void SeedAlly(BattleState& battle, const Combatant& ally) const;

    /// Attribute @p damage dealt by @p attacker to @p target.
    ///
    /// Only ally-on-enemy damage builds threat; it is credited to the
    /// attacker itself, so a summon draws aggro rather than its owner.
    void RecordDamage(BattleState& battle, const Combatant& attacker,
                      const Combatant& target, int32_t damage) const;

    /// Choose which living ally an enemy attacks, and remember it.
    ///
    /// Highest threat wins. When the winner is the enemy's last target and
    /// its lead over the runner-up is below the ignore gap, the runner-up
    /// is attacked instead. Remaining ties draw from @p rng.
    foundation::GameResult<TargetChoice> SelectEnemyTarget(BattleState& battle,
                                                           const std::string& enemyId,
                                                           Rng& rng) const;

    /// Living enemies ordered by an ally's threat, highest first, with
    /// equal-threat groups shuffled by @p rng.
    std::vector<std::string> OrderEnemiesByPartyThreat(BattleState& battle,
                                                       const std::string& allyId,
                                                       Rng& rng) const;

    [[nodiscard]] const ThreatTuning& Tuning() const noexcept { return tuning_; }

private:
    ThreatTuning tuning_;
};

}  // namespace tbc::game
