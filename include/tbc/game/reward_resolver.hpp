#pragma once

/// @file reward_resolver.hpp
/// @brief Victory rewards, progression and defeat bookkeeping.

#include <cstdint>
#include <string>
#include <vector>

#include "tbc/game/battle_events.hpp"
#include "tbc/game/battle_state.hpp"
#include "tbc/game/combat_tuning.hpp"
#include "tbc/game/content.hpp"
#include "tbc/game/game_state.hpp"

namespace tbc::game {

class RewardResolver {
public:
    RewardResolver(const CombatContent& content, const ProgressionTuning& progression,
                   const AttributeScalingTuning& scaling)
        : content_(content), progression_(progression), scaling_(scaling) {}

    /// Grant everything a won battle is worth, exactly once.
    ///
    /// Returns no events, and changes nothing, unless the allies won and no
    /// earlier call already paid out. In order: syncs the player's HP,
    /// restores the player's MP, clears the defeat flag, grants gold, splits
    /// exp across the active party (remainder to the player), records one
    /// kill per defeated enemy, then rolls loot.
    BattleEvents ApplyVictoryRewards(BattleState& battle, GameState& state) const;

    /// Add exp to one member, levelling up as many times as it covers.
    /// A player level-up recomputes scaled stats and fully restores HP/MP.
    BattleEvents AwardExp(GameState& state, const std::string& memberId, int32_t amount) const;

    /// exp_base + (level - 1) * exp_per_level
    [[nodiscard]] int32_t ExpToNextLevel(int32_t level) const;

    /// Required tags all present, no forbidden tag present.
    [[nodiscard]] static bool LootTableMatches(const LootTableDef& table,
                                               const std::vector<std::string>& enemyTags);

    /// Roll every matching table for one defeated enemy. Tables that do not
    /// match draw nothing.
    BattleEvents RollLoot(const Combatant& enemy, GameState& state) const;

    /// Flag a lost battle and carry the player's HP/MP back into GameState.
    void RecordDefeat(const BattleState& battle, GameState& state) const;

    /// Copy the player combatant's HP/MP into GameState.
    static void SyncPlayer(const BattleState& battle, GameState& state);

    [[nodiscard]] std::string MemberName(const GameState& state, const std::string& memberId) const;

private:
    const CombatContent& content_;
    ProgressionTuning progression_;
    AttributeScalingTuning scaling_;
};

}  // namespace tbc::game
