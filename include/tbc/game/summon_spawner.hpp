#pragma once

/// @file summon_spawner.hpp
/// @brief Bond-capped summon spawning at battle start.

#include <cstdint>
#include <string>
#include <vector>

#include "tbc/foundation/game_result.hpp"
#include "tbc/game/battle_events.hpp"
#include "tbc/game/battle_state.hpp"
#include "tbc/game/combatant.hpp"
#include "tbc/game/content.hpp"
#include "tbc/game/game_state.hpp"
#include "tbc/game/threat_engine.hpp"
#include "tbc/game/turn_scheduler.hpp"

namespace tbc::game {

/// A combatant that can own summons, with the loadout it brings.
struct SummonOwner {
    std::string combatantId;  ///< Instance id inside the battle.
    int32_t bond = 0;         ///< Capacity.
    std::vector<std::string> loadout;
};

class SummonSpawner {
public:
    SummonSpawner(const CombatContent& content, const ThreatEngine& threat,
                  const TurnScheduler& scheduler)
        : content_(content), threat_(threat), scheduler_(scheduler) {}

    /// Player first, then party members ("party_<id>") in party order.
    [[nodiscard]] static std::vector<SummonOwner> Owners(const GameState& state);

    /// FactoryFailed if any equipped summon id is unknown. Draws nothing.
    [[nodiscard]] foundation::GameResult<void> ValidateLoadouts(const GameState& state) const;

    /// Build one summon with bond-scaled stats and a fresh instance id.
    [[nodiscard]] Combatant CreateSummon(const SummonDef& def, const std::string& ownerId,
                                         int32_t ownerBond, const BattleState& battle,
                                         Rng& rng) const;

    /// Spawn every owner's loadout in equipped order.
    ///
    /// Each owner's bond is spent summon by summon. The first summon that
    /// costs more than what remains ends that owner's spawning; cheaper
    /// summons listed after it are not considered.
    foundation::GameResult<BattleEvents> SpawnEquipped(BattleState& battle, GameState& state) const;

private:
    const CombatContent& content_;
    const ThreatEngine& threat_;
    const TurnScheduler& scheduler_;
};

}  // namespace tbc::game
