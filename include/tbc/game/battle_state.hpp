#pragma once

/// @file battle_state.hpp
/// @brief BattleState: the mutable model every battle operation works on.

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "tbc/game/combat_types.hpp"
#include "tbc/game/combatant.hpp"

namespace tbc::game {

/// Target id -> accumulated threat. Ordered so iteration is deterministic.
using ThreatMap = std::map<std::string, int32_t>;

/// Frozen HP disclosure decision for one enemy.
struct EnemyKnowledge {
    std::string knowledgeKey;
    int32_t tier = 0;
    HpVisibility visibility = HpVisibility::Hidden;
    /// Range shown in StaticRange mode, computed once from max HP.
    int32_t rangeLow = 0;
    int32_t rangeHigh = 0;

    bool operator==(const EnemyKnowledge&) const = default;
};

/// State of one battle, created at battle start and discarded once it
/// resolves.
///
/// Invariant: turnQueue equals the living combatants sorted by
/// (-speed, instanceId); TurnScheduler rebuilds it after every death or
/// spawn.
struct BattleState {
    std::string battleId;
    std::vector<Combatant> allies;
    std::vector<Combatant> enemies;

    std::vector<std::string> turnQueue;
    std::optional<std::string> currentActorId;
    int32_t roundIndex = 1;
    /// Queue tail when the current round began.
    std::optional<std::string> roundLastActorId;

    /// enemy id -> threat toward each ally.
    std::map<std::string, ThreatMap> enemyAggro;
    /// ally id -> threat toward each enemy, for ally AI targeting.
    std::map<std::string, ThreatMap> partyThreat;
    /// enemy id -> ally it targeted last.
    std::map<std::string, std::string> lastTarget;

    /// enemy id -> disclosure decision.
    std::map<std::string, EnemyKnowledge> knowledgeSnapshot;
    /// Knowledge keys revealed by party talk for this battle only.
    std::set<std::string> temporaryReveals;

    std::optional<std::string> playerId;
    int32_t battleLevel = 0;
    bool isOver = false;
    std::optional<Side> victor;
    bool rewardsApplied = false;

    [[nodiscard]] Combatant* FindCombatant(std::string_view id);
    [[nodiscard]] const Combatant* FindCombatant(std::string_view id) const;

    [[nodiscard]] std::vector<Combatant>& SideMembers(Side side) {
        return side == Side::Allies ? allies : enemies;
    }
    [[nodiscard]] const std::vector<Combatant>& SideMembers(Side side) const {
        return side == Side::Allies ? allies : enemies;
    }

    /// Living members of a side, in list order.
    [[nodiscard]] std::vector<const Combatant*> Living(Side side) const;

    [[nodiscard]] bool AnyAlive(Side side) const;

    /// Whether any combatant, on either side, uses this id.
    [[nodiscard]] bool HasId(std::string_view id) const {
        return FindCombatant(id) != nullptr;
    }

    bool operator==(const BattleState&) const = default;
};

}  // namespace tbc::game
