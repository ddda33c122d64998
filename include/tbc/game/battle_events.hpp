#pragma once

/// @file battle_events.hpp
/// @brief Closed set of immutable records a battle operation returns.
///
/// Operations never render anything themselves. They return an ordered
/// std::vector<BattleEvent> that the presentation layer matches on
/// exhaustively with std::visit.

#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "tbc/game/combat_types.hpp"
#include "tbc/game/components.hpp"

namespace tbc::game {

struct BattleStarted {
    static constexpr std::string_view kName = "battle_started";
    std::string battleId;
    std::vector<std::string> enemyNames;
    int32_t battleLevel = 0;
    bool operator==(const BattleStarted&) const = default;
};

struct SummonSpawned {
    static constexpr std::string_view kName = "summon_spawned";
    std::string ownerId;
    std::string summonId;
    std::string summonInstanceId;
    std::string summonName;
    int32_t bondCost = 0;
    int32_t ownerBond = 0;
    Stats baseStats;
    Stats scaledStats;
    bool operator==(const SummonSpawned&) const = default;
};

/// Enemy AI targeting decision, emitted ahead of the attack it leads to.
struct EnemyTargeted {
    static constexpr std::string_view kName = "enemy_targeted";
    std::string attackerId;
    std::string attackerName;
    std::string targetId;
    std::string targetName;
    int32_t topValue = 0;
    bool antiRepeatApplied = false;
    bool operator==(const EnemyTargeted&) const = default;
};

struct AttackResolved {
    static constexpr std::string_view kName = "attack_resolved";
    std::string attackerId;
    std::string attackerName;
    std::string targetId;
    std::string targetName;
    int32_t damage = 0;
    int32_t targetHp = 0;
    bool operator==(const AttackResolved&) const = default;
};

/// One per damaged target of a damage skill.
struct SkillUsed {
    static constexpr std::string_view kName = "skill_used";
    std::string attackerId;
    std::string attackerName;
    std::string skillId;
    std::string skillName;
    std::string targetId;
    std::string targetName;
    int32_t damage = 0;
    int32_t targetHp = 0;
    bool operator==(const SkillUsed&) const = default;
};

enum class SkillFailReason : uint8_t {
    InsufficientMp
};

constexpr std::string_view skillFailReasonName(SkillFailReason reason) {
    switch (reason) {
        case SkillFailReason::InsufficientMp: return "insufficient_mp";
    }
    return "unknown";
}

struct SkillFailed {
    static constexpr std::string_view kName = "skill_failed";
    std::string combatantId;
    std::string combatantName;
    std::string skillId;
    SkillFailReason reason = SkillFailReason::InsufficientMp;
    bool operator==(const SkillFailed&) const = default;
};

struct GuardApplied {
    static constexpr std::string_view kName = "guard_applied";
    std::string combatantId;
    std::string combatantName;
    int32_t amount = 0;
    bool operator==(const GuardApplied&) const = default;
};

struct ItemUsed {
    static constexpr std::string_view kName = "item_used";
    std::string userId;
    std::string userName;
    std::string targetId;
    std::string targetName;
    std::string itemId;
    std::string itemName;
    int32_t hpDelta = 0;
    int32_t mpDelta = 0;
    std::string resultText;
    bool operator==(const ItemUsed&) const = default;
};

struct DebuffApplied {
    static constexpr std::string_view kName = "debuff_applied";
    std::string targetId;
    std::string targetName;
    DebuffType type = DebuffType::AttackDown;
    int32_t amount = 0;
    int32_t expiresAtRound = 0;
    bool operator==(const DebuffApplied&) const = default;
};

struct DebuffExpired {
    static constexpr std::string_view kName = "debuff_expired";
    std::string targetId;
    std::string targetName;
    DebuffType type = DebuffType::AttackDown;
    bool operator==(const DebuffExpired&) const = default;
};

struct CombatantDefeated {
    static constexpr std::string_view kName = "combatant_defeated";
    std::string combatantId;
    std::string combatantName;
    bool operator==(const CombatantDefeated&) const = default;
};

struct PartyTalk {
    static constexpr std::string_view kName = "party_talk";
    std::string speakerId;
    std::string speakerName;
    std::string text;
    bool operator==(const PartyTalk&) const = default;
};

struct GoldGranted {
    static constexpr std::string_view kName = "gold_granted";
    int32_t amount = 0;
    int64_t totalGold = 0;
    bool operator==(const GoldGranted&) const = default;
};

struct ExpGranted {
    static constexpr std::string_view kName = "exp_granted";
    std::string memberId;
    std::string memberName;
    int32_t amount = 0;
    int32_t newLevel = 1;
    bool operator==(const ExpGranted&) const = default;
};

struct LevelUp {
    static constexpr std::string_view kName = "level_up";
    std::string memberId;
    std::string memberName;
    int32_t newLevel = 1;
    bool operator==(const LevelUp&) const = default;
};

struct LootAcquired {
    static constexpr std::string_view kName = "loot_acquired";
    std::string itemId;
    std::string itemName;
    int32_t quantity = 0;
    bool operator==(const LootAcquired&) const = default;
};

struct BattleResolved {
    static constexpr std::string_view kName = "battle_resolved";
    Side victor = Side::Allies;
    bool operator==(const BattleResolved&) const = default;
};

using BattleEvent = std::variant<
    BattleStarted, SummonSpawned, EnemyTargeted, AttackResolved, SkillUsed,
    SkillFailed, GuardApplied, ItemUsed, DebuffApplied, DebuffExpired,
    CombatantDefeated, PartyTalk, GoldGranted, ExpGranted, LevelUp,
    LootAcquired, BattleResolved>;

using BattleEvents = std::vector<BattleEvent>;

/// Stable snake_case name of the event's kind.
inline std::string_view eventName(const BattleEvent& event) {
    return std::visit([](const auto& e) { return e.kName; }, event);
}

/// Append all of @p tail to @p events.
inline void appendEvents(BattleEvents& events, BattleEvents tail) {
    events.insert(events.end(), std::make_move_iterator(tail.begin()),
                  std::make_move_iterator(tail.end()));
}

}  // namespace tbc::game
