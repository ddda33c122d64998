#pragma once

/// @file combat_types.hpp
/// @brief Enumerations and constants for the battle engine.
///
/// String-tagged kinds from content definitions are parsed into these closed
/// enums once, at the content boundary. Each parse helper maps anything it
/// does not recognize to an explicit Unknown member so that callers can log
/// and ignore it instead of guessing.

#include <cstdint>
#include <string_view>

namespace tbc::game {

/// Highest knowledge tier a key can reach.
constexpr int kMaxKnowledgeTier = 3;

/// Tag carried by every spawned summon.
inline constexpr std::string_view kSummonTag = "summon";

/// Weapon tag that switches the physical stat from STR to DEX.
inline constexpr std::string_view kFinesseTag = "finesse";

/// Skill tag marking physical damage.
inline constexpr std::string_view kPhysicalTag = "physical";

/// Which team a combatant fights for.
enum class Side : uint8_t {
    Allies,
    Enemies
};

/// Round-scoped stat penalty kinds.
enum class DebuffType : uint8_t {
    AttackDown,
    DefenseDown,
    Unknown
};

/// How a skill selects its targets.
enum class SkillTargetMode : uint8_t {
    Self,         ///< Acts on the user only.
    SingleEnemy,  ///< Exactly one living enemy.
    MultiEnemy,   ///< 1..maxTargets distinct living enemies.
    Unknown
};

/// What a skill does once its targets are resolved.
enum class SkillEffectType : uint8_t {
    Damage,  ///< Deal attack + power - defense damage to each target.
    Guard,   ///< Set the user's one-shot guard reduction.
    Unknown  ///< Logged and ignored.
};

/// Which combatants an item may be used on.
enum class ItemTargeting : uint8_t {
    Self,
    Ally,
    Enemy,
    Unknown
};

/// HP disclosure mode for an enemy.
enum class HpVisibility : uint8_t {
    Hidden,       ///< "???"
    StaticRange,  ///< Range frozen at battle start.
    Realtime      ///< Exact current/max.
};

constexpr std::string_view sideName(Side side) {
    return side == Side::Allies ? "allies" : "enemies";
}

constexpr Side opposingSide(Side side) {
    return side == Side::Allies ? Side::Enemies : Side::Allies;
}

constexpr std::string_view debuffTypeName(DebuffType type) {
    switch (type) {
        case DebuffType::AttackDown:  return "attack_down";
        case DebuffType::DefenseDown: return "defense_down";
        case DebuffType::Unknown:     break;
    }
    return "unknown";
}

constexpr DebuffType parseDebuffType(std::string_view s) {
    if (s == "attack_down") return DebuffType::AttackDown;
    if (s == "defense_down") return DebuffType::DefenseDown;
    return DebuffType::Unknown;
}

constexpr std::string_view skillTargetModeName(SkillTargetMode mode) {
    switch (mode) {
        case SkillTargetMode::Self:        return "self";
        case SkillTargetMode::SingleEnemy: return "single_enemy";
        case SkillTargetMode::MultiEnemy:  return "multi_enemy";
        case SkillTargetMode::Unknown:     break;
    }
    return "unknown";
}

constexpr SkillTargetMode parseSkillTargetMode(std::string_view s) {
    if (s == "self") return SkillTargetMode::Self;
    if (s == "single_enemy") return SkillTargetMode::SingleEnemy;
    if (s == "multi_enemy") return SkillTargetMode::MultiEnemy;
    return SkillTargetMode::Unknown;
}

constexpr std::string_view skillEffectTypeName(SkillEffectType type) {
    switch (type) {
        case SkillEffectType::Damage:  return "damage";
        case SkillEffectType::Guard:   return "guard";
        case SkillEffectType::Unknown: break;
    }
    return "unknown";
}

constexpr SkillEffectType parseSkillEffectType(std::string_view s) {
    if (s == "damage") return SkillEffectType::Damage;
    if (s == "guard") return SkillEffectType::Guard;
    return SkillEffectType::Unknown;
}

constexpr std::string_view itemTargetingName(ItemTargeting t) {
    switch (t) {
        case ItemTargeting::Self:    return "self";
        case ItemTargeting::Ally:    return "ally";
        case ItemTargeting::Enemy:   return "enemy";
        case ItemTargeting::Unknown: break;
    }
    return "unknown";
}

constexpr ItemTargeting parseItemTargeting(std::string_view s) {
    if (s == "self") return ItemTargeting::Self;
    if (s == "ally") return ItemTargeting::Ally;
    if (s == "enemy") return ItemTargeting::Enemy;
    return ItemTargeting::Unknown;
}

constexpr std::string_view hpVisibilityName(HpVisibility mode) {
    switch (mode) {
        case HpVisibility::Hidden:      return "hidden";
        case HpVisibility::StaticRange: return "static_range";
        case HpVisibility::Realtime:    return "realtime";
    }
    return "unknown";
}

}  // namespace tbc::game
