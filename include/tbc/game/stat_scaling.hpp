#pragma once

/// @file stat_scaling.hpp
/// @brief Derive effective combat stats from base stats plus attributes,
///        battle level or owner bond.
///
/// All functions are pure.

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "tbc/game/combat_tuning.hpp"
#include "tbc/game/combatant.hpp"
#include "tbc/game/components.hpp"
#include "tbc/game/content.hpp"

namespace tbc::game {

/// Player/party scaling: VIT -> max HP, INT -> max MP, STR -> attack,
/// DEX -> speed. Current pools are clamped to the new maxima.
[[nodiscard]] Stats applyAttributeScaling(const Stats& base, const Attributes& attrs,
                                          int32_t currentHp, int32_t currentMp,
                                          const AttributeScalingTuning& tuning);

/// Additive per-level enemy scaling. The result starts at full HP and MP.
[[nodiscard]] Stats applyEnemyLevelScaling(const Stats& base, int32_t battleLevel,
                                           const EnemyScalingTuning& tuning);

/// Summon scaling: base + bond * perBond for HP/attack/defense/speed,
/// floored once per stat, then HP >= 1 and the rest >= 0. MP is unscaled.
[[nodiscard]] Stats applySummonBondScaling(const Stats& base, int32_t ownerBond,
                                           const BondScaling& scaling);

/// Whether a skill tag names an element (fire, ice, holy...).
[[nodiscard]] bool isElementalTag(std::string_view tag);

/// How an action draws on the actor's attributes.
enum class ActionKind : uint8_t {
    BasicAttack,
    Skill
};

/// Attack value an action starts from, before debuffs.
///
/// Combatants without attributes (enemies, summons) use their attack stat.
/// Otherwise the pre-scaling attack is combined with the physical stat
/// (STR, or DEX with a finesse weapon), INT, or their floored average,
/// depending on the skill's physical/elemental tags. Basic attacks are
/// physical.
[[nodiscard]] int32_t actionAttack(const Combatant& actor, ActionKind kind,
                                   const std::vector<std::string>& skillTags,
                                   const AttributeScalingTuning& tuning);

}  // namespace tbc::game
