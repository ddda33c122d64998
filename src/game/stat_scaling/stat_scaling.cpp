/// @file stat_scaling.cpp
/// @brief Attribute, enemy level and summon bond scaling.

#include "tbc/game/stat_scaling.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace tbc::game {

namespace {

constexpr std::array<std::string_view, 11> kElementalTags = {
    "fire", "ice", "frost", "lightning", "water", "earth",
    "wind", "holy", "shadow", "arcane", "nature"};

int32_t floorScaled(int32_t base, int32_t bond, double perBond) {
    return static_cast<int32_t>(std::floor(static_cast<double>(base) + bond * perBond));
}

}  // namespace

Stats applyAttributeScaling(const Stats& base, const Attributes& attrs,
                            int32_t currentHp, int32_t currentMp,
                            const AttributeScalingTuning& tuning) {
    Stats out;
    out.maxHp = base.maxHp + attrs.vit * tuning.vitHpPerPoint;
    out.maxMp = base.maxMp + attrs.intel * tuning.intMpPerPoint;
    out.attack = base.attack + attrs.str * tuning.strAtkPerPoint;
    out.defense = base.defense;
    out.speed = base.speed + attrs.dex * tuning.dexSpeedPerPoint;
    out.SetHp(currentHp);
    out.SetMp(currentMp);
    return out;
}

Stats applyEnemyLevelScaling(const Stats& base, int32_t battleLevel,
                             const EnemyScalingTuning& tuning) {
    const int32_t level = std::max(0, battleLevel);
    return makeStats(base.maxHp + tuning.hpPerLevel * level,
                     base.maxMp,
                     base.attack + tuning.attackPerLevel * level,
                     base.defense + tuning.defensePerLevel * level,
                     base.speed + tuning.speedPerLevel * level);
}

Stats applySummonBondScaling(const Stats& base, int32_t ownerBond,
                             const BondScaling& scaling) {
    const int32_t bond = std::max(0, ownerBond);
    return makeStats(std::max(1, floorScaled(base.maxHp, bond, scaling.hpPerBond)),
                     base.maxMp,
                     std::max(0, floorScaled(base.attack, bond, scaling.attackPerBond)),
                     std::max(0, floorScaled(base.defense, bond, scaling.defensePerBond)),
                     std::max(0, floorScaled(base.speed, bond, scaling.speedPerBond)));
}

bool isElementalTag(std::string_view tag) {
    return std::find(kElementalTags.begin(), kElementalTags.end(), tag) != kElementalTags.end();
}

int32_t actionAttack(const Combatant& actor, ActionKind kind,
                     const std::vector<std::string>& skillTags,
                     const AttributeScalingTuning& tuning) {
    if (!actor.attributes || !actor.baseStats) {
        return actor.stats.attack;
    }

    const auto& attrs = *actor.attributes;
    const int32_t base = actor.baseStats->attack;
    const int32_t physical =
        (actor.HasWeaponTag(kFinesseTag) ? attrs.dex : attrs.str) * tuning.strAtkPerPoint;
    const int32_t magical = attrs.intel * tuning.intAtkPerPoint;

    if (kind == ActionKind::BasicAttack) {
        return base + physical;
    }

    const bool hasPhysical =
        std::find(skillTags.begin(), skillTags.end(), kPhysicalTag) != skillTags.end();
    const bool hasElemental = std::any_of(skillTags.begin(), skillTags.end(),
                                          [](const std::string& t) { return isElementalTag(t); });

    if (hasPhysical && hasElemental) {
        return base + (physical + magical) / 2;
    }
    if (hasPhysical) {
        return base + physical;
    }
    return base + magical;
}

}  // namespace tbc::game
