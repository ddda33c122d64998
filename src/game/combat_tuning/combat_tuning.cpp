/// @file combat_tuning.cpp
/// @brief CombatTuning overlay from ConfigManager keys.

#include "tbc/game/combat_tuning.hpp"

#include <string>

#include "tbc/foundation/game_logger.hpp"

namespace tbc::game {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

/// Read one integer key into @p target, leaving it untouched when absent.
GameResult<void> overlay(const ConfigManager& config, const char* key,
                         int32_t& target, int32_t minValue) {
    auto value = config.getOr<int32_t>(key, target);
    if (!value) {
        return value.propagate<void>();
    }
    if (value.value() < minValue) {
        return GameResult<void>::err(GameError(
            ErrorCode::ConfigValueOutOfRange,
            std::string(key) + " must be >= " + std::to_string(minValue)));
    }
    target = value.value();
    return GameResult<void>::ok();
}

}  // namespace

GameResult<CombatTuning> CombatTuning::fromConfig(const ConfigManager& config) {
    CombatTuning t;

    struct Binding {
        const char* key;
        int32_t* target;
        int32_t minValue;
    };
    const Binding bindings[] = {
        {"threat.base_divisor", &t.threat.baseDivisor, 1},
        {"threat.player_base_bonus", &t.threat.playerBaseBonus, 0},
        {"threat.hit_bonus", &t.threat.hitBonus, 0},
        {"threat.anti_repeat_ignore_gap", &t.threat.antiRepeatIgnoreGap, 0},
        {"damage.minimum", &t.damage.minimum, 0},
        {"debuff.duration_rounds", &t.debuff.durationRounds, 1},
        {"knowledge.tier1_kills", &t.knowledge.tierKills[0], 1},
        {"knowledge.tier2_kills", &t.knowledge.tierKills[1], 1},
        {"knowledge.tier3_kills", &t.knowledge.tierKills[2], 1},
        {"knowledge.static_range_percent", &t.knowledge.staticRangePercent, 0},
        {"progression.exp_base", &t.progression.expBase, 1},
        {"progression.exp_per_level", &t.progression.expPerLevel, 0},
        {"scaling.vit_hp_per_point", &t.scaling.vitHpPerPoint, 0},
        {"scaling.int_mp_per_point", &t.scaling.intMpPerPoint, 0},
        {"scaling.str_atk_per_point", &t.scaling.strAtkPerPoint, 0},
        {"scaling.dex_speed_per_point", &t.scaling.dexSpeedPerPoint, 0},
        {"scaling.int_atk_per_point", &t.scaling.intAtkPerPoint, 0},
        {"enemy_scaling.hp_per_level", &t.enemyScaling.hpPerLevel, 0},
        {"enemy_scaling.attack_per_level", &t.enemyScaling.attackPerLevel, 0},
        {"enemy_scaling.defense_per_level", &t.enemyScaling.defensePerLevel, 0},
        {"enemy_scaling.speed_per_level", &t.enemyScaling.speedPerLevel, 0},
    };

    for (const auto& b : bindings) {
        auto applied = overlay(config, b.key, *b.target, b.minValue);
        if (!applied) {
            TBC_LOG_ERROR(LogCategory::Core,
                          "combat tuning rejected: " + std::string(applied.error().message()));
            return applied.propagate<CombatTuning>();
        }
    }

    const auto& kills = t.knowledge.tierKills;
    if (!(kills[0] < kills[1] && kills[1] < kills[2])) {
        return GameResult<CombatTuning>::err(GameError(
            ErrorCode::ConfigValueOutOfRange,
            "knowledge tier thresholds must be strictly ascending"));
    }

    return GameResult<CombatTuning>::ok(t);
}

}  // namespace tbc::game
