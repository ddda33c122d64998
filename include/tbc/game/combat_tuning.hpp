#pragma once

/// @file combat_tuning.hpp
/// @brief Game-balance constants, loadable from YAML.
///
/// None of these values is a correctness contract; they only shift the
/// numbers the engine produces. Every engine takes the block by const
/// reference so tests can pin the values they depend on.

#include <array>
#include <cstdint>

#include "tbc/foundation/config_manager.hpp"
#include "tbc/foundation/game_result.hpp"
#include "tbc/game/content.hpp"

namespace tbc::game {

struct ThreatTuning {
    int32_t baseDivisor = 5;        ///< base = max(1, (maxHp + def) / divisor)
    int32_t playerBaseBonus = 5;    ///< Extra base threat toward the player.
    int32_t hitBonus = 0;           ///< Flat threat added per damaging hit.
    int32_t antiRepeatIgnoreGap = 10;
};

struct DamageTuning {
    int32_t minimum = 1;
};

struct DebuffTuning {
    int32_t durationRounds = 2;
};

struct KnowledgeTuning {
    std::array<int32_t, kMaxKnowledgeTier> tierKills{25, 75, 150};
    int32_t staticRangePercent = 20;
};

struct ProgressionTuning {
    int32_t expBase = 10;
    int32_t expPerLevel = 5;
};

struct AttributeScalingTuning {
    int32_t vitHpPerPoint = 3;
    int32_t intMpPerPoint = 2;
    int32_t strAtkPerPoint = 1;
    int32_t dexSpeedPerPoint = 1;
    int32_t intAtkPerPoint = 1;
};

struct EnemyScalingTuning {
    int32_t hpPerLevel = 12;
    int32_t attackPerLevel = 2;
    int32_t defensePerLevel = 1;
    int32_t speedPerLevel = 1;
};

/// All tunables, with defaults matching the shipped config/combat.yaml.
struct CombatTuning {
    ThreatTuning threat;
    DamageTuning damage;
    DebuffTuning debuff;
    KnowledgeTuning knowledge;
    ProgressionTuning progression;
    AttributeScalingTuning scaling;
    EnemyScalingTuning enemyScaling;

    /// Overlay config keys on the defaults.
    ///
    /// Missing keys keep their default. Fails with ConfigTypeMismatch for a
    /// non-integer value and ConfigValueOutOfRange for a value the engine
    /// cannot work with (non-positive divisor, non-ascending thresholds...).
    static foundation::GameResult<CombatTuning> fromConfig(
        const foundation::ConfigManager& config);
};

}  // namespace tbc::game
