#pragma once

/// @file damage_resolver.hpp
/// @brief Damage math, guard absorption and skill target validation.

#include <cstdint>
#include <string>
#include <vector>

#include "tbc/foundation/game_result.hpp"
#include "tbc/game/battle_state.hpp"
#include "tbc/game/combat_tuning.hpp"
#include "tbc/game/combatant.hpp"
#include "tbc/game/content.hpp"
#include "tbc/game/stat_scaling.hpp"
#include "tbc/game/threat_engine.hpp"

namespace tbc::game {

/// What one resolved hit did.
struct HitOutcome {
    int32_t damage = 0;
    int32_t absorbed = 0;   ///< Guard consumed by this hit.
    bool defeated = false;  ///< The hit took the target to 0 HP.
};

/// Computes and applies damage.
///
/// damage = max(minimum, effectiveAttack + power - effectiveDefense - guard)
///
/// effectiveAttack starts from actionAttack() and loses attack_down
/// penalties; effectiveDefense loses defense_down penalties. The estimate
/// functions share this math and never mutate anything or draw from the RNG.
class DamageResolver {
public:
    DamageResolver(const DamageTuning& damage, const AttributeScalingTuning& scaling,
                   const ThreatEngine& threat)
        : damage_(damage), scaling_(scaling), threat_(threat) {}

    /// Action attack after debuffs.
    [[nodiscard]] int32_t EffectiveAttack(const Combatant& attacker, ActionKind kind,
                                          const std::vector<std::string>& skillTags) const;

    /// Pure damage computation.
    [[nodiscard]] static int32_t Estimate(int32_t effectiveAttack, int32_t power,
                                          const Combatant& target, int32_t minimum);

    /// Damage @p attacker would deal to @p target with @p skill, or with a
    /// basic attack when @p skill is null.
    [[nodiscard]] int32_t EstimateAction(const Combatant& attacker, const Combatant& target,
                                         const SkillDef* skill) const;

    /// Resolve one hit: consume guard, lower HP, record threat.
    HitOutcome Apply(BattleState& battle, const Combatant& attacker, Combatant& target,
                     const SkillDef* skill) const;

    /// Check @p targetIds against the skill's target mode before anything
    /// is mutated. Returns the ids to resolve (empty for self skills).
    foundation::GameResult<std::vector<std::string>> ValidateSkillTargets(
        const BattleState& battle, const Combatant& attacker, const SkillDef& skill,
        const std::vector<std::string>& targetIds) const;

    [[nodiscard]] int32_t Minimum() const noexcept { return damage_.minimum; }

private:
    DamageTuning damage_;
    AttributeScalingTuning scaling_;
    const ThreatEngine& threat_;
};

}  // namespace tbc::game
