/// @file damage_resolver.cpp
/// @brief DamageResolver implementation.
///
/// Target validation runs in a fixed order so the same bad request always
/// yields the same error code. Estimates share the damage formula but
/// never touch guard, HP or threat.

#include "tbc/game/damage_resolver.hpp"

#include <algorithm>
#include <set>

#include "tbc/foundation/game_logger.hpp"
#include "tbc/game/debuff_engine.hpp"

namespace tbc::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

const std::vector<std::string> kNoTags;

}  // namespace

int32_t DamageResolver::EffectiveAttack(const Combatant& attacker, ActionKind kind,
                                        const std::vector<std::string>& skillTags) const {
    return DebuffEngine::EffectiveAttack(actionAttack(attacker, kind, skillTags, scaling_),
                                         attacker.debuffs);
}

int32_t DamageResolver::Estimate(int32_t effectiveAttack, int32_t power, const Combatant& target,
                                 int32_t minimum) {
    const int32_t defense = DebuffEngine::EffectiveDefense(target.stats.defense, target.debuffs);
    const int32_t raw = effectiveAttack + power - defense;
    return std::max(minimum, raw - std::max(0, target.guardReduction));
}

int32_t DamageResolver::EstimateAction(const Combatant& attacker, const Combatant& target,
                                       const SkillDef* skill) const {
    const auto kind = skill ? ActionKind::Skill : ActionKind::BasicAttack;
    const auto& tags = skill ? skill->tags : kNoTags;
    const int32_t power = skill ? skill->basePower : 0;
    return Estimate(EffectiveAttack(attacker, kind, tags), power, target, damage_.minimum);
}

HitOutcome DamageResolver::Apply(BattleState& battle, const Combatant& attacker, Combatant& target,
                                 const SkillDef* skill) const {
    HitOutcome outcome;
    outcome.damage = EstimateAction(attacker, target, skill);
    if (target.guardReduction > 0) {
        outcome.absorbed = target.guardReduction;
        target.guardReduction = 0;
    }

    const bool wasAlive = target.IsAlive();
    target.SetHp(target.stats.hp - outcome.damage);
    outcome.defeated = wasAlive && !target.IsAlive();
    threat_.RecordDamage(battle, attacker, target, outcome.damage);

    if (foundation::GameLogger::instance().isEnabled(LogLevel::Debug, LogCategory::Combat)) {
        LogContext ctx;
        ctx.battleId = battle.battleId;
        ctx.actorId = attacker.instanceId;
        ctx.targetId = target.instanceId;
        ctx.extra["damage"] = std::to_string(outcome.damage);
        ctx.extra["absorbed"] = std::to_string(outcome.absorbed);
        ctx.extra["hp"] = std::to_string(target.stats.hp);
        if (skill) {
            ctx.extra["skill"] = skill->id;
        }
        foundation::GameLogger::instance().logWithContext(
            LogLevel::Debug, LogCategory::Combat, "hit resolved", ctx);
    }
    return outcome;
}

GameResult<std::vector<std::string>> DamageResolver::ValidateSkillTargets(
    const BattleState& battle, const Combatant& attacker, const SkillDef& skill,
    const std::vector<std::string>& targetIds) const {
    using R = GameResult<std::vector<std::string>>;

    switch (skill.targetMode) {
        case SkillTargetMode::Self:
            return R::ok({});
        case SkillTargetMode::SingleEnemy:
            if (targetIds.size() != 1) {
                return R::err(GameError(ErrorCode::TargetCountOutOfRange,
                                        skill.id + " needs exactly one target"));
            }
            break;
        case SkillTargetMode::MultiEnemy:
            if (targetIds.empty() ||
                targetIds.size() > static_cast<std::size_t>(std::max(skill.maxTargets, 1))) {
                return R::err(GameError(ErrorCode::TargetCountOutOfRange,
                                        skill.id + " takes 1 to " +
                                            std::to_string(std::max(skill.maxTargets, 1)) + " targets"));
            }
            break;
        case SkillTargetMode::Unknown:
            return R::err(GameError(ErrorCode::InvalidAction,
                                    skill.id + " has an unsupported target mode"));
    }

    std::set<std::string> seen;
    for (const auto& id : targetIds) {
        const Combatant* target = battle.FindCombatant(id);
        if (target == nullptr) {
            return R::err(GameError(ErrorCode::CombatantNotFound, "no combatant with id " + id));
        }
        if (target->side == attacker.side) {
            return R::err(GameError(ErrorCode::TargetWrongSide, id + " is not an enemy"));
        }
        if (!target->IsAlive()) {
            return R::err(GameError(ErrorCode::TargetNotAlive, id + " is already defeated"));
        }
        if (!seen.insert(id).second) {
            return R::err(GameError(ErrorCode::DuplicateTarget, id + " targeted twice"));
        }
    }
    return R::ok(targetIds);
}

}  // namespace tbc::game
