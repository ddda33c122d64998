/// @file battle_controller.cpp
/// @brief BattleController turn classification and action dispatch.

#include "tbc/service/battle_controller.hpp"

#include <type_traits>
#include <variant>

#include "tbc/foundation/error_code.hpp"
#include "tbc/foundation/game_error.hpp"

namespace tbc::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

bool BattleController::isPlayerTurn(const game::BattleState& battle,
                                    const game::GameState& state) const {
    return state.player && battle.currentActorId && *battle.currentActorId == state.player->id;
}

bool BattleController::isAllyAiTurn(const game::BattleState& battle,
                                    const game::GameState& state) const {
    if (!battle.currentActorId || isPlayerTurn(battle, state)) {
        return false;
    }
    const auto* actor = battle.FindCombatant(*battle.currentActorId);
    return actor != nullptr && actor->side == game::Side::Allies;
}

bool BattleController::isEnemyTurn(const game::BattleState& battle) const {
    if (!battle.currentActorId) {
        return false;
    }
    const auto* actor = battle.FindCombatant(*battle.currentActorId);
    return actor != nullptr && actor->side == game::Side::Enemies;
}

AvailableActions BattleController::availableActions(const game::BattleState& battle,
                                                    const game::GameState& state) const {
    AvailableActions actions;
    if (!battle.currentActorId || battle.isOver) {
        return actions;
    }
    auto skills = service_.availableSkills(battle, *battle.currentActorId);
    if (skills.hasValue()) {
        actions.skills = std::move(skills.value());
    }
    actions.items = service_.battleItems(state);
    actions.canAttack = true;
    actions.canUseSkill = !actions.skills.empty();
    actions.canUseItem = !actions.items.empty();
    actions.canTalk = !state.partyMembers.empty();
    return actions;
}

GameResult<game::BattleEvents> BattleController::applyPlayerAction(game::BattleState& battle,
                                                                   game::GameState& state,
                                                                   const BattleAction& action) const {
    if (!battle.currentActorId) {
        return GameResult<game::BattleEvents>::err(
            GameError(ErrorCode::NoCurrentActor, "no combatant holds the turn"));
    }
    const std::string actorId = *battle.currentActorId;

    return std::visit(
        [&](const auto& a) -> GameResult<game::BattleEvents> {
            using T = std::decay_t<decltype(a)>;
            if constexpr (std::is_same_v<T, AttackAction>) {
                return service_.basicAttack(battle, actorId, a.targetId);
            } else if constexpr (std::is_same_v<T, SkillAction>) {
                return service_.useSkill(battle, actorId, a.skillId, a.targetIds);
            } else if constexpr (std::is_same_v<T, TalkAction>) {
                return service_.partyTalk(battle, actorId, a.speakerId);
            } else {
                return service_.useItem(battle, state, actorId, a.itemId, a.targetId);
            }
        },
        action);
}

GameResult<game::BattleEvents> BattleController::runAllyAiTurn(game::BattleState& battle,
                                                               game::Rng& rng) const {
    if (!battle.currentActorId) {
        return GameResult<game::BattleEvents>::ok({});
    }
    const std::string actorId = *battle.currentActorId;
    return service_.runAllyAiTurn(battle, actorId, rng);
}

GameResult<game::BattleEvents> BattleController::runEnemyTurn(game::BattleState& battle,
                                                              game::Rng& rng) const {
    return service_.runEnemyTurn(battle, rng);
}

bool BattleController::shouldRenderStatePanel(const game::BattleState& battle,
                                              const game::GameState& state,
                                              bool isFirstTurn) const {
    return isFirstTurn || isPlayerTurn(battle, state);
}

}  // namespace tbc::service
