#pragma once

/// @file battle_controller.hpp
/// @brief I/O-free façade between a battle and the presentation layer.
///
/// The controller answers "whose turn is it and what can they do", applies
/// decisions and returns events. Rendering, prompting and formatting stay
/// with the caller.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "tbc/foundation/game_result.hpp"
#include "tbc/game/battle_events.hpp"
#include "tbc/game/battle_state.hpp"
#include "tbc/game/game_state.hpp"
#include "tbc/game/rng.hpp"
#include "tbc/service/battle_service.hpp"
#include "tbc/service/battle_types.hpp"

namespace tbc::service {

/// Usage:
/// @code
///   BattleController controller(service);
///   while (!battle.isOver) {
///       if (controller.isPlayerTurn(battle, state)) {
///           auto events = controller.applyPlayerAction(battle, state, AttackAction{targetId});
///       } else if (controller.isAllyAiTurn(battle, state)) {
///           auto events = controller.runAllyAiTurn(battle, state.rng);
///       } else {
///           auto events = controller.runEnemyTurn(battle, state.rng);
///       }
///   }
///   auto rewards = controller.applyVictoryRewards(battle, state);
/// @endcode
class BattleController {
public:
    explicit BattleController(const BattleService& service) : service_(service) {}

    // -- Turn kind ------------------------------------------------------------

    [[nodiscard]] bool isPlayerTurn(const game::BattleState& battle,
                                    const game::GameState& state) const;

    /// A living ally other than the player holds the turn.
    [[nodiscard]] bool isAllyAiTurn(const game::BattleState& battle,
                                    const game::GameState& state) const;

    [[nodiscard]] bool isEnemyTurn(const game::BattleState& battle) const;

    // -- Decisions ------------------------------------------------------------

    /// Menu for the current actor; everything false when nobody holds the turn.
    [[nodiscard]] AvailableActions availableActions(const game::BattleState& battle,
                                                    const game::GameState& state) const;

    /// Apply a player decision on behalf of the current actor.
    [[nodiscard]] foundation::GameResult<game::BattleEvents> applyPlayerAction(
        game::BattleState& battle, game::GameState& state, const BattleAction& action) const;

    [[nodiscard]] foundation::GameResult<game::BattleEvents> runAllyAiTurn(
        game::BattleState& battle, game::Rng& rng) const;

    [[nodiscard]] foundation::GameResult<game::BattleEvents> runEnemyTurn(
        game::BattleState& battle, game::Rng& rng) const;

    /// Full state panel on the first turn and on every player turn.
    [[nodiscard]] bool shouldRenderStatePanel(const game::BattleState& battle,
                                              const game::GameState& state,
                                              bool isFirstTurn) const;

    // -- Pass-throughs --------------------------------------------------------

    [[nodiscard]] BattleView battleView(const game::BattleState& battle) const {
        return service_.battleView(battle);
    }

    void refreshKnowledgeSnapshot(game::BattleState& battle, const game::GameState& state) const {
        service_.refreshKnowledgeSnapshot(battle, state);
    }

    game::BattleEvents applyVictoryRewards(game::BattleState& battle, game::GameState& state) const {
        return service_.applyVictoryRewards(battle, state);
    }

    [[nodiscard]] foundation::GameResult<std::vector<std::string>> partyTalkPreview(
        const game::BattleState& battle, const std::string& speakerId) const {
        return service_.partyTalkPreview(battle, speakerId);
    }

    [[nodiscard]] bool hasKnowledgeOfEnemy(const game::GameState& state,
                                           const std::vector<std::string>& enemyTags) const {
        return service_.hasKnowledgeOfEnemy(state, enemyTags);
    }

    [[nodiscard]] foundation::GameResult<int32_t> estimateDamage(
        const game::BattleState& battle, const std::string& attackerId,
        const std::string& targetId,
        const std::optional<std::string>& skillId = std::nullopt) const {
        return service_.estimateDamage(battle, attackerId, targetId, skillId);
    }

private:
    const BattleService& service_;
};

}  // namespace tbc::service
