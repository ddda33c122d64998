#pragma once

/// @file battle_service.hpp
/// @brief BattleService: the orchestrator behind every battle operation.
///
/// BattleService composes the game-layer engines (turn scheduler, threat,
/// debuffs, knowledge, damage, summons, rewards) into the operations the
/// controller exposes. It owns no battle: every call receives the
/// BattleState and GameState it works on, and every call that needs
/// randomness draws from the Rng it is handed.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tbc/foundation/game_result.hpp"
#include "tbc/game/battle_events.hpp"
#include "tbc/game/battle_state.hpp"
#include "tbc/game/combat_tuning.hpp"
#include "tbc/game/content.hpp"
#include "tbc/game/game_state.hpp"
#include "tbc/game/rng.hpp"
#include "tbc/service/battle_types.hpp"

namespace tbc::service {

/// Deterministic battle orchestrator.
///
/// Usage:
/// @code
///   BattleService service(content, tuning);
///   auto start = service.startBattle("goblin_pack", state);
///   if (!start) { report(start.error()); return; }
///   auto& battle = start.value().battle;
///
///   auto events = service.basicAttack(battle, state.player->id, targetId);
///   if (!events) { reprompt(events.error().message()); }
/// @endcode
///
/// Actions validate everything before they mutate anything: a returned
/// error means BattleState, GameState and the Rng are exactly as they were.
class BattleService {
public:
    BattleService(const game::CombatContent& content, game::CombatTuning tuning = {});
    ~BattleService();

    BattleService(const BattleService&) = delete;
    BattleService& operator=(const BattleService&) = delete;
    BattleService(BattleService&&) noexcept;
    BattleService& operator=(BattleService&&) noexcept;

    // -- Setup ----------------------------------------------------------------

    /// Start a battle against an enemy id or an enemy group id.
    ///
    /// Every referenced definition is looked up before the first RNG draw,
    /// so a FactoryFailed result leaves @p state untouched.
    [[nodiscard]] foundation::GameResult<BattleStart> startBattle(
        const std::string& enemyOrGroupId, game::GameState& state, int32_t battleLevel = 0) const;

    // -- Actions --------------------------------------------------------------

    [[nodiscard]] foundation::GameResult<game::BattleEvents> basicAttack(
        game::BattleState& battle, const std::string& attackerId,
        const std::string& targetId) const;

    /// Use a skill. Insufficient MP yields a single SkillFailed event and
    /// leaves the turn with the same actor.
    [[nodiscard]] foundation::GameResult<game::BattleEvents> useSkill(
        game::BattleState& battle, const std::string& attackerId, const std::string& skillId,
        const std::vector<std::string>& targetIds) const;

    /// Consume one unit of a consumable from the shared inventory.
    [[nodiscard]] foundation::GameResult<game::BattleEvents> useItem(
        game::BattleState& battle, game::GameState& state, const std::string& actorId,
        const std::string& itemId, const std::string& targetId) const;

    /// Spend @p actorId's turn on @p speakerId sharing what it knows about
    /// the enemies. Recognised keys are revealed for this battle only.
    /// The speaker must be a living ally that is not a summon.
    [[nodiscard]] foundation::GameResult<game::BattleEvents> partyTalk(
        game::BattleState& battle, const std::string& actorId,
        const std::string& speakerId) const;

    /// The lines partyTalk() would produce, without any mutation.
    [[nodiscard]] foundation::GameResult<std::vector<std::string>> partyTalkPreview(
        const game::BattleState& battle, const std::string& speakerId) const;

    // -- AI -------------------------------------------------------------------

    /// Let the current enemy pick a target by threat and act on it.
    [[nodiscard]] foundation::GameResult<game::BattleEvents> runEnemyTurn(
        game::BattleState& battle, game::Rng& rng) const;

    /// Let a non-player ally pick a skill or a basic attack.
    [[nodiscard]] foundation::GameResult<game::BattleEvents> runAllyAiTurn(
        game::BattleState& battle, const std::string& actorId, game::Rng& rng) const;

    // -- Queries --------------------------------------------------------------

    [[nodiscard]] foundation::GameResult<std::vector<game::SkillDef>> availableSkills(
        const game::BattleState& battle, const std::string& combatantId) const;

    /// Consumables with quantity > 0, in item id order.
    [[nodiscard]] std::vector<BattleItem> battleItems(const game::GameState& state) const;

    /// Damage @p attackerId would deal to @p targetId; a basic attack when
    /// @p skillId is empty. Mutates nothing and draws nothing.
    [[nodiscard]] foundation::GameResult<int32_t> estimateDamage(
        const game::BattleState& battle, const std::string& attackerId,
        const std::string& targetId, const std::optional<std::string>& skillId = std::nullopt) const;

    [[nodiscard]] BattleView battleView(const game::BattleState& battle) const;

    [[nodiscard]] bool hasKnowledgeOfEnemy(const game::GameState& state,
                                           const std::vector<std::string>& enemyTags) const;

    // -- Bookkeeping ----------------------------------------------------------

    /// Recompute the knowledge snapshot from the current kill counters.
    void refreshKnowledgeSnapshot(game::BattleState& battle, const game::GameState& state) const;

    /// Pay out a won battle once; later calls return no events.
    game::BattleEvents applyVictoryRewards(game::BattleState& battle, game::GameState& state) const;

    void recordDefeat(const game::BattleState& battle, game::GameState& state) const;

    [[nodiscard]] const game::CombatTuning& tuning() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace tbc::service
