#include <gtest/gtest.h>

#include <cstdint>
#include <string>

#include "tbc/game/battle_events.hpp"
#include "tbc/service/battle_controller.hpp"
#include "tbc/service/battle_service.hpp"

#include "support/test_content.hpp"

using namespace tbc::game;
using namespace tbc::service;
using tbc::test::makeGameState;
using tbc::test::TestContent;

// =============================================================================
// Integration fixture: whole battles driven through the controller
// =============================================================================

namespace {

struct BattleRun {
    BattleState battle;
    BattleEvents events;
    GameState state;
};

GameState partyState(uint64_t seed) {
    auto state = makeGameState(seed);
    state.partyMembers = {"mira"};
    state.player->attributes.bond = 3;
    state.player->equippedSummons = {"wisp", "sprite"};
    state.inventory.Add("potion", 2);
    state.inventory.Add("weakening_dust", 1);
    return state;
}

/// Player policy: dust the first enemy once, heal when low, otherwise hit the
/// first living enemy.
BattleAction choosePlayerAction(const BattleState& battle, const GameState& state) {
    const Combatant* target = nullptr;
    for (const auto& enemy : battle.enemies) {
        if (enemy.IsAlive()) {
            target = &enemy;
            break;
        }
    }
    const Combatant* player = battle.FindCombatant(*battle.playerId);
    if (state.inventory.Count("weakening_dust") > 0 && target->debuffs.empty()) {
        return ItemAction{"weakening_dust", target->instanceId};
    }
    if (player->stats.hp < 15 && state.inventory.Count("potion") > 0) {
        return ItemAction{"potion", player->instanceId};
    }
    return AttackAction{target->instanceId};
}

void playOut(const BattleController& controller, BattleRun& run, int maxTurns) {
    for (int turn = 0; turn < maxTurns && !run.battle.isOver; ++turn) {
        auto step = [&]() -> tbc::foundation::GameResult<BattleEvents> {
            if (controller.isPlayerTurn(run.battle, run.state)) {
                return controller.applyPlayerAction(run.battle, run.state,
                                                    choosePlayerAction(run.battle, run.state));
            }
            if (controller.isAllyAiTurn(run.battle, run.state)) {
                return controller.runAllyAiTurn(run.battle, run.state.rng);
            }
            return controller.runEnemyTurn(run.battle, run.state.rng);
        }();
        ASSERT_TRUE(step.hasValue()) << step.error().message();
        appendEvents(run.events, std::move(step.value()));
    }
}

}  // namespace

class BattleDeterminismTest : public ::testing::Test {
protected:
    BattleRun startRun(uint64_t seed, const std::string& group = "mixed", int32_t level = 1) {
        BattleRun run{BattleState{}, BattleEvents{}, partyState(seed)};
        auto started = service_.startBattle(group, run.state, level);
        EXPECT_TRUE(started.hasValue());
        if (started.hasValue()) {
            run.battle = started.value().battle;
            run.events = started.value().events;
        }
        return run;
    }

    BattleRun fullRun(uint64_t seed) {
        auto run = startRun(seed);
        playOut(controller_, run, 200);
        if (run.battle.isOver) {
            appendEvents(run.events, controller_.applyVictoryRewards(run.battle, run.state));
        }
        return run;
    }

    TestContent content_;
    BattleService service_{content_.content};
    BattleController controller_{service_};
};

// =============================================================================
// Same seed, same battle
// =============================================================================

TEST_F(BattleDeterminismTest, SameSeedReplaysIdentically) {
    for (uint64_t seed : {0ull, 1ull, 42ull, 1234ull, 987654321ull, 0xdeadbeefull}) {
        SCOPED_TRACE("seed " + std::to_string(seed));
        auto first = fullRun(seed);
        auto second = fullRun(seed);

        ASSERT_TRUE(first.battle.isOver);
        EXPECT_EQ(first.events, second.events);
        EXPECT_EQ(first.battle, second.battle);
        EXPECT_EQ(first.state.rng, second.state.rng);
        EXPECT_EQ(first.state.gold, second.state.gold);
        EXPECT_EQ(first.state.inventory, second.state.inventory);
        EXPECT_EQ(first.state.knowledgeKills, second.state.knowledgeKills);
        EXPECT_EQ(first.state.memberLevels, second.state.memberLevels);
        for (const auto& id : first.battle.turnQueue) {
            const Combatant* c = first.battle.FindCombatant(id);
            ASSERT_NE(c, nullptr);
            EXPECT_TRUE(c->IsAlive()) << id;
        }
    }
}

TEST_F(BattleDeterminismTest, DifferentSeedsProduceDifferentIds) {
    auto first = startRun(1);
    auto second = startRun(2);
    EXPECT_NE(first.battle.battleId, second.battle.battleId);
}

TEST_F(BattleDeterminismTest, SetupEventsComeFirst) {
    auto run = startRun(77);
    ASSERT_GE(run.events.size(), 3u);
    EXPECT_EQ(eventName(run.events[0]), "battle_started");
    EXPECT_EQ(eventName(run.events[1]), "summon_spawned");
    EXPECT_EQ(eventName(run.events[2]), "summon_spawned");
    EXPECT_EQ(run.battle.allies.size(), 4u);
}

// =============================================================================
// Resuming from a saved RNG
// =============================================================================

TEST_F(BattleDeterminismTest, ResumedRngContinuesTheSameBattle) {
    auto original = startRun(99);
    playOut(controller_, original, 5);
    ASSERT_FALSE(original.battle.isOver);

    // Snapshot the battle and persist the RNG through JSON.
    BattleRun resumed{original.battle, BattleEvents{}, partyState(0)};
    resumed.state.inventory = original.state.inventory;
    ASSERT_TRUE(resumed.state.rng.importJson(original.state.rng.exportJson()).hasValue());

    BattleRun continued{original.battle, BattleEvents{}, partyState(0)};
    continued.state.inventory = original.state.inventory;
    continued.state.rng = original.state.rng;

    playOut(controller_, resumed, 200);
    playOut(controller_, continued, 200);

    EXPECT_EQ(resumed.events, continued.events);
    EXPECT_EQ(resumed.battle, continued.battle);
    EXPECT_EQ(resumed.state.rng, continued.state.rng);
}
