#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <variant>
#include <vector>

#include "tbc/foundation/error_code.hpp"
#include "tbc/game/summon_spawner.hpp"

#include "support/test_content.hpp"

using namespace tbc::game;
using tbc::foundation::ErrorCode;
using tbc::test::makeCombatant;
using tbc::test::makeGameState;
using tbc::test::TestContent;

class SummonSpawnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        battle_.battleId = "battle_000005";
        battle_.playerId = "player";
        battle_.allies.push_back(makeCombatant("player", Side::Allies, makeStats(40, 10, 6, 3, 8)));
        battle_.enemies.push_back(makeCombatant("enemy_1", Side::Enemies, makeStats(20, 0, 6, 2, 5)));
        threat_.InitializeThreat(battle_);
        scheduler_.InitializeTurnOrder(battle_);
    }

    TestContent content_;
    DebuffEngine debuffs_{DebuffTuning{}};
    TurnScheduler scheduler_{debuffs_};
    ThreatEngine threat_{ThreatTuning{}};
    SummonSpawner spawner_{content_.content, threat_, scheduler_};
    BattleState battle_;
    GameState state_ = makeGameState();
};

TEST_F(SummonSpawnerTest, OwnersArePlayerThenParty) {
    state_.player->attributes.bond = 2;
    state_.player->equippedSummons = {"wisp"};
    state_.partyMembers = {"mira"};
    state_.partyMemberAttributes["mira"].bond = 1;
    state_.partySummonLoadouts["mira"] = {"sprite"};

    auto owners = SummonSpawner::Owners(state_);
    ASSERT_EQ(owners.size(), 2u);
    EXPECT_EQ(owners[0].combatantId, "player");
    EXPECT_EQ(owners[0].bond, 2);
    EXPECT_EQ(owners[1].combatantId, "party_mira");
    EXPECT_EQ(owners[1].loadout, (std::vector<std::string>{"sprite"}));
}

TEST_F(SummonSpawnerTest, BondCapStopsAtFirstUnaffordable) {
    state_.player->attributes.bond = 4;
    state_.player->equippedSummons = {"wisp", "golem", "sprite"};

    auto events = spawner_.SpawnEquipped(battle_, state_);
    ASSERT_TRUE(events.hasValue());
    ASSERT_EQ(events.value().size(), 1u);

    const auto& spawned = std::get<SummonSpawned>(events.value()[0]);
    EXPECT_EQ(spawned.ownerId, "player");
    EXPECT_EQ(spawned.summonId, "wisp");
    EXPECT_EQ(spawned.bondCost, 2);
    EXPECT_EQ(spawned.ownerBond, 4);
    EXPECT_EQ(spawned.scaledStats.maxHp, 14);
    EXPECT_EQ(spawned.scaledStats.attack, 5);
    EXPECT_EQ(battle_.allies.size(), 2u);
}

TEST_F(SummonSpawnerTest, SummonJoinsTablesAndQueue) {
    state_.player->attributes.bond = 1;
    state_.player->equippedSummons = {"sprite"};

    auto events = spawner_.SpawnEquipped(battle_, state_);
    ASSERT_TRUE(events.hasValue());

    const auto& summon = battle_.allies.back();
    EXPECT_EQ(summon.instanceId.rfind("summon_", 0), 0u);
    EXPECT_EQ(summon.tags, (std::vector<std::string>{"summon", "fey"}));
    EXPECT_EQ(summon.ownerId, "player");
    EXPECT_EQ(summon.bondCost, 1);
    EXPECT_EQ(summon.sourceId, "sprite");
    EXPECT_TRUE(summon.IsSummon());

    EXPECT_EQ(battle_.enemyAggro["enemy_1"].count(summon.instanceId), 1u);
    EXPECT_NE(std::find(battle_.turnQueue.begin(), battle_.turnQueue.end(), summon.instanceId),
              battle_.turnQueue.end());
}

TEST_F(SummonSpawnerTest, NoBondOrEmptyLoadoutSpawnsNothing) {
    state_.player->equippedSummons = {"wisp"};
    auto events = spawner_.SpawnEquipped(battle_, state_);
    ASSERT_TRUE(events.hasValue());
    EXPECT_TRUE(events.value().empty());
    EXPECT_EQ(state_.rng.drawCount(), 0u);
}

TEST_F(SummonSpawnerTest, PartyOwnerMustBePresent) {
    state_.partyMembers = {"mira"};
    state_.partyMemberAttributes["mira"].bond = 2;
    state_.partySummonLoadouts["mira"] = {"sprite"};

    auto events = spawner_.SpawnEquipped(battle_, state_);
    ASSERT_TRUE(events.hasError());
    EXPECT_EQ(events.error().code(), ErrorCode::SummonOwnerMissing);
}

TEST_F(SummonSpawnerTest, PartyOwnerSpawnsUnderPrefixedId) {
    battle_.allies.push_back(makeCombatant("party_mira", Side::Allies, makeStats(24, 10, 3, 1, 6)));
    state_.partyMembers = {"mira"};
    state_.partyMemberAttributes["mira"].bond = 2;
    state_.partySummonLoadouts["mira"] = {"sprite", "sprite"};

    auto events = spawner_.SpawnEquipped(battle_, state_);
    ASSERT_TRUE(events.hasValue());
    ASSERT_EQ(events.value().size(), 2u);
    EXPECT_EQ(std::get<SummonSpawned>(events.value()[1]).ownerId, "party_mira");
    EXPECT_NE(battle_.allies[2].instanceId, battle_.allies[3].instanceId);
}

TEST_F(SummonSpawnerTest, UnknownSummonFailsValidationWithoutDrawing) {
    state_.player->equippedSummons = {"wisp", "dragon"};
    auto valid = spawner_.ValidateLoadouts(state_);
    ASSERT_TRUE(valid.hasError());
    EXPECT_EQ(valid.error().code(), ErrorCode::FactoryFailed);
    EXPECT_EQ(state_.rng.drawCount(), 0u);
}

TEST_F(SummonSpawnerTest, KnownLoadoutsValidate) {
    state_.player->equippedSummons = {"wisp", "golem"};
    EXPECT_TRUE(spawner_.ValidateLoadouts(state_).hasValue());
}
