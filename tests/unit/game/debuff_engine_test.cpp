#include <gtest/gtest.h>

#include <variant>
#include <vector>

#include "tbc/game/debuff_engine.hpp"

#include "support/test_content.hpp"

using namespace tbc::game;
using tbc::test::makeCombatant;

// ═══════════════════════════════════════════════════════════════════════════
// Application
// ═══════════════════════════════════════════════════════════════════════════

TEST(DebuffEngineTest, SameTypeDoesNotStack) {
    auto goblin = makeCombatant("enemy_1", Side::Enemies, makeStats(20, 0, 6, 2, 5));
    EXPECT_TRUE(DebuffEngine::ApplyNoStack(goblin, DebuffType::AttackDown, 2, 3));
    EXPECT_FALSE(DebuffEngine::ApplyNoStack(goblin, DebuffType::AttackDown, 5, 4));

    ASSERT_EQ(goblin.debuffs.size(), 1u);
    EXPECT_EQ(goblin.debuffs[0].amount, 2);
    EXPECT_EQ(goblin.debuffs[0].expiresAtRound, 3);
}

TEST(DebuffEngineTest, DifferentTypesCoexist) {
    auto goblin = makeCombatant("enemy_1", Side::Enemies, makeStats(20, 0, 6, 2, 5));
    EXPECT_TRUE(DebuffEngine::ApplyNoStack(goblin, DebuffType::AttackDown, 2, 3));
    EXPECT_TRUE(DebuffEngine::ApplyNoStack(goblin, DebuffType::DefenseDown, 1, 3));
    EXPECT_EQ(goblin.debuffs.size(), 2u);
}

TEST(DebuffEngineTest, DeadTargetRejected) {
    auto goblin = makeCombatant("enemy_1", Side::Enemies, makeStats(20, 0, 6, 2, 5));
    goblin.SetHp(0);
    EXPECT_FALSE(DebuffEngine::ApplyNoStack(goblin, DebuffType::AttackDown, 2, 3));
    EXPECT_TRUE(goblin.debuffs.empty());
}

TEST(DebuffEngineTest, DeathClearsDebuffs) {
    auto goblin = makeCombatant("enemy_1", Side::Enemies, makeStats(20, 0, 6, 2, 5));
    ASSERT_TRUE(DebuffEngine::ApplyNoStack(goblin, DebuffType::AttackDown, 2, 3));
    goblin.SetHp(0);
    EXPECT_TRUE(goblin.debuffs.empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// Effective stats
// ═══════════════════════════════════════════════════════════════════════════

TEST(DebuffEngineTest, EffectiveAttackFlooredAtOne) {
    std::vector<ActiveDebuff> debuffs{{DebuffType::AttackDown, 2, 3}};
    EXPECT_EQ(DebuffEngine::EffectiveAttack(6, debuffs), 4);
    EXPECT_EQ(DebuffEngine::EffectiveAttack(2, debuffs), 1);
    EXPECT_EQ(DebuffEngine::EffectiveAttack(6, {}), 6);
}

TEST(DebuffEngineTest, EffectiveDefenseFlooredAtZero) {
    std::vector<ActiveDebuff> debuffs{{DebuffType::DefenseDown, 3, 3},
                                      {DebuffType::AttackDown, 9, 3}};
    EXPECT_EQ(DebuffEngine::EffectiveDefense(5, debuffs), 2);
    EXPECT_EQ(DebuffEngine::EffectiveDefense(1, debuffs), 0);
}

TEST(DebuffEngineTest, ExpiryRoundAddsDuration) {
    DebuffEngine engine(DebuffTuning{});
    BattleState battle;
    battle.roundIndex = 4;
    EXPECT_EQ(engine.ExpiryRound(battle), 6);
}

// ═══════════════════════════════════════════════════════════════════════════
// Expiry
// ═══════════════════════════════════════════════════════════════════════════

TEST(DebuffEngineTest, ExpireRemovesDueDebuffsOnly) {
    DebuffEngine engine(DebuffTuning{});
    BattleState battle;
    battle.roundIndex = 3;
    auto goblin = makeCombatant("enemy_1", Side::Enemies, makeStats(20, 0, 6, 2, 5));
    goblin.debuffs = {{DebuffType::AttackDown, 2, 3}, {DebuffType::DefenseDown, 1, 4}};
    battle.enemies.push_back(goblin);

    auto events = engine.ExpireDebuffs(battle);
    ASSERT_EQ(events.size(), 1u);
    const auto& expired = std::get<DebuffExpired>(events[0]);
    EXPECT_EQ(expired.targetId, "enemy_1");
    EXPECT_EQ(expired.type, DebuffType::AttackDown);

    const auto& remaining = battle.FindCombatant("enemy_1")->debuffs;
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].type, DebuffType::DefenseDown);
}

TEST(DebuffEngineTest, DeadCombatantsReportNothing) {
    DebuffEngine engine(DebuffTuning{});
    BattleState battle;
    battle.roundIndex = 5;
    auto fallen = makeCombatant("enemy_1", Side::Enemies, makeStats(20, 0, 6, 2, 5));
    fallen.stats.hp = 0;
    fallen.debuffs = {{DebuffType::AttackDown, 2, 5}};
    battle.enemies.push_back(fallen);

    EXPECT_TRUE(engine.ExpireDebuffs(battle).empty());
    EXPECT_TRUE(battle.FindCombatant("enemy_1")->debuffs.empty());
}
