#include <gtest/gtest.h>

#include "tbc/game/stat_scaling.hpp"

#include "support/test_content.hpp"

using namespace tbc::game;
using tbc::test::makeCombatant;

// ═══════════════════════════════════════════════════════════════════════════
// Attribute scaling
// ═══════════════════════════════════════════════════════════════════════════

TEST(AttributeScalingTest, AttributesFeedStats) {
    const auto base = makeStats(20, 10, 5, 2, 4);
    Attributes attrs;
    attrs.str = 2;
    attrs.dex = 3;
    attrs.intel = 1;
    attrs.vit = 4;

    auto scaled = applyAttributeScaling(base, attrs, 15, 3, AttributeScalingTuning{});
    EXPECT_EQ(scaled.maxHp, 32);
    EXPECT_EQ(scaled.maxMp, 12);
    EXPECT_EQ(scaled.attack, 7);
    EXPECT_EQ(scaled.defense, 2);
    EXPECT_EQ(scaled.speed, 7);
    EXPECT_EQ(scaled.hp, 15);
    EXPECT_EQ(scaled.mp, 3);
}

TEST(AttributeScalingTest, CurrentPoolsClampToNewMaxima) {
    auto scaled = applyAttributeScaling(makeStats(20, 4, 1, 1, 1), Attributes{}, 99, -5,
                                        AttributeScalingTuning{});
    EXPECT_EQ(scaled.hp, 20);
    EXPECT_EQ(scaled.mp, 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// Enemy level scaling
// ═══════════════════════════════════════════════════════════════════════════

TEST(EnemyLevelScalingTest, AddsPerLevelAndStartsFull) {
    auto scaled = applyEnemyLevelScaling(makeStats(20, 3, 6, 2, 5), 2, EnemyScalingTuning{});
    EXPECT_EQ(scaled.maxHp, 44);
    EXPECT_EQ(scaled.hp, 44);
    EXPECT_EQ(scaled.maxMp, 3);
    EXPECT_EQ(scaled.mp, 3);
    EXPECT_EQ(scaled.attack, 10);
    EXPECT_EQ(scaled.defense, 4);
    EXPECT_EQ(scaled.speed, 7);
}

TEST(EnemyLevelScalingTest, NegativeLevelActsAsZero) {
    const auto base = makeStats(20, 0, 6, 2, 5);
    EXPECT_EQ(applyEnemyLevelScaling(base, -3, EnemyScalingTuning{}), base);
}

// ═══════════════════════════════════════════════════════════════════════════
// Summon bond scaling
// ═══════════════════════════════════════════════════════════════════════════

TEST(SummonBondScalingTest, FlooredOncePerStat) {
    BondScaling scaling{1.0, 0.5, 0.0, 0.34};
    auto scaled = applySummonBondScaling(makeStats(10, 2, 3, 1, 4), 3, scaling);
    EXPECT_EQ(scaled.maxHp, 13);
    EXPECT_EQ(scaled.hp, 13);
    EXPECT_EQ(scaled.attack, 4);
    EXPECT_EQ(scaled.defense, 1);
    EXPECT_EQ(scaled.speed, 5);
    EXPECT_EQ(scaled.maxMp, 2);
}

TEST(SummonBondScalingTest, FloorsKeepStatsUsable) {
    BondScaling scaling{-1.0, -1.0, -1.0, -1.0};
    auto scaled = applySummonBondScaling(makeStats(2, 0, 1, 1, 1), 5, scaling);
    EXPECT_EQ(scaled.maxHp, 1);
    EXPECT_EQ(scaled.attack, 0);
    EXPECT_EQ(scaled.defense, 0);
    EXPECT_EQ(scaled.speed, 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// Action attack
// ═══════════════════════════════════════════════════════════════════════════

class ActionAttackTest : public ::testing::Test {
protected:
    void SetUp() override {
        hero_ = makeCombatant("hero", Side::Allies, makeStats(30, 10, 99, 2, 5));
        hero_.baseStats = makeStats(30, 10, 5, 2, 5);
        Attributes attrs;
        attrs.str = 4;
        attrs.dex = 2;
        attrs.intel = 6;
        hero_.attributes = attrs;
    }

    Combatant hero_;
    AttributeScalingTuning tuning_;
};

TEST_F(ActionAttackTest, WithoutAttributesUsesAttackStat) {
    auto enemy = makeCombatant("enemy", Side::Enemies, makeStats(10, 0, 7, 0, 1));
    EXPECT_EQ(actionAttack(enemy, ActionKind::BasicAttack, {}, tuning_), 7);
    EXPECT_EQ(actionAttack(enemy, ActionKind::Skill, {"fire"}, tuning_), 7);
}

TEST_F(ActionAttackTest, BasicAttackIsPhysical) {
    EXPECT_EQ(actionAttack(hero_, ActionKind::BasicAttack, {}, tuning_), 9);
}

TEST_F(ActionAttackTest, FinesseWeaponSwapsToDex) {
    hero_.weaponTags = {"finesse"};
    EXPECT_EQ(actionAttack(hero_, ActionKind::BasicAttack, {}, tuning_), 7);
}

TEST_F(ActionAttackTest, SkillTagsPickTheStat) {
    EXPECT_EQ(actionAttack(hero_, ActionKind::Skill, {"physical"}, tuning_), 9);
    EXPECT_EQ(actionAttack(hero_, ActionKind::Skill, {"ice"}, tuning_), 11);
    EXPECT_EQ(actionAttack(hero_, ActionKind::Skill, {"physical", "fire"}, tuning_), 10);
}

TEST(ElementalTagTest, KnownElements) {
    EXPECT_TRUE(isElementalTag("fire"));
    EXPECT_TRUE(isElementalTag("holy"));
    EXPECT_FALSE(isElementalTag("physical"));
    EXPECT_FALSE(isElementalTag(""));
}
