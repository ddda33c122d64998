#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "tbc/foundation/error_code.hpp"
#include "tbc/game/damage_resolver.hpp"
#include "tbc/game/debuff_engine.hpp"

#include "support/test_content.hpp"

using namespace tbc::game;
using tbc::foundation::ErrorCode;
using tbc::test::makeCombatant;
using tbc::test::TestContent;

class DamageResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        battle_.battleId = "battle_000004";
        battle_.playerId = "player";
        battle_.allies.push_back(makeCombatant("player", Side::Allies, makeStats(40, 10, 6, 3, 8)));
        battle_.enemies.push_back(makeCombatant("enemy_1", Side::Enemies, makeStats(20, 0, 6, 2, 5)));
        battle_.enemies.push_back(makeCombatant("enemy_2", Side::Enemies, makeStats(12, 0, 3, 0, 2)));
        threat_.InitializeThreat(battle_);
    }

    Combatant& player() { return *battle_.FindCombatant("player"); }
    Combatant& goblin() { return *battle_.FindCombatant("enemy_1"); }

    SkillDef skill(const std::string& id) { return content_.skills.get(id).value(); }

    TestContent content_;
    ThreatEngine threat_{ThreatTuning{}};
    DamageResolver damage_{DamageTuning{}, AttributeScalingTuning{}, threat_};
    BattleState battle_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Damage math
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(DamageResolverTest, BasicAttackSubtractsDefense) {
    auto hit = damage_.Apply(battle_, player(), goblin(), nullptr);
    EXPECT_EQ(hit.damage, 4);
    EXPECT_EQ(hit.absorbed, 0);
    EXPECT_FALSE(hit.defeated);
    EXPECT_EQ(goblin().stats.hp, 16);
}

TEST_F(DamageResolverTest, SkillPowerAdds) {
    const auto strike = skill("power_strike");
    EXPECT_EQ(damage_.EstimateAction(player(), goblin(), &strike), 8);
}

TEST_F(DamageResolverTest, GuardAbsorbsOnceThenResets) {
    goblin().guardReduction = 3;
    auto hit = damage_.Apply(battle_, player(), goblin(), nullptr);
    EXPECT_EQ(hit.damage, 1);
    EXPECT_EQ(hit.absorbed, 3);
    EXPECT_EQ(goblin().guardReduction, 0);

    auto next = damage_.Apply(battle_, player(), goblin(), nullptr);
    EXPECT_EQ(next.damage, 4);
}

TEST_F(DamageResolverTest, MinimumDamageApplies) {
    goblin().stats.defense = 50;
    EXPECT_EQ(damage_.EstimateAction(player(), goblin(), nullptr), 1);

    DamageTuning zero;
    zero.minimum = 0;
    DamageResolver lenient(zero, AttributeScalingTuning{}, threat_);
    EXPECT_EQ(lenient.EstimateAction(player(), goblin(), nullptr), 0);
}

TEST_F(DamageResolverTest, DebuffsShiftBothSides) {
    ASSERT_TRUE(DebuffEngine::ApplyNoStack(player(), DebuffType::AttackDown, 2, 3));
    EXPECT_EQ(damage_.EstimateAction(player(), goblin(), nullptr), 2);

    ASSERT_TRUE(DebuffEngine::ApplyNoStack(goblin(), DebuffType::DefenseDown, 5, 3));
    EXPECT_EQ(damage_.EstimateAction(player(), goblin(), nullptr), 4);
}

TEST_F(DamageResolverTest, EstimateDoesNotMutate) {
    goblin().guardReduction = 2;
    const BattleState before = battle_;
    EXPECT_EQ(damage_.EstimateAction(player(), goblin(), nullptr), 2);
    EXPECT_EQ(battle_, before);
}

TEST_F(DamageResolverTest, LethalHitReportsDefeatOnce) {
    goblin().SetHp(3);
    auto hit = damage_.Apply(battle_, player(), goblin(), nullptr);
    EXPECT_TRUE(hit.defeated);
    EXPECT_FALSE(goblin().IsAlive());
    EXPECT_EQ(goblin().stats.hp, 0);
}

TEST_F(DamageResolverTest, HitsBuildThreat) {
    damage_.Apply(battle_, player(), goblin(), nullptr);
    EXPECT_EQ(battle_.enemyAggro["enemy_1"]["player"], 13 + 4);
}

// ═══════════════════════════════════════════════════════════════════════════
// Target validation
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(DamageResolverTest, SelfSkillIgnoresTargets) {
    auto targets = damage_.ValidateSkillTargets(battle_, player(), skill("guard"), {"enemy_1"});
    ASSERT_TRUE(targets.hasValue());
    EXPECT_TRUE(targets.value().empty());
}

TEST_F(DamageResolverTest, SingleNeedsExactlyOne) {
    const auto strike = skill("power_strike");
    auto none = damage_.ValidateSkillTargets(battle_, player(), strike, {});
    ASSERT_TRUE(none.hasError());
    EXPECT_EQ(none.error().code(), ErrorCode::TargetCountOutOfRange);

    auto two = damage_.ValidateSkillTargets(battle_, player(), strike, {"enemy_1", "enemy_2"});
    ASSERT_TRUE(two.hasError());
    EXPECT_EQ(two.error().code(), ErrorCode::TargetCountOutOfRange);

    auto one = damage_.ValidateSkillTargets(battle_, player(), strike, {"enemy_2"});
    ASSERT_TRUE(one.hasValue());
    EXPECT_EQ(one.value(), (std::vector<std::string>{"enemy_2"}));
}

TEST_F(DamageResolverTest, MultiRespectsMaxTargets) {
    battle_.enemies.push_back(makeCombatant("enemy_3", Side::Enemies, makeStats(12, 0, 3, 0, 2)));
    const auto cleave = skill("cleave");
    auto three = damage_.ValidateSkillTargets(battle_, player(), cleave,
                                              {"enemy_1", "enemy_2", "enemy_3"});
    ASSERT_TRUE(three.hasError());
    EXPECT_EQ(three.error().code(), ErrorCode::TargetCountOutOfRange);

    EXPECT_TRUE(damage_.ValidateSkillTargets(battle_, player(), cleave, {"enemy_1", "enemy_3"})
                    .hasValue());
}

TEST_F(DamageResolverTest, DuplicateTargetRejected) {
    auto dup = damage_.ValidateSkillTargets(battle_, player(), skill("cleave"),
                                            {"enemy_1", "enemy_1"});
    ASSERT_TRUE(dup.hasError());
    EXPECT_EQ(dup.error().code(), ErrorCode::DuplicateTarget);
}

TEST_F(DamageResolverTest, TargetChecksInOrder) {
    const auto strike = skill("power_strike");

    auto missing = damage_.ValidateSkillTargets(battle_, player(), strike, {"enemy_9"});
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::CombatantNotFound);

    auto ally = damage_.ValidateSkillTargets(battle_, player(), strike, {"player"});
    ASSERT_TRUE(ally.hasError());
    EXPECT_EQ(ally.error().code(), ErrorCode::TargetWrongSide);

    goblin().SetHp(0);
    auto dead = damage_.ValidateSkillTargets(battle_, player(), strike, {"enemy_1"});
    ASSERT_TRUE(dead.hasError());
    EXPECT_EQ(dead.error().code(), ErrorCode::TargetNotAlive);
}

TEST_F(DamageResolverTest, UnknownTargetModeRejected) {
    auto odd = skill("power_strike");
    odd.targetMode = SkillTargetMode::Unknown;
    auto result = damage_.ValidateSkillTargets(battle_, player(), odd, {"enemy_1"});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidAction);
}
