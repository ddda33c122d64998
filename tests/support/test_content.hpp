#pragma once

/// @file test_content.hpp
/// @brief Small, fully specified content set and combatant builders shared
///        by the unit and integration tests.

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "tbc/game/battle_state.hpp"
#include "tbc/game/combatant.hpp"
#include "tbc/game/components.hpp"
#include "tbc/game/content.hpp"
#include "tbc/game/game_state.hpp"

namespace tbc::test {

/// Every definition the tests refer to, plus the CombatContent bundle that
/// points at them. Not copyable: the bundle holds references to the sources.
///
/// | Enemy   | HP | ATK | DEF | SPD | Gold | Exp | Tags              |
/// |---------|----|-----|-----|-----|------|-----|-------------------|
/// | goblin  | 20 |  6  |  2  |  5  |  5   |  6  | goblinoid         |
/// | slime   | 12 |  3  |  0  |  2  |  2   |  3  | slime             |
/// | wolf    | 18 |  5  |  1  |  9  |  4   |  4  | beast (key canine)|
/// | shaman  | 16 |  4  |  1  |  4  |  7   |  8  | goblinoid, caster |
struct TestContent {
    game::InMemoryDefinitionSource<game::EnemyDef> enemies{"enemy"};
    game::InMemoryDefinitionSource<game::EnemyGroupDef> enemyGroups{"enemy group"};
    game::InMemoryDefinitionSource<game::SkillDef> skills{"skill"};
    game::InMemoryDefinitionSource<game::ItemDef> items{"item"};
    game::InMemoryDefinitionSource<game::LootTableDef> lootTables{"loot table"};
    game::InMemoryDefinitionSource<game::SummonDef> summons{"summon"};
    game::InMemoryDefinitionSource<game::PartyMemberDef> partyMembers{"party member"};
    game::InMemoryKnowledgeSource knowledge;

    game::CombatContent content{enemies, enemyGroups, skills, items,
                                lootTables, summons, partyMembers, knowledge};

    TestContent() {
        addEnemies();
        addSkills();
        addItems();
        addSummons();
        addParty();
        addKnowledge();
    }

    TestContent(const TestContent&) = delete;
    TestContent& operator=(const TestContent&) = delete;

private:
    void addEnemies() {
        game::EnemyDef goblin;
        goblin.id = "goblin";
        goblin.name = "Goblin";
        goblin.baseStats = game::makeStats(20, 0, 6, 2, 5);
        goblin.rewardsGold = 5;
        goblin.rewardsExp = 6;
        goblin.tags = {"goblinoid"};
        enemies.add(goblin);

        game::EnemyDef slime;
        slime.id = "slime";
        slime.name = "Slime";
        slime.baseStats = game::makeStats(12, 0, 3, 0, 2);
        slime.rewardsGold = 2;
        slime.rewardsExp = 3;
        slime.tags = {"slime"};
        enemies.add(slime);

        game::EnemyDef wolf;
        wolf.id = "wolf";
        wolf.name = "Wolf";
        wolf.baseStats = game::makeStats(18, 0, 5, 1, 9);
        wolf.rewardsGold = 4;
        wolf.rewardsExp = 4;
        wolf.tags = {"beast"};
        wolf.knowledgeKey = "canine";
        enemies.add(wolf);

        game::EnemyDef shaman;
        shaman.id = "shaman";
        shaman.name = "Goblin Shaman";
        shaman.baseStats = game::makeStats(16, 6, 4, 1, 4);
        shaman.rewardsGold = 7;
        shaman.rewardsExp = 8;
        shaman.tags = {"goblinoid", "caster"};
        shaman.equippedSkills = {"firebolt"};
        enemies.add(shaman);

        enemyGroups.add({"goblin_pack", {"goblin", "goblin"}});
        enemyGroups.add({"mixed", {"goblin", "slime"}});
        enemyGroups.add({"empty", {}});
        enemyGroups.add({"broken", {"goblin", "dragon"}});
    }

    void addSkills() {
        game::SkillDef strike;
        strike.id = "power_strike";
        strike.name = "Power Strike";
        strike.targetMode = game::SkillTargetMode::SingleEnemy;
        strike.mpCost = 3;
        strike.basePower = 4;
        strike.tags = {"physical"};
        strike.requiredWeaponTags = {"blade"};
        skills.add(strike);

        game::SkillDef cleave;
        cleave.id = "cleave";
        cleave.name = "Cleave";
        cleave.targetMode = game::SkillTargetMode::MultiEnemy;
        cleave.maxTargets = 2;
        cleave.mpCost = 5;
        cleave.basePower = 1;
        cleave.tags = {"physical"};
        cleave.requiredWeaponTags = {"blade"};
        skills.add(cleave);

        game::SkillDef guard;
        guard.id = "guard";
        guard.name = "Guard";
        guard.targetMode = game::SkillTargetMode::Self;
        guard.mpCost = 0;
        guard.basePower = 3;
        guard.effectType = game::SkillEffectType::Guard;
        guard.requiredWeaponTags = {"shield"};
        skills.add(guard);

        game::SkillDef firebolt;
        firebolt.id = "firebolt";
        firebolt.name = "Firebolt";
        firebolt.targetMode = game::SkillTargetMode::SingleEnemy;
        firebolt.mpCost = 2;
        firebolt.basePower = 3;
        firebolt.tags = {"fire"};
        firebolt.requiredWeaponTags = {"staff"};
        skills.add(firebolt);
    }

    void addItems() {
        game::ItemDef potion;
        potion.id = "potion";
        potion.name = "Potion";
        potion.targeting = game::ItemTargeting::Ally;
        potion.healHp = 10;
        items.add(potion);

        game::ItemDef ether;
        ether.id = "ether";
        ether.name = "Ether";
        ether.targeting = game::ItemTargeting::Self;
        ether.healMp = 5;
        items.add(ether);

        game::ItemDef dust;
        dust.id = "weakening_dust";
        dust.name = "Weakening Dust";
        dust.targeting = game::ItemTargeting::Enemy;
        dust.debuffAttackFlat = 2;
        items.add(dust);

        game::ItemDef rock;
        rock.id = "rock";
        rock.name = "Rock";
        rock.targeting = game::ItemTargeting::Enemy;
        items.add(rock);

        game::ItemDef ore;
        ore.id = "iron_ore";
        ore.name = "Iron Ore";
        ore.kind = "material";
        items.add(ore);

        game::LootTableDef goblinLoot;
        goblinLoot.id = "goblin_loot";
        goblinLoot.requiredTags = {"goblinoid"};
        goblinLoot.forbiddenTags = {"summon"};
        goblinLoot.drops = {{"potion", 1.0, 1, 1}, {"iron_ore", 1.0, 1, 3}};
        lootTables.add(goblinLoot);
    }

    void addSummons() {
        game::SummonDef wisp;
        wisp.id = "wisp";
        wisp.name = "Wisp";
        wisp.baseStats = game::makeStats(10, 0, 3, 1, 4);
        wisp.bondCost = 2;
        wisp.bondScaling = {1.0, 0.5, 0.0, 0.0};
        summons.add(wisp);

        game::SummonDef golem;
        golem.id = "golem";
        golem.name = "Golem";
        golem.baseStats = game::makeStats(30, 0, 5, 4, 1);
        golem.bondCost = 3;
        summons.add(golem);

        game::SummonDef sprite;
        sprite.id = "sprite";
        sprite.name = "Sprite";
        sprite.baseStats = game::makeStats(6, 0, 2, 0, 7);
        sprite.bondCost = 1;
        sprite.tags = {"fey"};
        summons.add(sprite);
    }

    void addParty() {
        game::PartyMemberDef mira;
        mira.id = "mira";
        mira.name = "Mira";
        mira.baseStats = game::makeStats(24, 10, 3, 1, 6);
        mira.weaponTags = {"staff"};
        partyMembers.add(mira);
    }

    void addKnowledge() {
        game::KnowledgeEntry goblins;
        goblins.knowledgeKeys = {"goblin"};
        goblins.hpHint = "Sturdy for their size.";
        goblins.behavior = "They gang up on the weakest.";
        knowledge.addEntry("warrior", goblins);

        game::KnowledgeEntry slimes;
        slimes.enemyTags = {"slime"};
        slimes.speedHint = "Very slow.";
        knowledge.addEntry("mira", slimes);
    }
};

/// Level-1 warrior with no allocated attributes: basic attacks hit with 6.
inline game::PlayerState makePlayer() {
    game::PlayerState player;
    player.id = "player";
    player.name = "Hero";
    player.classId = "warrior";
    player.baseStats = game::makeStats(40, 10, 6, 3, 8);
    player.stats = player.baseStats;
    player.weaponTags = {"blade"};
    return player;
}

inline game::GameState makeGameState(uint64_t seed = 42) {
    game::GameState state(seed);
    state.player = makePlayer();
    return state;
}

/// Bare combatant for engine-level tests.
inline game::Combatant makeCombatant(std::string id, game::Side side, game::Stats stats) {
    game::Combatant c;
    c.displayName = id;
    c.instanceId = std::move(id);
    c.side = side;
    c.stats = stats;
    return c;
}

}  // namespace tbc::test
