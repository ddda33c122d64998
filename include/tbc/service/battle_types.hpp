#pragma once

/// @file battle_types.hpp
/// @brief Value types exchanged between the battle services and the
///        presentation layer.

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "tbc/game/battle_events.hpp"
#include "tbc/game/battle_state.hpp"
#include "tbc/game/combat_types.hpp"
#include "tbc/game/content.hpp"

namespace tbc::service {

/// Freshly created battle plus the events its setup produced.
struct BattleStart {
    game::BattleState battle;
    game::BattleEvents events;
};

/// Render-ready snapshot of one combatant.
struct CombatantView {
    std::string id;
    std::string name;
    game::Side side = game::Side::Allies;
    bool alive = true;
    int32_t hp = 0;
    int32_t maxHp = 0;
    int32_t mp = 0;
    int32_t maxMp = 0;
    int32_t defense = 0;
    /// Exact for allies; for enemies whatever knowledge allows.
    std::string hpDisplay;
};

struct BattleView {
    std::string battleId;
    std::vector<CombatantView> allies;
    std::vector<CombatantView> enemies;
    std::optional<std::string> currentActorId;
};

/// Consumable the party can use right now.
struct BattleItem {
    std::string itemId;
    std::string itemName;
    int32_t quantity = 0;
    game::ItemTargeting targeting = game::ItemTargeting::Self;
};

// -- Player actions -----------------------------------------------------------

struct AttackAction {
    std::string targetId;
};

struct SkillAction {
    std::string skillId;
    std::vector<std::string> targetIds;
};

/// A party member shares what it knows; the current actor spends the turn.
struct TalkAction {
    std::string speakerId;
};

struct ItemAction {
    std::string itemId;
    std::string targetId;
};

using BattleAction = std::variant<AttackAction, SkillAction, TalkAction, ItemAction>;

/// What the current actor may do, for building a menu.
struct AvailableActions {
    bool canAttack = false;
    bool canUseSkill = false;
    bool canUseItem = false;
    bool canTalk = false;
    std::vector<game::SkillDef> skills;
    std::vector<BattleItem> items;
};

}  // namespace tbc::service
