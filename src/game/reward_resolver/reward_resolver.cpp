/// @file reward_resolver.cpp
/// @brief RewardResolver implementation: gold, exp and level-ups, kill counters
///        and loot.

#include "tbc/game/reward_resolver.hpp"

#include <algorithm>

#include "tbc/foundation/game_logger.hpp"
#include "tbc/game/knowledge_engine.hpp"
#include "tbc/game/stat_scaling.hpp"

namespace tbc::game {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

bool contains(const std::vector<std::string>& tags, const std::string& tag) {
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

}  // namespace

int32_t RewardResolver::ExpToNextLevel(int32_t level) const {
    return progression_.expBase + (std::max(level, 1) - 1) * progression_.expPerLevel;
}

bool RewardResolver::LootTableMatches(const LootTableDef& table,
                                      const std::vector<std::string>& enemyTags) {
    for (const auto& tag : table.requiredTags) {
        if (!contains(enemyTags, tag)) {
            return false;
        }
    }
    return std::none_of(table.forbiddenTags.begin(), table.forbiddenTags.end(),
                        [&enemyTags](const std::string& tag) { return contains(enemyTags, tag); });
}

std::string RewardResolver::MemberName(const GameState& state, const std::string& memberId) const {
    if (state.player && state.player->id == memberId) {
        return state.player->name;
    }
    auto def = content_.partyMembers.get(memberId);
    return def.hasValue() ? def.value().name : memberId;
}

void RewardResolver::SyncPlayer(const BattleState& battle, GameState& state) {
    if (!state.player || !battle.playerId) {
        return;
    }
    const Combatant* player = battle.FindCombatant(*battle.playerId);
    if (player == nullptr) {
        return;
    }
    state.player->stats.SetHp(player->stats.hp);
    state.player->stats.SetMp(player->stats.mp);
}

BattleEvents RewardResolver::AwardExp(GameState& state, const std::string& memberId,
                                      int32_t amount) const {
    BattleEvents events;
    if (amount <= 0) {
        return events;
    }
    int32_t level = state.LevelOf(memberId);
    int32_t exp = state.ExpOf(memberId) + amount;

    std::vector<int32_t> reached;
    for (int32_t threshold = ExpToNextLevel(level); exp >= threshold;
         threshold = ExpToNextLevel(level)) {
        exp -= threshold;
        ++level;
        reached.push_back(level);
    }
    state.memberLevels[memberId] = level;
    state.memberExp[memberId] = exp;

    const auto name = MemberName(state, memberId);
    events.emplace_back(ExpGranted{memberId, name, amount, level});
    for (int32_t newLevel : reached) {
        events.emplace_back(LevelUp{memberId, name, newLevel});
        TBC_LOG_INFO(LogCategory::Rewards, name + " reached level " + std::to_string(newLevel));
    }

    if (!reached.empty() && state.player && state.player->id == memberId) {
        auto& player = *state.player;
        player.stats = applyAttributeScaling(player.baseStats, player.attributes, player.stats.hp,
                                             player.stats.mp, scaling_);
        player.stats.RestoreAll();
    }
    return events;
}

BattleEvents RewardResolver::RollLoot(const Combatant& enemy, GameState& state) const {
    BattleEvents events;
    for (const auto& table : content_.lootTables.all()) {
        if (!LootTableMatches(table, enemy.tags)) {
            continue;
        }
        for (const auto& drop : table.drops) {
            if (state.rng.random() > drop.chance) {
                continue;
            }
            const auto quantity = drop.minQty == drop.maxQty
                                      ? drop.minQty
                                      : static_cast<int32_t>(state.rng.randint(drop.minQty, drop.maxQty));
            if (quantity <= 0) {
                continue;
            }
            state.inventory.Add(drop.itemId, quantity);
            auto item = content_.items.get(drop.itemId);
            events.emplace_back(LootAcquired{drop.itemId, item.hasValue() ? item.value().name : drop.itemId,
                                             quantity});
        }
    }
    return events;
}

BattleEvents RewardResolver::ApplyVictoryRewards(BattleState& battle, GameState& state) const {
    BattleEvents events;
    if (!battle.isOver || battle.victor != Side::Allies || battle.rewardsApplied || !state.player) {
        return events;
    }
    battle.rewardsApplied = true;

    SyncPlayer(battle, state);
    state.player->stats.SetMp(state.player->stats.maxMp);
    state.lastBattleWasDefeat = false;

    int32_t totalGold = 0;
    int32_t totalExp = 0;
    std::vector<const Combatant*> defeated;
    std::vector<std::string> killKeys;
    for (const auto& enemy : battle.enemies) {
        if (!enemy.sourceId) {
            continue;
        }
        auto def = content_.enemies.get(*enemy.sourceId);
        if (def.hasError()) {
            TBC_LOG_WARN(LogCategory::Rewards, "no definition for defeated " + *enemy.sourceId);
            continue;
        }
        totalGold += def.value().rewardsGold;
        totalExp += def.value().rewardsExp;
        defeated.push_back(&enemy);
        killKeys.push_back(resolveKnowledgeKey(def.value()));
    }

    if (totalGold > 0) {
        state.gold += totalGold;
        events.emplace_back(GoldGranted{totalGold, state.gold});
    }

    if (totalExp > 0) {
        const auto participants = state.ActivePartyIds();
        const auto count = static_cast<int32_t>(participants.size());
        const int32_t share = totalExp / count;
        const int32_t remainder = totalExp % count;
        for (const auto& memberId : participants) {
            const int32_t amount = memberId == state.player->id ? share + remainder : share;
            appendEvents(events, AwardExp(state, memberId, amount));
        }
    }

    KnowledgeEngine::RecordKills(state, killKeys);

    for (const auto* enemy : defeated) {
        appendEvents(events, RollLoot(*enemy, state));
    }

    if (foundation::GameLogger::instance().isEnabled(LogLevel::Info, LogCategory::Rewards)) {
        LogContext ctx;
        ctx.battleId = battle.battleId;
        ctx.extra["gold"] = std::to_string(totalGold);
        ctx.extra["exp"] = std::to_string(totalExp);
        ctx.extra["kills"] = std::to_string(killKeys.size());
        foundation::GameLogger::instance().logWithContext(
            LogLevel::Info, LogCategory::Rewards, "victory rewards applied", ctx);
    }
    return events;
}

void RewardResolver::RecordDefeat(const BattleState& battle, GameState& state) const {
    if (!battle.isOver || battle.victor != Side::Enemies) {
        return;
    }
    state.lastBattleWasDefeat = true;
    SyncPlayer(battle, state);
    TBC_LOG_INFO(LogCategory::Rewards, "battle " + battle.battleId + " lost");
}

}  // namespace tbc::game
