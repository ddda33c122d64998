/// @file threat_engine.cpp
/// @brief ThreatEngine implementation.
///
/// Enemy aggro and party threat are kept as two separate tables. Only the
/// enemy side consults lastTarget for the anti-repeat rule.

#include "tbc/game/threat_engine.hpp"

#include <algorithm>
#include <map>

#include "tbc/foundation/game_logger.hpp"

namespace tbc::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

int32_t ThreatEngine::BaseThreat(const BattleState& battle, const Combatant& target) const {
    int32_t base = std::max(1, (target.stats.maxHp + target.stats.defense) / tuning_.baseDivisor);
    if (battle.playerId && target.instanceId == *battle.playerId) {
        base += tuning_.playerBaseBonus;
    }
    return base;
}

void ThreatEngine::InitializeThreat(BattleState& battle) const {
    battle.enemyAggro.clear();
    battle.partyThreat.clear();
    battle.lastTarget.clear();

    for (const auto& enemy : battle.enemies) {
        auto& table = battle.enemyAggro[enemy.instanceId];
        for (const auto& ally : battle.allies) {
            if (ally.IsAlive()) {
                table[ally.instanceId] = BaseThreat(battle, ally);
            }
        }
    }
    for (const auto& ally : battle.allies) {
        auto& table = battle.partyThreat[ally.instanceId];
        for (const auto& enemy : battle.enemies) {
            if (enemy.IsAlive()) {
                table[enemy.instanceId] = BaseThreat(battle, enemy);
            }
        }
    }
}

void ThreatEngine::SeedAlly(BattleState& battle, const Combatant& ally) const {
    const int32_t base = BaseThreat(battle, ally);
    for (const auto& enemy : battle.enemies) {
        battle.enemyAggro[enemy.instanceId].try_emplace(ally.instanceId, base);
    }
    auto& table = battle.partyThreat[ally.instanceId];
    for (const auto& enemy : battle.enemies) {
        table.try_emplace(enemy.instanceId, BaseThreat(battle, enemy));
    }
}

void ThreatEngine::RecordDamage(BattleState& battle, const Combatant& attacker,
                                const Combatant& target, int32_t damage) const {
    if (damage <= 0 || attacker.side != Side::Allies || target.side != Side::Enemies) {
        return;
    }
    const int32_t gain = damage + tuning_.hitBonus;

    auto& aggro = battle.enemyAggro[target.instanceId];
    auto [it, inserted] = aggro.try_emplace(attacker.instanceId, BaseThreat(battle, attacker));
    it->second += gain;

    auto& threat = battle.partyThreat[attacker.instanceId];
    auto [jt, added] = threat.try_emplace(target.instanceId, BaseThreat(battle, target));
    jt->second += gain;
}

GameResult<TargetChoice> ThreatEngine::SelectEnemyTarget(BattleState& battle,
                                                         const std::string& enemyId,
                                                         Rng& rng) const {
    const Combatant* enemy = battle.FindCombatant(enemyId);
    if (enemy == nullptr || enemy->side != Side::Enemies) {
        return GameResult<TargetChoice>::err(
            GameError(ErrorCode::CombatantNotFound, "no enemy with id " + enemyId));
    }
    auto living = battle.Living(Side::Allies);
    if (living.empty()) {
        return GameResult<TargetChoice>::err(
            GameError(ErrorCode::TargetNotAlive, "no living ally to target"));
    }

    auto& table = battle.enemyAggro[enemyId];
    for (const auto* ally : living) {
        table.try_emplace(ally->instanceId, BaseThreat(battle, *ally));
    }

    // Candidates in list order; values read back from the table.
    std::vector<std::string> ids;
    for (const auto* ally : living) {
        ids.push_back(ally->instanceId);
    }
    auto valueOf = [&table](const std::string& id) { return table.at(id); };
    auto pick = [&rng](const std::vector<std::string>& pool) {
        if (pool.size() == 1) {
            return pool.front();
        }
        return pool[static_cast<std::size_t>(
            rng.randint(0, static_cast<int64_t>(pool.size()) - 1))];
    };
    auto withValue = [&](int32_t v) {
        std::vector<std::string> out;
        for (const auto& id : ids) {
            if (valueOf(id) == v) {
                out.push_back(id);
            }
        }
        return out;
    };

    const auto lastIt = battle.lastTarget.find(enemyId);
    const std::string last = lastIt == battle.lastTarget.end() ? std::string() : lastIt->second;
    const bool canAvoidRepeat = ids.size() > 1 && !last.empty() &&
                                std::find(ids.begin(), ids.end(), last) != ids.end();

    int32_t top = valueOf(ids.front());
    for (const auto& id : ids) {
        top = std::max(top, valueOf(id));
    }
    auto leaders = withValue(top);

    TargetChoice choice;
    if (canAvoidRepeat && leaders.size() > 1 &&
        std::find(leaders.begin(), leaders.end(), last) != leaders.end()) {
        // Tied at the top with the last target: take one of the others.
        leaders.erase(std::remove(leaders.begin(), leaders.end(), last), leaders.end());
        choice.targetId = pick(leaders);
        choice.antiRepeatApplied = true;
    } else if (canAvoidRepeat && leaders.size() == 1 && leaders.front() == last) {
        int32_t second = 0;
        bool hasSecond = false;
        for (const auto& id : ids) {
            if (id != last && (!hasSecond || valueOf(id) > second)) {
                second = valueOf(id);
                hasSecond = true;
            }
        }
        if (hasSecond && top - second < tuning_.antiRepeatIgnoreGap) {
            choice.targetId = pick(withValue(second));
            choice.antiRepeatApplied = true;
        } else {
            choice.targetId = last;
        }
    } else {
        choice.targetId = pick(leaders);
    }

    choice.topValue = valueOf(choice.targetId);
    battle.lastTarget[enemyId] = choice.targetId;

    if (foundation::GameLogger::instance().isEnabled(LogLevel::Debug, LogCategory::AI)) {
        LogContext ctx;
        ctx.battleId = battle.battleId;
        ctx.actorId = enemyId;
        ctx.targetId = choice.targetId;
        ctx.extra["threat"] = std::to_string(choice.topValue);
        ctx.extra["anti_repeat"] = choice.antiRepeatApplied ? "true" : "false";
        foundation::GameLogger::instance().logWithContext(
            LogLevel::Debug, LogCategory::AI, "enemy target selected", ctx);
    }
    return GameResult<TargetChoice>::ok(choice);
}

std::vector<std::string> ThreatEngine::OrderEnemiesByPartyThreat(BattleState& battle,
                                                                 const std::string& allyId,
                                                                 Rng& rng) const {
    auto& table = battle.partyThreat[allyId];
    std::map<int32_t, std::vector<std::string>, std::greater<>> groups;
    for (const auto* enemy : battle.Living(Side::Enemies)) {
        auto [it, inserted] = table.try_emplace(enemy->instanceId, BaseThreat(battle, *enemy));
        groups[it->second].push_back(enemy->instanceId);
    }

    std::vector<std::string> ordered;
    for (auto& [value, group] : groups) {
        if (group.size() > 1) {
            rng.shuffle(group);
        }
        ordered.insert(ordered.end(), group.begin(), group.end());
    }
    return ordered;
}

}  // namespace tbc::game
