/// @file turn_scheduler.cpp
/// @brief TurnScheduler implementation: queue order, round wrap and battle
///        resolution.

#include "tbc/game/turn_scheduler.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include "tbc/foundation/game_logger.hpp"

namespace tbc::game {

using foundation::LogCategory;

namespace {

std::optional<std::size_t> indexOf(const std::vector<std::string>& queue,
                                   const std::string& id) {
    auto it = std::find(queue.begin(), queue.end(), id);
    if (it == queue.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - queue.begin());
}

}  // namespace

void TurnScheduler::RebuildQueue(BattleState& battle) const {
    std::vector<const Combatant*> living;
    for (const auto* side : {&battle.allies, &battle.enemies}) {
        for (const auto& c : *side) {
            if (c.IsAlive()) {
                living.push_back(&c);
            }
        }
    }
    std::sort(living.begin(), living.end(), [](const Combatant* a, const Combatant* b) {
        if (a->stats.speed != b->stats.speed) {
            return a->stats.speed > b->stats.speed;
        }
        return a->instanceId < b->instanceId;
    });

    battle.turnQueue.clear();
    for (const auto* c : living) {
        battle.turnQueue.push_back(c->instanceId);
    }
    if (battle.turnQueue.empty()) {
        battle.currentActorId.reset();
    }
}

void TurnScheduler::InitializeTurnOrder(BattleState& battle) const {
    RebuildQueue(battle);
    if (battle.turnQueue.empty()) {
        battle.currentActorId.reset();
        battle.roundLastActorId.reset();
        return;
    }
    battle.currentActorId = battle.turnQueue.front();
    battle.roundLastActorId = battle.turnQueue.back();
}

BattleEvents TurnScheduler::AdvanceTurn(BattleState& battle, const std::string& lastActorId) const {
    RebuildQueue(battle);
    BattleEvents events;
    if (battle.turnQueue.empty() || battle.isOver) {
        battle.currentActorId.reset();
        return events;
    }

    bool wrapped = battle.roundLastActorId &&
                   !indexOf(battle.turnQueue, *battle.roundLastActorId);

    auto nextFrom = [&battle, &lastActorId]() {
        const auto& queue = battle.turnQueue;
        auto idx = indexOf(queue, lastActorId);
        return idx ? (*idx + 1) % queue.size() : 0;
    };

    auto nextIndex = nextFrom();
    if (indexOf(battle.turnQueue, lastActorId) && nextIndex == 0) {
        wrapped = true;
    }

    if (wrapped) {
        appendEvents(events, StartNewRound(battle));
        if (battle.turnQueue.empty()) {
            battle.currentActorId.reset();
            return events;
        }
        nextIndex = nextFrom();
    }

    battle.currentActorId = battle.turnQueue[nextIndex];
    return events;
}

BattleEvents TurnScheduler::StartNewRound(BattleState& battle) const {
    ++battle.roundIndex;
    auto events = debuffs_.ExpireDebuffs(battle);
    if (battle.turnQueue.empty()) {
        battle.roundLastActorId.reset();
    } else {
        battle.roundLastActorId = battle.turnQueue.back();
    }
    TBC_LOG_DEBUG(LogCategory::Turn, "round " + std::to_string(battle.roundIndex) +
                                     " begins in " + battle.battleId);
    return events;
}

std::optional<BattleResolved> TurnScheduler::CheckTerminal(BattleState& battle) const {
    if (battle.isOver) {
        return std::nullopt;
    }
    // The fallen leave the queue even when their death ends the battle.
    RebuildQueue(battle);
    std::optional<Side> victor;
    if (!battle.AnyAlive(Side::Enemies)) {
        victor = Side::Allies;
    } else if (!battle.AnyAlive(Side::Allies)) {
        victor = Side::Enemies;
    }
    if (!victor) {
        return std::nullopt;
    }
    battle.isOver = true;
    battle.victor = victor;
    battle.currentActorId.reset();
    TBC_LOG_INFO(LogCategory::Battle, "battle " + battle.battleId + " won by " +
                                      std::string(sideName(*victor)));
    return BattleResolved{*victor};
}

}  // namespace tbc::game
