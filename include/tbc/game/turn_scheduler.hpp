#pragma once

/// @file turn_scheduler.hpp
/// @brief Turn order, turn advancement and round boundaries.

#include <optional>
#include <string>

#include "tbc/game/battle_events.hpp"
#include "tbc/game/battle_state.hpp"
#include "tbc/game/debuff_engine.hpp"

namespace tbc::game {

/// Orders and advances turns.
///
/// The queue is the living combatants sorted by descending speed, ties by
/// instance id. A round is one full pass of that queue: it ends when the
/// turn wraps past the tail, or when the combatant that closed the round
/// when it began is no longer in the queue.
class TurnScheduler {
public:
    explicit TurnScheduler(const DebuffEngine& debuffs) : debuffs_(debuffs) {}

    /// Rebuild the queue from the living combatants. Clears the current
    /// actor when nobody is left.
    void RebuildQueue(BattleState& battle) const;

    /// Rebuild, then put the head on turn and mark the tail as the round's
    /// last actor. Used once at battle start.
    void InitializeTurnOrder(BattleState& battle) const;

    /// Pass the turn on from @p lastActorId.
    ///
    /// The next actor is the entry after @p lastActorId in the rebuilt
    /// queue, or the head when it is gone. Crossing a round boundary runs
    /// StartNewRound first; its events are returned.
    BattleEvents AdvanceTurn(BattleState& battle, const std::string& lastActorId) const;

    /// Increment the round, expire debuffs, and record the new round's
    /// last actor.
    BattleEvents StartNewRound(BattleState& battle) const;

    /// End the battle if a side has no living members.
    ///
    /// Drops the fallen from the queue first. Sets isOver, victor and clears
    /// the current actor. Returns the
    /// resolution event the first time it fires, nothing otherwise.
    std::optional<BattleResolved> CheckTerminal(BattleState& battle) const;

private:
    const DebuffEngine& debuffs_;
};

}  // namespace tbc::game
