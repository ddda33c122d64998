/// @file summon_spawner.cpp
/// @brief SummonSpawner implementation.

#include "tbc/game/summon_spawner.hpp"

#include <algorithm>

#include "tbc/foundation/game_logger.hpp"
#include "tbc/game/stat_scaling.hpp"

namespace tbc::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

std::vector<SummonOwner> SummonSpawner::Owners(const GameState& state) {
    std::vector<SummonOwner> owners;
    if (state.player) {
        owners.push_back({state.player->id, state.player->attributes.bond,
                          state.player->equippedSummons});
    }
    for (const auto& memberId : state.partyMembers) {
        SummonOwner owner;
        owner.combatantId = "party_" + memberId;
        if (auto it = state.partyMemberAttributes.find(memberId);
            it != state.partyMemberAttributes.end()) {
            owner.bond = it->second.bond;
        }
        if (auto it = state.partySummonLoadouts.find(memberId);
            it != state.partySummonLoadouts.end()) {
            owner.loadout = it->second;
        }
        owners.push_back(std::move(owner));
    }
    return owners;
}

GameResult<void> SummonSpawner::ValidateLoadouts(const GameState& state) const {
    for (const auto& owner : Owners(state)) {
        for (const auto& summonId : owner.loadout) {
            auto def = content_.summons.get(summonId);
            if (def.hasError()) {
                return GameResult<void>::err(GameError(
                    ErrorCode::FactoryFailed,
                    "summon '" + summonId + "' equipped by " + owner.combatantId + " not found",
                    def.error()));
            }
        }
    }
    return GameResult<void>::ok();
}

Combatant SummonSpawner::CreateSummon(const SummonDef& def, const std::string& ownerId,
                                      int32_t ownerBond, const BattleState& battle,
                                      Rng& rng) const {
    Combatant summon;
    summon.instanceId = makeInstanceId("summon", rng, [&battle](std::string_view id) {
        return battle.HasId(id);
    });
    summon.displayName = def.name;
    summon.side = Side::Allies;
    summon.baseStats = def.baseStats;
    summon.stats = applySummonBondScaling(def.baseStats, ownerBond, def.bondScaling);
    summon.tags.push_back(std::string(kSummonTag));
    for (const auto& tag : def.tags) {
        if (!summon.HasTag(tag)) {
            summon.tags.push_back(tag);
        }
    }
    summon.sourceId = def.id;
    summon.ownerId = ownerId;
    summon.bondCost = def.bondCost;
    return summon;
}

GameResult<BattleEvents> SummonSpawner::SpawnEquipped(BattleState& battle, GameState& state) const {
    BattleEvents events;
    for (const auto& owner : Owners(state)) {
        int32_t remaining = owner.bond;
        if (remaining <= 0 || owner.loadout.empty()) {
            continue;
        }
        if (!battle.HasId(owner.combatantId)) {
            return GameResult<BattleEvents>::err(GameError(
                ErrorCode::SummonOwnerMissing,
                "summon owner " + owner.combatantId + " is not among the allies"));
        }

        for (const auto& summonId : owner.loadout) {
            auto defResult = content_.summons.get(summonId);
            if (defResult.hasError()) {
                return GameResult<BattleEvents>::err(GameError(
                    ErrorCode::FactoryFailed, "summon '" + summonId + "' not found",
                    defResult.error()));
            }
            const auto& def = defResult.value();
            if (def.bondCost > remaining) {
                TBC_LOG_DEBUG(LogCategory::Summon,
                              owner.combatantId + " lacks bond for " + summonId + ", stopping");
                break;
            }

            Combatant summon = CreateSummon(def, owner.combatantId, owner.bond, battle, state.rng);
            remaining -= def.bondCost;

            events.emplace_back(SummonSpawned{owner.combatantId, def.id, summon.instanceId,
                                              summon.displayName, def.bondCost, owner.bond,
                                              def.baseStats, summon.stats});

            if (foundation::GameLogger::instance().isEnabled(LogLevel::Info, LogCategory::Summon)) {
                LogContext ctx;
                ctx.battleId = battle.battleId;
                ctx.actorId = owner.combatantId;
                ctx.targetId = summon.instanceId;
                ctx.extra["summon"] = def.id;
                ctx.extra["bond_left"] = std::to_string(remaining);
                foundation::GameLogger::instance().logWithContext(
                    LogLevel::Info, LogCategory::Summon, "summon spawned", ctx);
            }

            battle.allies.push_back(std::move(summon));
            threat_.SeedAlly(battle, battle.allies.back());
            scheduler_.RebuildQueue(battle);
        }
    }
    return GameResult<BattleEvents>::ok(std::move(events));
}

}  // namespace tbc::game
