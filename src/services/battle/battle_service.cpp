/// @file battle_service.cpp
/// @brief BattleService implementation: battle setup, action resolution,
///        AI turns and read-only queries.

#include "tbc/service/battle_service.hpp"

#include <algorithm>
#include <map>
#include <set>

#include "tbc/foundation/error_code.hpp"
#include "tbc/foundation/game_error.hpp"
#include "tbc/foundation/game_logger.hpp"
#include "tbc/game/damage_resolver.hpp"
#include "tbc/game/debuff_engine.hpp"
#include "tbc/game/knowledge_engine.hpp"
#include "tbc/game/reward_resolver.hpp"
#include "tbc/game/stat_scaling.hpp"
#include "tbc/game/summon_spawner.hpp"
#include "tbc/game/threat_engine.hpp"
#include "tbc/game/turn_scheduler.hpp"
#include "tbc/version.hpp"

namespace tbc::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

using game::BattleEvents;
using game::BattleState;
using game::Combatant;
using game::GameState;
using game::Side;

namespace {

using EventsResult = GameResult<BattleEvents>;

GameError factoryError(const std::string& what, const GameError& cause) {
    return GameError(ErrorCode::FactoryFailed, what, cause);
}

std::string debuffText(game::DebuffType type, int32_t amount) {
    const char* label = type == game::DebuffType::AttackDown ? "ATK" : "DEF";
    return std::string(label) + " -" + std::to_string(amount) + " (until end of next round).";
}

std::string healText(int32_t hpDelta, int32_t mpDelta) {
    std::string text;
    if (hpDelta > 0) {
        text += "+" + std::to_string(hpDelta) + " HP";
    }
    if (mpDelta > 0) {
        text += (text.empty() ? "+" : ", +") + std::to_string(mpDelta) + " MP";
    }
    return text.empty() ? "had no effect." : text + ".";
}

/// Append " (1)", " (2)"... to every enemy sharing a display name.
void disambiguateNames(std::vector<Combatant>& enemies) {
    std::map<std::string, std::vector<Combatant*>> byName;
    for (auto& enemy : enemies) {
        byName[enemy.displayName].push_back(&enemy);
    }
    for (auto& [name, group] : byName) {
        if (group.size() < 2) {
            continue;
        }
        for (std::size_t i = 0; i < group.size(); ++i) {
            group[i]->displayName = name + " (" + std::to_string(i + 1) + ")";
        }
    }
}

}  // namespace

// -- Impl ---------------------------------------------------------------------

struct BattleService::Impl {
    const game::CombatContent& content;
    game::CombatTuning tuning;

    game::DebuffEngine debuffs;
    game::TurnScheduler scheduler;
    game::ThreatEngine threat;
    game::DamageResolver damage;
    game::KnowledgeEngine knowledge;
    game::SummonSpawner summons;
    game::RewardResolver rewards;

    Impl(const game::CombatContent& c, game::CombatTuning t)
        : content(c)
        , tuning(std::move(t))
        , debuffs(tuning.debuff)
        , scheduler(debuffs)
        , threat(tuning.threat)
        , damage(tuning.damage, tuning.scaling, threat)
        , knowledge(content, tuning.knowledge)
        , summons(content, threat, scheduler)
        , rewards(content, tuning.progression, tuning.scaling) {}

    /// The actor must hold the current turn of a running battle.
    GameResult<Combatant*> actingCombatant(BattleState& battle, const std::string& actorId) const {
        using R = GameResult<Combatant*>;
        if (battle.isOver) {
            return R::err(GameError(ErrorCode::BattleOver, "battle " + battle.battleId + " is over"));
        }
        if (!battle.currentActorId) {
            return R::err(GameError(ErrorCode::NoCurrentActor, "no combatant holds the turn"));
        }
        Combatant* actor = battle.FindCombatant(actorId);
        if (actor == nullptr) {
            return R::err(GameError(ErrorCode::CombatantNotFound, "no combatant with id " + actorId));
        }
        if (*battle.currentActorId != actorId) {
            return R::err(GameError(ErrorCode::InvalidAction,
                                    "it is not " + actorId + "'s turn"));
        }
        if (!actor->IsAlive()) {
            return R::err(GameError(ErrorCode::ActorNotAlive, actorId + " is defeated"));
        }
        return R::ok(actor);
    }

    /// Resolve the battle if a side is wiped, else pass the turn on.
    void finishAction(BattleState& battle, const std::string& actorId, BattleEvents& events) const {
        if (auto resolved = scheduler.CheckTerminal(battle)) {
            events.emplace_back(*resolved);
            return;
        }
        game::appendEvents(events, scheduler.AdvanceTurn(battle, actorId));
    }

    std::vector<game::SkillDef> skillsFor(const Combatant& combatant) const {
        std::vector<game::SkillDef> skills;
        if (combatant.side == Side::Enemies) {
            for (const auto& id : combatant.equippedSkills) {
                auto def = content.skills.get(id);
                if (def.hasValue()) {
                    skills.push_back(def.value());
                } else {
                    TBC_LOG_WARN(LogCategory::AI, combatant.instanceId + " equips unknown skill " + id);
                }
            }
            return skills;
        }
        if (combatant.weaponTags.empty()) {
            return skills;
        }
        for (auto& skill : content.skills.all()) {
            const bool usable = std::all_of(
                skill.requiredWeaponTags.begin(), skill.requiredWeaponTags.end(),
                [&combatant](const std::string& tag) { return combatant.HasWeaponTag(tag); });
            if (usable) {
                skills.push_back(std::move(skill));
            }
        }
        return skills;
    }

    GameResult<Combatant> buildPartyMember(const std::string& memberId, const GameState& state) const {
        auto def = content.partyMembers.get(memberId);
        if (def.hasError()) {
            return GameResult<Combatant>::err(
                factoryError("party member '" + memberId + "' not found", def.error()));
        }
        const auto& member = def.value();
        auto attrsIt = state.partyMemberAttributes.find(memberId);
        const auto attrs = attrsIt == state.partyMemberAttributes.end() ? member.startingAttributes
                                                                        : attrsIt->second;
        Combatant c;
        c.instanceId = "party_" + memberId;
        c.displayName = member.name;
        c.side = Side::Allies;
        c.stats = game::applyAttributeScaling(member.baseStats, attrs, 0, 0, tuning.scaling);
        c.stats.RestoreAll();
        c.baseStats = member.baseStats;
        c.attributes = attrs;
        c.tags = member.tags;
        c.weaponTags = member.weaponTags;
        c.sourceId = member.id;
        return GameResult<Combatant>::ok(std::move(c));
    }

    Combatant buildPlayer(const game::PlayerState& player) const {
        Combatant c;
        c.instanceId = player.id;
        c.displayName = player.name;
        c.side = Side::Allies;
        c.stats = player.stats;
        c.baseStats = player.baseStats;
        c.attributes = player.attributes;
        c.weaponTags = player.weaponTags;
        if (!player.classId.empty()) {
            c.sourceId = player.classId;
        }
        return c;
    }

    EventsResult resolveSkill(BattleState& battle, Combatant& attacker, const game::SkillDef& skill,
                              const std::vector<std::string>& targetIds) const;
};

// -- Construction / destruction / move ----------------------------------------

BattleService::BattleService(const game::CombatContent& content, game::CombatTuning tuning)
    : impl_(std::make_unique<Impl>(content, std::move(tuning))) {
    TBC_LOG_DEBUG(LogCategory::Core, std::string("battle service ready, engine ") + Version::string);
}

BattleService::~BattleService() = default;

BattleService::BattleService(BattleService&&) noexcept = default;
BattleService& BattleService::operator=(BattleService&&) noexcept = default;

const game::CombatTuning& BattleService::tuning() const noexcept {
    return impl_->tuning;
}

// -- Setup --------------------------------------------------------------------

GameResult<BattleStart> BattleService::startBattle(const std::string& enemyOrGroupId,
                                                   GameState& state, int32_t battleLevel) const {
    using R = GameResult<BattleStart>;
    auto fail = [&enemyOrGroupId](GameError error) {
        TBC_LOG_ERROR(LogCategory::Battle,
                      "cannot start battle against " + enemyOrGroupId + ": " + std::string(error.message()));
        return R::err(std::move(error));
    };

    if (!state.player) {
        return fail(GameError(ErrorCode::NoPlayer, "no player character to fight with"));
    }
    const auto& content = impl_->content;

    // Resolve every definition before drawing from the RNG.
    std::vector<std::string> enemyIds;
    if (content.enemies.contains(enemyOrGroupId)) {
        enemyIds.push_back(enemyOrGroupId);
    } else {
        auto group = content.enemyGroups.get(enemyOrGroupId);
        if (group.hasError()) {
            return fail(factoryError("no enemy or group '" + enemyOrGroupId + "'", group.error()));
        }
        enemyIds = group.value().enemyIds;
        if (enemyIds.empty()) {
            return fail(factoryError("group '" + enemyOrGroupId + "' has no enemies",
                                     GameError(ErrorCode::GroupNotInstantiable, enemyOrGroupId)));
        }
    }

    std::vector<game::EnemyDef> enemyDefs;
    for (const auto& id : enemyIds) {
        auto def = content.enemies.get(id);
        if (def.hasError()) {
            return fail(factoryError("enemy '" + id + "' not found", def.error()));
        }
        enemyDefs.push_back(def.value());
    }

    std::vector<Combatant> allies;
    allies.push_back(impl_->buildPlayer(*state.player));
    for (const auto& memberId : state.partyMembers) {
        auto member = impl_->buildPartyMember(memberId, state);
        if (member.hasError()) {
            return fail(member.error());
        }
        allies.push_back(std::move(member.value()));
    }

    if (auto loadouts = impl_->summons.ValidateLoadouts(state); loadouts.hasError()) {
        return fail(loadouts.error());
    }

    // Instantiate.
    BattleStart start;
    auto& battle = start.battle;
    battle.allies = std::move(allies);
    battle.playerId = state.player->id;
    battle.battleLevel = std::max(0, battleLevel);

    for (const auto& def : enemyDefs) {
        Combatant enemy;
        enemy.instanceId = game::makeInstanceId("enemy", state.rng, [&battle](std::string_view id) {
            return battle.HasId(id);
        });
        enemy.displayName = def.name;
        enemy.side = Side::Enemies;
        enemy.stats = game::applyEnemyLevelScaling(def.baseStats, battle.battleLevel,
                                                   impl_->tuning.enemyScaling);
        enemy.baseStats = def.baseStats;
        enemy.tags = def.tags;
        enemy.equippedSkills = def.equippedSkills;
        enemy.sourceId = def.id;
        battle.enemies.push_back(std::move(enemy));
    }
    disambiguateNames(battle.enemies);
    battle.battleId = game::makeInstanceId("battle", state.rng);

    game::BattleStarted started;
    started.battleId = battle.battleId;
    started.battleLevel = battle.battleLevel;
    for (const auto& enemy : battle.enemies) {
        started.enemyNames.push_back(enemy.displayName);
    }
    start.events.emplace_back(std::move(started));

    auto spawned = impl_->summons.SpawnEquipped(battle, state);
    if (spawned.hasError()) {
        return fail(spawned.error());
    }
    game::appendEvents(start.events, std::move(spawned.value()));

    impl_->threat.InitializeThreat(battle);
    impl_->scheduler.InitializeTurnOrder(battle);
    impl_->knowledge.BuildSnapshot(battle, state);

    if (foundation::GameLogger::instance().isEnabled(LogLevel::Info, LogCategory::Battle)) {
        LogContext ctx;
        ctx.battleId = battle.battleId;
        ctx.extra["enemies"] = std::to_string(battle.enemies.size());
        ctx.extra["allies"] = std::to_string(battle.allies.size());
        ctx.extra["level"] = std::to_string(battle.battleLevel);
        foundation::GameLogger::instance().logWithContext(
            LogLevel::Info, LogCategory::Battle, "battle started against " + enemyOrGroupId, ctx);
    }
    return R::ok(std::move(start));
}

// -- Actions ------------------------------------------------------------------

GameResult<BattleEvents> BattleService::basicAttack(BattleState& battle,
                                                    const std::string& attackerId,
                                                    const std::string& targetId) const {
    auto acting = impl_->actingCombatant(battle, attackerId);
    if (acting.hasError()) {
        return acting.propagate<BattleEvents>();
    }
    Combatant& attacker = *acting.value();

    Combatant* target = battle.FindCombatant(targetId);
    if (target == nullptr) {
        return EventsResult::err(GameError(ErrorCode::CombatantNotFound, "no combatant with id " + targetId));
    }
    if (target->side == attacker.side) {
        return EventsResult::err(GameError(ErrorCode::TargetWrongSide, targetId + " is not an enemy"));
    }
    if (!target->IsAlive()) {
        return EventsResult::err(GameError(ErrorCode::TargetNotAlive, targetId + " is already defeated"));
    }

    auto hit = impl_->damage.Apply(battle, attacker, *target, nullptr);
    BattleEvents events;
    events.emplace_back(game::AttackResolved{attacker.instanceId, attacker.displayName,
                                             target->instanceId, target->displayName, hit.damage,
                                             target->stats.hp});
    if (hit.defeated) {
        events.emplace_back(game::CombatantDefeated{target->instanceId, target->displayName});
    }
    impl_->finishAction(battle, attacker.instanceId, events);
    return EventsResult::ok(std::move(events));
}

GameResult<BattleEvents> BattleService::useSkill(BattleState& battle, const std::string& attackerId,
                                                 const std::string& skillId,
                                                 const std::vector<std::string>& targetIds) const {
    auto acting = impl_->actingCombatant(battle, attackerId);
    if (acting.hasError()) {
        return acting.propagate<BattleEvents>();
    }
    Combatant& attacker = *acting.value();

    auto def = impl_->content.skills.get(skillId);
    if (def.hasError()) {
        return def.propagate<BattleEvents>();
    }
    const auto skills = impl_->skillsFor(attacker);
    if (std::none_of(skills.begin(), skills.end(),
                     [&skillId](const game::SkillDef& s) { return s.id == skillId; })) {
        return EventsResult::err(GameError(ErrorCode::InvalidAction,
                                           attackerId + " cannot use " + skillId));
    }
    return impl_->resolveSkill(battle, attacker, def.value(), targetIds);
}

GameResult<BattleEvents> BattleService::Impl::resolveSkill(
    BattleState& battle, Combatant& attacker, const game::SkillDef& skill,
    const std::vector<std::string>& targetIds) const {
    BattleEvents events;
    if (attacker.stats.mp < skill.mpCost) {
        events.emplace_back(game::SkillFailed{attacker.instanceId, attacker.displayName, skill.id,
                                              game::SkillFailReason::InsufficientMp});
        return EventsResult::ok(std::move(events));
    }

    auto targets = damage.ValidateSkillTargets(battle, attacker, skill, targetIds);
    if (targets.hasError()) {
        return targets.propagate<BattleEvents>();
    }

    attacker.stats.SetMp(attacker.stats.mp - skill.mpCost);

    switch (skill.effectType) {
        case game::SkillEffectType::Damage:
            for (const auto& id : targets.value()) {
                Combatant& target = *battle.FindCombatant(id);
                auto hit = damage.Apply(battle, attacker, target, &skill);
                events.emplace_back(game::SkillUsed{attacker.instanceId, attacker.displayName,
                                                    skill.id, skill.name, target.instanceId,
                                                    target.displayName, hit.damage,
                                                    target.stats.hp});
                if (hit.defeated) {
                    events.emplace_back(game::CombatantDefeated{target.instanceId, target.displayName});
                }
            }
            break;
        case game::SkillEffectType::Guard:
            attacker.guardReduction = skill.basePower;
            events.emplace_back(game::GuardApplied{attacker.instanceId, attacker.displayName,
                                                   skill.basePower});
            break;
        case game::SkillEffectType::Unknown:
            TBC_LOG_WARN(LogCategory::Combat,
                         "skill " + skill.id + " has an unknown effect kind; ignored");
            break;
    }

    finishAction(battle, attacker.instanceId, events);
    return EventsResult::ok(std::move(events));
}

GameResult<BattleEvents> BattleService::useItem(BattleState& battle, GameState& state,
                                                const std::string& actorId,
                                                const std::string& itemId,
                                                const std::string& targetId) const {
    auto acting = impl_->actingCombatant(battle, actorId);
    if (acting.hasError()) {
        return acting.propagate<BattleEvents>();
    }
    Combatant& actor = *acting.value();

    Combatant* target = battle.FindCombatant(targetId);
    if (target == nullptr) {
        return EventsResult::err(GameError(ErrorCode::CombatantNotFound, "no combatant with id " + targetId));
    }
    if (!target->IsAlive()) {
        return EventsResult::err(GameError(ErrorCode::TargetNotAlive, targetId + " is already defeated"));
    }

    auto def = impl_->content.items.get(itemId);
    if (def.hasError()) {
        return EventsResult::err(GameError(ErrorCode::UnknownItem, "unknown item " + itemId, def.error()));
    }
    const auto& item = def.value();
    if (!item.IsConsumable()) {
        return EventsResult::err(GameError(ErrorCode::ItemNotConsumable, itemId + " is not consumable"));
    }

    switch (item.targeting) {
        case game::ItemTargeting::Self:
            if (target->instanceId != actor.instanceId) {
                return EventsResult::err(GameError(ErrorCode::TargetWrongSide, itemId + " targets its user"));
            }
            break;
        case game::ItemTargeting::Ally:
            if (target->side != actor.side) {
                return EventsResult::err(GameError(ErrorCode::TargetWrongSide, itemId + " targets an ally"));
            }
            break;
        case game::ItemTargeting::Enemy:
            if (!item.IsDebuffItem()) {
                return EventsResult::err(GameError(ErrorCode::TargetingNotSupported,
                                                   itemId + " has no effect on enemies"));
            }
            break;
        case game::ItemTargeting::Unknown:
            return EventsResult::err(GameError(ErrorCode::TargetingNotSupported,
                                               itemId + " has unsupported targeting"));
    }
    if (item.IsDebuffItem() && target->side == actor.side) {
        return EventsResult::err(GameError(ErrorCode::TargetWrongSide, itemId + " targets an enemy"));
    }
    if (!state.inventory.Remove(itemId, 1)) {
        return EventsResult::err(GameError(ErrorCode::ItemNotAvailable, "no " + itemId + " left"));
    }

    BattleEvents events;
    const std::string prefix = actor.displayName + " uses " + item.name + " on " + target->displayName + ": ";
    if (item.IsDebuffItem()) {
        const auto type = item.debuffAttackFlat > 0 ? game::DebuffType::AttackDown
                                                    : game::DebuffType::DefenseDown;
        const int32_t amount = item.debuffAttackFlat > 0 ? item.debuffAttackFlat : item.debuffDefenseFlat;
        const int32_t expires = impl_->debuffs.ExpiryRound(battle);
        const bool applied = game::DebuffEngine::ApplyNoStack(*target, type, amount, expires);
        events.emplace_back(game::ItemUsed{actor.instanceId, actor.displayName, target->instanceId,
                                           target->displayName, item.id, item.name, 0, 0,
                                           prefix + (applied ? debuffText(type, amount) : "had no effect.")});
        if (applied) {
            events.emplace_back(game::DebuffApplied{target->instanceId, target->displayName, type,
                                                    amount, expires});
        }
    } else {
        const int32_t hpBefore = target->stats.hp;
        const int32_t mpBefore = target->stats.mp;
        target->SetHp(target->stats.hp + item.healHp);
        target->stats.SetMp(target->stats.mp + item.healMp);
        const int32_t hpDelta = target->stats.hp - hpBefore;
        const int32_t mpDelta = target->stats.mp - mpBefore;
        events.emplace_back(game::ItemUsed{actor.instanceId, actor.displayName, target->instanceId,
                                           target->displayName, item.id, item.name, hpDelta, mpDelta,
                                           prefix + healText(hpDelta, mpDelta)});
    }

    impl_->finishAction(battle, actor.instanceId, events);
    return EventsResult::ok(std::move(events));
}

GameResult<BattleEvents> BattleService::partyTalk(BattleState& battle, const std::string& actorId,
                                                  const std::string& speakerId) const {
    auto acting = impl_->actingCombatant(battle, actorId);
    if (acting.hasError()) {
        return acting.propagate<BattleEvents>();
    }
    const Combatant* speaker = battle.FindCombatant(speakerId);
    if (speaker == nullptr) {
        return EventsResult::err(GameError(ErrorCode::CombatantNotFound, "no combatant with id " + speakerId));
    }
    if (speaker->side != Side::Allies || speaker->IsSummon()) {
        return EventsResult::err(GameError(ErrorCode::InvalidAction, speakerId + " cannot talk"));
    }
    if (!speaker->IsAlive()) {
        return EventsResult::err(GameError(ErrorCode::TargetNotAlive, speakerId + " is defeated"));
    }

    auto report = impl_->knowledge.DescribeEnemies(battle, speaker->SourceOrInstanceId(),
                                                   speaker->displayName);
    impl_->knowledge.Reveal(battle, report.matchedKeys);

    BattleEvents events;
    events.emplace_back(game::PartyTalk{speaker->instanceId, speaker->displayName, report.text});
    game::appendEvents(events, impl_->scheduler.AdvanceTurn(battle, actorId));
    return EventsResult::ok(std::move(events));
}

GameResult<std::vector<std::string>> BattleService::partyTalkPreview(
    const BattleState& battle, const std::string& speakerId) const {
    using R = GameResult<std::vector<std::string>>;
    const Combatant* speaker = battle.FindCombatant(speakerId);
    if (speaker == nullptr) {
        return R::err(GameError(ErrorCode::CombatantNotFound, "no combatant with id " + speakerId));
    }
    auto report = impl_->knowledge.DescribeEnemies(battle, speaker->SourceOrInstanceId(),
                                                   speaker->displayName);
    return R::ok(std::move(report.lines));
}

// -- AI -----------------------------------------------------------------------

GameResult<BattleEvents> BattleService::runEnemyTurn(BattleState& battle, game::Rng& rng) const {
    if (battle.isOver) {
        return EventsResult::err(GameError(ErrorCode::BattleOver, "battle " + battle.battleId + " is over"));
    }
    if (!battle.currentActorId) {
        return EventsResult::err(GameError(ErrorCode::NoCurrentActor, "no combatant holds the turn"));
    }
    const std::string actorId = *battle.currentActorId;
    auto acting = impl_->actingCombatant(battle, actorId);
    if (acting.hasError()) {
        return acting.propagate<BattleEvents>();
    }
    Combatant& actor = *acting.value();
    if (actor.side != Side::Enemies) {
        return EventsResult::err(GameError(ErrorCode::InvalidAction, actorId + " is not an enemy"));
    }

    BattleEvents events;
    if (!battle.AnyAlive(Side::Allies)) {
        if (auto resolved = impl_->scheduler.CheckTerminal(battle)) {
            events.emplace_back(*resolved);
        }
        return EventsResult::ok(std::move(events));
    }

    auto choice = impl_->threat.SelectEnemyTarget(battle, actorId, rng);
    if (choice.hasError()) {
        return choice.propagate<BattleEvents>();
    }
    const auto& picked = choice.value();
    const Combatant* target = battle.FindCombatant(picked.targetId);
    events.emplace_back(game::EnemyTargeted{actor.instanceId, actor.displayName, target->instanceId,
                                            target->displayName, picked.topValue,
                                            picked.antiRepeatApplied});

    const game::SkillDef* chosen = nullptr;
    const auto skills = impl_->skillsFor(actor);
    for (const auto& skill : skills) {
        if (skill.effectType == game::SkillEffectType::Damage &&
            skill.targetMode == game::SkillTargetMode::SingleEnemy && actor.stats.mp >= skill.mpCost) {
            chosen = &skill;
            break;
        }
    }

    auto acted = chosen ? impl_->resolveSkill(battle, actor, *chosen, {picked.targetId})
                        : basicAttack(battle, actorId, picked.targetId);
    if (acted.hasError()) {
        return acted;
    }
    game::appendEvents(events, std::move(acted.value()));
    return EventsResult::ok(std::move(events));
}

GameResult<BattleEvents> BattleService::runAllyAiTurn(BattleState& battle, const std::string& actorId,
                                                      game::Rng& rng) const {
    auto acting = impl_->actingCombatant(battle, actorId);
    if (acting.hasError()) {
        return acting.propagate<BattleEvents>();
    }
    Combatant& actor = *acting.value();
    if (actor.side != Side::Allies) {
        return EventsResult::err(GameError(ErrorCode::InvalidAction, actorId + " is not an ally"));
    }

    const auto livingEnemies = battle.Living(Side::Enemies).size();
    if (livingEnemies == 0) {
        return EventsResult::ok({});
    }

    for (const auto& skill : impl_->skillsFor(actor)) {
        if (actor.stats.mp < skill.mpCost) {
            continue;
        }
        std::vector<std::string> targets;
        switch (skill.targetMode) {
            case game::SkillTargetMode::Self:
                break;
            case game::SkillTargetMode::SingleEnemy:
                targets.push_back(impl_->threat.OrderEnemiesByPartyThreat(battle, actorId, rng).front());
                break;
            case game::SkillTargetMode::MultiEnemy: {
                if (livingEnemies < 2) {
                    continue;
                }
                auto ordered = impl_->threat.OrderEnemiesByPartyThreat(battle, actorId, rng);
                const auto count = std::min(ordered.size(),
                                            static_cast<std::size_t>(std::max(skill.maxTargets, 1)));
                targets.assign(ordered.begin(), ordered.begin() + static_cast<std::ptrdiff_t>(count));
                if (targets.size() < 2) {
                    continue;
                }
                break;
            }
            case game::SkillTargetMode::Unknown:
                continue;
        }
        TBC_LOG_DEBUG(LogCategory::AI, actorId + " uses " + skill.id);
        return impl_->resolveSkill(battle, actor, skill, targets);
    }

    const auto target = impl_->threat.OrderEnemiesByPartyThreat(battle, actorId, rng).front();
    return basicAttack(battle, actorId, target);
}

// -- Queries ------------------------------------------------------------------

GameResult<std::vector<game::SkillDef>> BattleService::availableSkills(
    const BattleState& battle, const std::string& combatantId) const {
    using R = GameResult<std::vector<game::SkillDef>>;
    const Combatant* combatant = battle.FindCombatant(combatantId);
    if (combatant == nullptr) {
        return R::err(GameError(ErrorCode::CombatantNotFound, "no combatant with id " + combatantId));
    }
    return R::ok(impl_->skillsFor(*combatant));
}

std::vector<BattleItem> BattleService::battleItems(const GameState& state) const {
    std::vector<BattleItem> items;
    for (const auto& [itemId, quantity] : state.inventory.Items()) {
        if (quantity <= 0) {
            continue;
        }
        auto def = impl_->content.items.get(itemId);
        if (def.hasError() || !def.value().IsConsumable()) {
            continue;
        }
        items.push_back(BattleItem{itemId, def.value().name, quantity, def.value().targeting});
    }
    return items;
}

GameResult<int32_t> BattleService::estimateDamage(const BattleState& battle,
                                                  const std::string& attackerId,
                                                  const std::string& targetId,
                                                  const std::optional<std::string>& skillId) const {
    using R = GameResult<int32_t>;
    const Combatant* attacker = battle.FindCombatant(attackerId);
    const Combatant* target = battle.FindCombatant(targetId);
    if (attacker == nullptr || target == nullptr) {
        return R::err(GameError(ErrorCode::CombatantNotFound,
                                "no combatant with id " + (attacker ? targetId : attackerId)));
    }
    if (!skillId || skillId->empty()) {
        return R::ok(impl_->damage.EstimateAction(*attacker, *target, nullptr));
    }
    auto skill = impl_->content.skills.get(*skillId);
    if (skill.hasError()) {
        return skill.propagate<int32_t>();
    }
    return R::ok(impl_->damage.EstimateAction(*attacker, *target, &skill.value()));
}

BattleView BattleService::battleView(const BattleState& battle) const {
    auto toView = [](const Combatant& c) {
        CombatantView view;
        view.id = c.instanceId;
        view.name = c.displayName;
        view.side = c.side;
        view.alive = c.IsAlive();
        view.hp = c.stats.hp;
        view.maxHp = c.stats.maxHp;
        view.mp = c.stats.mp;
        view.maxMp = c.stats.maxMp;
        view.defense = c.stats.defense;
        return view;
    };

    BattleView view;
    view.battleId = battle.battleId;
    view.currentActorId = battle.currentActorId;
    for (const auto& ally : battle.allies) {
        auto v = toView(ally);
        v.hpDisplay = std::to_string(ally.stats.hp) + "/" + std::to_string(ally.stats.maxHp);
        view.allies.push_back(std::move(v));
    }
    for (const auto& enemy : battle.enemies) {
        auto v = toView(enemy);
        v.hpDisplay = impl_->knowledge.HpDisplay(battle, enemy);
        view.enemies.push_back(std::move(v));
    }
    return view;
}

bool BattleService::hasKnowledgeOfEnemy(const GameState& state,
                                        const std::vector<std::string>& enemyTags) const {
    return impl_->knowledge.HasKnowledgeOfEnemy(state, enemyTags);
}

// -- Bookkeeping --------------------------------------------------------------

void BattleService::refreshKnowledgeSnapshot(BattleState& battle, const GameState& state) const {
    impl_->knowledge.BuildSnapshot(battle, state);
}

BattleEvents BattleService::applyVictoryRewards(BattleState& battle, GameState& state) const {
    return impl_->rewards.ApplyVictoryRewards(battle, state);
}

void BattleService::recordDefeat(const BattleState& battle, GameState& state) const {
    impl_->rewards.RecordDefeat(battle, state);
}

}  // namespace tbc::service
