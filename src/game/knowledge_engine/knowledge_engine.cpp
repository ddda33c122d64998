/// @file knowledge_engine.cpp
/// @brief KnowledgeEngine implementation.
///
/// Tiers come from the tuned kill thresholds, visibility per tier from the
/// knowledge source. Talk text groups living enemies by knowledge key.

#include "tbc/game/knowledge_engine.hpp"

#include <algorithm>
#include <map>

#include "tbc/foundation/game_logger.hpp"

namespace tbc::game {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

bool overlaps(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    return std::any_of(a.begin(), a.end(), [&b](const std::string& tag) {
        return std::find(b.begin(), b.end(), tag) != b.end();
    });
}

}  // namespace

int32_t KnowledgeEngine::TierForKills(int32_t kills, const KnowledgeTuning& tuning) {
    int32_t tier = 0;
    for (int32_t i = 0; i < kMaxKnowledgeTier; ++i) {
        if (kills >= tuning.tierKills[static_cast<std::size_t>(i)]) {
            tier = i + 1;
        }
    }
    return tier;
}

std::string KnowledgeEngine::KeyFor(const Combatant& enemy) const {
    if (enemy.sourceId) {
        auto def = content_.enemies.get(*enemy.sourceId);
        if (def.hasValue()) {
            return resolveKnowledgeKey(def.value());
        }
    }
    return enemy.SourceOrInstanceId();
}

void KnowledgeEngine::BuildSnapshot(BattleState& battle, const GameState& state) const {
    const auto rules = content_.knowledge.rules();
    battle.knowledgeSnapshot.clear();
    for (const auto& enemy : battle.enemies) {
        EnemyKnowledge entry;
        entry.knowledgeKey = KeyFor(enemy);
        auto it = state.knowledgeKills.find(entry.knowledgeKey);
        const int32_t kills = it == state.knowledgeKills.end() ? 0 : it->second;
        entry.tier = TierForKills(kills, tuning_);
        entry.visibility = rules.visibility[static_cast<std::size_t>(entry.tier)];
        auto [low, high] = StaticRange(enemy.stats.maxHp);
        entry.rangeLow = low;
        entry.rangeHigh = high;

        if (foundation::GameLogger::instance().isEnabled(LogLevel::Debug, LogCategory::Knowledge)) {
            LogContext ctx;
            ctx.battleId = battle.battleId;
            ctx.targetId = enemy.instanceId;
            ctx.extra["key"] = entry.knowledgeKey;
            ctx.extra["kills"] = std::to_string(kills);
            ctx.extra["tier"] = std::to_string(entry.tier);
            foundation::GameLogger::instance().logWithContext(
                LogLevel::Debug, LogCategory::Knowledge, "knowledge snapshot", ctx);
        }
        battle.knowledgeSnapshot[enemy.instanceId] = std::move(entry);
    }
}

std::pair<int32_t, int32_t> KnowledgeEngine::StaticRange(int32_t maxHp) const {
    const int32_t spread = maxHp * tuning_.staticRangePercent / 100;
    return {std::max(1, maxHp - spread), maxHp + spread};
}

HpVisibility KnowledgeEngine::VisibilityOf(const BattleState& battle, const Combatant& enemy) const {
    auto it = battle.knowledgeSnapshot.find(enemy.instanceId);
    if (it == battle.knowledgeSnapshot.end()) {
        return HpVisibility::Hidden;
    }
    const auto& known = it->second;
    if (battle.temporaryReveals.count(known.knowledgeKey) == 0) {
        return known.visibility;
    }
    const int32_t tier = std::min(known.tier + 1, kMaxKnowledgeTier);
    return content_.knowledge.rules().visibility[static_cast<std::size_t>(tier)];
}

std::string KnowledgeEngine::HpDisplay(const BattleState& battle, const Combatant& enemy) const {
    switch (VisibilityOf(battle, enemy)) {
        case HpVisibility::StaticRange: {
            const auto& known = battle.knowledgeSnapshot.at(enemy.instanceId);
            return std::to_string(known.rangeLow) + "-" + std::to_string(known.rangeHigh);
        }
        case HpVisibility::Realtime:
            return std::to_string(enemy.stats.hp) + "/" + std::to_string(enemy.stats.maxHp);
        case HpVisibility::Hidden:
            break;
    }
    return "???";
}

std::optional<KnowledgeEntry> KnowledgeEngine::matchEntry(const std::vector<KnowledgeEntry>& entries,
                                                          const std::string& key,
                                                          const std::vector<std::string>& tags) const {
    for (const auto& entry : entries) {
        if (std::find(entry.knowledgeKeys.begin(), entry.knowledgeKeys.end(), key) !=
            entry.knowledgeKeys.end()) {
            return entry;
        }
    }
    for (const auto& entry : entries) {
        if (overlaps(entry.enemyTags, tags)) {
            return entry;
        }
    }
    return std::nullopt;
}

std::string KnowledgeEngine::groupName(const Combatant& enemy) const {
    if (enemy.sourceId) {
        auto def = content_.enemies.get(*enemy.sourceId);
        if (def.hasValue()) {
            return def.value().name;
        }
    }
    return enemy.displayName;
}

TalkReport KnowledgeEngine::DescribeEnemies(const BattleState& battle,
                                            const std::string& knowledgeSourceId,
                                            const std::string& speakerName) const {
    TalkReport report;
    const auto fallback = speakerName + ": I'm not sure about these foes.";
    const auto entries = content_.knowledge.entriesFor(knowledgeSourceId);
    if (entries.empty()) {
        report.text = fallback;
        return report;
    }

    // First living enemy per key stands in for its group.
    std::map<std::string, const Combatant*> groups;
    for (const auto* enemy : battle.Living(Side::Enemies)) {
        groups.try_emplace(KeyFor(*enemy), enemy);
    }

    for (const auto& [key, enemy] : groups) {
        auto entry = matchEntry(entries, key, enemy->tags);
        if (!entry) {
            continue;
        }
        auto [low, high] = StaticRange(enemy->stats.maxHp);
        std::string line = groupName(*enemy) + " look to have around " + std::to_string(low) +
                           "-" + std::to_string(high) + " HP.";
        for (const auto* hint : {&entry->hpHint, &entry->speedHint, &entry->behavior}) {
            if (!hint->empty()) {
                line += " " + *hint;
            }
        }
        report.lines.push_back(std::move(line));
        report.matchedKeys.push_back(key);
    }

    if (report.lines.empty()) {
        report.text = fallback;
        return report;
    }
    report.text = speakerName + ":";
    for (const auto& line : report.lines) {
        report.text += " " + line;
    }
    return report;
}

void KnowledgeEngine::Reveal(BattleState& battle, const std::vector<std::string>& keys) const {
    for (const auto& key : keys) {
        if (battle.temporaryReveals.insert(key).second) {
            TBC_LOG_DEBUG(LogCategory::Knowledge, "temporary reveal of " + key + " in " + battle.battleId);
        }
    }
}

std::vector<std::string> KnowledgeEngine::KnowledgeSourceIds(const GameState& state) {
    std::vector<std::string> ids;
    if (state.player) {
        ids.push_back(state.player->classId.empty() ? state.player->id : state.player->classId);
    }
    ids.insert(ids.end(), state.partyMembers.begin(), state.partyMembers.end());
    return ids;
}

bool KnowledgeEngine::HasKnowledgeOfEnemy(const GameState& state,
                                          const std::vector<std::string>& enemyTags) const {
    for (const auto& sourceId : KnowledgeSourceIds(state)) {
        for (const auto& entry : content_.knowledge.entriesFor(sourceId)) {
            if (overlaps(entry.enemyTags, enemyTags)) {
                return true;
            }
        }
    }
    return false;
}

void KnowledgeEngine::RecordKills(GameState& state, const std::vector<std::string>& keys) {
    for (const auto& key : keys) {
        AddKillCount(state, key, 1);
    }
}

void KnowledgeEngine::SetKillCount(GameState& state, const std::string& key, int32_t count) {
    if (key.empty()) {
        return;
    }
    state.knowledgeKills[key] = std::max(0, count);
}

void KnowledgeEngine::AddKillCount(GameState& state, const std::string& key, int32_t delta) {
    if (key.empty()) {
        return;
    }
    auto& kills = state.knowledgeKills[key];
    kills = std::max(0, kills + delta);
}

}  // namespace tbc::game
