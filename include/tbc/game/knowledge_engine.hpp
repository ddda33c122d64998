#pragma once

/// @file knowledge_engine.hpp
/// @brief Kill-count driven disclosure of enemy HP and party talk text.

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "tbc/game/battle_state.hpp"
#include "tbc/game/combat_tuning.hpp"
#include "tbc/game/combatant.hpp"
#include "tbc/game/content.hpp"
#include "tbc/game/game_state.hpp"

namespace tbc::game {

/// Party talk output before it becomes an event.
struct TalkReport {
    std::string text;
    /// One sentence per known enemy group, sorted by knowledge key.
    std::vector<std::string> lines;
    /// Knowledge keys the speaker recognised.
    std::vector<std::string> matchedKeys;
};

/// Knowledge tiers, the per-battle snapshot and what it lets the UI show.
///
/// The snapshot is frozen at battle start: later kill counter updates only
/// take effect through an explicit BuildSnapshot() call. Party talk reveals
/// live in BattleState::temporaryReveals and are never written back to the
/// persistent counters.
class KnowledgeEngine {
public:
    KnowledgeEngine(const CombatContent& content, const KnowledgeTuning& tuning)
        : content_(content), tuning_(tuning) {}

    /// Highest tier whose threshold @p kills has reached; 0 below the first.
    [[nodiscard]] static int32_t TierForKills(int32_t kills, const KnowledgeTuning& tuning);

    /// Knowledge key of an enemy combatant, resolved through its definition.
    [[nodiscard]] std::string KeyFor(const Combatant& enemy) const;

    /// (Re)compute the visibility decision for every enemy from @p state's
    /// kill counters.
    void BuildSnapshot(BattleState& battle, const GameState& state) const;

    /// Static range shown at the range tier. Derived from max HP only, so it
    /// never moves while the enemy takes damage.
    [[nodiscard]] std::pair<int32_t, int32_t> StaticRange(int32_t maxHp) const;

    /// Visibility after temporary reveals are applied.
    [[nodiscard]] HpVisibility VisibilityOf(const BattleState& battle,
                                            const Combatant& enemy) const;

    /// "???", "low-high" or "hp/max" depending on VisibilityOf().
    [[nodiscard]] std::string HpDisplay(const BattleState& battle, const Combatant& enemy) const;

    /// Build party talk text for a speaker. Pure: consumes no RNG and
    /// touches neither the snapshot nor the counters.
    [[nodiscard]] TalkReport DescribeEnemies(const BattleState& battle,
                                             const std::string& knowledgeSourceId,
                                             const std::string& speakerName) const;

    /// Mark keys as revealed for the rest of the battle.
    void Reveal(BattleState& battle, const std::vector<std::string>& keys) const;

    /// Id each active party member's knowledge entries are stored under:
    /// the player's class, then the party member ids.
    [[nodiscard]] static std::vector<std::string> KnowledgeSourceIds(const GameState& state);

    /// Whether any active party member has an entry for these enemy tags.
    [[nodiscard]] bool HasKnowledgeOfEnemy(const GameState& state,
                                           const std::vector<std::string>& enemyTags) const;

    // ── Persistent counters ─────────────────────────────────────────────

    /// One kill per key.
    static void RecordKills(GameState& state, const std::vector<std::string>& keys);
    static void SetKillCount(GameState& state, const std::string& key, int32_t count);
    static void AddKillCount(GameState& state, const std::string& key, int32_t delta);

private:
    [[nodiscard]] std::optional<KnowledgeEntry> matchEntry(const std::vector<KnowledgeEntry>& entries,
                                                           const std::string& key,
                                                           const std::vector<std::string>& tags) const;
    [[nodiscard]] std::string groupName(const Combatant& enemy) const;

    const CombatContent& content_;
    KnowledgeTuning tuning_;
};

}  // namespace tbc::game
