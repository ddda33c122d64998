#pragma once

/// @file content.hpp
/// @brief Read-only content definitions and the narrow lookup interfaces
///        the battle engine consumes them through.
///
/// Loading and validating content files happens outside the engine; any
/// storage backend that can answer `get(id)` satisfies these interfaces.

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "tbc/foundation/game_result.hpp"
#include "tbc/game/combat_types.hpp"
#include "tbc/game/components.hpp"

namespace tbc::game {

// ── Definitions ─────────────────────────────────────────────────────────

struct EnemyDef {
    std::string id;
    std::string name;
    Stats baseStats;
    int32_t rewardsGold = 0;
    int32_t rewardsExp = 0;
    std::vector<std::string> tags;
    std::vector<std::string> equippedSkills;
    /// Overrides the id as the kill-counter key when set.
    std::optional<std::string> knowledgeKey;
};

/// Ordered list of enemies instantiated together.
struct EnemyGroupDef {
    std::string id;
    std::vector<std::string> enemyIds;
};

struct SkillDef {
    std::string id;
    std::string name;
    SkillTargetMode targetMode = SkillTargetMode::SingleEnemy;
    int32_t maxTargets = 1;
    int32_t mpCost = 0;
    int32_t basePower = 0;
    SkillEffectType effectType = SkillEffectType::Damage;
    std::vector<std::string> tags;
    std::vector<std::string> requiredWeaponTags;
};

struct ItemDef {
    std::string id;
    std::string name;
    std::string kind = "consumable";
    ItemTargeting targeting = ItemTargeting::Self;
    int32_t healHp = 0;
    int32_t healMp = 0;
    int32_t debuffAttackFlat = 0;
    int32_t debuffDefenseFlat = 0;

    [[nodiscard]] bool IsConsumable() const { return kind == "consumable"; }
    [[nodiscard]] bool IsDebuffItem() const {
        return debuffAttackFlat > 0 || debuffDefenseFlat > 0;
    }
};

struct LootDropDef {
    std::string itemId;
    double chance = 1.0;
    int32_t minQty = 1;
    int32_t maxQty = 1;
};

/// Drops rolled for every defeated enemy whose tags include all required
/// tags and none of the forbidden ones.
struct LootTableDef {
    std::string id;
    std::vector<std::string> requiredTags;
    std::vector<std::string> forbiddenTags;
    std::vector<LootDropDef> drops;
};

/// Per-bond-point bonuses applied to a summon's base stats.
struct BondScaling {
    double hpPerBond = 0.0;
    double attackPerBond = 0.0;
    double defensePerBond = 0.0;
    double speedPerBond = 0.0;
};

struct SummonDef {
    std::string id;
    std::string name;
    Stats baseStats;
    int32_t bondCost = 1;
    std::vector<std::string> tags;
    BondScaling bondScaling;
};

struct PartyMemberDef {
    std::string id;
    std::string name;
    Stats baseStats;
    std::vector<std::string> tags;
    std::vector<std::string> weaponTags;
    Attributes startingAttributes;
};

/// HP visibility per knowledge tier. The kill thresholds that select the
/// tier are balance values and live in KnowledgeTuning.
struct KnowledgeRules {
    std::array<HpVisibility, kMaxKnowledgeTier + 1> visibility{
        HpVisibility::Hidden, HpVisibility::StaticRange,
        HpVisibility::Realtime, HpVisibility::Realtime};
};

/// What one party member knows about a family of enemies.
struct KnowledgeEntry {
    std::vector<std::string> knowledgeKeys;
    std::vector<std::string> enemyTags;
    std::string hpHint;
    std::string speedHint;
    std::string behavior;
};

// ── Lookup interfaces ───────────────────────────────────────────────────

/// Id-keyed definition lookup for one content kind.
template <typename Def>
class IDefinitionSource {
public:
    virtual ~IDefinitionSource() = default;

    /// Fetch a definition; ContentNotFound when the id is unknown.
    [[nodiscard]] virtual foundation::GameResult<Def> get(std::string_view id) const = 0;

    [[nodiscard]] virtual bool contains(std::string_view id) const = 0;

    /// Every definition, in the order it was defined.
    [[nodiscard]] virtual std::vector<Def> all() const = 0;
};

/// Vector-backed source used by tests and embedders that build content in code.
template <typename Def>
class InMemoryDefinitionSource final : public IDefinitionSource<Def> {
public:
    InMemoryDefinitionSource() = default;

    explicit InMemoryDefinitionSource(std::string kindName)
        : kindName_(std::move(kindName)) {}

    /// Insert a definition, replacing any previous one with the same id.
    void add(Def def) {
        auto it = index_.find(def.id);
        if (it != index_.end()) {
            defs_[it->second] = std::move(def);
            return;
        }
        index_.emplace(def.id, defs_.size());
        defs_.push_back(std::move(def));
    }

    [[nodiscard]] foundation::GameResult<Def> get(std::string_view id) const override {
        auto it = index_.find(std::string(id));
        if (it == index_.end()) {
            return foundation::GameResult<Def>::err(foundation::GameError(
                foundation::ErrorCode::ContentNotFound,
                "unknown " + kindName_ + " id: " + std::string(id)));
        }
        return foundation::GameResult<Def>::ok(defs_[it->second]);
    }

    [[nodiscard]] bool contains(std::string_view id) const override {
        return index_.count(std::string(id)) > 0;
    }

    [[nodiscard]] std::vector<Def> all() const override { return defs_; }

private:
    std::string kindName_ = "definition";
    std::vector<Def> defs_;
    std::unordered_map<std::string, std::size_t> index_;
};

/// Knowledge rules plus per-member knowledge entries.
class IKnowledgeSource {
public:
    virtual ~IKnowledgeSource() = default;

    [[nodiscard]] virtual KnowledgeRules rules() const = 0;

    /// Entries for a party member or class id; empty when it knows nothing.
    [[nodiscard]] virtual std::vector<KnowledgeEntry> entriesFor(std::string_view memberId) const = 0;
};

class InMemoryKnowledgeSource final : public IKnowledgeSource {
public:
    InMemoryKnowledgeSource() = default;
    explicit InMemoryKnowledgeSource(KnowledgeRules rules) : rules_(rules) {}

    void setRules(const KnowledgeRules& rules) { rules_ = rules; }

    void addEntry(const std::string& memberId, KnowledgeEntry entry) {
        entries_[memberId].push_back(std::move(entry));
    }

    [[nodiscard]] KnowledgeRules rules() const override { return rules_; }

    [[nodiscard]] std::vector<KnowledgeEntry> entriesFor(std::string_view memberId) const override {
        auto it = entries_.find(std::string(memberId));
        if (it == entries_.end()) {
            return {};
        }
        return it->second;
    }

private:
    KnowledgeRules rules_;
    std::unordered_map<std::string, std::vector<KnowledgeEntry>> entries_;
};

/// Non-owning bundle of every source the battle engine reads.
struct CombatContent {
    const IDefinitionSource<EnemyDef>& enemies;
    const IDefinitionSource<EnemyGroupDef>& enemyGroups;
    const IDefinitionSource<SkillDef>& skills;
    const IDefinitionSource<ItemDef>& items;
    const IDefinitionSource<LootTableDef>& lootTables;
    const IDefinitionSource<SummonDef>& summons;
    const IDefinitionSource<PartyMemberDef>& partyMembers;
    const IKnowledgeSource& knowledge;
};

/// Kill-counter key for an enemy: the explicit override, else its id.
inline std::string resolveKnowledgeKey(const EnemyDef& def) {
    if (def.knowledgeKey && !def.knowledgeKey->empty()) {
        return *def.knowledgeKey;
    }
    return def.id;
}

}  // namespace tbc::game
