#pragma once

/// @file combatant.hpp
/// @brief Combatant: one participant of a single battle.

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tbc/game/combat_types.hpp"
#include "tbc/game/components.hpp"

namespace tbc::game {

/// A round-scoped stat penalty.
struct ActiveDebuff {
    DebuffType type = DebuffType::AttackDown;
    int32_t amount = 0;
    int32_t expiresAtRound = 0;

    bool operator==(const ActiveDebuff&) const = default;
};

/// A player, party member, enemy or summon inside one battle.
///
/// Invariant: IsAlive() iff stats.hp > 0, and a dead combatant carries no
/// debuffs. Route every HP change through SetHp() to keep both halves.
struct Combatant {
    std::string instanceId;
    std::string displayName;
    Side side = Side::Allies;
    Stats stats;
    std::optional<Stats> baseStats;        ///< Pre-scaling stats, display only.
    std::optional<Attributes> attributes;  ///< Players and party members.
    std::vector<std::string> tags;
    std::vector<std::string> weaponTags;
    int32_t guardReduction = 0;
    std::vector<ActiveDebuff> debuffs;
    std::optional<std::string> sourceId;   ///< Definition id.
    std::vector<std::string> equippedSkills;
    std::optional<std::string> ownerId;    ///< Summons only.
    std::optional<int32_t> bondCost;       ///< Summons only.

    [[nodiscard]] bool IsAlive() const noexcept { return stats.hp > 0; }
    [[nodiscard]] bool IsSummon() const noexcept { return ownerId.has_value(); }

    [[nodiscard]] bool HasTag(std::string_view tag) const {
        return std::find(tags.begin(), tags.end(), tag) != tags.end();
    }

    [[nodiscard]] bool HasWeaponTag(std::string_view tag) const {
        return std::find(weaponTags.begin(), weaponTags.end(), tag) != weaponTags.end();
    }

    /// Set HP (clamped); clears debuffs the moment the combatant dies.
    void SetHp(int32_t value) noexcept {
        stats.SetHp(value);
        if (!IsAlive()) {
            debuffs.clear();
        }
    }

    /// Definition id when known, else the instance id.
    [[nodiscard]] const std::string& SourceOrInstanceId() const noexcept {
        return sourceId ? *sourceId : instanceId;
    }

    bool operator==(const Combatant&) const = default;
};

}  // namespace tbc::game
