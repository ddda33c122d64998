#pragma once

/// @file components.hpp
/// @brief Plain stat blocks shared by content definitions, combatants and
///        persistent player state.

#include <algorithm>
#include <cstdint>

namespace tbc::game {

// ── Stats ───────────────────────────────────────────────────────────────

/// Combat stat block: pools plus flat attack/defense/speed.
struct Stats {
    int32_t maxHp = 1;
    int32_t hp = 1;
    int32_t maxMp = 0;
    int32_t mp = 0;
    int32_t attack = 0;
    int32_t defense = 0;
    int32_t speed = 0;

    /// Set HP, clamping to [0, maxHp].
    void SetHp(int32_t value) noexcept {
        hp = std::clamp(value, static_cast<int32_t>(0), std::max(maxHp, 0));
    }

    /// Set MP, clamping to [0, maxMp].
    void SetMp(int32_t value) noexcept {
        mp = std::clamp(value, static_cast<int32_t>(0), std::max(maxMp, 0));
    }

    /// Refill both pools.
    void RestoreAll() noexcept {
        hp = maxHp;
        mp = maxMp;
    }

    bool operator==(const Stats&) const = default;
};

/// Build a stat block whose current pools start full.
constexpr Stats makeStats(int32_t maxHp, int32_t maxMp, int32_t attack,
                          int32_t defense, int32_t speed) {
    return Stats{maxHp, maxHp, maxMp, maxMp, attack, defense, speed};
}

// ── Attributes ──────────────────────────────────────────────────────────

/// Allocated character attributes.
///
/// VIT/INT/STR/DEX feed attribute scaling; BOND is the summon capacity.
struct Attributes {
    int32_t str = 0;
    int32_t dex = 0;
    int32_t intel = 0;
    int32_t vit = 0;
    int32_t bond = 0;

    bool operator==(const Attributes&) const = default;
};

}  // namespace tbc::game
