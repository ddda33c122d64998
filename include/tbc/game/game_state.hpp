#pragma once

/// @file game_state.hpp
/// @brief Persistent state that survives between battles.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tbc/game/components.hpp"
#include "tbc/game/rng.hpp"

namespace tbc::game {

/// The player character.
struct PlayerState {
    std::string id;
    std::string name;
    std::string classId;
    Stats baseStats;   ///< Before attribute scaling.
    Stats stats;       ///< Scaled stats with current pools.
    Attributes attributes;
    std::vector<std::string> weaponTags;
    std::vector<std::string> equippedSummons;
};

/// Shared item stacks keyed by item id.
class Inventory {
public:
    void Add(const std::string& itemId, int32_t quantity) {
        if (quantity > 0) {
            items_[itemId] += quantity;
        }
    }

    /// Remove @p quantity units; false (and no change) if not enough are held.
    bool Remove(const std::string& itemId, int32_t quantity) {
        auto it = items_.find(itemId);
        if (quantity <= 0 || it == items_.end() || it->second < quantity) {
            return false;
        }
        it->second -= quantity;
        if (it->second == 0) {
            items_.erase(it);
        }
        return true;
    }

    [[nodiscard]] int32_t Count(const std::string& itemId) const {
        auto it = items_.find(itemId);
        return it == items_.end() ? 0 : it->second;
    }

    [[nodiscard]] const std::map<std::string, int32_t>& Items() const noexcept {
        return items_;
    }

    bool operator==(const Inventory&) const = default;

private:
    std::map<std::string, int32_t> items_;
};

/// Everything a save file must round-trip for combat to resume exactly.
struct GameState {
    Rng rng;
    std::optional<PlayerState> player;
    std::vector<std::string> partyMembers;
    std::map<std::string, Attributes> partyMemberAttributes;
    std::map<std::string, std::vector<std::string>> partySummonLoadouts;
    std::map<std::string, int32_t> memberLevels;
    std::map<std::string, int32_t> memberExp;
    int64_t gold = 0;
    Inventory inventory;
    /// Persistent kill counters per knowledge key.
    std::map<std::string, int32_t> knowledgeKills;
    bool lastBattleWasDefeat = false;

    explicit GameState(uint64_t seed = 0) : rng(seed) {}

    [[nodiscard]] int32_t LevelOf(const std::string& memberId) const {
        auto it = memberLevels.find(memberId);
        return it == memberLevels.end() ? 1 : it->second;
    }

    [[nodiscard]] int32_t ExpOf(const std::string& memberId) const {
        auto it = memberExp.find(memberId);
        return it == memberExp.end() ? 0 : it->second;
    }

    /// Player first, then party members in order.
    [[nodiscard]] std::vector<std::string> ActivePartyIds() const {
        std::vector<std::string> ids;
        if (player) {
            ids.push_back(player->id);
        }
        ids.insert(ids.end(), partyMembers.begin(), partyMembers.end());
        return ids;
    }
};

}  // namespace tbc::game
