#pragma once

/// @file rng.hpp
/// @brief Seeded, exportable random source shared by every battle decision.
///
/// The RNG is the only source of non-determinism in the engine. It is owned
/// by GameState and passed explicitly to every operation that draws from it;
/// there is no ambient or global generator.

#include <cstdint>
#include <functional>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tbc/foundation/game_result.hpp"
#include "tbc/foundation/game_serializer.hpp"

namespace tbc::game {

/// JSON-safe snapshot of an Rng.
///
/// `engine` is the textual engine state as produced by the standard stream
/// operator; restoring it reproduces the exact forward sequence.
struct RngState {
    uint64_t seed = 0;
    std::string engine;
    uint64_t draws = 0;

    bool operator==(const RngState&) const = default;
};

/// Deterministic random number generator.
///
/// Bounded and unit-interval draws are computed in-house on top of the raw
/// 64-bit engine output, so a given seed yields the same values with every
/// standard library.
class Rng {
public:
    explicit Rng(uint64_t seed = 0);

    /// Inclusive integer draw in [lo, hi]. Returns lo without drawing
    /// when hi <= lo.
    int64_t randint(int64_t lo, int64_t hi);

    /// Uniform draw in [0, 1) with 53 bits of precision.
    double random();

    /// Uniformly pick one element. Fails on an empty sequence.
    template <typename T>
    foundation::GameResult<T> choice(const std::vector<T>& seq) {
        if (seq.empty()) {
            return foundation::GameResult<T>::err(foundation::GameError(
                foundation::ErrorCode::InvalidArgument, "choice from empty sequence"));
        }
        auto idx = randint(0, static_cast<int64_t>(seq.size()) - 1);
        return foundation::GameResult<T>::ok(seq[static_cast<std::size_t>(idx)]);
    }

    /// In-place Fisher-Yates shuffle, walking from the back.
    template <typename T>
    void shuffle(std::vector<T>& seq) {
        for (std::size_t i = seq.size(); i > 1; --i) {
            auto j = static_cast<std::size_t>(randint(0, static_cast<int64_t>(i - 1)));
            std::swap(seq[i - 1], seq[j]);
        }
    }

    [[nodiscard]] RngState exportState() const;
    foundation::GameResult<void> importState(const RngState& state);

    [[nodiscard]] std::string exportJson() const;
    foundation::GameResult<void> importJson(std::string_view json);

    [[nodiscard]] uint64_t seed() const noexcept { return seed_; }
    [[nodiscard]] uint64_t drawCount() const noexcept { return draws_; }

    bool operator==(const Rng& other) const {
        return seed_ == other.seed_ && draws_ == other.draws_ && engine_ == other.engine_;
    }

private:
    uint64_t next();

    uint64_t seed_;
    std::mt19937_64 engine_;
    uint64_t draws_ = 0;
};

/// Predicate reporting whether an id is already in use.
using IdTakenFn = std::function<bool(std::string_view)>;

/// Build "<prefix>_<6 digits>", redrawing while @p taken reports a clash.
std::string makeInstanceId(std::string_view prefix, Rng& rng,
                           const IdTakenFn& taken = {});

}  // namespace tbc::game

TBC_SERIALIZABLE(tbc::game::RngState, 1,
    field("seed", &tbc::game::RngState::seed),
    field("engine", &tbc::game::RngState::engine),
    field("draws", &tbc::game::RngState::draws)
);
