/// @file rng.cpp
/// @brief Rng implementation.

#include "tbc/game/rng.hpp"

#include <sstream>

#include "tbc/foundation/game_logger.hpp"

namespace tbc::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

Rng::Rng(uint64_t seed) : seed_(seed), engine_(seed) {}

uint64_t Rng::next() {
    ++draws_;
    return engine_();
}

int64_t Rng::randint(int64_t lo, int64_t hi) {
    if (hi <= lo) {
        return lo;
    }
    const auto range = static_cast<uint64_t>(hi - lo) + 1;
    // Reject the low 2^64 mod range values so every residue is equally likely.
    const uint64_t threshold = (0 - range) % range;
    uint64_t x = next();
    while (x < threshold) {
        x = next();
    }
    return lo + static_cast<int64_t>(x % range);
}

double Rng::random() {
    return static_cast<double>(next() >> 11) * 0x1.0p-53;
}

RngState Rng::exportState() const {
    std::ostringstream oss;
    oss << engine_;
    return RngState{seed_, oss.str(), draws_};
}

GameResult<void> Rng::importState(const RngState& state) {
    std::istringstream iss(state.engine);
    std::mt19937_64 restored;
    iss >> restored;
    if (state.engine.empty() || iss.fail()) {
        TBC_LOG_WARN(LogCategory::Core, "rejected malformed rng engine state");
        return GameResult<void>::err(
            GameError(ErrorCode::RngStateInvalid, "malformed rng engine state"));
    }
    seed_ = state.seed;
    engine_ = restored;
    draws_ = state.draws;
    return GameResult<void>::ok();
}

std::string Rng::exportJson() const {
    return foundation::GameSerializer::instance().serializeJson(exportState());
}

GameResult<void> Rng::importJson(std::string_view json) {
    auto parsed = foundation::GameSerializer::instance().deserializeJson<RngState>(json);
    if (!parsed) {
        return GameResult<void>::err(GameError(
            ErrorCode::RngStateInvalid,
            "rng state JSON rejected: " + std::string(parsed.error().message()),
            parsed.error()));
    }
    return importState(parsed.value());
}

std::string makeInstanceId(std::string_view prefix, Rng& rng, const IdTakenFn& taken) {
    std::string id;
    do {
        id = std::string(prefix) + "_" + std::to_string(rng.randint(100000, 999999));
    } while (taken && taken(id));
    return id;
}

}  // namespace tbc::game
