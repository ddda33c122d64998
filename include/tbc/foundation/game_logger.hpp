#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping kcenon's logger registry for battle-scoped
///        structured logging.
///
/// Provides category-based filtering, structured logging with battle
/// context, and per-category runtime log level control. Logging is a pure
/// side channel: it never reads or advances the battle RNG.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "tbc/foundation/game_result.hpp"

namespace tbc::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Engine log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core      = 0, ///< Config, content lookup, RNG persistence
    Battle    = 1, ///< Battle start/resolution
    Turn      = 2, ///< Turn queue and round transitions
    AI        = 3, ///< Enemy/ally targeting decisions
    Combat    = 4, ///< Damage, guard, debuffs, items
    Knowledge = 5, ///< Kill counters and disclosure tiers
    Summon    = 6, ///< Summon spawning
    Rewards   = 7  ///< Gold, exp, loot
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 8;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Battle", "Turn", "AI", "Combat", "Knowledge", "Summon", "Rewards"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.battleId = battle.battleId;
///   ctx.actorId = attacker.instanceId;
///   ctx.extra["damage"] = "4";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Combat,
///                         "damage applied", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> battleId;
    std::optional<std::string> actorId;
    std::optional<std::string> targetId;
    std::unordered_map<std::string, std::string> extra;
};

/// Engine logger wrapping kcenon's logging registry.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
///
/// Default log levels per category:
/// | Category  | Default Level |
/// |-----------|---------------|
/// | Core      | Info          |
/// | Battle    | Info          |
/// | Turn      | Debug         |
/// | AI        | Debug         |
/// | Combat    | Debug         |
/// | Knowledge | Info          |
/// | Summon    | Info          |
/// | Rewards   | Info          |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    // Non-copyable, movable.
    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data.
    /// Context fields are appended as key-value pairs to the log message.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Set the minimum log level for a category at runtime.
    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Get the current minimum log level for a category.
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    GameResult<void> flush();

    /// Get the global GameLogger singleton instance.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tbc::foundation

// ---------------------------------------------------------------------------
// Convenience macros (must be outside namespace, macros are global)
// ---------------------------------------------------------------------------

/// @name TBC_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// TBC_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef TBC_MIN_LOG_LEVEL
    #define TBC_MIN_LOG_LEVEL 0
#endif

#define TBC_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= TBC_MIN_LOG_LEVEL &&                      \
            ::tbc::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::tbc::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define TBC_LOG_DEBUG(cat, msg) \
    TBC_LOG(::tbc::foundation::LogLevel::Debug, (cat), (msg))

#define TBC_LOG_INFO(cat, msg) \
    TBC_LOG(::tbc::foundation::LogLevel::Info, (cat), (msg))

#define TBC_LOG_WARN(cat, msg) \
    TBC_LOG(::tbc::foundation::LogLevel::Warning, (cat), (msg))

#define TBC_LOG_ERROR(cat, msg) \
    TBC_LOG(::tbc::foundation::LogLevel::Error, (cat), (msg))

/// @}
