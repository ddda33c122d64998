#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the combat engine.

#include <cstdint>
#include <string_view>

namespace tbc::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    NotImplemented = 0x0005,

    // Content (0x0100 - 0x01FF)
    ContentNotFound = 0x0100,
    InvalidDefinition = 0x0101,
    GroupNotInstantiable = 0x0102,

    // Battle setup (0x0200 - 0x02FF)
    FactoryFailed = 0x0200,
    NoPlayer = 0x0201,
    SummonOwnerMissing = 0x0202,

    // Action rejection (0x0300 - 0x03FF)
    CombatantNotFound = 0x0300,
    NoCurrentActor = 0x0301,
    BattleOver = 0x0302,
    ActorNotAlive = 0x0303,
    TargetNotAlive = 0x0304,
    TargetWrongSide = 0x0305,
    DuplicateTarget = 0x0306,
    TargetCountOutOfRange = 0x0307,
    InsufficientMp = 0x0308,
    UnknownItem = 0x0309,
    ItemNotConsumable = 0x030A,
    ItemNotAvailable = 0x030B,
    TargetingNotSupported = 0x030C,
    InvalidAction = 0x030D,

    // RNG (0x0400 - 0x04FF)
    RngStateInvalid = 0x0400,

    // Serialization (0x0500 - 0x05FF)
    InvalidJsonData = 0x0500,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigValueOutOfRange = 0x0603,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerNotInitialized = 0x0801,
    LoggerFlushFailed = 0x0802,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Content";
        case 0x0200: return "Setup";
        case 0x0300: return "Action";
        case 0x0400: return "Rng";
        case 0x0500: return "Serialization";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

/// True for codes that reject a player/AI action without mutating state.
/// The presentation layer re-prompts on these instead of aborting.
constexpr bool isActionRejection(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xFF00) == 0x0300;
}

} // namespace tbc::foundation
