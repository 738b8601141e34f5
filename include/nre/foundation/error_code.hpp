#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the ranking engine.

#include <cstdint>
#include <string_view>

namespace nre::foundation {

/// Error codes grouped by subsystem in 256-value ranges (0x100),
/// so the source of an error can be read from the code alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,

    // Ingest (0x0100 - 0x01FF)
    IngestError = 0x0100,
    MalformedRecord = 0x0101,
    DuplicateMatch = 0x0102,
    UnknownGameMode = 0x0103,

    // Ranking (0x0200 - 0x02FF)
    RankingError = 0x0200,
    ConfidenceUndefined = 0x0201,
    NationNotFound = 0x0202,
    GameModeNotFound = 0x0203,

    // Teams (0x0300 - 0x03FF)
    TeamsError = 0x0300,
    UnknownTeamType = 0x0301,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Thread (0x0700 - 0x07FF)
    ThreadError = 0x0700,
    JobScheduleFailed = 0x0701,
    JobNotFound = 0x0702,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    switch (static_cast<uint32_t>(code) & 0xFF00) {
        case 0x0000: return "General";
        case 0x0100: return "Ingest";
        case 0x0200: return "Ranking";
        case 0x0300: return "Teams";
        case 0x0600: return "Config";
        case 0x0700: return "Thread";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace nre::foundation
