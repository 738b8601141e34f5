#pragma once

/// @file engine_logger.hpp
/// @brief EngineLogger wrapping the kcenon logger registry for
///        category-filtered pipeline logging.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "nre/foundation/engine_result.hpp"

namespace nre::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Pipeline stages that log independently.
enum class LogCategory : uint8_t {
    Core    = 0, ///< Engine facade, run orchestration
    Ingest  = 1, ///< Snapshot building and record validation
    Ranking = 2, ///< Aggregation, confidence correction, leaderboards
    Teams   = 3, ///< Co-occurrence graph, party and community detection
    Config  = 4, ///< Configuration loading
    Thread  = 5  ///< Job scheduling
};

inline constexpr std::size_t kLogCategoryCount = 6;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Ingest", "Ranking", "Teams", "Config", "Thread"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

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

/// Structured key-value data appended to a log line.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.gameMode = "Duel";
///   ctx.extra["k"] = "76.5";
///   logger.logWithContext(LogLevel::Info, LogCategory::Ranking,
///                         "confidence factor derived", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> gameMode;
    std::optional<std::string> nation;
    std::optional<uint64_t> playerId;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-aware logger forwarding to kcenon's GlobalLoggerRegistry.
///
/// Each category resolves a named logger "nre.<Category>" and falls back
/// to the registry's default logger. Per-category minimum levels can be
/// changed at runtime.
///
/// Default levels: Core, Ingest, Ranking, Teams, Config at Info;
/// Thread at Warning.
class EngineLogger {
public:
    EngineLogger();
    ~EngineLogger();

    EngineLogger(const EngineLogger&) = delete;
    EngineLogger& operator=(const EngineLogger&) = delete;
    EngineLogger(EngineLogger&&) noexcept;
    EngineLogger& operator=(EngineLogger&&) noexcept;

    /// Log a message. No-op below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with context fields appended as {key=val, ...}.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    GameResult<void> flush();

    /// Process-wide logger used by the NRE_LOG macros.
    static EngineLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace nre::foundation

// ---------------------------------------------------------------------------
// Logging macros
// ---------------------------------------------------------------------------

/// NRE_MIN_LOG_LEVEL may be defined before inclusion to compile out calls
/// below a level (0=Trace ... 6=Off).
#ifndef NRE_MIN_LOG_LEVEL
    #define NRE_MIN_LOG_LEVEL 0
#endif

#define NRE_LOG(level, cat, msg)                                                   \
    do {                                                                           \
        _Pragma("GCC diagnostic push")                                             \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                        \
        if (static_cast<int>(level) >= NRE_MIN_LOG_LEVEL &&                        \
            ::nre::foundation::EngineLogger::instance().isEnabled((level), (cat))) \
        {                                                                          \
            ::nre::foundation::EngineLogger::instance().log((level), (cat), (msg)); \
        }                                                                          \
        _Pragma("GCC diagnostic pop")                                              \
    } while (0)

#define NRE_LOG_DEBUG(cat, msg) \
    NRE_LOG(::nre::foundation::LogLevel::Debug, (cat), (msg))

#define NRE_LOG_INFO(cat, msg) \
    NRE_LOG(::nre::foundation::LogLevel::Info, (cat), (msg))

#define NRE_LOG_WARN(cat, msg) \
    NRE_LOG(::nre::foundation::LogLevel::Warning, (cat), (msg))

#define NRE_LOG_ERROR(cat, msg) \
    NRE_LOG(::nre::foundation::LogLevel::Error, (cat), (msg))
