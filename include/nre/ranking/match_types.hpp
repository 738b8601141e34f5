#pragma once

/// @file match_types.hpp
/// @brief Core input records: game modes, outcomes, match rosters,
///        player profiles and time windows.

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nre/foundation/types.hpp"

namespace nre::ranking {

using foundation::MatchId;
using foundation::PartyId;
using foundation::PlayerId;

using Timestamp = std::chrono::system_clock::time_point;

/// Ranked game modes. Each mode is an independent ranking slice.
enum class GameMode : uint8_t {
    Duel,       ///< 1v1.
    SmallTeam,  ///< Small team games.
    LargeTeam,  ///< Large team games.
    Team,       ///< Legacy team bucket.
    FFA,        ///< Free for all.
    Unknown     ///< Unparseable mode; records carrying it are rejected.
};

inline constexpr std::array<GameMode, 5> kRankedGameModes = {
    GameMode::Duel, GameMode::SmallTeam, GameMode::LargeTeam,
    GameMode::Team, GameMode::FFA
};

constexpr std::string_view gameModeName(GameMode mode) {
    switch (mode) {
        case GameMode::Duel:      return "Duel";
        case GameMode::SmallTeam: return "Small Team";
        case GameMode::LargeTeam: return "Large Team";
        case GameMode::Team:      return "Team";
        case GameMode::FFA:       return "FFA";
        case GameMode::Unknown:   return "Unknown";
    }
    return "Unknown";
}

/// Parse a display name ("Small Team") back to a mode; Unknown if unmatched.
constexpr GameMode parseGameMode(std::string_view name) {
    for (auto mode : kRankedGameModes) {
        if (gameModeName(mode) == name) {
            return mode;
        }
    }
    return GameMode::Unknown;
}

/// Per-player result of a match. Draws are explicit.
enum class Outcome : uint8_t { Win, Loss, Draw };

/// One player's line in a match roster.
struct PlayerResult {
    PlayerId playerId;
    std::optional<PartyId> partyId;  ///< Set when the player queued in a party.
    uint32_t teamSide = 0;
    Outcome outcome = Outcome::Loss;

    /// Post-match skill estimate and its uncertainty, when the match was rated.
    std::optional<double> skill;
    std::optional<double> uncertainty;

    bool operator==(const PlayerResult&) const = default;
};

/// Immutable record of a finished match.
struct MatchRecord {
    MatchId matchId;
    GameMode mode = GameMode::Unknown;
    Timestamp startTime{};
    std::vector<PlayerResult> players;

    bool operator==(const MatchRecord&) const = default;
};

/// Directory entry for a player. The nation of a player comes from here.
struct PlayerProfile {
    PlayerId playerId;
    std::string name;
    std::optional<std::string> countryCode;
};

/// Half-open time range [begin, end). Missing bounds are unbounded.
struct TimeWindow {
    std::optional<Timestamp> begin;
    std::optional<Timestamp> end;

    static TimeWindow all() { return {}; }

    static TimeWindow between(Timestamp from, Timestamp to) {
        return TimeWindow{from, to};
    }

    /// The @p span immediately preceding @p now, e.g. the last seven days.
    static TimeWindow trailing(Timestamp now, std::chrono::system_clock::duration span) {
        return TimeWindow{now - span, now};
    }

    [[nodiscard]] bool contains(Timestamp t) const {
        if (begin && t < *begin) {
            return false;
        }
        if (end && t >= *end) {
            return false;
        }
        return true;
    }

    /// Timestamps in both windows. Disjoint windows give an empty window
    /// whose end equals its begin.
    [[nodiscard]] TimeWindow overlap(const TimeWindow& other) const {
        TimeWindow out;
        out.begin = begin;
        if (other.begin && (!out.begin || *other.begin > *out.begin)) {
            out.begin = other.begin;
        }
        out.end = end;
        if (other.end && (!out.end || *other.end < *out.end)) {
            out.end = other.end;
        }
        if (out.begin && out.end && *out.end < *out.begin) {
            out.end = out.begin;
        }
        return out;
    }

    bool operator==(const TimeWindow&) const = default;
};

}  // namespace nre::ranking
