#pragma once

/// @file leaderboard_builder.hpp
/// @brief Nation and player leaderboards and per-nation score breakdowns.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nre/foundation/engine_result.hpp"
#include "nre/ranking/confidence_corrector.hpp"
#include "nre/ranking/match_snapshot.hpp"
#include "nre/ranking/score_aggregator.hpp"

namespace nre::ranking {

/// A player's share of a nation's score.
struct Contributor {
    PlayerId playerId;
    std::string name;
    int64_t netWins = 0;
    uint32_t wins = 0;
    uint32_t losses = 0;

    bool operator==(const Contributor&) const = default;
};

/// One ranked row of a nation leaderboard.
struct NationScore {
    std::string countryCode;
    GameMode mode = GameMode::Unknown;
    uint32_t rank = 0;
    uint32_t wins = 0;
    uint32_t losses = 0;
    uint32_t totalGames = 0;
    uint32_t playerCount = 0;
    int64_t rawScore = 0;           ///< wins - losses
    double adjustedScore = 0.0;     ///< confidence-corrected
    double uncorrectedScore = 0.0;  ///< raw / total * 10000
    std::vector<Contributor> topContributors;

    bool operator==(const NationScore&) const = default;
};

struct NationLeaderboard {
    GameMode mode = GameMode::Unknown;
    TimeWindow window;
    std::vector<NationScore> nations;
    ConfidenceFactor factor;
    std::size_t nationsConsidered = 0;  ///< Before the activity gate.

    bool operator==(const NationLeaderboard&) const = default;
};

/// One ranked row of a player leaderboard.
struct PlayerStanding {
    uint32_t rank = 0;
    PlayerId playerId;
    std::string name;
    std::optional<std::string> countryCode;
    double rating = 0.0;  ///< skill - uncertainty from the latest rated match
    uint32_t gamesPlayed = 0;

    bool operator==(const PlayerStanding&) const = default;
};

struct PlayerLeaderboard {
    GameMode mode = GameMode::Unknown;
    std::optional<std::string> countryCode;  ///< Set for a single-nation board.
    std::vector<PlayerStanding> players;  ///< Truncated to the board size.
    std::size_t totalPlayers = 0;         ///< Qualifying players before truncation.

    bool operator==(const PlayerLeaderboard&) const = default;
};

/// Everything behind a nation's score, for display and audit.
struct NationScoreBreakdown {
    std::string countryCode;
    GameMode mode = GameMode::Unknown;
    uint32_t wins = 0;
    uint32_t losses = 0;
    uint32_t totalGames = 0;
    int64_t rawScore = 0;
    double adjustedScore = 0.0;
    double uncorrectedScore = 0.0;
    ConfidenceFactor factor;
    bool qualifies = false;           ///< Passes the k/4 activity gate.
    std::optional<uint32_t> rank;     ///< Set when it qualifies.
    std::vector<Contributor> contributions;  ///< Every player, net wins descending.

    bool operator==(const NationScoreBreakdown&) const = default;
};

struct LeaderboardOptions {
    std::size_t topContributors = 3;
    uint32_t playerMinGames = 5;
    std::size_t playerBoardSize = 50;
};

/// Builds ranked boards from aggregates.
///
/// Nation order: adjusted score descending, then total games descending,
/// then country code ascending. Player order: rating descending, then
/// games played descending, then player id ascending. Ranks are the
/// 1-based positions in that order, so they are always 1..N.
class LeaderboardBuilder {
public:
    explicit LeaderboardBuilder(LeaderboardOptions options = LeaderboardOptions());

    /// Confidence-corrected nation board for the slice in @p aggregate.
    /// ConfidenceUndefined if the slice has no nation with a decided game.
    [[nodiscard]] foundation::GameResult<NationLeaderboard> buildNationLeaderboard(
        const ModeAggregate& aggregate, const MatchSnapshot& snapshot) const;

    /// Player board for @p mode over all of @p snapshot.
    ///
    /// With @p countryCode set, only players whose profile resolves to that
    /// nation through @p resolver are ranked; games still count across the
    /// whole mode. GameModeNotFound if the snapshot has no match in
    /// @p mode, InvalidArgument if @p countryCode is not a nation code.
    [[nodiscard]] foundation::GameResult<PlayerLeaderboard> buildPlayerLeaderboard(
        const MatchSnapshot& snapshot, GameMode mode,
        const std::optional<std::string>& countryCode = std::nullopt,
        const NationCodeResolver& resolver = NationCodeResolver()) const;

    /// Full breakdown for one nation. NationNotFound if it has no decided
    /// game in the slice.
    [[nodiscard]] foundation::GameResult<NationScoreBreakdown> explainNationScore(
        const ModeAggregate& aggregate, const MatchSnapshot& snapshot,
        std::string_view countryCode) const;

    [[nodiscard]] const LeaderboardOptions& options() const noexcept { return options_; }

private:
    std::vector<Contributor> contributorsOf(const ModeAggregate& aggregate,
                                            const MatchSnapshot& snapshot,
                                            const std::string& countryCode) const;

    LeaderboardOptions options_;
};

}  // namespace nre::ranking
