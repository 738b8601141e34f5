#pragma once

/// @file score_aggregator.hpp
/// @brief Win/loss tallies per nation and per player for one game mode.

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "nre/ranking/match_snapshot.hpp"
#include "nre/ranking/match_types.hpp"
#include "nre/ranking/nation_codes.hpp"

namespace nre::ranking {

/// Decided-game tally of a nation in one mode. Draws are not counted.
struct NationAggregate {
    std::string countryCode;
    GameMode mode = GameMode::Unknown;
    uint32_t wins = 0;
    uint32_t losses = 0;
    uint32_t playerCount = 0;  ///< Distinct players with a decided game.

    [[nodiscard]] uint32_t totalGames() const noexcept { return wins + losses; }
    [[nodiscard]] int64_t rawScore() const noexcept {
        return static_cast<int64_t>(wins) - static_cast<int64_t>(losses);
    }

    bool operator==(const NationAggregate&) const = default;
};

/// Tally of one player in one mode, whether or not a nation resolves.
struct PlayerAggregate {
    PlayerId playerId;
    GameMode mode = GameMode::Unknown;
    std::optional<std::string> countryCode;  ///< Resolved nation, if any.
    uint32_t wins = 0;
    uint32_t losses = 0;
    uint32_t draws = 0;

    [[nodiscard]] int64_t netWins() const noexcept {
        return static_cast<int64_t>(wins) - static_cast<int64_t>(losses);
    }
    [[nodiscard]] uint32_t decidedGames() const noexcept { return wins + losses; }
    [[nodiscard]] uint32_t gamesPlayed() const noexcept { return wins + losses + draws; }

    bool operator==(const PlayerAggregate&) const = default;
};

/// Everything the ranking stages need for one (mode, window) slice.
struct ModeAggregate {
    GameMode mode = GameMode::Unknown;
    std::map<std::string, NationAggregate> nations;
    std::map<PlayerId, PlayerAggregate> players;
    uint64_t unresolvedResults = 0;  ///< Player results left out for lack of a nation.

    bool operator==(const ModeAggregate&) const = default;
};

/// Tallies wins and losses from a snapshot.
///
/// Every run recomputes from scratch; nothing is carried between calls.
class ScoreAggregator {
public:
    explicit ScoreAggregator(NationCodeResolver resolver = NationCodeResolver());

    /// Aggregate all matches of @p mode in @p snapshot.
    [[nodiscard]] ModeAggregate aggregate(const MatchSnapshot& snapshot, GameMode mode) const;

    [[nodiscard]] const NationCodeResolver& resolver() const noexcept { return resolver_; }

private:
    NationCodeResolver resolver_;
};

}  // namespace nre::ranking
