#pragma once

/// @file confidence_corrector.hpp
/// @brief Small-sample damping for nation scores.
///
/// For one (game mode, window) slice:
///   k   = (average decided games per nation) / 2
///   CF  = 2k
///   adjusted = (wins - losses) / (total_games + CF) * 10000
///
/// Nations with few games are pulled toward zero; nations with many
/// games keep close to their uncorrected score.

#include <cstddef>
#include <cstdint>
#include <vector>

#include "nre/foundation/engine_result.hpp"
#include "nre/ranking/match_types.hpp"
#include "nre/ranking/score_aggregator.hpp"

namespace nre::ranking {

/// Derived damping constants of one slice.
struct ConfidenceFactor {
    GameMode mode = GameMode::Unknown;
    std::size_t nationsCounted = 0;
    double averageGamesPerNation = 0.0;
    double k = 0.0;
    double cf = 0.0;
    double minGamesRequired = 0.0;  ///< k / 4, the activity gate.

    bool operator==(const ConfidenceFactor&) const = default;
};

/// Static utility for the confidence correction.
class ConfidenceCorrector {
public:
    ConfidenceCorrector() = delete;

    static constexpr double kScoreScale = 10000.0;

    /// Derive k and CF from every nation with at least one decided game.
    ///
    /// Uses the unfiltered nation set: the activity gate is k/4, so
    /// deriving k from gated nations would be circular.
    /// @return ConfidenceUndefined when no nation has a game in the slice.
    [[nodiscard]] static foundation::GameResult<ConfidenceFactor> derive(const ModeAggregate& aggregate);

    /// Same as above from raw per-nation game counts.
    [[nodiscard]] static foundation::GameResult<ConfidenceFactor> derive(
        GameMode mode, const std::vector<uint32_t>& gamesPerNation);

    /// (wins - losses) / (totalGames + cf) * 10000. Zero if the denominator is not positive.
    [[nodiscard]] static double adjustedScore(uint32_t wins, uint32_t losses,
                                              uint32_t totalGames, double cf);

    /// (wins - losses) / totalGames * 10000, the score without damping.
    [[nodiscard]] static double uncorrectedScore(uint32_t wins, uint32_t losses,
                                                 uint32_t totalGames);

    /// True if @p totalGames passes the k/4 activity gate.
    [[nodiscard]] static bool meetsActivityGate(uint32_t totalGames, const ConfidenceFactor& factor);
};

}  // namespace nre::ranking
