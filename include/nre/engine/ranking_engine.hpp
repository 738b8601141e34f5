#pragma once

/// @file ranking_engine.hpp
/// @brief Entry point of the engine: leaderboards, explanations and teams
///        over one immutable match snapshot.
///
/// RankingEngine ties ScoreAggregator, ConfidenceCorrector,
/// LeaderboardBuilder, TeamGraph and TeamDetector together and fans the
/// independent game modes out on a JobScheduler.

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nre/engine/engine_config.hpp"
#include "nre/foundation/engine_result.hpp"
#include "nre/ranking/leaderboard_builder.hpp"
#include "nre/ranking/match_snapshot.hpp"
#include "nre/teams/team_detector.hpp"

namespace nre::engine {

using ranking::GameMode;
using ranking::TimeWindow;

/// Outcome of one nation ranking run: one result per ranked game mode.
///
/// A failed slice (e.g. ConfidenceUndefined) does not affect the others.
struct NationRankingRun {
    TimeWindow window;
    std::map<GameMode, foundation::GameResult<ranking::NationLeaderboard>> slices;

    [[nodiscard]] std::size_t succeeded() const;
    [[nodiscard]] std::size_t failed() const;
};

/// Boards currently served, one per game mode.
using PublishedLeaderboards = std::map<GameMode, ranking::NationLeaderboard>;

/// Apply @p run on top of @p previous. A mode whose slice failed keeps
/// its previous board; a stale but valid board beats a partial one.
[[nodiscard]] PublishedLeaderboards mergePublished(PublishedLeaderboards previous,
                                                   const NationRankingRun& run);

/// Batch ranking engine over one snapshot.
///
/// Usage:
/// @code
///   auto snapshot = MatchSnapshot::build(store, TimeWindow::all());
///   RankingEngine engine(std::move(snapshot), config);
///
///   auto board = engine.buildNationLeaderboard(GameMode::Duel, window);
///   auto run = engine.runNationRankings(window);
///   published = mergePublished(std::move(published), run);
///
///   auto parties = engine.buildTeams(TeamType::Party, window);
/// @endcode
class RankingEngine {
public:
    explicit RankingEngine(ranking::MatchSnapshot snapshot, EngineConfig config = EngineConfig());
    ~RankingEngine();

    RankingEngine(const RankingEngine&) = delete;
    RankingEngine& operator=(const RankingEngine&) = delete;
    RankingEngine(RankingEngine&&) noexcept;
    RankingEngine& operator=(RankingEngine&&) noexcept;

    // -- Nation rankings ------------------------------------------------------

    /// Confidence-corrected board for one (mode, window) slice.
    [[nodiscard]] foundation::GameResult<ranking::NationLeaderboard> buildNationLeaderboard(
        GameMode mode, const TimeWindow& window) const;

    /// Every ranked mode over @p window, computed in parallel.
    [[nodiscard]] NationRankingRun runNationRankings(const TimeWindow& window) const;

    /// Full breakdown of one nation's score in @p mode over @p window.
    [[nodiscard]] foundation::GameResult<ranking::NationScoreBreakdown> explainNationScore(
        std::string_view countryCode, GameMode mode,
        const TimeWindow& window = TimeWindow::all()) const;

    // -- Player rankings ------------------------------------------------------

    /// Player board for @p mode over the whole snapshot, optionally limited
    /// to players of one nation (resolved like nation aggregation).
    [[nodiscard]] foundation::GameResult<ranking::PlayerLeaderboard> buildPlayerLeaderboard(
        GameMode mode, const std::optional<std::string>& countryCode = std::nullopt) const;

    // -- Teams ----------------------------------------------------------------

    [[nodiscard]] teams::TeamReport buildTeams(teams::TeamType type, const TimeWindow& window) const;

    [[nodiscard]] std::vector<teams::PlayerPairEdge> frequentPairs(const TimeWindow& window) const;

    /// Teams over the whole snapshot with a member matching @p playerName.
    [[nodiscard]] teams::TeamReport searchTeams(std::string_view playerName,
                                                teams::TeamType type) const;

    // -- Accessors ------------------------------------------------------------

    [[nodiscard]] const ranking::MatchSnapshot& snapshot() const noexcept;
    [[nodiscard]] const EngineConfig& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace nre::engine
