/// @file ranking_engine.cpp
/// @brief RankingEngine implementation: per-slice pipeline and fan-out.

#include "nre/engine/ranking_engine.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "nre/foundation/engine_logger.hpp"
#include "nre/foundation/job_scheduler.hpp"
#include "nre/ranking/score_aggregator.hpp"
#include "nre/teams/team_graph.hpp"

namespace nre::engine {

using foundation::EngineError;
using foundation::ErrorCode;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using ranking::NationLeaderboard;

// -- NationRankingRun ---------------------------------------------------------

std::size_t NationRankingRun::succeeded() const {
    std::size_t n = 0;
    for (const auto& [mode, slice] : slices) {
        if (slice) {
            ++n;
        }
    }
    return n;
}

std::size_t NationRankingRun::failed() const {
    return slices.size() - succeeded();
}

PublishedLeaderboards mergePublished(PublishedLeaderboards previous,
                                     const NationRankingRun& run) {
    for (const auto& [mode, slice] : run.slices) {
        if (slice) {
            previous.insert_or_assign(mode, slice.value());
        }
    }
    return previous;
}

// -- Impl ---------------------------------------------------------------------

struct RankingEngine::Impl {
    ranking::MatchSnapshot snapshot;
    EngineConfig config;
    ranking::ScoreAggregator aggregator;
    ranking::LeaderboardBuilder leaderboards;
    teams::TeamDetector detector;
    foundation::JobScheduler scheduler;

    Impl(ranking::MatchSnapshot snap, EngineConfig cfg)
        : snapshot(std::move(snap))
        , config(std::move(cfg))
        , aggregator(ranking::NationCodeResolver(config.factionCodes))
        , leaderboards(config.leaderboard)
        , detector(config.teams)
        , scheduler(config.workerThreads) {}

    GameResult<NationLeaderboard> nationSlice(GameMode mode, const TimeWindow& window) const {
        auto sliced = snapshot.slice(window);
        auto aggregate = aggregator.aggregate(sliced, mode);
        return leaderboards.buildNationLeaderboard(aggregate, sliced);
    }
};

RankingEngine::RankingEngine(ranking::MatchSnapshot snapshot, EngineConfig config)
    : impl_(std::make_unique<Impl>(std::move(snapshot), std::move(config))) {}

RankingEngine::~RankingEngine() = default;

RankingEngine::RankingEngine(RankingEngine&&) noexcept = default;
RankingEngine& RankingEngine::operator=(RankingEngine&&) noexcept = default;

// -- Nation rankings ----------------------------------------------------------

GameResult<NationLeaderboard> RankingEngine::buildNationLeaderboard(
    GameMode mode, const TimeWindow& window) const {
    return impl_->nationSlice(mode, window);
}

NationRankingRun RankingEngine::runNationRankings(const TimeWindow& window) const {
    constexpr auto kModes = ranking::kRankedGameModes;

    // One slot per mode; each job writes only its own.
    std::vector<std::optional<GameResult<NationLeaderboard>>> slots(kModes.size());
    std::vector<std::optional<foundation::JobScheduler::JobId>> jobs(kModes.size());

    auto* impl = impl_.get();
    for (std::size_t i = 0; i < kModes.size(); ++i) {
        auto mode = kModes[i];
        auto* slot = &slots[i];
        auto scheduled = impl->scheduler.schedule([impl, slot, mode, &window] {
            slot->emplace(impl->nationSlice(mode, window));
        });
        if (scheduled) {
            jobs[i] = scheduled.value();
        } else {
            slots[i].emplace(GameResult<NationLeaderboard>::err(scheduled.error()));
        }
    }

    for (std::size_t i = 0; i < kModes.size(); ++i) {
        if (!jobs[i]) {
            continue;
        }
        auto waited = impl->scheduler.wait(*jobs[i]);
        if (!waited) {
            slots[i].emplace(GameResult<NationLeaderboard>::err(
                EngineError(waited.error().code(), std::string(waited.error().message()),
                            std::string(ranking::gameModeName(kModes[i])))));
        }
    }

    NationRankingRun run;
    run.window = impl_->snapshot.window().overlap(window);
    for (std::size_t i = 0; i < kModes.size(); ++i) {
        if (!slots[i]) {
            slots[i].emplace(GameResult<NationLeaderboard>::err(
                EngineError(ErrorCode::ThreadError, "slice produced no result",
                            std::string(ranking::gameModeName(kModes[i])))));
        }
        run.slices.emplace(kModes[i], std::move(*slots[i]));
    }

    for (const auto& [mode, slice] : run.slices) {
        if (!slice) {
            LogContext ctx;
            ctx.gameMode = std::string(ranking::gameModeName(mode));
            ctx.extra["subsystem"] = std::string(slice.error().subsystem());
            foundation::EngineLogger::instance().logWithContext(
                LogLevel::Warning, LogCategory::Core,
                "slice failed: " + std::string(slice.error().message()), ctx);
        }
    }
    NRE_LOG_INFO(LogCategory::Core,
                 "nation ranking run: " + std::to_string(run.succeeded()) + " slices ok, " +
                 std::to_string(run.failed()) + " failed");
    return run;
}

GameResult<ranking::NationScoreBreakdown> RankingEngine::explainNationScore(
    std::string_view countryCode, GameMode mode, const TimeWindow& window) const {
    auto sliced = impl_->snapshot.slice(window);
    auto aggregate = impl_->aggregator.aggregate(sliced, mode);
    return impl_->leaderboards.explainNationScore(aggregate, sliced, countryCode);
}

// -- Player rankings ----------------------------------------------------------

GameResult<ranking::PlayerLeaderboard> RankingEngine::buildPlayerLeaderboard(
    GameMode mode, const std::optional<std::string>& countryCode) const {
    return impl_->leaderboards.buildPlayerLeaderboard(impl_->snapshot, mode, countryCode,
                                                      impl_->aggregator.resolver());
}

// -- Teams --------------------------------------------------------------------

teams::TeamReport RankingEngine::buildTeams(teams::TeamType type, const TimeWindow& window) const {
    return impl_->detector.buildTeams(impl_->snapshot.slice(window), type);
}

std::vector<teams::PlayerPairEdge> RankingEngine::frequentPairs(const TimeWindow& window) const {
    auto sliced = impl_->snapshot.slice(window);
    return impl_->detector.frequentPairs(sliced, teams::TeamGraph::build(sliced));
}

teams::TeamReport RankingEngine::searchTeams(std::string_view playerName,
                                             teams::TeamType type) const {
    auto report = impl_->detector.buildTeams(impl_->snapshot, type);
    return teams::TeamDetector::searchTeams(report, playerName);
}

// -- Accessors ----------------------------------------------------------------

const ranking::MatchSnapshot& RankingEngine::snapshot() const noexcept {
    return impl_->snapshot;
}

const EngineConfig& RankingEngine::config() const noexcept {
    return impl_->config;
}

}  // namespace nre::engine
