/// @file engine_config.cpp
/// @brief buildEngineConfig implementation.

#include "nre/engine/engine_config.hpp"

#include <string>
#include <string_view>
#include <vector>

#include "nre/foundation/engine_logger.hpp"

namespace nre::engine {

using foundation::EngineError;
using foundation::ErrorCode;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

/// Copy @p key into @p out when present. A missing key keeps the default;
/// a value of the wrong type is an error.
template <typename T, typename Field>
GameResult<void> readKey(const foundation::ConfigManager& config, std::string_view key,
                         Field& out) {
    auto value = config.get<T>(key);
    if (value) {
        out = value.value();
        return GameResult<void>::ok();
    }
    if (value.error().code() == ErrorCode::ConfigKeyNotFound) {
        return GameResult<void>::ok();
    }
    return GameResult<void>::err(value.error());
}

} // namespace

GameResult<EngineConfig> buildEngineConfig(const foundation::ConfigManager& config) {
    EngineConfig cfg;

    GameResult<void> reads[] = {
        readKey<std::vector<std::string>>(config, "ranking.faction_codes", cfg.factionCodes),
        readKey<unsigned int>(config, "ranking.top_contributors", cfg.leaderboard.topContributors),
        readKey<unsigned int>(config, "ranking.player_min_games", cfg.leaderboard.playerMinGames),
        readKey<unsigned int>(config, "ranking.player_board_size", cfg.leaderboard.playerBoardSize),
        readKey<unsigned int>(config, "teams.party_min_matches", cfg.teams.partyMinMatches),
        readKey<unsigned int>(config, "teams.community_min_edge_weight",
                              cfg.teams.communityMinEdgeWeight),
        readKey<unsigned int>(config, "teams.min_roster_size", cfg.teams.minRosterSize),
        readKey<unsigned int>(config, "teams.max_roster_size", cfg.teams.maxRosterSize),
        readKey<unsigned int>(config, "teams.pair_min_weight", cfg.teams.pairMinWeight),
        readKey<unsigned int>(config, "teams.max_teams", cfg.teams.maxTeams),
        readKey<unsigned int>(config, "engine.worker_threads", cfg.workerThreads),
    };
    for (auto& read : reads) {
        if (read.hasError()) {
            NRE_LOG_ERROR(LogCategory::Config,
                          "invalid engine config: " + std::string(read.error().message()));
            return GameResult<EngineConfig>::err(read.error());
        }
    }

    if (cfg.teams.minRosterSize > cfg.teams.maxRosterSize) {
        return GameResult<EngineConfig>::err(
            EngineError(ErrorCode::InvalidArgument,
                        "teams.min_roster_size exceeds teams.max_roster_size"));
    }
    if (cfg.workerThreads == 0) {
        return GameResult<EngineConfig>::err(
            EngineError(ErrorCode::InvalidArgument, "engine.worker_threads must be positive"));
    }
    if (cfg.leaderboard.playerBoardSize == 0) {
        return GameResult<EngineConfig>::err(
            EngineError(ErrorCode::InvalidArgument, "ranking.player_board_size must be positive"));
    }

    NRE_LOG_DEBUG(LogCategory::Config,
                  "engine config: " + std::to_string(cfg.factionCodes.size()) +
                  " faction codes, " + std::to_string(cfg.workerThreads) + " workers");
    return GameResult<EngineConfig>::ok(std::move(cfg));
}

}  // namespace nre::engine
