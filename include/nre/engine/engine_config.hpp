#pragma once

/// @file engine_config.hpp
/// @brief Engine configuration and its mapping from ConfigManager keys.

#include <cstddef>
#include <string>
#include <vector>

#include "nre/foundation/config_manager.hpp"
#include "nre/foundation/engine_result.hpp"
#include "nre/ranking/leaderboard_builder.hpp"
#include "nre/teams/team_detector.hpp"

namespace nre::engine {

struct EngineConfig {
    /// Non-ISO nation codes accepted besides two-letter codes.
    std::vector<std::string> factionCodes;

    ranking::LeaderboardOptions leaderboard;
    teams::TeamDetectorOptions teams;

    /// Workers used to compute game modes in parallel.
    std::size_t workerThreads = 4;
};

/// Build an EngineConfig from "ranking.*", "teams.*" and "engine.*" keys.
///
/// Missing keys keep their defaults. InvalidArgument when
/// teams.min_roster_size exceeds teams.max_roster_size or a count that
/// must be positive is zero.
[[nodiscard]] foundation::GameResult<EngineConfig> buildEngineConfig(
    const foundation::ConfigManager& config);

}  // namespace nre::engine
