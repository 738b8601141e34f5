#pragma once

/// @file result_writer.hpp
/// @brief YAML rendering of finished engine outputs.
///
/// Output depends only on the values passed in: maps are emitted in key
/// order and doubles at a fixed precision, so two runs over the same
/// snapshot render to identical bytes.

#include <string>
#include <vector>

#include "nre/engine/ranking_engine.hpp"

namespace nre::engine {

[[nodiscard]] std::string toYaml(const ranking::NationLeaderboard& board);
[[nodiscard]] std::string toYaml(const ranking::PlayerLeaderboard& board);
[[nodiscard]] std::string toYaml(const ranking::NationScoreBreakdown& breakdown);
[[nodiscard]] std::string toYaml(const teams::TeamReport& report);
[[nodiscard]] std::string toYaml(const std::vector<teams::PlayerPairEdge>& pairs);

/// Every slice of @p run; failed slices carry their error instead of a board.
[[nodiscard]] std::string toYaml(const NationRankingRun& run);

}  // namespace nre::engine
