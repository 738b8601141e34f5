/// @file confidence_corrector.cpp
/// @brief ConfidenceCorrector implementation.

#include "nre/ranking/confidence_corrector.hpp"

#include <string>

#include "nre/foundation/engine_logger.hpp"

namespace nre::ranking {

using foundation::EngineError;
using foundation::ErrorCode;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

GameResult<ConfidenceFactor> ConfidenceCorrector::derive(const ModeAggregate& aggregate) {
    std::vector<uint32_t> games;
    games.reserve(aggregate.nations.size());
    for (const auto& [code, nation] : aggregate.nations) {
        games.push_back(nation.totalGames());
    }
    return derive(aggregate.mode, games);
}

GameResult<ConfidenceFactor> ConfidenceCorrector::derive(
    GameMode mode, const std::vector<uint32_t>& gamesPerNation) {
    uint64_t total = 0;
    std::size_t counted = 0;
    for (auto g : gamesPerNation) {
        if (g > 0) {
            total += g;
            ++counted;
        }
    }

    if (counted == 0) {
        return GameResult<ConfidenceFactor>::err(
            EngineError(ErrorCode::ConfidenceUndefined,
                        "no nation has a decided game; confidence factor undefined",
                        std::string(gameModeName(mode))));
    }

    ConfidenceFactor f;
    f.mode = mode;
    f.nationsCounted = counted;
    f.averageGamesPerNation = static_cast<double>(total) / static_cast<double>(counted);
    f.k = f.averageGamesPerNation / 2.0;
    f.cf = 2.0 * f.k;
    f.minGamesRequired = f.k / 4.0;

    LogContext ctx;
    ctx.gameMode = std::string(gameModeName(mode));
    ctx.extra["nations"] = std::to_string(counted);
    ctx.extra["avg_games"] = std::to_string(f.averageGamesPerNation);
    ctx.extra["k"] = std::to_string(f.k);
    ctx.extra["cf"] = std::to_string(f.cf);
    foundation::EngineLogger::instance().logWithContext(
        LogLevel::Info, LogCategory::Ranking, "confidence factor derived", ctx);

    return GameResult<ConfidenceFactor>::ok(f);
}

double ConfidenceCorrector::adjustedScore(uint32_t wins, uint32_t losses,
                                          uint32_t totalGames, double cf) {
    double denominator = static_cast<double>(totalGames) + cf;
    if (denominator <= 0.0) {
        return 0.0;
    }
    double raw = static_cast<double>(wins) - static_cast<double>(losses);
    return raw / denominator * kScoreScale;
}

double ConfidenceCorrector::uncorrectedScore(uint32_t wins, uint32_t losses,
                                             uint32_t totalGames) {
    if (totalGames == 0) {
        return 0.0;
    }
    double raw = static_cast<double>(wins) - static_cast<double>(losses);
    return raw / static_cast<double>(totalGames) * kScoreScale;
}

bool ConfidenceCorrector::meetsActivityGate(uint32_t totalGames, const ConfidenceFactor& factor) {
    return static_cast<double>(totalGames) >= factor.minGamesRequired;
}

}  // namespace nre::ranking
