/// @file leaderboard_builder.cpp
/// @brief LeaderboardBuilder implementation.

#include "nre/ranking/leaderboard_builder.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <string>

#include "nre/foundation/engine_logger.hpp"

namespace nre::ranking {

using foundation::EngineError;
using foundation::ErrorCode;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

bool nationOrder(const NationScore& a, const NationScore& b) {
    if (a.adjustedScore != b.adjustedScore) {
        return a.adjustedScore > b.adjustedScore;
    }
    if (a.totalGames != b.totalGames) {
        return a.totalGames > b.totalGames;
    }
    return a.countryCode < b.countryCode;
}

bool contributorOrder(const Contributor& a, const Contributor& b) {
    if (a.netWins != b.netWins) {
        return a.netWins > b.netWins;
    }
    auto gamesA = a.wins + a.losses;
    auto gamesB = b.wins + b.losses;
    if (gamesA != gamesB) {
        return gamesA > gamesB;
    }
    return a.playerId < b.playerId;
}

std::string normalizeCode(std::string_view code) {
    std::string out;
    for (char c : code) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            out += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    return out;
}

NationScore scoreOf(const NationAggregate& nation, const ConfidenceFactor& factor) {
    NationScore s;
    s.countryCode = nation.countryCode;
    s.mode = nation.mode;
    s.wins = nation.wins;
    s.losses = nation.losses;
    s.totalGames = nation.totalGames();
    s.playerCount = nation.playerCount;
    s.rawScore = nation.rawScore();
    s.adjustedScore = ConfidenceCorrector::adjustedScore(
        nation.wins, nation.losses, s.totalGames, factor.cf);
    s.uncorrectedScore = ConfidenceCorrector::uncorrectedScore(
        nation.wins, nation.losses, s.totalGames);
    return s;
}

} // namespace

LeaderboardBuilder::LeaderboardBuilder(LeaderboardOptions options)
    : options_(options) {}

std::vector<Contributor> LeaderboardBuilder::contributorsOf(
    const ModeAggregate& aggregate, const MatchSnapshot& snapshot,
    const std::string& countryCode) const {
    std::vector<Contributor> out;
    for (const auto& [id, player] : aggregate.players) {
        if (player.countryCode != countryCode || player.decidedGames() == 0) {
            continue;
        }
        Contributor c;
        c.playerId = id;
        c.name = snapshot.playerName(id);
        c.netWins = player.netWins();
        c.wins = player.wins;
        c.losses = player.losses;
        out.push_back(std::move(c));
    }
    std::sort(out.begin(), out.end(), contributorOrder);
    return out;
}

GameResult<NationLeaderboard> LeaderboardBuilder::buildNationLeaderboard(
    const ModeAggregate& aggregate, const MatchSnapshot& snapshot) const {
    auto factor = ConfidenceCorrector::derive(aggregate);
    if (!factor) {
        NRE_LOG_WARN(LogCategory::Ranking,
                     std::string(gameModeName(aggregate.mode)) + ": " +
                     std::string(factor.error().message()));
        return GameResult<NationLeaderboard>::err(factor.error());
    }

    NationLeaderboard board;
    board.mode = aggregate.mode;
    board.window = snapshot.window();
    board.factor = factor.value();
    board.nationsConsidered = aggregate.nations.size();

    for (const auto& [code, nation] : aggregate.nations) {
        if (!ConfidenceCorrector::meetsActivityGate(nation.totalGames(), board.factor)) {
            continue;
        }
        board.nations.push_back(scoreOf(nation, board.factor));
    }

    std::sort(board.nations.begin(), board.nations.end(), nationOrder);

    uint32_t rank = 0;
    for (auto& row : board.nations) {
        row.rank = ++rank;
        auto contributors = contributorsOf(aggregate, snapshot, row.countryCode);
        if (contributors.size() > options_.topContributors) {
            contributors.resize(options_.topContributors);
        }
        row.topContributors = std::move(contributors);
    }

    NRE_LOG_INFO(LogCategory::Ranking,
                 std::string(gameModeName(board.mode)) + ": ranked " +
                 std::to_string(board.nations.size()) + " of " +
                 std::to_string(board.nationsConsidered) + " nations");
    return GameResult<NationLeaderboard>::ok(std::move(board));
}

GameResult<PlayerLeaderboard> LeaderboardBuilder::buildPlayerLeaderboard(
    const MatchSnapshot& snapshot, GameMode mode,
    const std::optional<std::string>& countryCode,
    const NationCodeResolver& resolver) const {
    std::optional<std::string> nation;
    if (countryCode) {
        nation = resolver.resolve(countryCode);
        if (!nation) {
            return GameResult<PlayerLeaderboard>::err(
                EngineError(ErrorCode::InvalidArgument, "not a nation code",
                            std::string(gameModeName(mode)) + "/" + *countryCode));
        }
    }

    struct Tally {
        uint32_t games = 0;
        std::optional<double> rating;
    };

    std::map<PlayerId, Tally> tallies;
    bool anyMatch = false;
    // Matches are in chronological order, so the last rating seen is the latest.
    for (const auto* match : snapshot.matches()) {
        if (match->mode != mode) {
            continue;
        }
        anyMatch = true;
        for (const auto& result : match->players) {
            auto& t = tallies[result.playerId];
            ++t.games;
            if (result.skill && std::isfinite(*result.skill)) {
                double uncertainty = result.uncertainty.value_or(0.0);
                if (std::isfinite(uncertainty)) {
                    t.rating = *result.skill - uncertainty;
                }
            }
        }
    }

    if (!anyMatch) {
        return GameResult<PlayerLeaderboard>::err(
            EngineError(ErrorCode::GameModeNotFound,
                        "no matches recorded for game mode",
                        std::string(gameModeName(mode))));
    }

    PlayerLeaderboard board;
    board.mode = mode;
    board.countryCode = nation;
    std::vector<PlayerStanding> rows;
    for (const auto& [id, t] : tallies) {
        if (t.games < options_.playerMinGames || !t.rating) {
            continue;
        }
        if (nation && resolver.resolve(snapshot.countryOf(id)) != nation) {
            continue;
        }
        PlayerStanding s;
        s.playerId = id;
        s.name = snapshot.playerName(id);
        s.countryCode = snapshot.countryOf(id);
        s.rating = *t.rating;
        s.gamesPlayed = t.games;
        rows.push_back(std::move(s));
    }

    std::sort(rows.begin(), rows.end(), [](const PlayerStanding& a, const PlayerStanding& b) {
        if (a.rating != b.rating) {
            return a.rating > b.rating;
        }
        if (a.gamesPlayed != b.gamesPlayed) {
            return a.gamesPlayed > b.gamesPlayed;
        }
        return a.playerId < b.playerId;
    });

    board.totalPlayers = rows.size();
    if (rows.size() > options_.playerBoardSize) {
        rows.resize(options_.playerBoardSize);
    }
    uint32_t rank = 0;
    for (auto& row : rows) {
        row.rank = ++rank;
    }
    board.players = std::move(rows);
    return GameResult<PlayerLeaderboard>::ok(std::move(board));
}

GameResult<NationScoreBreakdown> LeaderboardBuilder::explainNationScore(
    const ModeAggregate& aggregate, const MatchSnapshot& snapshot,
    std::string_view countryCode) const {
    auto code = normalizeCode(countryCode);
    auto scope = std::string(gameModeName(aggregate.mode)) + "/" + code;

    auto it = aggregate.nations.find(code);
    if (it == aggregate.nations.end()) {
        return GameResult<NationScoreBreakdown>::err(
            EngineError(ErrorCode::NationNotFound,
                        "nation has no decided games in this slice", scope));
    }

    auto board = buildNationLeaderboard(aggregate, snapshot);
    if (!board) {
        return GameResult<NationScoreBreakdown>::err(board.error());
    }

    const auto& nation = it->second;
    const auto& factor = board.value().factor;
    auto score = scoreOf(nation, factor);

    NationScoreBreakdown out;
    out.countryCode = code;
    out.mode = aggregate.mode;
    out.wins = score.wins;
    out.losses = score.losses;
    out.totalGames = score.totalGames;
    out.rawScore = score.rawScore;
    out.adjustedScore = score.adjustedScore;
    out.uncorrectedScore = score.uncorrectedScore;
    out.factor = factor;
    out.qualifies = ConfidenceCorrector::meetsActivityGate(score.totalGames, factor);
    for (const auto& row : board.value().nations) {
        if (row.countryCode == code) {
            out.rank = row.rank;
            break;
        }
    }
    out.contributions = contributorsOf(aggregate, snapshot, code);
    return GameResult<NationScoreBreakdown>::ok(std::move(out));
}

}  // namespace nre::ranking
