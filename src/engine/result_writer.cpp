/// @file result_writer.cpp
/// @brief YAML rendering with yaml-cpp's Emitter.

#include "nre/engine/result_writer.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <yaml-cpp/yaml.h>

namespace nre::engine {

namespace {

constexpr std::size_t kDoublePrecision = 10;

YAML::Emitter& beginDocument(YAML::Emitter& out) {
    out.SetDoublePrecision(kDoublePrecision);
    return out;
}

std::string str(std::string_view s) {
    return std::string(s);
}

void emitTimestamp(YAML::Emitter& out, const std::optional<ranking::Timestamp>& t) {
    if (!t) {
        out << YAML::Null;
        return;
    }
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(t->time_since_epoch());
    out << static_cast<int64_t>(seconds.count());
}

void emitWindow(YAML::Emitter& out, const TimeWindow& window) {
    out << YAML::Key << "window" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "begin" << YAML::Value;
    emitTimestamp(out, window.begin);
    out << YAML::Key << "end" << YAML::Value;
    emitTimestamp(out, window.end);
    out << YAML::EndMap;
}

void emitOptional(YAML::Emitter& out, const std::optional<std::string>& value) {
    if (value) {
        out << *value;
    } else {
        out << YAML::Null;
    }
}

void emitFactor(YAML::Emitter& out, const ranking::ConfidenceFactor& f) {
    out << YAML::Key << "nations_counted" << YAML::Value << f.nationsCounted;
    out << YAML::Key << "average_games_per_nation" << YAML::Value << f.averageGamesPerNation;
    out << YAML::Key << "k" << YAML::Value << f.k;
    out << YAML::Key << "cf" << YAML::Value << f.cf;
    out << YAML::Key << "min_games_required" << YAML::Value << f.minGamesRequired;
}

void emitContributors(YAML::Emitter& out, const char* key,
                      const std::vector<ranking::Contributor>& contributors) {
    out << YAML::Key << key << YAML::Value << YAML::BeginSeq;
    for (const auto& c : contributors) {
        out << YAML::BeginMap;
        out << YAML::Key << "player_id" << YAML::Value << c.playerId.value();
        out << YAML::Key << "name" << YAML::Value << c.name;
        out << YAML::Key << "net_wins" << YAML::Value << c.netWins;
        out << YAML::Key << "wins" << YAML::Value << c.wins;
        out << YAML::Key << "losses" << YAML::Value << c.losses;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
}

void emitNationBoard(YAML::Emitter& out, const ranking::NationLeaderboard& board) {
    out << YAML::BeginMap;
    out << YAML::Key << "mode" << YAML::Value << str(ranking::gameModeName(board.mode));
    emitWindow(out, board.window);
    emitFactor(out, board.factor);
    out << YAML::Key << "nations_considered" << YAML::Value << board.nationsConsidered;
    out << YAML::Key << "nations" << YAML::Value << YAML::BeginSeq;
    for (const auto& n : board.nations) {
        out << YAML::BeginMap;
        out << YAML::Key << "rank" << YAML::Value << n.rank;
        out << YAML::Key << "country_code" << YAML::Value << n.countryCode;
        out << YAML::Key << "wins" << YAML::Value << n.wins;
        out << YAML::Key << "losses" << YAML::Value << n.losses;
        out << YAML::Key << "total_games" << YAML::Value << n.totalGames;
        out << YAML::Key << "player_count" << YAML::Value << n.playerCount;
        out << YAML::Key << "raw_score" << YAML::Value << n.rawScore;
        out << YAML::Key << "adjusted_score" << YAML::Value << n.adjustedScore;
        out << YAML::Key << "uncorrected_score" << YAML::Value << n.uncorrectedScore;
        emitContributors(out, "top_contributors", n.topContributors);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
}

void emitStats(YAML::Emitter& out, const teams::TeamStats& s) {
    out << YAML::BeginMap;
    out << YAML::Key << "matches" << YAML::Value << s.matches;
    out << YAML::Key << "wins" << YAML::Value << s.wins;
    out << YAML::Key << "losses" << YAML::Value << s.losses;
    out << YAML::Key << "win_rate" << YAML::Value << s.winRate;
    out << YAML::EndMap;
}

void emitStatsByMode(YAML::Emitter& out, const std::map<GameMode, teams::TeamStats>& byMode) {
    out << YAML::Key << "stats_by_mode" << YAML::Value << YAML::BeginMap;
    for (const auto& [mode, stats] : byMode) {
        out << YAML::Key << str(ranking::gameModeName(mode)) << YAML::Value;
        emitStats(out, stats);
    }
    out << YAML::EndMap;
}

void emitMembers(YAML::Emitter& out, const std::vector<teams::TeamMember>& members) {
    out << YAML::Key << "members" << YAML::Value << YAML::BeginSeq;
    for (const auto& m : members) {
        out << YAML::BeginMap;
        out << YAML::Key << "player_id" << YAML::Value << m.playerId.value();
        out << YAML::Key << "name" << YAML::Value << m.name;
        out << YAML::Key << "country_code" << YAML::Value;
        emitOptional(out, m.countryCode);
        out << YAML::Key << "matches_with_team" << YAML::Value << m.matchesWithTeam;
        out << YAML::Key << "attendance_percent" << YAML::Value << m.attendancePercent;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
}

void emitParty(YAML::Emitter& out, const teams::PartyTeamCandidate& team) {
    out << YAML::BeginMap;
    out << YAML::Key << "team_id" << YAML::Value << team.teamId;
    emitMembers(out, team.members);
    out << YAML::Key << "exact_roster_matches" << YAML::Value << team.exactRosterMatches;
    out << YAML::Key << "member_party_matches" << YAML::Value << team.memberPartyMatches;
    out << YAML::Key << "stability_score" << YAML::Value << team.stabilityScore;
    out << YAML::Key << "stats_overall" << YAML::Value;
    emitStats(out, team.statsOverall);
    emitStatsByMode(out, team.statsByMode);
    out << YAML::EndMap;
}

void emitCommunity(YAML::Emitter& out, const teams::CommunityCluster& cluster) {
    out << YAML::BeginMap;
    out << YAML::Key << "cluster_id" << YAML::Value << cluster.clusterId;
    out << YAML::Key << "team_name" << YAML::Value << cluster.teamName;
    emitMembers(out, cluster.members);
    out << YAML::Key << "edge_count" << YAML::Value << cluster.edgeCount;
    out << YAML::Key << "density" << YAML::Value << cluster.density;
    out << YAML::Key << "avg_connection_strength" << YAML::Value << cluster.avgConnectionStrength;
    out << YAML::Key << "stats_overall" << YAML::Value;
    emitStats(out, cluster.statsOverall);
    emitStatsByMode(out, cluster.statsByMode);
    out << YAML::Key << "common_lineups" << YAML::Value << YAML::BeginSeq;
    for (const auto& lineup : cluster.commonLineups) {
        out << YAML::BeginMap;
        out << YAML::Key << "names" << YAML::Value << YAML::Flow << lineup.names;
        out << YAML::Key << "count" << YAML::Value << lineup.count;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
}

} // namespace

std::string toYaml(const ranking::NationLeaderboard& board) {
    YAML::Emitter out;
    beginDocument(out);
    emitNationBoard(out, board);
    return out.c_str();
}

std::string toYaml(const ranking::PlayerLeaderboard& board) {
    YAML::Emitter out;
    beginDocument(out);
    out << YAML::BeginMap;
    out << YAML::Key << "mode" << YAML::Value << str(ranking::gameModeName(board.mode));
    out << YAML::Key << "country_code" << YAML::Value;
    emitOptional(out, board.countryCode);
    out << YAML::Key << "total_players" << YAML::Value << board.totalPlayers;
    out << YAML::Key << "players" << YAML::Value << YAML::BeginSeq;
    for (const auto& p : board.players) {
        out << YAML::BeginMap;
        out << YAML::Key << "rank" << YAML::Value << p.rank;
        out << YAML::Key << "player_id" << YAML::Value << p.playerId.value();
        out << YAML::Key << "name" << YAML::Value << p.name;
        out << YAML::Key << "country_code" << YAML::Value;
        emitOptional(out, p.countryCode);
        out << YAML::Key << "rating" << YAML::Value << p.rating;
        out << YAML::Key << "games_played" << YAML::Value << p.gamesPlayed;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return out.c_str();
}

std::string toYaml(const ranking::NationScoreBreakdown& b) {
    YAML::Emitter out;
    beginDocument(out);
    out << YAML::BeginMap;
    out << YAML::Key << "country_code" << YAML::Value << b.countryCode;
    out << YAML::Key << "mode" << YAML::Value << str(ranking::gameModeName(b.mode));
    out << YAML::Key << "wins" << YAML::Value << b.wins;
    out << YAML::Key << "losses" << YAML::Value << b.losses;
    out << YAML::Key << "total_games" << YAML::Value << b.totalGames;
    out << YAML::Key << "raw_score" << YAML::Value << b.rawScore;
    out << YAML::Key << "adjusted_score" << YAML::Value << b.adjustedScore;
    out << YAML::Key << "uncorrected_score" << YAML::Value << b.uncorrectedScore;
    emitFactor(out, b.factor);
    out << YAML::Key << "qualifies" << YAML::Value << b.qualifies;
    out << YAML::Key << "rank" << YAML::Value;
    if (b.rank) {
        out << *b.rank;
    } else {
        out << YAML::Null;
    }
    emitContributors(out, "contributions", b.contributions);
    out << YAML::EndMap;
    return out.c_str();
}

std::string toYaml(const teams::TeamReport& report) {
    YAML::Emitter out;
    beginDocument(out);
    out << YAML::BeginMap;
    out << YAML::Key << "type" << YAML::Value << str(teams::teamTypeName(report.type));
    emitWindow(out, report.window);
    out << YAML::Key << "teams" << YAML::Value << YAML::BeginSeq;
    for (const auto& team : report.parties) {
        emitParty(out, team);
    }
    for (const auto& cluster : report.communities) {
        emitCommunity(out, cluster);
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return out.c_str();
}

std::string toYaml(const std::vector<teams::PlayerPairEdge>& pairs) {
    YAML::Emitter out;
    beginDocument(out);
    out << YAML::BeginSeq;
    for (const auto& e : pairs) {
        out << YAML::BeginMap;
        out << YAML::Key << "players" << YAML::Value << YAML::Flow << YAML::BeginSeq
            << e.a.value() << e.b.value() << YAML::EndSeq;
        out << YAML::Key << "names" << YAML::Value << YAML::Flow << YAML::BeginSeq
            << e.nameA << e.nameB << YAML::EndSeq;
        out << YAML::Key << "weight" << YAML::Value << e.weight;
        out << YAML::Key << "joint_wins" << YAML::Value << e.jointWins;
        out << YAML::Key << "joint_losses" << YAML::Value << e.jointLosses;
        out << YAML::Key << "joint_win_rate" << YAML::Value << e.jointWinRate;
        out << YAML::Key << "solo_win_rate_a" << YAML::Value << e.soloWinRateA;
        out << YAML::Key << "solo_win_rate_b" << YAML::Value << e.soloWinRateB;
        out << YAML::Key << "synergy" << YAML::Value << e.synergy;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    return out.c_str();
}

std::string toYaml(const NationRankingRun& run) {
    YAML::Emitter out;
    beginDocument(out);
    out << YAML::BeginMap;
    emitWindow(out, run.window);
    out << YAML::Key << "slices" << YAML::Value << YAML::BeginMap;
    for (const auto& [mode, slice] : run.slices) {
        out << YAML::Key << str(ranking::gameModeName(mode)) << YAML::Value;
        if (slice) {
            emitNationBoard(out, slice.value());
        } else {
            out << YAML::BeginMap;
            out << YAML::Key << "error" << YAML::Value << str(slice.error().message());
            out << YAML::Key << "subsystem" << YAML::Value << str(slice.error().subsystem());
            out << YAML::EndMap;
        }
    }
    out << YAML::EndMap;
    out << YAML::EndMap;
    return out.c_str();
}

}  // namespace nre::engine
