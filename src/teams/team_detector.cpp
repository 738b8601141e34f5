/// @file team_detector.cpp
/// @brief TeamDetector implementation.

#include "nre/teams/team_detector.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <string>
#include <utility>

#include "nre/foundation/engine_logger.hpp"

namespace nre::teams {

using foundation::EngineError;
using foundation::ErrorCode;
using foundation::GameResult;
using foundation::LogCategory;
using ranking::MatchRecord;
using ranking::MatchSnapshot;
using ranking::Outcome;

// -- TeamType -----------------------------------------------------------------

std::string_view teamTypeName(TeamType type) {
    switch (type) {
        case TeamType::Party:     return "party";
        case TeamType::Community: return "community";
    }
    return "unknown";
}

namespace {

std::string toLower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/// Tally of one team's matches; finish() turns it into TeamStats.
class StatsTally {
public:
    void add(GameMode mode, Outcome outcome) {
        record(overall_, outcome);
        record(byMode_[mode], outcome);
    }

    [[nodiscard]] TeamStats overall() const { return finish(overall_); }

    [[nodiscard]] std::map<GameMode, TeamStats> byMode() const {
        std::map<GameMode, TeamStats> out;
        for (const auto& [mode, stats] : byMode_) {
            out.emplace(mode, finish(stats));
        }
        return out;
    }

private:
    static void record(TeamStats& stats, Outcome outcome) {
        ++stats.matches;
        if (outcome == Outcome::Win) {
            ++stats.wins;
        } else if (outcome == Outcome::Loss) {
            ++stats.losses;
        }
    }

    static TeamStats finish(TeamStats stats) {
        auto decided = stats.wins + stats.losses;
        stats.winRate = decided > 0
            ? static_cast<double>(stats.wins) / static_cast<double>(decided)
            : 0.0;
        return stats;
    }

    TeamStats overall_;
    std::map<GameMode, TeamStats> byMode_;
};

double attendancePercent(uint32_t attended, uint32_t total) {
    if (total == 0) {
        return 0.0;
    }
    return std::round(static_cast<double>(attended) * 1000.0 / static_cast<double>(total)) / 10.0;
}

TeamMember makeMember(const MatchSnapshot& snapshot, PlayerId id,
                      uint32_t attended, uint32_t total) {
    TeamMember m;
    m.playerId = id;
    m.name = snapshot.playerName(id);
    m.countryCode = snapshot.countryOf(id);
    m.matchesWithTeam = attended;
    m.attendancePercent = attendancePercent(attended, total);
    return m;
}

/// One party as it appeared in one match.
struct PartyInstance {
    MatchId matchId;
    GameMode mode = GameMode::Unknown;
    Outcome outcome = Outcome::Loss;
    std::vector<PlayerId> members;  // ascending
};

std::vector<PartyInstance> partyInstances(const MatchSnapshot& snapshot) {
    std::vector<PartyInstance> out;
    for (const auto* match : snapshot.matches()) {
        std::map<PartyId, PartyInstance> parties;
        for (const auto& result : match->players) {
            if (!result.partyId) {
                continue;
            }
            auto [it, fresh] = parties.try_emplace(*result.partyId);
            if (fresh) {
                it->second.matchId = match->matchId;
                it->second.mode = match->mode;
                it->second.outcome = result.outcome;
            }
            it->second.members.push_back(result.playerId);
        }
        for (auto& [id, party] : parties) {
            std::sort(party.members.begin(), party.members.end());
            out.push_back(std::move(party));
        }
    }
    return out;
}

/// The largest group of @p members on one side of @p match, if it has two
/// or more players. Ties go to the lowest side number.
struct SideLineup {
    std::vector<PlayerId> members;  // ascending
    Outcome outcome = Outcome::Loss;
};

std::optional<SideLineup> communityLineup(const MatchRecord& match,
                                          const std::set<PlayerId>& members) {
    std::map<uint32_t, SideLineup> sides;
    for (const auto& result : match.players) {
        if (!members.contains(result.playerId)) {
            continue;
        }
        auto [it, fresh] = sides.try_emplace(result.teamSide);
        if (fresh) {
            it->second.outcome = result.outcome;
        }
        it->second.members.push_back(result.playerId);
    }

    const SideLineup* best = nullptr;
    for (const auto& [side, lineup] : sides) {
        if (!best || lineup.members.size() > best->members.size()) {
            best = &lineup;
        }
    }
    if (!best || best->members.size() < 2) {
        return std::nullopt;
    }
    auto out = *best;
    std::sort(out.members.begin(), out.members.end());
    return out;
}

bool membersMatch(const std::vector<TeamMember>& members, const std::string& needle) {
    return std::any_of(members.begin(), members.end(), [&](const TeamMember& m) {
        return toLower(m.name).find(needle) != std::string::npos;
    });
}

} // namespace

GameResult<TeamType> parseTeamType(std::string_view name) {
    auto lowered = toLower(name);
    if (lowered == "party") {
        return GameResult<TeamType>::ok(TeamType::Party);
    }
    if (lowered == "community") {
        return GameResult<TeamType>::ok(TeamType::Community);
    }
    return GameResult<TeamType>::err(
        EngineError(ErrorCode::UnknownTeamType,
                    "team type must be 'party' or 'community'", std::string(name)));
}

// -- TeamDetector -------------------------------------------------------------

TeamDetector::TeamDetector(TeamDetectorOptions options)
    : options_(options) {}

std::vector<PartyTeamCandidate> TeamDetector::detectPartyTeams(
    const MatchSnapshot& snapshot) const {
    auto instances = partyInstances(snapshot);

    // Every match in which a player queued in a party, solo parties included.
    std::map<PlayerId, std::set<MatchId>> partyMatchesOf;
    std::map<std::vector<PlayerId>, std::vector<const PartyInstance*>> rosters;
    for (const auto& inst : instances) {
        for (auto id : inst.members) {
            partyMatchesOf[id].insert(inst.matchId);
        }
        if (inst.members.size() >= 2) {
            rosters[inst.members].push_back(&inst);
        }
    }

    std::vector<PartyTeamCandidate> out;
    for (const auto& [memberIds, seen] : rosters) {
        std::set<MatchId> exact;
        StatsTally tally;
        for (const auto* inst : seen) {
            if (exact.insert(inst->matchId).second) {
                tally.add(inst->mode, inst->outcome);
            }
        }
        if (exact.size() < options_.partyMinMatches) {
            continue;
        }

        std::set<MatchId> anyMember;
        for (auto id : memberIds) {
            const auto& matches = partyMatchesOf[id];
            anyMember.insert(matches.begin(), matches.end());
        }

        PartyTeamCandidate team;
        team.memberIds = memberIds;
        team.exactRosterMatches = static_cast<uint32_t>(exact.size());
        team.memberPartyMatches = static_cast<uint32_t>(anyMember.size());
        team.stabilityScore = anyMember.empty()
            ? 0.0
            : static_cast<double>(exact.size()) / static_cast<double>(anyMember.size());
        team.statsOverall = tally.overall();
        team.statsByMode = tally.byMode();
        for (auto id : memberIds) {
            team.members.push_back(
                makeMember(snapshot, id, team.exactRosterMatches, team.exactRosterMatches));
        }
        out.push_back(std::move(team));
    }

    std::sort(out.begin(), out.end(), [](const PartyTeamCandidate& a, const PartyTeamCandidate& b) {
        if (a.exactRosterMatches != b.exactRosterMatches) {
            return a.exactRosterMatches > b.exactRosterMatches;
        }
        if (a.stabilityScore != b.stabilityScore) {
            return a.stabilityScore > b.stabilityScore;
        }
        return a.memberIds < b.memberIds;
    });
    if (out.size() > options_.maxTeams) {
        out.resize(options_.maxTeams);
    }
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i].teamId = "party_" + std::to_string(i + 1);
    }

    NRE_LOG_INFO(LogCategory::Teams,
                 "party teams: " + std::to_string(out.size()) + " of " +
                 std::to_string(rosters.size()) + " rosters kept");
    return out;
}

std::vector<CommunityCluster> TeamDetector::detectCommunities(
    const MatchSnapshot& snapshot, const TeamGraph& graph) const {
    // Union-find over the edges that pass the weight threshold.
    std::map<PlayerId, PlayerId> parent;
    auto findRoot = [&parent](PlayerId x) {
        auto root = x;
        while (parent[root] != root) {
            root = parent[root];
        }
        while (parent[x] != root) {
            auto next = parent[x];
            parent[x] = root;
            x = next;
        }
        return root;
    };

    for (const auto& [pair, stats] : graph.edges()) {
        if (stats.weight < options_.communityMinEdgeWeight) {
            continue;
        }
        parent.try_emplace(pair.a, pair.a);
        parent.try_emplace(pair.b, pair.b);
        auto ra = findRoot(pair.a);
        auto rb = findRoot(pair.b);
        if (ra != rb) {
            // Smaller id becomes the root so components are labelled stably.
            if (rb < ra) {
                std::swap(ra, rb);
            }
            parent[rb] = ra;
        }
    }

    std::map<PlayerId, std::set<PlayerId>> components;
    for (const auto& [id, _] : parent) {
        components[findRoot(id)].insert(id);
    }

    std::vector<CommunityCluster> out;
    for (const auto& [root, members] : components) {
        if (members.size() < options_.minRosterSize || members.size() > options_.maxRosterSize) {
            continue;
        }

        CommunityCluster cluster;
        cluster.memberIds.assign(members.begin(), members.end());

        uint64_t totalWeight = 0;
        for (const auto& [pair, stats] : graph.edges()) {
            if (stats.weight >= options_.communityMinEdgeWeight &&
                members.contains(pair.a) && members.contains(pair.b)) {
                ++cluster.edgeCount;
                totalWeight += stats.weight;
            }
        }
        auto n = static_cast<double>(members.size());
        auto possible = n * (n - 1.0) / 2.0;
        cluster.density = possible > 0.0 ? static_cast<double>(cluster.edgeCount) / possible : 0.0;
        cluster.avgConnectionStrength = cluster.edgeCount > 0
            ? static_cast<double>(totalWeight) / static_cast<double>(cluster.edgeCount)
            : 0.0;

        StatsTally tally;
        std::map<PlayerId, uint32_t> attendance;
        std::map<std::vector<PlayerId>, uint32_t> lineups;
        for (const auto* match : snapshot.matches()) {
            auto lineup = communityLineup(*match, members);
            if (!lineup) {
                continue;
            }
            tally.add(match->mode, lineup->outcome);
            for (auto id : lineup->members) {
                ++attendance[id];
            }
            ++lineups[lineup->members];
        }
        cluster.statsOverall = tally.overall();
        cluster.statsByMode = tally.byMode();

        for (auto id : cluster.memberIds) {
            cluster.members.push_back(
                makeMember(snapshot, id, attendance[id], cluster.statsOverall.matches));
        }
        std::stable_sort(cluster.members.begin(), cluster.members.end(),
                         [](const TeamMember& a, const TeamMember& b) {
                             return a.matchesWithTeam > b.matchesWithTeam;
                         });
        cluster.teamName = cluster.members.front().name + "'s Squad";

        std::vector<std::pair<std::vector<PlayerId>, uint32_t>> ranked(lineups.begin(), lineups.end());
        std::stable_sort(ranked.begin(), ranked.end(),
                         [](const auto& a, const auto& b) { return a.second > b.second; });
        for (std::size_t i = 0; i < ranked.size() && i < 5; ++i) {
            Lineup l;
            l.memberIds = ranked[i].first;
            for (auto id : l.memberIds) {
                l.names.push_back(snapshot.playerName(id));
            }
            l.count = ranked[i].second;
            cluster.commonLineups.push_back(std::move(l));
        }

        out.push_back(std::move(cluster));
    }

    std::sort(out.begin(), out.end(), [](const CommunityCluster& a, const CommunityCluster& b) {
        if (a.statsOverall.matches != b.statsOverall.matches) {
            return a.statsOverall.matches > b.statsOverall.matches;
        }
        if (a.memberIds.size() != b.memberIds.size()) {
            return a.memberIds.size() > b.memberIds.size();
        }
        return a.memberIds.front() < b.memberIds.front();
    });
    if (out.size() > options_.maxTeams) {
        out.resize(options_.maxTeams);
    }
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i].clusterId = "community_" + std::to_string(i + 1);
    }

    NRE_LOG_INFO(LogCategory::Teams,
                 "communities: " + std::to_string(out.size()) + " of " +
                 std::to_string(components.size()) + " components kept (min edge weight " +
                 std::to_string(options_.communityMinEdgeWeight) + ")");
    return out;
}

std::vector<PlayerPairEdge> TeamDetector::frequentPairs(
    const MatchSnapshot& snapshot, const TeamGraph& graph) const {
    std::vector<PlayerPairEdge> out;
    for (const auto& [pair, stats] : graph.edges()) {
        if (stats.weight < options_.pairMinWeight) {
            continue;
        }
        PlayerPairEdge e;
        e.a = pair.a;
        e.b = pair.b;
        e.nameA = snapshot.playerName(pair.a);
        e.nameB = snapshot.playerName(pair.b);
        e.weight = stats.weight;
        e.jointWins = stats.jointWins;
        e.jointLosses = stats.jointLosses;
        auto decided = stats.jointWins + stats.jointLosses;
        e.jointWinRate = decided > 0
            ? static_cast<double>(stats.jointWins) / static_cast<double>(decided)
            : 0.0;
        e.soloWinRateA = graph.soloWinRate(pair.a, pair.b);
        e.soloWinRateB = graph.soloWinRate(pair.b, pair.a);
        e.synergy = e.jointWinRate - (e.soloWinRateA + e.soloWinRateB) / 2.0;
        out.push_back(std::move(e));
    }

    // Edges come out of the map ordered by (a, b), so a stable sort keeps that as the tie-break.
    std::stable_sort(out.begin(), out.end(), [](const PlayerPairEdge& x, const PlayerPairEdge& y) {
        return x.weight > y.weight;
    });

    NRE_LOG_DEBUG(LogCategory::Teams,
                  "frequent pairs: " + std::to_string(out.size()) + " with weight >= " +
                  std::to_string(options_.pairMinWeight));
    return out;
}

TeamReport TeamDetector::buildTeams(const MatchSnapshot& snapshot, TeamType type) const {
    TeamReport report;
    report.type = type;
    report.window = snapshot.window();
    if (type == TeamType::Party) {
        report.parties = detectPartyTeams(snapshot);
    } else {
        report.communities = detectCommunities(snapshot, TeamGraph::build(snapshot));
    }
    return report;
}

TeamReport TeamDetector::searchTeams(const TeamReport& report, std::string_view playerName) {
    TeamReport out;
    out.type = report.type;
    out.window = report.window;
    if (playerName.empty()) {
        return out;
    }

    auto needle = toLower(playerName);
    for (const auto& team : report.parties) {
        if (membersMatch(team.members, needle)) {
            out.parties.push_back(team);
        }
    }
    for (const auto& cluster : report.communities) {
        if (membersMatch(cluster.members, needle)) {
            out.communities.push_back(cluster);
        }
    }
    return out;
}

}  // namespace nre::teams
