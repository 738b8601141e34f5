#pragma once

/// @file team_detector.hpp
/// @brief Party teams, community clusters, frequent pairs and team search.
///
/// Three independent outputs over the same snapshot:
///   - party teams: exact member sets that queued under one party id,
///   - communities: connected components of the co-occurrence graph
///     after dropping light edges,
///   - frequent pairs: heavy edges with their synergy.
///
/// Every output is a pure function of (snapshot, options); identical
/// input gives identical output, including order.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nre/foundation/engine_result.hpp"
#include "nre/ranking/match_snapshot.hpp"
#include "nre/teams/team_graph.hpp"

namespace nre::teams {

using ranking::GameMode;

enum class TeamType : uint8_t { Party, Community };

std::string_view teamTypeName(TeamType type);

/// "party" or "community", case-insensitive. UnknownTeamType otherwise.
[[nodiscard]] foundation::GameResult<TeamType> parseTeamType(std::string_view name);

/// Match record of a team. Draws count as matches but not as decided games.
struct TeamStats {
    uint32_t matches = 0;
    uint32_t wins = 0;
    uint32_t losses = 0;
    double winRate = 0.0;  ///< wins / (wins + losses), 0 when nothing was decided.

    bool operator==(const TeamStats&) const = default;
};

struct TeamMember {
    PlayerId playerId;
    std::string name;
    std::optional<std::string> countryCode;
    uint32_t matchesWithTeam = 0;
    double attendancePercent = 0.0;  ///< One decimal place.

    bool operator==(const TeamMember&) const = default;
};

/// An exact member set seen sharing a party id.
struct PartyTeamCandidate {
    std::string teamId;                 ///< "party_<n>" in output order.
    std::vector<PlayerId> memberIds;    ///< Ascending.
    std::vector<TeamMember> members;
    uint32_t exactRosterMatches = 0;
    uint32_t memberPartyMatches = 0;    ///< Matches any member played in any party.
    double stabilityScore = 0.0;        ///< exact / member party matches, in [0, 1].
    TeamStats statsOverall;
    std::map<GameMode, TeamStats> statsByMode;

    bool operator==(const PartyTeamCandidate&) const = default;
};

/// A set of members who took the field together, and how often.
struct Lineup {
    std::vector<PlayerId> memberIds;
    std::vector<std::string> names;
    uint32_t count = 0;

    bool operator==(const Lineup&) const = default;
};

struct CommunityCluster {
    std::string clusterId;              ///< "community_<n>" in output order.
    std::string teamName;               ///< "<best attending member>'s Squad"
    std::vector<PlayerId> memberIds;    ///< Ascending.
    std::vector<TeamMember> members;    ///< By attendance, descending.
    std::size_t edgeCount = 0;
    double density = 0.0;               ///< edges / possible edges, in [0, 1].
    double avgConnectionStrength = 0.0; ///< Mean weight of the kept edges.
    TeamStats statsOverall;
    std::map<GameMode, TeamStats> statsByMode;
    std::vector<Lineup> commonLineups;  ///< At most five.

    bool operator==(const CommunityCluster&) const = default;
};

struct PlayerPairEdge {
    PlayerId a;
    PlayerId b;
    std::string nameA;
    std::string nameB;
    uint32_t weight = 0;
    uint32_t jointWins = 0;
    uint32_t jointLosses = 0;
    double jointWinRate = 0.0;
    double soloWinRateA = 0.0;
    double soloWinRateB = 0.0;
    double synergy = 0.0;  ///< joint - mean(soloA, soloB)

    bool operator==(const PlayerPairEdge&) const = default;
};

struct TeamDetectorOptions {
    uint32_t partyMinMatches = 1;
    uint32_t communityMinEdgeWeight = 5;
    std::size_t minRosterSize = 2;
    std::size_t maxRosterSize = 10;
    uint32_t pairMinWeight = 5;
    std::size_t maxTeams = 100;
};

struct TeamReport {
    TeamType type = TeamType::Party;
    ranking::TimeWindow window;
    std::vector<PartyTeamCandidate> parties;      ///< Set for TeamType::Party.
    std::vector<CommunityCluster> communities;    ///< Set for TeamType::Community.

    [[nodiscard]] std::size_t size() const noexcept {
        return type == TeamType::Party ? parties.size() : communities.size();
    }

    bool operator==(const TeamReport&) const = default;
};

class TeamDetector {
public:
    explicit TeamDetector(TeamDetectorOptions options = TeamDetectorOptions());

    /// Party teams, by matches then stability descending, then member ids.
    [[nodiscard]] std::vector<PartyTeamCandidate> detectPartyTeams(
        const ranking::MatchSnapshot& snapshot) const;

    /// Thresholded connected components of @p graph with a roster size in
    /// [minRosterSize, maxRosterSize], by matches then size descending,
    /// then smallest member id.
    [[nodiscard]] std::vector<CommunityCluster> detectCommunities(
        const ranking::MatchSnapshot& snapshot, const TeamGraph& graph) const;

    /// Edges with weight >= pairMinWeight, by weight descending, then ids.
    [[nodiscard]] std::vector<PlayerPairEdge> frequentPairs(
        const ranking::MatchSnapshot& snapshot, const TeamGraph& graph) const;

    /// One report of @p type over @p snapshot.
    [[nodiscard]] TeamReport buildTeams(const ranking::MatchSnapshot& snapshot,
                                        TeamType type) const;

    /// Teams of @p report with a member whose name contains @p playerName,
    /// ignoring case. An empty query matches nothing.
    [[nodiscard]] static TeamReport searchTeams(const TeamReport& report,
                                                std::string_view playerName);

    [[nodiscard]] const TeamDetectorOptions& options() const noexcept { return options_; }

private:
    TeamDetectorOptions options_;
};

}  // namespace nre::teams
