#pragma once

/// @file team_graph.hpp
/// @brief Weighted player co-occurrence graph.
///
/// Two players are connected when they appear on the same team side of
/// the same match. The edge weight counts those matches and only grows
/// as more matches are added. Players that never shared a side with
/// anyone are not nodes.

#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <vector>

#include "nre/ranking/match_snapshot.hpp"
#include "nre/ranking/match_types.hpp"

namespace nre::teams {

using foundation::MatchId;
using foundation::PartyId;
using foundation::PlayerId;

/// Unordered player pair, stored with a < b.
struct PlayerPair {
    PlayerId a;
    PlayerId b;

    static PlayerPair of(PlayerId x, PlayerId y) {
        return x < y ? PlayerPair{x, y} : PlayerPair{y, x};
    }

    auto operator<=>(const PlayerPair&) const = default;
};

/// Accumulated statistics of one edge.
struct PairStats {
    uint32_t weight = 0;       ///< Matches played on the same side.
    uint32_t jointWins = 0;
    uint32_t jointLosses = 0;

    bool operator==(const PairStats&) const = default;
};

/// Overall record of one player across every match added.
struct PlayerRecord {
    uint32_t matches = 0;
    uint32_t wins = 0;
    uint32_t losses = 0;
    uint32_t draws = 0;

    [[nodiscard]] uint32_t decided() const noexcept { return wins + losses; }

    bool operator==(const PlayerRecord&) const = default;
};

class TeamGraph {
public:
    TeamGraph() = default;

    /// Graph over every match of @p snapshot.
    static TeamGraph build(const ranking::MatchSnapshot& snapshot);

    /// Add one match: every pair on a common side gains one unit of weight.
    void addMatch(const ranking::MatchRecord& match);

    // -- Queries --------------------------------------------------------------

    /// Connected players, ascending.
    [[nodiscard]] std::vector<PlayerId> nodes() const;

    [[nodiscard]] const std::map<PlayerPair, PairStats>& edges() const noexcept { return edges_; }

    /// Edge between @p x and @p y, or nullptr.
    [[nodiscard]] const PairStats* edge(PlayerId x, PlayerId y) const;

    /// Neighbours of @p player, ascending. Empty for non-nodes.
    [[nodiscard]] const std::set<PlayerId>& neighbors(PlayerId player) const;

    [[nodiscard]] std::size_t nodeCount() const noexcept { return adjacency_.size(); }
    [[nodiscard]] std::size_t edgeCount() const noexcept { return edges_.size(); }

    /// Record of any player seen, node or not.
    [[nodiscard]] PlayerRecord record(PlayerId player) const;

    /// Win rate of @p player over decided matches without @p partner on their side.
    ///
    /// Falls back to the player's overall win rate when every decided match
    /// was played with the partner; 0 for a player with no decided match.
    [[nodiscard]] double soloWinRate(PlayerId player, PlayerId partner) const;

private:
    std::map<PlayerPair, PairStats> edges_;
    std::map<PlayerId, std::set<PlayerId>> adjacency_;
    std::map<PlayerId, PlayerRecord> records_;
};

}  // namespace nre::teams
