/// @file team_graph.cpp
/// @brief TeamGraph implementation.

#include "nre/teams/team_graph.hpp"

#include <string>

#include "nre/foundation/engine_logger.hpp"

namespace nre::teams {

using foundation::LogCategory;
using ranking::Outcome;

TeamGraph TeamGraph::build(const ranking::MatchSnapshot& snapshot) {
    TeamGraph graph;
    for (const auto* match : snapshot.matches()) {
        graph.addMatch(*match);
    }
    NRE_LOG_DEBUG(LogCategory::Teams,
                  "co-occurrence graph: " + std::to_string(graph.nodeCount()) + " nodes, " +
                  std::to_string(graph.edgeCount()) + " edges from " +
                  std::to_string(snapshot.size()) + " matches");
    return graph;
}

void TeamGraph::addMatch(const ranking::MatchRecord& match) {
    for (const auto& result : match.players) {
        auto& rec = records_[result.playerId];
        ++rec.matches;
        switch (result.outcome) {
            case Outcome::Win:  ++rec.wins; break;
            case Outcome::Loss: ++rec.losses; break;
            case Outcome::Draw: ++rec.draws; break;
        }
    }

    const auto& roster = match.players;
    for (std::size_t i = 0; i < roster.size(); ++i) {
        for (std::size_t j = i + 1; j < roster.size(); ++j) {
            const auto& x = roster[i];
            const auto& y = roster[j];
            if (x.teamSide != y.teamSide) {
                continue;
            }
            auto& stats = edges_[PlayerPair::of(x.playerId, y.playerId)];
            ++stats.weight;
            if (x.outcome == Outcome::Win && y.outcome == Outcome::Win) {
                ++stats.jointWins;
            } else if (x.outcome == Outcome::Loss && y.outcome == Outcome::Loss) {
                ++stats.jointLosses;
            }
            adjacency_[x.playerId].insert(y.playerId);
            adjacency_[y.playerId].insert(x.playerId);
        }
    }
}

std::vector<PlayerId> TeamGraph::nodes() const {
    std::vector<PlayerId> out;
    out.reserve(adjacency_.size());
    for (const auto& [id, _] : adjacency_) {
        out.push_back(id);
    }
    return out;
}

const PairStats* TeamGraph::edge(PlayerId x, PlayerId y) const {
    auto it = edges_.find(PlayerPair::of(x, y));
    return it == edges_.end() ? nullptr : &it->second;
}

const std::set<PlayerId>& TeamGraph::neighbors(PlayerId player) const {
    static const std::set<PlayerId> kNone;
    auto it = adjacency_.find(player);
    return it == adjacency_.end() ? kNone : it->second;
}

PlayerRecord TeamGraph::record(PlayerId player) const {
    auto it = records_.find(player);
    return it == records_.end() ? PlayerRecord{} : it->second;
}

double TeamGraph::soloWinRate(PlayerId player, PlayerId partner) const {
    auto rec = record(player);
    uint32_t jointWins = 0;
    uint32_t jointLosses = 0;
    if (const auto* e = edge(player, partner)) {
        jointWins = e->jointWins;
        jointLosses = e->jointLosses;
    }

    uint32_t soloWins = rec.wins - jointWins;
    uint32_t soloLosses = rec.losses - jointLosses;
    if (soloWins + soloLosses > 0) {
        return static_cast<double>(soloWins) / static_cast<double>(soloWins + soloLosses);
    }
    if (rec.decided() > 0) {
        return static_cast<double>(rec.wins) / static_cast<double>(rec.decided());
    }
    return 0.0;
}

}  // namespace nre::teams
