/// @file score_aggregator.cpp
/// @brief ScoreAggregator implementation.

#include "nre/ranking/score_aggregator.hpp"

#include <set>
#include <utility>

#include "nre/foundation/engine_logger.hpp"

namespace nre::ranking {

using foundation::LogCategory;

ScoreAggregator::ScoreAggregator(NationCodeResolver resolver)
    : resolver_(std::move(resolver)) {}

ModeAggregate ScoreAggregator::aggregate(const MatchSnapshot& snapshot, GameMode mode) const {
    ModeAggregate out;
    out.mode = mode;

    // Resolve each player's nation once per call.
    std::map<PlayerId, std::optional<std::string>> nationOf;
    auto nationFor = [&](PlayerId id) -> const std::optional<std::string>& {
        auto it = nationOf.find(id);
        if (it == nationOf.end()) {
            it = nationOf.emplace(id, resolver_.resolve(snapshot.countryOf(id))).first;
        }
        return it->second;
    };

    std::map<std::string, std::set<PlayerId>> nationPlayers;

    for (const auto* match : snapshot.matches()) {
        if (match->mode != mode) {
            continue;
        }
        for (const auto& result : match->players) {
            const auto& nation = nationFor(result.playerId);

            auto [pit, inserted] = out.players.try_emplace(result.playerId);
            auto& player = pit->second;
            if (inserted) {
                player.playerId = result.playerId;
                player.mode = mode;
                player.countryCode = nation;
            }

            switch (result.outcome) {
                case Outcome::Win:  ++player.wins; break;
                case Outcome::Loss: ++player.losses; break;
                case Outcome::Draw: ++player.draws; break;
            }

            if (result.outcome == Outcome::Draw) {
                continue;
            }
            if (!nation) {
                ++out.unresolvedResults;
                continue;
            }

            auto [nit, fresh] = out.nations.try_emplace(*nation);
            auto& agg = nit->second;
            if (fresh) {
                agg.countryCode = *nation;
                agg.mode = mode;
            }
            if (result.outcome == Outcome::Win) {
                ++agg.wins;
            } else {
                ++agg.losses;
            }
            nationPlayers[*nation].insert(result.playerId);
        }
    }

    for (auto& [code, agg] : out.nations) {
        agg.playerCount = static_cast<uint32_t>(nationPlayers[code].size());
    }

    NRE_LOG_DEBUG(LogCategory::Ranking,
                  std::string(gameModeName(mode)) + ": aggregated " +
                  std::to_string(out.nations.size()) + " nations, " +
                  std::to_string(out.players.size()) + " players");
    return out;
}

}  // namespace nre::ranking
