#pragma once

/// @file match_fixtures.hpp
/// @brief Synthetic match history shared by the unit tests.

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "nre/ranking/match_snapshot.hpp"
#include "nre/ranking/match_types.hpp"

namespace nre::test {

using ranking::GameMode;
using ranking::MatchRecord;
using ranking::Outcome;
using ranking::PlayerProfile;
using ranking::PlayerResult;
using ranking::Timestamp;
using ranking::TimeWindow;
using foundation::MatchId;
using foundation::PartyId;
using foundation::PlayerId;

/// Seconds since the epoch as a Timestamp.
inline Timestamp at(int64_t seconds) {
    return Timestamp(std::chrono::seconds(seconds));
}

inline PlayerResult result(uint64_t player, Outcome outcome, uint32_t side = 0,
                           std::optional<uint64_t> party = std::nullopt) {
    PlayerResult r;
    r.playerId = PlayerId(player);
    r.outcome = outcome;
    r.teamSide = side;
    if (party) {
        r.partyId = PartyId(*party);
    }
    return r;
}

inline PlayerResult rated(PlayerResult r, double skill, double uncertainty) {
    r.skill = skill;
    r.uncertainty = uncertainty;
    return r;
}

inline MatchRecord match(uint64_t id, GameMode mode, int64_t seconds,
                         std::vector<PlayerResult> players) {
    MatchRecord m;
    m.matchId = MatchId(id);
    m.mode = mode;
    m.startTime = at(seconds);
    m.players = std::move(players);
    return m;
}

inline PlayerProfile profile(uint64_t id, std::string name,
                             std::optional<std::string> country = std::nullopt) {
    PlayerProfile p;
    p.playerId = PlayerId(id);
    p.name = std::move(name);
    p.countryCode = std::move(country);
    return p;
}

/// Builds match lists with increasing ids and timestamps.
class MatchLog {
public:
    explicit MatchLog(uint64_t firstId = 1, int64_t firstSecond = 1'000'000)
        : nextId_(firstId), nextSecond_(firstSecond) {}

    /// Append a match; returns its id.
    uint64_t add(GameMode mode, std::vector<PlayerResult> players) {
        auto id = nextId_++;
        records_.push_back(match(id, mode, nextSecond_, std::move(players)));
        nextSecond_ += 60;
        return id;
    }

    /// @p player beats @p opponent @p wins times and loses @p losses times.
    void duels(uint64_t player, uint64_t opponent, int wins, int losses,
               GameMode mode = GameMode::Duel) {
        for (int i = 0; i < wins; ++i) {
            add(mode, {result(player, Outcome::Win, 0), result(opponent, Outcome::Loss, 1)});
        }
        for (int i = 0; i < losses; ++i) {
            add(mode, {result(player, Outcome::Loss, 0), result(opponent, Outcome::Win, 1)});
        }
    }

    /// @p party (side 0, shared party id) against @p opponent (side 1).
    uint64_t partyGame(const std::vector<uint64_t>& party, uint64_t partyId,
                       uint64_t opponent, Outcome outcome,
                       GameMode mode = GameMode::SmallTeam) {
        auto opposite = outcome == Outcome::Win ? Outcome::Loss
                      : outcome == Outcome::Loss ? Outcome::Win
                      : Outcome::Draw;
        std::vector<PlayerResult> players;
        for (auto p : party) {
            players.push_back(result(p, outcome, 0, partyId));
        }
        players.push_back(result(opponent, opposite, 1));
        return add(mode, std::move(players));
    }

    [[nodiscard]] const std::vector<MatchRecord>& records() const { return records_; }
    [[nodiscard]] int64_t lastSecond() const { return nextSecond_ - 60; }

    [[nodiscard]] ranking::MatchSnapshot snapshot(std::vector<PlayerProfile> profiles = {},
                                                  const TimeWindow& window = TimeWindow::all()) const {
        return ranking::MatchSnapshot::fromRecords(records_, std::move(profiles), window);
    }

private:
    std::vector<MatchRecord> records_;
    uint64_t nextId_;
    int64_t nextSecond_;
};

}  // namespace nre::test
