/// @file match_snapshot.cpp
/// @brief Match store, ingestion validation and snapshot views.

#include "nre/ranking/match_snapshot.hpp"

#include <algorithm>
#include <string>
#include <unordered_set>
#include <utility>

#include "nre/foundation/engine_logger.hpp"

namespace nre::ranking {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

// -- IMatchStore -------------------------------------------------------------

std::vector<MatchRecord> IMatchStore::matches(const TimeWindow& window, GameMode mode) const {
    auto all = matches(window);
    std::erase_if(all, [mode](const MatchRecord& m) { return m.mode != mode; });
    return all;
}

// -- InMemoryMatchStore -------------------------------------------------------

void InMemoryMatchStore::addMatch(MatchRecord record) {
    matches_.push_back(std::move(record));
}

void InMemoryMatchStore::addProfile(PlayerProfile profile) {
    profiles_.push_back(std::move(profile));
}

std::vector<MatchRecord> InMemoryMatchStore::matches(const TimeWindow& window) const {
    std::vector<MatchRecord> out;
    for (const auto& m : matches_) {
        if (window.contains(m.startTime)) {
            out.push_back(m);
        }
    }
    return out;
}

std::vector<PlayerProfile> InMemoryMatchStore::profiles() const {
    return profiles_;
}

// -- Ingestion ----------------------------------------------------------------

std::string_view skipReasonName(SkipReason reason) {
    switch (reason) {
        case SkipReason::InvalidMatchId:  return "invalid_match_id";
        case SkipReason::DuplicateMatch:  return "duplicate_match";
        case SkipReason::UnknownGameMode: return "unknown_game_mode";
        case SkipReason::EmptyRoster:     return "empty_roster";
        case SkipReason::InvalidPlayerId: return "invalid_player_id";
        case SkipReason::DuplicatePlayer: return "duplicate_player";
        case SkipReason::OutsideWindow:   return "outside_window";
    }
    return "unknown";
}

namespace {

std::optional<SkipReason> validate(const MatchRecord& record,
                                   const TimeWindow& window,
                                   const std::unordered_set<MatchId>& seen) {
    if (!record.matchId.isValid()) {
        return SkipReason::InvalidMatchId;
    }
    if (seen.contains(record.matchId)) {
        return SkipReason::DuplicateMatch;
    }
    if (record.mode == GameMode::Unknown) {
        return SkipReason::UnknownGameMode;
    }
    if (record.players.empty()) {
        return SkipReason::EmptyRoster;
    }
    if (!window.contains(record.startTime)) {
        return SkipReason::OutsideWindow;
    }

    std::unordered_set<PlayerId> roster;
    for (const auto& p : record.players) {
        if (!p.playerId.isValid()) {
            return SkipReason::InvalidPlayerId;
        }
        if (!roster.insert(p.playerId).second) {
            return SkipReason::DuplicatePlayer;
        }
    }
    return std::nullopt;
}

bool chronological(const MatchRecord& a, const MatchRecord& b) {
    if (a.startTime != b.startTime) {
        return a.startTime < b.startTime;
    }
    return a.matchId < b.matchId;
}

} // namespace

MatchSnapshot MatchSnapshot::build(const IMatchStore& store, const TimeWindow& window) {
    return fromRecords(store.matches(window), store.profiles(), window);
}

MatchSnapshot MatchSnapshot::fromRecords(std::vector<MatchRecord> records,
                                         std::vector<PlayerProfile> profiles,
                                         const TimeWindow& window) {
    auto data = std::make_shared<Data>();

    // Sort first so the surviving copy of a duplicated match id does not
    // depend on the order the store returned records in.
    std::stable_sort(records.begin(), records.end(), chronological);

    std::unordered_set<MatchId> seen;
    data->records.reserve(records.size());
    for (auto& record : records) {
        auto reason = validate(record, window, seen);
        if (reason) {
            ++data->report.skipped;
            ++data->report.skippedByReason[*reason];
            continue;
        }
        seen.insert(record.matchId);
        data->records.push_back(std::move(record));
        ++data->report.accepted;
    }

    for (auto& profile : profiles) {
        if (profile.playerId.isValid()) {
            data->profiles.insert_or_assign(profile.playerId, std::move(profile));
        }
    }

    if (data->report.skipped > 0) {
        LogContext ctx;
        ctx.extra["accepted"] = std::to_string(data->report.accepted);
        ctx.extra["skipped"] = std::to_string(data->report.skipped);
        for (const auto& [reason, count] : data->report.skippedByReason) {
            ctx.extra[std::string(skipReasonName(reason))] = std::to_string(count);
        }
        foundation::EngineLogger::instance().logWithContext(
            LogLevel::Warning, LogCategory::Ingest, "rejected malformed match records", ctx);
    } else {
        NRE_LOG_DEBUG(LogCategory::Ingest,
                      "ingested " + std::to_string(data->report.accepted) + " match records");
    }

    std::vector<const MatchRecord*> view;
    view.reserve(data->records.size());
    for (const auto& r : data->records) {
        view.push_back(&r);
    }
    return MatchSnapshot(std::move(data), std::move(view), window);
}

MatchSnapshot::MatchSnapshot(std::shared_ptr<const Data> data,
                             std::vector<const MatchRecord*> view,
                             TimeWindow window)
    : data_(std::move(data)), view_(std::move(view)), window_(std::move(window)) {}

// -- Views --------------------------------------------------------------------

MatchSnapshot MatchSnapshot::slice(const TimeWindow& window) const {
    std::vector<const MatchRecord*> view;
    for (const auto* m : view_) {
        if (window.contains(m->startTime)) {
            view.push_back(m);
        }
    }
    return MatchSnapshot(data_, std::move(view), window_.overlap(window));
}

MatchSnapshot MatchSnapshot::forMode(GameMode mode) const {
    std::vector<const MatchRecord*> view;
    for (const auto* m : view_) {
        if (m->mode == mode) {
            view.push_back(m);
        }
    }
    return MatchSnapshot(data_, std::move(view), window_);
}

std::vector<GameMode> MatchSnapshot::modes() const {
    std::vector<GameMode> out;
    for (auto mode : kRankedGameModes) {
        auto present = std::any_of(view_.begin(), view_.end(),
                                   [mode](const MatchRecord* m) { return m->mode == mode; });
        if (present) {
            out.push_back(mode);
        }
    }
    return out;
}

const PlayerProfile* MatchSnapshot::profile(PlayerId id) const {
    auto it = data_->profiles.find(id);
    return it == data_->profiles.end() ? nullptr : &it->second;
}

std::string MatchSnapshot::playerName(PlayerId id) const {
    const auto* p = profile(id);
    if (p && !p->name.empty()) {
        return p->name;
    }
    return "Player_" + std::to_string(id.value());
}

std::optional<std::string> MatchSnapshot::countryOf(PlayerId id) const {
    const auto* p = profile(id);
    if (!p) {
        return std::nullopt;
    }
    return p->countryCode;
}

}  // namespace nre::ranking
