#pragma once

/// @file match_snapshot.hpp
/// @brief Match store boundary and the immutable snapshot every stage reads.

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "nre/ranking/match_types.hpp"

namespace nre::ranking {

/// Source of match history for a window. Implementations live outside the
/// engine (database, parquet files, ...); the engine only enumerates.
class IMatchStore {
public:
    virtual ~IMatchStore() = default;

    /// Finite sequence of matches whose start time lies in @p window.
    [[nodiscard]] virtual std::vector<MatchRecord> matches(const TimeWindow& window) const = 0;

    /// Matches in @p window restricted to one game mode.
    [[nodiscard]] std::vector<MatchRecord> matches(const TimeWindow& window, GameMode mode) const;

    /// All known player profiles.
    [[nodiscard]] virtual std::vector<PlayerProfile> profiles() const = 0;
};

/// In-process store, used by embedding hosts and tests.
class InMemoryMatchStore final : public IMatchStore {
public:
    void addMatch(MatchRecord record);
    void addProfile(PlayerProfile profile);

    using IMatchStore::matches;
    [[nodiscard]] std::vector<MatchRecord> matches(const TimeWindow& window) const override;
    [[nodiscard]] std::vector<PlayerProfile> profiles() const override;

private:
    std::vector<MatchRecord> matches_;
    std::vector<PlayerProfile> profiles_;
};

/// Why a record was rejected at ingestion.
enum class SkipReason : uint8_t {
    InvalidMatchId,
    DuplicateMatch,
    UnknownGameMode,
    EmptyRoster,
    InvalidPlayerId,
    DuplicatePlayer,
    OutsideWindow
};

std::string_view skipReasonName(SkipReason reason);

/// Outcome of ingesting a store's records into a snapshot.
struct IngestReport {
    std::size_t accepted = 0;
    std::size_t skipped = 0;
    std::map<SkipReason, std::size_t> skippedByReason;
};

/// Immutable, validated view over a window of match history.
///
/// Records are held once behind a shared pointer; narrowing with
/// slice()/forMode() only copies a vector of pointers. Records are
/// ordered by (start time, match id) so every stage iterates them in
/// the same order.
class MatchSnapshot {
public:
    /// Read @p store once for @p window and validate every record.
    static MatchSnapshot build(const IMatchStore& store, const TimeWindow& window);

    /// Build directly from records (same validation as build()).
    static MatchSnapshot fromRecords(std::vector<MatchRecord> records,
                                     std::vector<PlayerProfile> profiles,
                                     const TimeWindow& window = TimeWindow::all());

    /// Matches in this view.
    [[nodiscard]] const std::vector<const MatchRecord*>& matches() const noexcept { return view_; }
    [[nodiscard]] std::size_t size() const noexcept { return view_.size(); }
    [[nodiscard]] bool empty() const noexcept { return view_.empty(); }

    [[nodiscard]] const TimeWindow& window() const noexcept { return window_; }
    [[nodiscard]] const IngestReport& ingestReport() const noexcept { return data_->report; }

    /// Narrow to the matches inside @p window. The result covers only the
    /// overlap of @p window with this snapshot's own window.
    [[nodiscard]] MatchSnapshot slice(const TimeWindow& window) const;

    /// Narrow to one game mode.
    [[nodiscard]] MatchSnapshot forMode(GameMode mode) const;

    /// Modes that occur in this view, in enum order.
    [[nodiscard]] std::vector<GameMode> modes() const;

    [[nodiscard]] const PlayerProfile* profile(PlayerId id) const;

    /// Display name; "Player_<id>" for players without a profile.
    [[nodiscard]] std::string playerName(PlayerId id) const;

    /// Raw country code from the profile, unvalidated.
    [[nodiscard]] std::optional<std::string> countryOf(PlayerId id) const;

private:
    struct Data {
        std::vector<MatchRecord> records;
        std::unordered_map<PlayerId, PlayerProfile> profiles;
        IngestReport report;
    };

    MatchSnapshot(std::shared_ptr<const Data> data, std::vector<const MatchRecord*> view,
                  TimeWindow window);

    std::shared_ptr<const Data> data_;
    std::vector<const MatchRecord*> view_;
    TimeWindow window_;
};

}  // namespace nre::ranking
