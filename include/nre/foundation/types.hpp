#pragma once

/// @file types.hpp
/// @brief Strong ID types shared by every engine stage.

#include <compare>
#include <cstdint>
#include <functional>

namespace nre::foundation {

/// Tag-based strong typedef for ID values.
///
/// Keeps player, match and party identifiers from being mixed up while
/// sharing one underlying representation. Zero is the invalid/null value.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct PlayerIdTag {};
struct MatchIdTag {};
struct PartyIdTag {};

/// Player account identifier.
using PlayerId = StrongId<PlayerIdTag>;

/// Match identifier, unique within a snapshot.
using MatchId = StrongId<MatchIdTag>;

/// Party (premade queue group) identifier, scoped to a match.
using PartyId = StrongId<PartyIdTag>;

} // namespace nre::foundation

template <typename Tag, typename T>
struct std::hash<nre::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const nre::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
