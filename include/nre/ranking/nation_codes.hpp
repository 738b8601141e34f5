#pragma once

/// @file nation_codes.hpp
/// @brief Resolution of player country codes to rankable nation codes.

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace nre::ranking {

/// Decides which country codes count as nations.
///
/// A code is accepted when it is two ASCII letters or appears in the
/// configured faction allow-list. Accepted codes are upper-cased.
/// Anything else (missing, "??", "XYZ", digits) resolves to nullopt and
/// the player is left out of nation aggregation.
class NationCodeResolver {
public:
    NationCodeResolver() = default;
    explicit NationCodeResolver(const std::vector<std::string>& factionCodes);

    [[nodiscard]] std::optional<std::string> resolve(const std::optional<std::string>& raw) const;
    [[nodiscard]] bool isRecognized(std::string_view code) const;

    [[nodiscard]] const std::set<std::string>& factionCodes() const noexcept { return factions_; }

private:
    std::set<std::string> factions_;
};

}  // namespace nre::ranking
