#include "nre/ranking/nation_codes.hpp"

#include <algorithm>
#include <cctype>

namespace nre::ranking {

namespace {

std::string upper(std::string_view in) {
    std::string out(in);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string_view trim(std::string_view in) {
    while (!in.empty() && std::isspace(static_cast<unsigned char>(in.front()))) {
        in.remove_prefix(1);
    }
    while (!in.empty() && std::isspace(static_cast<unsigned char>(in.back()))) {
        in.remove_suffix(1);
    }
    return in;
}

bool isIsoShaped(std::string_view code) {
    return code.size() == 2 &&
           std::isalpha(static_cast<unsigned char>(code[0])) &&
           std::isalpha(static_cast<unsigned char>(code[1]));
}

} // namespace

NationCodeResolver::NationCodeResolver(const std::vector<std::string>& factionCodes) {
    for (const auto& code : factionCodes) {
        auto trimmed = trim(code);
        if (!trimmed.empty()) {
            factions_.insert(upper(trimmed));
        }
    }
}

bool NationCodeResolver::isRecognized(std::string_view code) const {
    auto normalized = upper(trim(code));
    if (normalized.empty()) {
        return false;
    }
    return isIsoShaped(normalized) || factions_.contains(normalized);
}

std::optional<std::string> NationCodeResolver::resolve(const std::optional<std::string>& raw) const {
    if (!raw || !isRecognized(*raw)) {
        return std::nullopt;
    }
    return upper(trim(*raw));
}

}  // namespace nre::ranking
