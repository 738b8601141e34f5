#pragma once

/// @file version.hpp
/// @brief Engine version information.

#define NRE_VERSION_MAJOR 1
#define NRE_VERSION_MINOR 0
#define NRE_VERSION_PATCH 0
#define NRE_VERSION_STRING "1.0.0"

namespace nre {

struct Version {
    static constexpr int major = NRE_VERSION_MAJOR;
    static constexpr int minor = NRE_VERSION_MINOR;
    static constexpr int patch = NRE_VERSION_PATCH;
    static constexpr const char* string = NRE_VERSION_STRING;
};

} // namespace nre
