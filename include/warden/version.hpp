#pragma once

/// @file version.hpp
/// @brief Library version information and root namespace definition.

#define WARDEN_VERSION_MAJOR 0
#define WARDEN_VERSION_MINOR 3
#define WARDEN_VERSION_PATCH 0
#define WARDEN_VERSION_STRING "0.3.0"

namespace warden {

/// Library version information at compile time.
struct Version {
    static constexpr int major = WARDEN_VERSION_MAJOR;
    static constexpr int minor = WARDEN_VERSION_MINOR;
    static constexpr int patch = WARDEN_VERSION_PATCH;
    static constexpr const char* string = WARDEN_VERSION_STRING;
};

} // namespace warden
