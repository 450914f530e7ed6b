#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define OCS_VERSION_MAJOR 0
#define OCS_VERSION_MINOR 1
#define OCS_VERSION_PATCH 0
#define OCS_VERSION_STRING "0.1.0"

namespace ocs {

/// Project version information at compile time.
struct Version {
    static constexpr int major = OCS_VERSION_MAJOR;
    static constexpr int minor = OCS_VERSION_MINOR;
    static constexpr int patch = OCS_VERSION_PATCH;
    static constexpr const char* string = OCS_VERSION_STRING;
};

} // namespace ocs
