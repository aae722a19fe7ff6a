#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define FWR_VERSION_MAJOR 0
#define FWR_VERSION_MINOR 3
#define FWR_VERSION_PATCH 0
#define FWR_VERSION_STRING "0.3.0"

namespace fwr {

/// Project version information at compile time.
struct Version {
    static constexpr int major = FWR_VERSION_MAJOR;
    static constexpr int minor = FWR_VERSION_MINOR;
    static constexpr int patch = FWR_VERSION_PATCH;
    static constexpr const char* string = FWR_VERSION_STRING;
};

} // namespace fwr
