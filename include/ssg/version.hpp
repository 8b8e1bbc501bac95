#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define SSG_VERSION_MAJOR 0
#define SSG_VERSION_MINOR 3
#define SSG_VERSION_PATCH 0
#define SSG_VERSION_STRING "0.3.0"

namespace ssg {

/// Project version information at compile time.
struct Version {
    static constexpr int major = SSG_VERSION_MAJOR;
    static constexpr int minor = SSG_VERSION_MINOR;
    static constexpr int patch = SSG_VERSION_PATCH;
    static constexpr const char* string = SSG_VERSION_STRING;
};

} // namespace ssg
