#pragma once

/// @file version.hpp
/// @brief Library version information.
///
/// CMakeLists.txt reads the project version from the three macros below.

#define PLUME_VERSION_MAJOR 0
#define PLUME_VERSION_MINOR 1
#define PLUME_VERSION_PATCH 0

#define PLUME_STRINGIFY_IMPL(x) #x
#define PLUME_STRINGIFY(x) PLUME_STRINGIFY_IMPL(x)

/// @brief "major.minor.patch" as a string literal.
#define PLUME_VERSION_STRING                 \
    PLUME_STRINGIFY(PLUME_VERSION_MAJOR) "." \
    PLUME_STRINGIFY(PLUME_VERSION_MINOR) "." \
    PLUME_STRINGIFY(PLUME_VERSION_PATCH)

namespace plume {

/// @brief Library version, e.g. "0.1.0".
/// @return Null-terminated string built from the version macros.
inline const char* version() { return PLUME_VERSION_STRING; }

/// @brief Version packed as major * 10000 + minor * 100 + patch.
/// @return Packed version, ordered the same way as releases.
inline constexpr int versionNumber() {
    return PLUME_VERSION_MAJOR * 10000 + PLUME_VERSION_MINOR * 100 + PLUME_VERSION_PATCH;
}

} // namespace plume
