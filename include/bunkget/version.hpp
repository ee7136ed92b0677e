/*
 * Fallback version header for bunkget
 *
 * The build system defines BUNKGET_VERSION_* from the CMake project version; these defaults
 * only apply when the header is used outside that build.
 */

#pragma once

// Semantic version components (fallback to 0.0.0)
#ifndef BUNKGET_VERSION_MAJOR
#define BUNKGET_VERSION_MAJOR 0
#endif

#ifndef BUNKGET_VERSION_MINOR
#define BUNKGET_VERSION_MINOR 0
#endif

#ifndef BUNKGET_VERSION_PATCH
#define BUNKGET_VERSION_PATCH 0
#endif

// Combined version string (fallback)
#ifndef BUNKGET_VERSION_STRING
#define BUNKGET_VERSION_STRING "0.0.0+dev"
#endif

#ifndef BUNKGET_BUILD_DATE
#define BUNKGET_BUILD_DATE __DATE__ " " __TIME__
#endif

// "X.Y.Z (built: <date>)"
#define BUNKGET_VERSION_LONG_STRING BUNKGET_VERSION_STRING " (built: " BUNKGET_BUILD_DATE ")"

#if defined(__cplusplus)
namespace bunkget::version {
constexpr int major_v = BUNKGET_VERSION_MAJOR;
constexpr int minor_v = BUNKGET_VERSION_MINOR;
constexpr int patch_v = BUNKGET_VERSION_PATCH;
constexpr const char* string_v = BUNKGET_VERSION_STRING;
constexpr const char* long_string_v = BUNKGET_VERSION_LONG_STRING;
} // namespace bunkget::version
#endif
