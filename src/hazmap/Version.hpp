#pragma once

#include <string>

// Build/version metadata for HazMap.
//
// CMake defines these macros for all targets via hazmap_core's PUBLIC compile
// definitions (see CMakeLists.txt). Fallbacks keep the header usable in IDEs or
// non-CMake builds.

#ifndef HAZMAP_VERSION_MAJOR
#define HAZMAP_VERSION_MAJOR 0
#endif

#ifndef HAZMAP_VERSION_MINOR
#define HAZMAP_VERSION_MINOR 0
#endif

#ifndef HAZMAP_VERSION_PATCH
#define HAZMAP_VERSION_PATCH 0
#endif

#ifndef HAZMAP_VERSION_STRING
#define HAZMAP_VERSION_STRING "0.0.0"
#endif

namespace hazmap {

inline std::string VersionString()
{
  return std::string(HAZMAP_VERSION_STRING);
}

} // namespace hazmap
