#pragma once

#include <string>

// CMake sets these on footpack_core (PUBLIC), the fallbacks keep the header
// usable in non-CMake builds.

#ifndef FOOTPACK_VERSION_MAJOR
#define FOOTPACK_VERSION_MAJOR 0
#endif

#ifndef FOOTPACK_VERSION_MINOR
#define FOOTPACK_VERSION_MINOR 0
#endif

#ifndef FOOTPACK_VERSION_PATCH
#define FOOTPACK_VERSION_PATCH 0
#endif

#ifndef FOOTPACK_VERSION_STRING
#define FOOTPACK_VERSION_STRING "0.0.0"
#endif

#ifndef FOOTPACK_GIT_SHA
#define FOOTPACK_GIT_SHA "unknown"
#endif

namespace footpack {

inline constexpr const char* VersionString()
{
  return FOOTPACK_VERSION_STRING;
}

inline std::string FullVersionString()
{
  std::string s = VersionString();
  const std::string sha = FOOTPACK_GIT_SHA;
  if (!sha.empty() && sha != "unknown") s += " (" + sha + ")";
  return s;
}

} // namespace footpack
