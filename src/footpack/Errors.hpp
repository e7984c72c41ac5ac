#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace footpack {

// Error taxonomy for a pack run.
//
// SkippedGeometry and HeightFallback are per-record and non-fatal: they are
// counted in RunStats and logged, the run continues.
// IOFailure and ConfigurationError are fatal: the run stops before anything
// is committed.
enum class ErrorKind : std::uint8_t {
  SkippedGeometry = 0,
  HeightFallback,
  IOFailure,
  ConfigurationError,
};

const char* ErrorKindName(ErrorKind k);

inline bool IsFatal(ErrorKind k)
{
  return k == ErrorKind::IOFailure || k == ErrorKind::ConfigurationError;
}

struct PackError {
  ErrorKind kind = ErrorKind::IOFailure;
  std::string message;
};

inline PackError MakeIOFailure(std::string msg)
{
  return PackError{ErrorKind::IOFailure, std::move(msg)};
}

inline PackError MakeConfigurationError(std::string msg)
{
  return PackError{ErrorKind::ConfigurationError, std::move(msg)};
}

// "<kind>: <message>"
std::string FormatPackError(const PackError& e);

} // namespace footpack
