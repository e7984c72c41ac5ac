#include "footpack/Errors.hpp"

namespace footpack {

const char* ErrorKindName(ErrorKind k)
{
  switch (k) {
  case ErrorKind::SkippedGeometry: return "SkippedGeometry";
  case ErrorKind::HeightFallback: return "HeightFallback";
  case ErrorKind::IOFailure: return "IOFailure";
  case ErrorKind::ConfigurationError: return "ConfigurationError";
  }
  return "Unknown";
}

std::string FormatPackError(const PackError& e)
{
  std::string s = ErrorKindName(e.kind);
  if (!e.message.empty()) {
    s += ": ";
    s += e.message;
  }
  return s;
}

} // namespace footpack
