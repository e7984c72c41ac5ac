#pragma once

// Small strict parsers shared by the footpack_cli subcommands.
//
// All of them reject partial parses ("12abc"), empty input and non-finite
// floats, and never throw.

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace footpack::cli {

inline bool EnsureParentDir(const std::filesystem::path& file)
{
  if (file.empty()) return false;
  const std::filesystem::path parent = file.parent_path();
  if (parent.empty()) return true;
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  return !ec;
}

inline bool ParseI32(std::string_view s, int* out)
{
  if (!out || s.empty()) return false;

  // from_chars does not take a leading '+'.
  if (s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return false;

  int v = 0;
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(s.data(), end, v, 10);
  if (res.ec != std::errc() || res.ptr != end) return false;
  *out = v;
  return true;
}

inline bool ParseF64(std::string_view s, double* out)
{
  if (!out || s.empty()) return false;

  const std::string tmp(s);
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(tmp.c_str(), &end);
  if (errno != 0) return false;
  if (!end || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

// "a,b,c" -> {"a","b","c"}. Whitespace is dropped, empty items are kept so
// callers can detect "1,,2".
inline std::vector<std::string> SplitCommaList(std::string_view s)
{
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      out.push_back(cur);
      cur.clear();
      continue;
    }
    if (c == ' ' || c == '\t') continue;
    cur.push_back(c);
  }
  out.push_back(cur);
  return out;
}

// "x,y"
inline bool ParseF64Pair(std::string_view s, double* outA, double* outB)
{
  if (!outA || !outB) return false;
  const std::vector<std::string> parts = SplitCommaList(s);
  if (parts.size() != 2) return false;
  double a = 0.0;
  double b = 0.0;
  if (!ParseF64(parts[0], &a) || !ParseF64(parts[1], &b)) return false;
  *outA = a;
  *outB = b;
  return true;
}

} // namespace footpack::cli
