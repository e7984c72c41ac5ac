#include "footpack/Types.hpp"

#include <charconv>
#include <system_error>

namespace footpack {

namespace {

bool ParseI64(const char* begin, const char* end, std::int64_t& out)
{
  if (begin == end) return false;
  if (*begin == '+') ++begin;
  if (begin == end) return false;
  std::int64_t v = 0;
  const auto res = std::from_chars(begin, end, v, 10);
  if (res.ec != std::errc() || res.ptr != end) return false;
  out = v;
  return true;
}

} // namespace

std::string TileKeyToString(const TileKey& key)
{
  return std::to_string(key.ix) + "," + std::to_string(key.iy);
}

bool ParseTileKey(const std::string& s, TileKey& outKey)
{
  const std::size_t comma = s.find(',');
  if (comma == std::string::npos) return false;
  if (s.find(',', comma + 1) != std::string::npos) return false;

  TileKey k;
  const char* base = s.data();
  if (!ParseI64(base, base + comma, k.ix)) return false;
  if (!ParseI64(base + comma + 1, base + s.size(), k.iy)) return false;
  outKey = k;
  return true;
}

} // namespace footpack
