#include "footpack/TileGrid.hpp"

#include <cmath>

namespace footpack {

namespace {

// 2^63 as a double; anything at or above it does not fit in int64.
constexpr double kI64Limit = 9223372036854775808.0;

bool FloorIndex(double coord, double origin, double size, std::int64_t& out)
{
  const double q = std::floor((coord - origin) / size);
  if (!std::isfinite(q)) return false;
  if (q >= kI64Limit || q < -kI64Limit) return false;
  out = static_cast<std::int64_t>(q);
  return true;
}

} // namespace

bool ComputeTileKey(const Vec2& p, const TileGrid& grid, TileKey& outKey)
{
  if (!(grid.tileSize > 0.0)) return false;
  TileKey k;
  if (!FloorIndex(p.x, grid.minBound.x, grid.tileSize, k.ix)) return false;
  if (!FloorIndex(p.y, grid.minBound.y, grid.tileSize, k.iy)) return false;
  outKey = k;
  return true;
}

Vec2 TileOrigin(const TileKey& key, const TileGrid& grid)
{
  return Vec2{grid.minBound.x + static_cast<double>(key.ix) * grid.tileSize,
              grid.minBound.y + static_cast<double>(key.iy) * grid.tileSize};
}

} // namespace footpack
