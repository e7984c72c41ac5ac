#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace footpack {

// Planar coordinate in meters.
struct Vec2 {
  double x = 0.0;
  double y = 0.0;

  bool operator==(const Vec2& o) const { return x == o.x && y == o.y; }
  bool operator!=(const Vec2& o) const { return !(*this == o); }
};

// Sequence of points. Rings produced by the normalizer are closed (front == back).
using Ring = std::vector<Vec2>;

// One building ready for tiling/encoding.
//
// footprint: closed exterior ring with >= 3 distinct points.
// height:    finite, > 0.
struct BuildingRecord {
  Ring footprint;
  double height = 0.0;
};

// Integer grid cell. Ordered lexicographically by (ix, iy).
struct TileKey {
  std::int64_t ix = 0;
  std::int64_t iy = 0;

  bool operator==(const TileKey& o) const { return ix == o.ix && iy == o.iy; }
  bool operator!=(const TileKey& o) const { return !(*this == o); }
  bool operator<(const TileKey& o) const { return ix < o.ix || (ix == o.ix && iy < o.iy); }
};

struct TileKeyHash {
  std::size_t operator()(const TileKey& k) const
  {
    // splitmix-style combine; only used for bucket placement, never for ordering.
    std::uint64_t h = static_cast<std::uint64_t>(k.ix) * 0x9E3779B97F4A7C15ull;
    h ^= static_cast<std::uint64_t>(k.iy) + 0x7F4A7C159E3779B9ull + (h << 6) + (h >> 2);
    return static_cast<std::size_t>(h);
  }
};

// "ix,iy" (the key form used by the pack index).
std::string TileKeyToString(const TileKey& key);

// Parse "ix,iy". Whitespace around either number is not accepted.
bool ParseTileKey(const std::string& s, TileKey& outKey);

struct Tile {
  TileKey key;
  std::vector<BuildingRecord> buildings;
};

} // namespace footpack
