#pragma once

#include "footpack/Types.hpp"

namespace footpack {

// Square tile grid anchored at the dataset's global minimum bound.
//
// Membership is half-open on both axes: tile ix covers
// [minx + ix*size, minx + (ix+1)*size). A point exactly on a boundary goes to
// the tile with the larger index. This must stay bit-for-bit stable, packs
// produced earlier depend on it.
struct TileGrid {
  Vec2 minBound;
  double tileSize = 1000.0;
};

// ix = floor((x - minx) / size), iy = floor((y - miny) / size).
//
// Returns false when the point is non-finite or the index does not fit in 64 bits.
bool ComputeTileKey(const Vec2& p, const TileGrid& grid, TileKey& outKey);

// Lower-left corner of a tile: (minx + ix*size, miny + iy*size).
Vec2 TileOrigin(const TileKey& key, const TileGrid& grid);

} // namespace footpack
