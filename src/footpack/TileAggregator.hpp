#pragma once

#include "footpack/Types.hpp"

#include <cstddef>
#include <unordered_map>
#include <vector>

namespace footpack {

// Groups buildings by tile key.
//
// Tiles are kept in first-seen order and buildings in insertion order, so the
// grouping mirrors the upstream iteration order. Consumers that need a stable
// layout (the pack encoder) must use sortedTiles(). Only tiles that received
// at least one building exist.
//
// Not thread-safe: one writer at a time.
class TileGrouping {
public:
  void add(const TileKey& key, BuildingRecord building);

  std::size_t tileCount() const { return m_tiles.size(); }
  std::size_t buildingCount() const { return m_buildings; }
  bool empty() const { return m_tiles.empty(); }

  // First-seen order.
  const std::vector<Tile>& tiles() const { return m_tiles; }

  const Tile* find(const TileKey& key) const;

  // Ascending lexicographic (ix, iy).
  std::vector<const Tile*> sortedTiles() const;

  void clear();

private:
  std::vector<Tile> m_tiles;
  std::unordered_map<TileKey, std::size_t, TileKeyHash> m_index;
  std::size_t m_buildings = 0;
};

} // namespace footpack
