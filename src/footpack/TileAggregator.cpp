#include "footpack/TileAggregator.hpp"

#include <algorithm>
#include <utility>

namespace footpack {

void TileGrouping::add(const TileKey& key, BuildingRecord building)
{
  const auto it = m_index.find(key);
  if (it == m_index.end()) {
    m_index.emplace(key, m_tiles.size());
    Tile t;
    t.key = key;
    t.buildings.push_back(std::move(building));
    m_tiles.push_back(std::move(t));
  } else {
    m_tiles[it->second].buildings.push_back(std::move(building));
  }
  ++m_buildings;
}

const Tile* TileGrouping::find(const TileKey& key) const
{
  const auto it = m_index.find(key);
  if (it == m_index.end()) return nullptr;
  return &m_tiles[it->second];
}

std::vector<const Tile*> TileGrouping::sortedTiles() const
{
  std::vector<const Tile*> out;
  out.reserve(m_tiles.size());
  for (const Tile& t : m_tiles) out.push_back(&t);
  std::sort(out.begin(), out.end(), [](const Tile* a, const Tile* b) { return a->key < b->key; });
  return out;
}

void TileGrouping::clear()
{
  m_tiles.clear();
  m_index.clear();
  m_buildings = 0;
}

} // namespace footpack
