#pragma once

#include "footpack/Errors.hpp"
#include "footpack/FileSync.hpp"
#include "footpack/TileAggregator.hpp"
#include "footpack/TileGrid.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace footpack {

// Uncompressed output: one JSON file per non-empty tile.
//
//   tile_<ix>_<iy>.json
//   {"tile_origin": [x, y], "tile_size": s, "buildings": [{"footprint": [[x, y], ...], "height": h}, ...]}
//
// Separators are ", " and ": " (single line), so the files match earlier
// exports byte for byte.

std::string TileFileName(const TileKey& key);

bool WriteTileFileJson(std::ostream& os, const Tile& tile, const TileGrid& grid, std::string& outError);

// Inverse of TileFileName; false for any other file name.
bool ParseTileFileName(const std::string& name, TileKey& outKey);

struct TileFilesResult {
  std::size_t files = 0;
  std::uint64_t bytes = 0;
  // FNV-1a 64 chained over every file's bytes in ascending key order.
  std::uint64_t fnv1a64 = 0;
};

// Two-phase tile file output.
//
// stage() encodes every tile and writes it to a synced temp file next to its
// final name; nothing visible changes yet. commit() removes tile files left
// by earlier runs that are not part of this one, then renames the staged
// files into place. Destroying an uncommitted instance deletes its temp files.
class StagedTileFiles {
public:
  bool stage(const TileGrouping& tiles, const TileGrid& grid, const std::filesystem::path& dir,
             PackError& outError);
  bool commit(PackError& outError);

  const TileFilesResult& result() const { return m_result; }
  const std::filesystem::path& dir() const { return m_dir; }

private:
  std::filesystem::path m_dir;
  std::vector<std::unique_ptr<StagedFile>> m_files;
  TileFilesResult m_result;
};

} // namespace footpack
