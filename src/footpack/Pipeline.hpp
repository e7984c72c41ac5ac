#pragma once

#include "footpack/Config.hpp"
#include "footpack/Errors.hpp"
#include "footpack/Geometry.hpp"
#include "footpack/Normalize.hpp"
#include "footpack/RawFeature.hpp"
#include "footpack/TileAggregator.hpp"
#include "footpack/TileGrid.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace footpack {

// Counters for one run. Everything here is a pure function of the input and
// the configuration (no timings), so two identical runs report equal stats.
struct RunStats {
  std::size_t features = 0;
  std::size_t malformedGeometries = 0;

  // Valid polygons produced by the normalizer (before AOI filtering).
  std::size_t polygons = 0;
  std::array<std::size_t, kSkipReasonCount> skipped{};

  std::size_t aoiRejected = 0;
  // Finite polygons whose tile index does not fit in 64 bits.
  std::size_t outOfGrid = 0;

  // Buildings placed in tiles. heightExplicit + heightLevels + heightDefault == buildings.
  std::size_t buildings = 0;
  std::size_t tiles = 0;
  std::size_t heightExplicit = 0;
  std::size_t heightLevels = 0;
  std::size_t heightDefault = 0;
  std::size_t heightFallbacks = 0;

  bool hasInputBounds = false;
  Bounds inputBounds;
  Vec2 gridOrigin;

  // Pack output.
  std::uint64_t rawBytes = 0;
  std::uint64_t packBytes = 0;
  std::uint64_t indexBytes = 0;
  std::uint64_t packFnv1a64 = 0;
  std::uint64_t indexFnv1a64 = 0;

  // Tile file output.
  std::size_t tileFiles = 0;
  std::uint64_t tileFileBytes = 0;
  std::uint64_t tileFilesFnv1a64 = 0;

  std::size_t skippedTotal() const;
};

// Bounds over every finite coordinate in the input, whatever the geometry
// type (points and lines included) and whether or not it is valid later.
// Non-finite points are ignored.
Bounds ComputeInputBounds(const std::vector<RawFeature>& features);

// Normalize, estimate heights, filter by AOI and group into tiles.
//
// Per-feature work runs on cfg.threads workers with results stored at the
// feature's index; grouping then walks the results in input order, so the
// output does not depend on the thread count. Never fails on bad records:
// they are counted in stats and logged at debug level.
void BuildTiles(const std::vector<RawFeature>& features, const PackConfig& cfg, TileGrouping& outTiles,
                TileGrid& outGrid, RunStats& stats);

// Write the artifacts selected by cfg.mode below cfg.outputDir:
//   pack:  <out>/<pack_name> + <out>/<index_name>
//   tiles: <out>/tile_<ix>_<iy>.json
//   both:  the pack as above, tile files under <out>/tiles/
bool WriteOutputs(const TileGrouping& tiles, const TileGrid& grid, const PackConfig& cfg, RunStats& stats,
                  PackError& outError);

// Read a GeoJSON file and run the whole pipeline. cfg must already be validated.
bool RunPack(const std::string& inputPath, const PackConfig& cfg, RunStats& stats, PackError& outError);

// Machine-readable run summary (pretty JSON, trailing newline).
bool WriteRunSummaryJson(std::ostream& os, const RunStats& stats, const PackConfig& cfg, std::string& outError);

} // namespace footpack
