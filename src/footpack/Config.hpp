#pragma once

#include "footpack/Aoi.hpp"
#include "footpack/Compression.hpp"
#include "footpack/Height.hpp"
#include "footpack/Types.hpp"

#include <cstdint>
#include <string>

namespace footpack {

enum class OutputMode : std::uint8_t {
  Pack = 0,  // blob + offset/length index
  Tiles,     // one uncompressed JSON file per tile
  Both,
};

const char* OutputModeName(OutputMode m);
bool ParseOutputMode(const std::string& name, OutputMode& out);

// Run configuration. Built once (defaults <- config file <- CLI flags),
// validated, then passed by const reference to every stage.
struct PackConfig {
  // Edge length of a square tile, in input units (meters).
  double tileSize = 1000.0;

  HeightConfig height;

  CompressionMethod compression = CompressionMethod::Zlib;
  int compressionLevel = kDefaultZlibLevel;

  AreaOfInterest aoi;

  // Grid origin override. When unset the origin is the global minimum bound
  // of the input.
  bool hasOrigin = false;
  Vec2 origin;

  // Worker threads for normalization and compression. <= 0: hardware concurrency.
  int threads = 0;

  OutputMode mode = OutputMode::Pack;

  std::string outputDir = "packed_buildings";
  std::string packName = "buildings.pack";
  std::string indexName = "buildings.index.json";
};

// Reject values that would make the run meaningless (ConfigurationError).
bool ValidatePackConfig(const PackConfig& cfg, std::string& outError);

} // namespace footpack
