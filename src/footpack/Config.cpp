#include "footpack/Config.hpp"

#include <cmath>

namespace footpack {

const char* OutputModeName(OutputMode m)
{
  switch (m) {
  case OutputMode::Pack: return "pack";
  case OutputMode::Tiles: return "tiles";
  case OutputMode::Both: return "both";
  }
  return "unknown";
}

bool ParseOutputMode(const std::string& name, OutputMode& out)
{
  if (name == "pack") {
    out = OutputMode::Pack;
  } else if (name == "tiles") {
    out = OutputMode::Tiles;
  } else if (name == "both") {
    out = OutputMode::Both;
  } else {
    return false;
  }
  return true;
}

bool ValidatePackConfig(const PackConfig& cfg, std::string& outError)
{
  if (!std::isfinite(cfg.tileSize) || !(cfg.tileSize > 0.0)) {
    outError = "tile_size must be a finite number > 0";
    return false;
  }
  if (!std::isfinite(cfg.height.defaultHeight) || !(cfg.height.defaultHeight > 0.0)) {
    outError = "default_height must be a finite number > 0";
    return false;
  }
  if (!std::isfinite(cfg.height.levelHeight) || !(cfg.height.levelHeight > 0.0)) {
    outError = "level_height must be a finite number > 0";
    return false;
  }
  if (cfg.height.heightTag.empty() || cfg.height.levelsTag.empty()) {
    outError = "height_tag and levels_tag must not be empty";
    return false;
  }
  if (cfg.compression == CompressionMethod::Zlib &&
      (cfg.compressionLevel < -1 || cfg.compressionLevel > 9)) {
    outError = "compression_level must be -1..9 for zlib";
    return false;
  }
  if (cfg.compression == CompressionMethod::Zstd && cfg.compressionLevel != kDefaultZlibLevel &&
      (cfg.compressionLevel < 1 || cfg.compressionLevel > kMaxZstdLevel)) {
    outError = "compression_level must be -1 or 1..22 for zstd";
    return false;
  }
  if (cfg.hasOrigin && (!std::isfinite(cfg.origin.x) || !std::isfinite(cfg.origin.y))) {
    outError = "origin must be finite";
    return false;
  }
  if (cfg.aoi.kind() == AreaOfInterest::Kind::BBox) {
    const Bounds& b = cfg.aoi.bbox();
    if (!b.valid || !(b.minx < b.maxx) || !(b.miny < b.maxy)) {
      outError = "aoi bbox must satisfy minx < maxx and miny < maxy";
      return false;
    }
  }
  if (cfg.aoi.kind() == AreaOfInterest::Kind::Polygon && cfg.aoi.rings().empty()) {
    outError = "aoi polygon has no rings";
    return false;
  }
  if (cfg.outputDir.empty()) {
    outError = "output_dir must not be empty";
    return false;
  }
  if (cfg.mode != OutputMode::Tiles && (cfg.packName.empty() || cfg.indexName.empty())) {
    outError = "pack_name and index_name must not be empty";
    return false;
  }
  if (cfg.mode != OutputMode::Tiles && cfg.packName == cfg.indexName) {
    outError = "pack_name and index_name must differ";
    return false;
  }
  outError.clear();
  return true;
}

} // namespace footpack
