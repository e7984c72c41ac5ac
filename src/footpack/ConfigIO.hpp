#pragma once

#include "footpack/Config.hpp"
#include "footpack/Json.hpp"

#include <string>

namespace footpack {

// JSON helpers for PackConfig.
//
// Config files are partial overrides (merge semantics): missing keys leave the
// current value unchanged, present keys must have the right type, unknown keys
// are rejected so typos do not silently fall back to defaults.
//
// Keys (snake_case):
//   tile_size, default_height, level_height, height_tag, levels_tag,
//   compression ("zlib" | "zstd" | "sllz" | "none"), compression_level, threads,
//   mode ("pack" | "tiles" | "both"), output_dir, pack_name, index_name,
//   origin [x, y],
//   aoi {"bbox": [minx, miny, maxx, maxy]} or {"geojson": "<path>"}
//
// A relative aoi.geojson path is resolved against `baseDir`.

std::string PackConfigToJson(const PackConfig& cfg, int indentSpaces = 2);

bool ApplyPackConfigJson(const JsonValue& root, PackConfig& ioCfg, const std::string& baseDir,
                         std::string& outError);

bool LoadPackConfigJsonFile(const std::string& path, PackConfig& ioCfg, std::string& outError);

} // namespace footpack
