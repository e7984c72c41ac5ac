#include "footpack/ConfigIO.hpp"

#include <cmath>
#include <filesystem>
#include <set>
#include <sstream>

namespace footpack {

namespace {

bool ApplyF64(const JsonValue& root, const char* key, double& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true; // missing => keep
  if (!v->isNumber()) {
    err = std::string("expected number for key '") + key + "'";
    return false;
  }
  if (!std::isfinite(v->numberValue)) {
    err = std::string("non-finite number for key '") + key + "'";
    return false;
  }
  io = v->numberValue;
  return true;
}

bool ApplyI32(const JsonValue& root, const char* key, int& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isNumber() || !std::isfinite(v->numberValue) || v->numberValue != std::floor(v->numberValue)) {
    err = std::string("expected integer for key '") + key + "'";
    return false;
  }
  if (v->numberValue < -2147483648.0 || v->numberValue > 2147483647.0) {
    err = std::string("out-of-range integer for key '") + key + "'";
    return false;
  }
  io = static_cast<int>(v->numberValue);
  return true;
}

bool ApplyString(const JsonValue& root, const char* key, std::string& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isString()) {
    err = std::string("expected string for key '") + key + "'";
    return false;
  }
  io = v->stringValue;
  return true;
}

bool ReadNumberArray(const JsonValue& v, std::size_t n, double* out)
{
  if (!v.isArray() || v.arrayValue.size() != n) return false;
  for (std::size_t i = 0; i < n; ++i) {
    const JsonValue& e = v.arrayValue[i];
    if (!e.isNumber() || !std::isfinite(e.numberValue)) return false;
    out[i] = e.numberValue;
  }
  return true;
}

bool ApplyAoi(const JsonValue& aoi, PackConfig& cfg, const std::string& baseDir, std::string& err)
{
  if (aoi.isNull()) {
    cfg.aoi = AreaOfInterest();
    return true;
  }
  if (!aoi.isObject()) {
    err = "expected object or null for key 'aoi'";
    return false;
  }

  const JsonValue* bbox = FindJsonMember(aoi, "bbox");
  const JsonValue* geojson = FindJsonMember(aoi, "geojson");
  if ((bbox != nullptr) == (geojson != nullptr)) {
    err = "aoi needs exactly one of 'bbox' or 'geojson'";
    return false;
  }

  if (bbox) {
    double v[4];
    if (!ReadNumberArray(*bbox, 4, v) || !(v[0] < v[2]) || !(v[1] < v[3])) {
      err = "aoi.bbox must be [minx, miny, maxx, maxy] with min < max";
      return false;
    }
    Bounds b;
    b.extend(Vec2{v[0], v[1]});
    b.extend(Vec2{v[2], v[3]});
    cfg.aoi = AreaOfInterest::MakeBBox(b);
    return true;
  }

  if (!geojson->isString() || geojson->stringValue.empty()) {
    err = "aoi.geojson must be a non-empty path string";
    return false;
  }
  std::filesystem::path p(geojson->stringValue);
  if (p.is_relative() && !baseDir.empty()) p = std::filesystem::path(baseDir) / p;

  AreaOfInterest a;
  if (!LoadAoiGeoJson(p.string(), a, err)) return false;
  cfg.aoi = std::move(a);
  return true;
}

} // namespace

std::string PackConfigToJson(const PackConfig& cfg, int indentSpaces)
{
  JsonWriteOptions opt;
  opt.pretty = true;
  opt.indent = indentSpaces;

  std::ostringstream oss;
  JsonWriter w(oss, opt);

  w.beginObject();
  w.key("tile_size");
  w.numberValue(cfg.tileSize);
  w.key("default_height");
  w.numberValue(cfg.height.defaultHeight);
  w.key("level_height");
  w.numberValue(cfg.height.levelHeight);
  w.key("height_tag");
  w.stringValue(cfg.height.heightTag);
  w.key("levels_tag");
  w.stringValue(cfg.height.levelsTag);
  w.key("compression");
  w.stringValue(CompressionMethodName(cfg.compression));
  w.key("compression_level");
  w.intValue(cfg.compressionLevel);
  w.key("threads");
  w.intValue(cfg.threads);
  w.key("mode");
  w.stringValue(OutputModeName(cfg.mode));
  w.key("output_dir");
  w.stringValue(cfg.outputDir);
  w.key("pack_name");
  w.stringValue(cfg.packName);
  w.key("index_name");
  w.stringValue(cfg.indexName);

  w.key("origin");
  if (cfg.hasOrigin) {
    w.beginArray();
    w.numberValue(cfg.origin.x);
    w.numberValue(cfg.origin.y);
    w.endArray();
  } else {
    w.nullValue();
  }

  w.key("aoi");
  switch (cfg.aoi.kind()) {
  case AreaOfInterest::Kind::None: w.nullValue(); break;
  case AreaOfInterest::Kind::BBox: {
    const Bounds& b = cfg.aoi.bbox();
    w.beginObject();
    w.key("bbox");
    w.beginArray();
    w.numberValue(b.minx);
    w.numberValue(b.miny);
    w.numberValue(b.maxx);
    w.numberValue(b.maxy);
    w.endArray();
    w.endObject();
    break;
  }
  case AreaOfInterest::Kind::Polygon:
    w.beginObject();
    w.key("geojson");
    w.stringValue(cfg.aoi.sourcePath());
    w.endObject();
    break;
  }
  w.endObject();

  // Validated configs only hold finite numbers, so the writer cannot fail.
  oss << "\n";
  return oss.str();
}

bool ApplyPackConfigJson(const JsonValue& root, PackConfig& ioCfg, const std::string& baseDir,
                         std::string& outError)
{
  if (!root.isObject()) {
    outError = "config root must be a JSON object";
    return false;
  }

  static const std::set<std::string> kKnown = {
      "tile_size", "default_height", "level_height", "height_tag", "levels_tag", "compression",
      "compression_level", "threads", "mode", "output_dir", "pack_name", "index_name", "origin", "aoi",
  };
  for (const auto& kv : root.objectValue) {
    if (kKnown.count(kv.first) == 0) {
      outError = "unknown config key '" + kv.first + "'";
      return false;
    }
  }

  // Work on a copy so a failed load leaves ioCfg untouched.
  PackConfig cfg = ioCfg;
  std::string err;

  if (!ApplyF64(root, "tile_size", cfg.tileSize, err) ||
      !ApplyF64(root, "default_height", cfg.height.defaultHeight, err) ||
      !ApplyF64(root, "level_height", cfg.height.levelHeight, err) ||
      !ApplyString(root, "height_tag", cfg.height.heightTag, err) ||
      !ApplyString(root, "levels_tag", cfg.height.levelsTag, err) ||
      !ApplyI32(root, "compression_level", cfg.compressionLevel, err) ||
      !ApplyI32(root, "threads", cfg.threads, err) ||
      !ApplyString(root, "output_dir", cfg.outputDir, err) ||
      !ApplyString(root, "pack_name", cfg.packName, err) ||
      !ApplyString(root, "index_name", cfg.indexName, err)) {
    outError = err;
    return false;
  }

  std::string name;
  if (FindJsonMember(root, "compression")) {
    if (!ApplyString(root, "compression", name, err)) {
      outError = err;
      return false;
    }
    if (!ParseCompressionMethod(name, cfg.compression)) {
      outError = "unknown compression '" + name + "' (expected zlib, zstd, sllz or none)";
      return false;
    }
  }

  if (FindJsonMember(root, "mode")) {
    if (!ApplyString(root, "mode", name, err)) {
      outError = err;
      return false;
    }
    if (!ParseOutputMode(name, cfg.mode)) {
      outError = "unknown mode '" + name + "' (expected pack, tiles or both)";
      return false;
    }
  }

  if (const JsonValue* origin = FindJsonMember(root, "origin")) {
    if (origin->isNull()) {
      cfg.hasOrigin = false;
    } else {
      double v[2];
      if (!ReadNumberArray(*origin, 2, v)) {
        outError = "origin must be [x, y] or null";
        return false;
      }
      cfg.hasOrigin = true;
      cfg.origin = Vec2{v[0], v[1]};
    }
  }

  if (const JsonValue* aoi = FindJsonMember(root, "aoi")) {
    if (!ApplyAoi(*aoi, cfg, baseDir, err)) {
      outError = err;
      return false;
    }
  }

  ioCfg = std::move(cfg);
  outError.clear();
  return true;
}

bool LoadPackConfigJsonFile(const std::string& path, PackConfig& ioCfg, std::string& outError)
{
  JsonValue root;
  if (!ParseJsonFile(path, root, outError)) return false;

  const std::string baseDir = std::filesystem::path(path).parent_path().string();
  std::string err;
  if (!ApplyPackConfigJson(root, ioCfg, baseDir, err)) {
    outError = path + ": " + err;
    return false;
  }
  outError.clear();
  return true;
}

} // namespace footpack
