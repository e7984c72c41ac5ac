#include "footpack/Pipeline.hpp"

#include "footpack/FileHash.hpp"
#include "footpack/GeoJsonInput.hpp"
#include "footpack/Height.hpp"
#include "footpack/Json.hpp"
#include "footpack/Log.hpp"
#include "footpack/PackWriter.hpp"
#include "footpack/Parallel.hpp"
#include "footpack/TileFiles.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <utility>

namespace footpack {

namespace fs = std::filesystem;

namespace {

struct FeatureWork {
  NormalizeResult shapes;
  HeightEstimate height;
};

void LogFallbacks(std::size_t featureIndex, const RawFeature& f, const HeightEstimate& h, const HeightConfig& cfg)
{
  if (!LogEnabled(LogLevel::Debug)) return;
  if (h.heightRejected) {
    auto it = f.tags.find(cfg.heightTag);
    LogDebug("feature " + std::to_string(featureIndex) + ": unusable " + cfg.heightTag + "='" +
             (it != f.tags.end() ? it->second : std::string()) + "'");
  }
  if (h.levelsRejected) {
    auto it = f.tags.find(cfg.levelsTag);
    LogDebug("feature " + std::to_string(featureIndex) + ": unusable " + cfg.levelsTag + "='" +
             (it != f.tags.end() ? it->second : std::string()) + "'");
  }
}

} // namespace

std::size_t RunStats::skippedTotal() const
{
  std::size_t n = 0;
  for (std::size_t v : skipped) n += v;
  return n;
}

Bounds ComputeInputBounds(const std::vector<RawFeature>& features)
{
  Bounds b;
  for (const RawFeature& f : features) {
    b.extend(f.geometry.bounds);
    for (const RawPolygon& poly : f.geometry.polygons) {
      for (const Ring& ring : poly.rings) {
        for (const Vec2& p : ring) {
          if (IsFinitePoint(p)) b.extend(p);
        }
      }
    }
  }
  return b;
}

void BuildTiles(const std::vector<RawFeature>& features, const PackConfig& cfg, TileGrouping& outTiles,
                TileGrid& outGrid, RunStats& stats)
{
  outTiles.clear();
  stats.features = features.size();

  const Bounds bounds = ComputeInputBounds(features);
  stats.hasInputBounds = bounds.valid;
  stats.inputBounds = bounds;

  outGrid.tileSize = cfg.tileSize;
  if (cfg.hasOrigin) {
    outGrid.minBound = cfg.origin;
  } else if (bounds.valid) {
    outGrid.minBound = Vec2{bounds.minx, bounds.miny};
  } else {
    outGrid.minBound = Vec2{};
  }
  stats.gridOrigin = outGrid.minBound;

  std::vector<FeatureWork> work(features.size());
  ParallelFor(features.size(), cfg.threads, [&](std::size_t i) {
    work[i].shapes = NormalizeGeometry(features[i].geometry);
    if (!work[i].shapes.polygons.empty()) work[i].height = EstimateHeight(features[i].tags, cfg.height);
  });

  // Single-writer fan-in in input order.
  for (std::size_t i = 0; i < features.size(); ++i) {
    FeatureWork& w = work[i];

    for (const SkippedPart& s : w.shapes.skipped) {
      stats.skipped[static_cast<std::size_t>(s.reason)]++;
      LogLazy(LogLevel::Debug, [&] {
        return "feature " + std::to_string(i) + " part " + std::to_string(s.part) + ": skipped (" +
               SkipReasonName(s.reason) + ")";
      });
    }
    if (w.shapes.polygons.empty()) continue;

    stats.polygons += w.shapes.polygons.size();
    LogFallbacks(i, features[i], w.height, cfg.height);

    for (NormalizedPolygon& poly : w.shapes.polygons) {
      if (!cfg.aoi.contains(poly.centroid)) {
        stats.aoiRejected++;
        continue;
      }

      TileKey key;
      if (!ComputeTileKey(poly.centroid, outGrid, key)) {
        stats.outOfGrid++;
        LogLazy(LogLevel::Debug,
                [&] { return "feature " + std::to_string(i) + ": centroid outside the addressable grid"; });
        continue;
      }

      switch (w.height.source) {
      case HeightSource::ExplicitHeight: stats.heightExplicit++; break;
      case HeightSource::Levels: stats.heightLevels++; break;
      case HeightSource::Default: stats.heightDefault++; break;
      }
      stats.heightFallbacks += static_cast<std::size_t>(w.height.fallbacks());

      BuildingRecord rec;
      rec.footprint = std::move(poly.exterior);
      rec.height = w.height.height;
      outTiles.add(key, std::move(rec));
    }

    // Release per-feature memory as we go; the grouping now owns the rings.
    std::vector<NormalizedPolygon>().swap(w.shapes.polygons);
  }

  stats.buildings = outTiles.buildingCount();
  stats.tiles = outTiles.tileCount();
}

bool WriteOutputs(const TileGrouping& tiles, const TileGrid& grid, const PackConfig& cfg, RunStats& stats,
                  PackError& outError)
{
  const fs::path outDir(cfg.outputDir);
  const bool wantPack = cfg.mode == OutputMode::Pack || cfg.mode == OutputMode::Both;
  const bool wantTiles = cfg.mode == OutputMode::Tiles || cfg.mode == OutputMode::Both;

  // Everything is encoded and staged before the first rename, so a failure
  // in either artifact leaves the previous run's output untouched.
  StagedTileFiles tileFiles;
  if (wantTiles) {
    const fs::path tileDir = cfg.mode == OutputMode::Both ? outDir / "tiles" : outDir;
    if (!tileFiles.stage(tiles, grid, tileDir, outError)) return false;
  }

  const fs::path blobPath = outDir / cfg.packName;
  const fs::path indexPath = outDir / cfg.indexName;
  EncodedPack pack;
  StagedPack stagedPack;
  if (wantPack) {
    PackEncodeOptions opt;
    opt.method = cfg.compression;
    opt.level = cfg.compressionLevel;
    opt.threads = cfg.threads;

    std::string err;
    if (!EncodePack(tiles, opt, pack, err)) {
      outError = MakeIOFailure("pack encoding failed: " + err);
      return false;
    }
    if (!stagedPack.stage(pack, blobPath, indexPath, outError)) return false;
  }

  if (wantPack) {
    if (!stagedPack.commit(outError)) return false;

    FileDigest blobDigest;
    FileDigest indexDigest;
    std::string err;
    if (!DigestFile(blobPath.string(), blobDigest, err) || !DigestFile(indexPath.string(), indexDigest, err)) {
      outError = MakeIOFailure("cannot re-read published pack: " + err);
      return false;
    }

    stats.rawBytes = pack.rawBytes;
    stats.packBytes = blobDigest.sizeBytes;
    stats.indexBytes = indexDigest.sizeBytes;
    stats.packFnv1a64 = blobDigest.fnv1a64;
    stats.indexFnv1a64 = indexDigest.fnv1a64;

    LogInfo("wrote " + blobPath.string() + " (" + std::to_string(stats.packBytes) + " bytes, " +
            std::to_string(pack.index.size()) + " tiles, " + std::to_string(stats.rawBytes) + " bytes raw)");
    LogInfo("wrote " + indexPath.string());
  }

  if (wantTiles) {
    if (!tileFiles.commit(outError)) return false;

    const TileFilesResult& res = tileFiles.result();
    stats.tileFiles = res.files;
    stats.tileFileBytes = res.bytes;
    stats.tileFilesFnv1a64 = res.fnv1a64;
    LogInfo("wrote " + std::to_string(res.files) + " tile files to " + tileFiles.dir().string());
  }

  return true;
}

bool RunPack(const std::string& inputPath, const PackConfig& cfg, RunStats& stats, PackError& outError)
{
  stats = RunStats{};

  std::vector<RawFeature> features;
  GeoJsonReadStats readStats;
  std::string err;
  if (!ReadGeoJsonFile(inputPath, features, err, &readStats)) {
    outError = MakeIOFailure("cannot read input: " + err);
    return false;
  }
  LogInfo("read " + std::to_string(features.size()) + " features from " + inputPath);

  TileGrouping tiles;
  TileGrid grid;
  BuildTiles(features, cfg, tiles, grid, stats);
  stats.malformedGeometries = readStats.malformedGeometries;

  // The raw input is no longer needed once the grouping owns the footprints.
  std::vector<RawFeature>().swap(features);

  if (stats.skippedTotal() > 0) {
    LogWarn("skipped " + std::to_string(stats.skippedTotal()) + " geometries (see --log-level debug)");
  }
  if (stats.heightFallbacks > 0) {
    LogInfo(std::to_string(stats.heightFallbacks) + " height tags were unusable and fell back");
  }
  LogInfo("grouped " + std::to_string(stats.buildings) + " buildings into " + std::to_string(stats.tiles) +
          " tiles");

  return WriteOutputs(tiles, grid, cfg, stats, outError);
}

bool WriteRunSummaryJson(std::ostream& os, const RunStats& stats, const PackConfig& cfg, std::string& outError)
{
  JsonWriteOptions opt;
  opt.pretty = true;
  opt.indent = 2;
  JsonWriter w(os, opt);

  auto count = [&w](const char* k, std::uint64_t v) {
    w.key(k);
    w.uintValue(v);
  };

  w.beginObject();
  w.key("mode");
  w.stringValue(OutputModeName(cfg.mode));
  w.key("compression");
  w.stringValue(CompressionMethodName(cfg.compression));
  w.key("tile_size");
  w.numberValue(cfg.tileSize);

  w.key("grid_origin");
  w.beginArray();
  w.numberValue(stats.gridOrigin.x);
  w.numberValue(stats.gridOrigin.y);
  w.endArray();

  w.key("input_bounds");
  if (stats.hasInputBounds) {
    w.beginArray();
    w.numberValue(stats.inputBounds.minx);
    w.numberValue(stats.inputBounds.miny);
    w.numberValue(stats.inputBounds.maxx);
    w.numberValue(stats.inputBounds.maxy);
    w.endArray();
  } else {
    w.nullValue();
  }

  count("features", stats.features);
  count("malformed_geometries", stats.malformedGeometries);
  count("polygons", stats.polygons);
  count("buildings", stats.buildings);
  count("tiles", stats.tiles);
  count("aoi_rejected", stats.aoiRejected);
  count("out_of_grid", stats.outOfGrid);

  w.key("skipped");
  w.beginObject();
  for (int r = 0; r < kSkipReasonCount; ++r) {
    count(SkipReasonName(static_cast<SkipReason>(r)), stats.skipped[static_cast<std::size_t>(r)]);
  }
  w.endObject();

  w.key("height_sources");
  w.beginObject();
  count(HeightSourceName(HeightSource::ExplicitHeight), stats.heightExplicit);
  count(HeightSourceName(HeightSource::Levels), stats.heightLevels);
  count(HeightSourceName(HeightSource::Default), stats.heightDefault);
  w.endObject();
  count("height_fallbacks", stats.heightFallbacks);

  if (cfg.mode != OutputMode::Tiles) {
    w.key("pack");
    w.beginObject();
    count("raw_bytes", stats.rawBytes);
    count("pack_bytes", stats.packBytes);
    count("index_bytes", stats.indexBytes);
    w.key("pack_fnv1a64");
    w.stringValue(HexU64(stats.packFnv1a64));
    w.key("index_fnv1a64");
    w.stringValue(HexU64(stats.indexFnv1a64));
    w.endObject();
  }
  if (cfg.mode != OutputMode::Pack) {
    w.key("tile_files");
    w.beginObject();
    count("files", stats.tileFiles);
    count("bytes", stats.tileFileBytes);
    w.key("fnv1a64");
    w.stringValue(HexU64(stats.tileFilesFnv1a64));
    w.endObject();
  }
  w.endObject();

  if (!w.ok()) {
    outError = w.error();
    return false;
  }
  os << '\n';
  if (!os) {
    outError = "stream write failed";
    return false;
  }
  return true;
}

} // namespace footpack
