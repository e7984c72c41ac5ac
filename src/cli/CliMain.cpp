#include "cli/CliMain.hpp"
#include "cli/CliParse.hpp"

#include "footpack/Aoi.hpp"
#include "footpack/ConfigIO.hpp"
#include "footpack/FileSync.hpp"
#include "footpack/Log.hpp"
#include "footpack/LogTee.hpp"
#include "footpack/PackReader.hpp"
#include "footpack/Pipeline.hpp"
#include "footpack/Version.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

namespace footpack {

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void PrintUsage()
{
  std::cout
      << "footpack_cli " << FullVersionString() << ": tile building footprints into a compressed pack.\n\n"
      << "Usage:\n"
      << "  footpack_cli pack    --in <buildings.geojson> [--out <dir>] [options]\n"
      << "  footpack_cli tiles   --in <buildings.geojson> [--out <dir>] [options]\n"
      << "  footpack_cli verify  [--pack <file> --index <file> | --out <dir>] [--compression <m>]\n"
      << "  footpack_cli extract --tile <ix,iy> [--pack <file> --index <file> | --out <dir>] [--to <file>]\n"
      << "  footpack_cli config  [--config <file>] [options]\n"
      << "  footpack_cli version\n\n"
      << "Run options:\n"
      << "  --config <file>             JSON config (partial overrides of the defaults).\n"
      << "  --out <dir>                 Output directory (default: packed_buildings).\n"
      << "  --mode <pack|tiles|both>    Artifacts to write (pack command only, default: pack).\n"
      << "  --tile-size <m>             Tile edge length in meters (default: 1000).\n"
      << "  --default-height <m>        Height when no tag is usable (default: 5).\n"
      << "  --level-height <m>          Meters per building level (default: 5).\n"
      << "  --compression <m>           zlib | zstd | sllz | none (default: zlib).\n"
      << "  --compression-level <n>     zlib -1..9, zstd 1..22; -1 = codec default (default: -1).\n"
      << "  --aoi-bbox <x0,y0,x1,y1>    Keep only buildings whose centroid is inside.\n"
      << "  --aoi <file.geojson>        Same with a polygon area of interest.\n"
      << "  --origin <x,y>              Grid origin (default: minimum input bound).\n"
      << "  --threads <n>               Worker threads, 0 = all cores (default: 0).\n"
      << "  --summary <file|->          Write a JSON run summary.\n\n"
      << "Logging:\n"
      << "  --log <file>                Also write diagnostics to <file> (rotated, timestamped).\n"
      << "  --log-level <lvl>           debug | info | warn | error (default: info).\n"
      << "  --quiet                     Errors only.\n\n"
      << "Exit codes: 0 ok, 1 runtime or verification failure, 2 usage or configuration error.\n";
}

// Flags collected before the config file is applied; they win over it.
struct CliArgs {
  std::string command;

  std::string inPath;
  std::optional<std::string> outDir;
  std::string configPath;
  std::string summaryPath;
  std::string packPath;
  std::string indexPath;
  std::string tileArg;
  std::string toPath;

  std::string logPath;
  std::optional<LogLevel> logLevel;
  bool quiet = false;

  std::optional<OutputMode> mode;
  std::optional<double> tileSize;
  std::optional<double> defaultHeight;
  std::optional<double> levelHeight;
  std::optional<CompressionMethod> compression;
  std::optional<int> compressionLevel;
  std::optional<Bounds> aoiBBox;
  std::string aoiPath;
  std::optional<Vec2> origin;
  std::optional<int> threads;
};

// Returns kExitOk, or kExitUsage after printing the problem.
int ParseArgs(int argc, char** argv, CliArgs& args)
{
  for (int i = 2; i < argc; ++i) {
    const std::string a = argv[i];
    std::string v;
    auto requireValue = [&]() -> bool {
      if (i + 1 >= argc) {
        std::cerr << a << " requires a value\n";
        return false;
      }
      v = argv[++i];
      return true;
    };
    auto invalid = [&](const char* expected) {
      std::cerr << "Invalid " << a << " '" << v << "' (expected " << expected << ")\n";
      return kExitUsage;
    };

    if (a == "--quiet" || a == "-q") {
      args.quiet = true;
      continue;
    }

    if (!requireValue()) return kExitUsage;

    if (a == "--in") {
      args.inPath = v;
    } else if (a == "--out") {
      args.outDir = v;
    } else if (a == "--config") {
      args.configPath = v;
    } else if (a == "--summary") {
      args.summaryPath = v;
    } else if (a == "--pack") {
      args.packPath = v;
    } else if (a == "--index") {
      args.indexPath = v;
    } else if (a == "--tile") {
      args.tileArg = v;
    } else if (a == "--to") {
      args.toPath = v;
    } else if (a == "--log") {
      args.logPath = v;
    } else if (a == "--log-level") {
      LogLevel l = LogLevel::Info;
      if (!ParseLogLevel(v, l)) return invalid("debug|info|warn|error");
      args.logLevel = l;
    } else if (a == "--mode") {
      OutputMode m = OutputMode::Pack;
      if (!ParseOutputMode(v, m)) return invalid("pack|tiles|both");
      args.mode = m;
    } else if (a == "--tile-size") {
      double d = 0.0;
      if (!cli::ParseF64(v, &d)) return invalid("a number");
      args.tileSize = d;
    } else if (a == "--default-height") {
      double d = 0.0;
      if (!cli::ParseF64(v, &d)) return invalid("a number");
      args.defaultHeight = d;
    } else if (a == "--level-height") {
      double d = 0.0;
      if (!cli::ParseF64(v, &d)) return invalid("a number");
      args.levelHeight = d;
    } else if (a == "--compression") {
      CompressionMethod m = CompressionMethod::Zlib;
      if (!ParseCompressionMethod(v, m)) return invalid("zlib|zstd|sllz|none");
      args.compression = m;
    } else if (a == "--compression-level") {
      int n = 0;
      if (!cli::ParseI32(v, &n)) return invalid("an integer");
      args.compressionLevel = n;
    } else if (a == "--aoi-bbox") {
      Bounds b;
      if (!ParseBBox(v, b)) return invalid("minx,miny,maxx,maxy");
      args.aoiBBox = b;
    } else if (a == "--aoi") {
      args.aoiPath = v;
    } else if (a == "--origin") {
      Vec2 o;
      if (!cli::ParseF64Pair(v, &o.x, &o.y)) return invalid("x,y");
      args.origin = o;
    } else if (a == "--threads") {
      int n = 0;
      if (!cli::ParseI32(v, &n) || n < 0) return invalid("a non-negative integer");
      args.threads = n;
    } else {
      std::cerr << "Unknown option: " << a << "\n";
      return kExitUsage;
    }
  }
  return kExitOk;
}

// defaults <- config file <- flags, then validation.
int BuildConfig(const CliArgs& args, PackConfig& cfg)
{
  std::string err;
  if (!args.configPath.empty() && !LoadPackConfigJsonFile(args.configPath, cfg, err)) {
    LogError(FormatPackError(MakeConfigurationError(err)));
    return kExitUsage;
  }

  if (args.outDir) cfg.outputDir = *args.outDir;
  if (args.mode) cfg.mode = *args.mode;
  if (args.tileSize) cfg.tileSize = *args.tileSize;
  if (args.defaultHeight) cfg.height.defaultHeight = *args.defaultHeight;
  if (args.levelHeight) cfg.height.levelHeight = *args.levelHeight;
  if (args.compression) cfg.compression = *args.compression;
  if (args.compressionLevel) cfg.compressionLevel = *args.compressionLevel;
  if (args.threads) cfg.threads = *args.threads;
  if (args.origin) {
    cfg.hasOrigin = true;
    cfg.origin = *args.origin;
  }

  if (args.aoiBBox && !args.aoiPath.empty()) {
    LogError(FormatPackError(MakeConfigurationError("--aoi-bbox and --aoi are mutually exclusive")));
    return kExitUsage;
  }
  if (args.aoiBBox) cfg.aoi = AreaOfInterest::MakeBBox(*args.aoiBBox);
  if (!args.aoiPath.empty()) {
    AreaOfInterest aoi;
    if (!LoadAoiGeoJson(args.aoiPath, aoi, err)) {
      LogError(FormatPackError(MakeConfigurationError(err)));
      return kExitUsage;
    }
    cfg.aoi = std::move(aoi);
  }

  if (!ValidatePackConfig(cfg, err)) {
    LogError(FormatPackError(MakeConfigurationError(err)));
    return kExitUsage;
  }
  return kExitOk;
}

bool WriteSummary(const std::string& path, const RunStats& stats, const PackConfig& cfg, std::string& outError)
{
  if (path == "-") return WriteRunSummaryJson(std::cout, stats, cfg, outError);

  if (!cli::EnsureParentDir(path)) {
    outError = "cannot create directory for " + path;
    return false;
  }
  StagedFile f;
  if (!f.open(path, outError)) return false;
  if (!WriteRunSummaryJson(f.stream(), stats, cfg, outError)) return false;
  return f.finish(outError) && f.commit(outError);
}

int CmdPack(const CliArgs& args, const PackConfig& cfg)
{
  if (args.inPath.empty()) {
    std::cerr << args.command << " requires --in <file>\n";
    return kExitUsage;
  }

  RunStats stats;
  PackError perr;
  if (!RunPack(args.inPath, cfg, stats, perr)) {
    LogError(FormatPackError(perr));
    return perr.kind == ErrorKind::ConfigurationError ? kExitUsage : kExitFailure;
  }

  if (!args.summaryPath.empty()) {
    std::string err;
    if (!WriteSummary(args.summaryPath, stats, cfg, err)) {
      LogError(FormatPackError(MakeIOFailure("cannot write summary: " + err)));
      return kExitFailure;
    }
  }
  return kExitOk;
}

void ResolvePackPaths(const CliArgs& args, const PackConfig& cfg, std::string& blob, std::string& index)
{
  const std::filesystem::path dir(cfg.outputDir);
  blob = args.packPath.empty() ? (dir / cfg.packName).string() : args.packPath;
  index = args.indexPath.empty() ? (dir / cfg.indexName).string() : args.indexPath;
}

int CmdVerify(const CliArgs& args, const PackConfig& cfg)
{
  std::string blob;
  std::string index;
  ResolvePackPaths(args, cfg, blob, index);

  PackReader reader;
  std::string err;
  if (!reader.open(blob, index, cfg.compression, err)) {
    LogError(FormatPackError(MakeIOFailure(err)));
    return kExitFailure;
  }

  PackVerifyReport report;
  VerifyPack(reader, report);
  for (const std::string& p : report.problems) LogError(p);

  std::cout << (report.ok() ? "OK" : "FAILED") << ": " << report.tiles << " tiles, " << report.buildings
            << " buildings, " << report.blobBytes << " bytes (" << report.rawBytes << " raw), "
            << report.problems.size() << " problems\n";
  return report.ok() ? kExitOk : kExitFailure;
}

int CmdExtract(const CliArgs& args, const PackConfig& cfg)
{
  TileKey key;
  if (!ParseTileKey(args.tileArg, key)) {
    std::cerr << "extract requires --tile <ix,iy>\n";
    return kExitUsage;
  }

  std::string blob;
  std::string index;
  ResolvePackPaths(args, cfg, blob, index);

  PackReader reader;
  std::string err;
  if (!reader.open(blob, index, cfg.compression, err)) {
    LogError(FormatPackError(MakeIOFailure(err)));
    return kExitFailure;
  }

  std::string encoded;
  if (!reader.readTile(key, encoded, err)) {
    LogError(err);
    return kExitFailure;
  }

  if (args.toPath.empty()) {
    std::cout << encoded << "\n";
    return kExitOk;
  }

  StagedFile f;
  if (!f.open(args.toPath, err) || !f.write(encoded, err) || !f.finish(err) || !f.commit(err)) {
    LogError(FormatPackError(MakeIOFailure(err)));
    return kExitFailure;
  }
  LogInfo("wrote tile " + TileKeyToString(key) + " to " + args.toPath);
  return kExitOk;
}

} // namespace

int FootPackCliMain(int argc, char** argv)
{
  if (argc < 2) {
    PrintUsage();
    return kExitUsage;
  }

  CliArgs args;
  args.command = argv[1];

  if (args.command == "--help" || args.command == "-h" || args.command == "help") {
    PrintUsage();
    return kExitOk;
  }
  if (args.command == "version" || args.command == "--version") {
    std::cout << "footpack " << FullVersionString() << "\n";
    return kExitOk;
  }
  if (args.command != "pack" && args.command != "tiles" && args.command != "verify" &&
      args.command != "extract" && args.command != "config") {
    std::cerr << "Unknown command: " << args.command << "\n\n";
    PrintUsage();
    return kExitUsage;
  }

  for (int i = 2; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--help" || a == "-h") {
      PrintUsage();
      return kExitOk;
    }
  }

  if (const int rc = ParseArgs(argc, argv, args); rc != kExitOk) return rc;

  if (args.quiet) {
    SetLogLevel(LogLevel::Error);
  } else if (args.logLevel) {
    SetLogLevel(*args.logLevel);
  }

  LogTee tee;
  if (!args.logPath.empty()) {
    LogTeeOptions opt;
    opt.path = args.logPath;
    std::string err;
    if (!tee.start(opt, err)) {
      std::cerr << "Cannot start log file: " << err << "\n";
      return kExitUsage;
    }
  }

  PackConfig cfg;
  if (const int rc = BuildConfig(args, cfg); rc != kExitOk) return rc;
  if (args.command == "tiles") cfg.mode = OutputMode::Tiles;

  if (args.command == "config") {
    std::cout << PackConfigToJson(cfg);
    return kExitOk;
  }
  if (args.command == "pack" || args.command == "tiles") return CmdPack(args, cfg);
  if (args.command == "verify") return CmdVerify(args, cfg);
  return CmdExtract(args, cfg);
}

} // namespace footpack
