#include "footpack/Compression.hpp"
#include "footpack/ConfigIO.hpp"
#include "footpack/Errors.hpp"
#include "footpack/FileHash.hpp"
#include "footpack/FileSync.hpp"
#include "footpack/GeoJsonInput.hpp"
#include "footpack/Height.hpp"
#include "footpack/Json.hpp"
#include "footpack/Log.hpp"
#include "footpack/LogTee.hpp"
#include "footpack/Normalize.hpp"
#include "footpack/PackReader.hpp"
#include "footpack/PackWriter.hpp"
#include "footpack/Pipeline.hpp"
#include "footpack/TileCodec.hpp"
#include "footpack/TileFiles.hpp"
#include "footpack/TileGrid.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                          \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";              \
    }                                                                                                                \
  } while (0)

#define EXPECT_NE(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if ((_a == _b)) {                                                                                                \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NE failed: " << #a << " != " << #b << "\n";              \
    }                                                                                                                \
  } while (0)

#define EXPECT_NEAR(a, b, eps)                                                                                       \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    const auto _e = (eps);                                                                                           \
    if (std::fabs((_a) - (_b)) > (_e)) {                                                                             \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " ~= " << #b << " (eps=" << _e   \
                << ")\n";                                                                                            \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                          \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

namespace {

using namespace footpack;

fs::path MakeTempPath(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;

  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec || root.empty()) root = fs::current_path(ec);
  if (ec || root.empty()) root = fs::path(".");

  const auto stamp = static_cast<std::uint64_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
  return root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
}

std::string ReadFileBytes(const fs::path& p)
{
  std::ifstream f(p, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

bool WriteFileBytes(const fs::path& p, const std::string& s)
{
  std::error_code ec;
  if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);
  std::ofstream f(p, std::ios::binary | std::ios::trunc);
  f << s;
  return static_cast<bool>(f);
}

Ring Square(double x0, double y0, double size)
{
  return Ring{{x0, y0}, {x0 + size, y0}, {x0 + size, y0 + size}, {x0, y0 + size}, {x0, y0}};
}

RawGeometry PolygonGeometry(std::vector<Ring> rings)
{
  RawGeometry g;
  g.type = RawGeometry::Type::Polygon;
  g.typeName = "Polygon";
  RawPolygon p;
  p.rings = std::move(rings);
  g.polygons.push_back(std::move(p));
  return g;
}

BuildingRecord MakeBuilding(double x0, double y0, double size, double height)
{
  BuildingRecord b;
  b.footprint = Square(x0, y0, size);
  b.height = height;
  return b;
}

// Small city: two valid buildings, one multi-polygon with an unusable height,
// plus a non-finite ring, a null geometry and a point.
const char* kSampleGeoJson = R"({
  "type": "FeatureCollection",
  "features": [
    {"type": "Feature", "properties": {"height": "12m", "building": "yes"},
     "geometry": {"type": "Polygon", "coordinates": [[[0, 0], [10, 0], [10, 10], [0, 10], [0, 0]]]}},
    {"type": "Feature", "properties": {"building:levels": 3},
     "geometry": {"type": "Polygon", "coordinates": [[[1500, 2500], [1510, 2500], [1510, 2510], [1500, 2510], [1500, 2500]]]}},
    {"type": "Feature", "properties": {},
     "geometry": {"type": "Polygon", "coordinates": [[[NaN, 5], [3, 3], [4, 4], [NaN, 5]]]}},
    {"type": "Feature", "properties": {"height": "7"}, "geometry": null},
    {"type": "Feature", "properties": {}, "geometry": {"type": "Point", "coordinates": [5, 5]}},
    {"type": "Feature", "properties": {"height": "not-a-number"},
     "geometry": {"type": "MultiPolygon", "coordinates": [
       [[[2000, 0], [2010, 0], [2010, 10], [2000, 10], [2000, 0]]],
       [[[20, 20], [30, 20], [30, 30], [20, 30], [20, 20]]]
     ]}}
  ]
})";

void TestTileKeyAssignment()
{
  TileGrid grid;
  grid.minBound = Vec2{0.0, 0.0};
  grid.tileSize = 1000.0;

  TileKey k;
  ASSERT_TRUE(ComputeTileKey(Vec2{1500.0, 2500.0}, grid, k));
  EXPECT_EQ(k.ix, 1);
  EXPECT_EQ(k.iy, 2);
  const Vec2 o = TileOrigin(k, grid);
  EXPECT_EQ(o.x, 1000.0);
  EXPECT_EQ(o.y, 2000.0);

  // Boundaries belong to the tile with the larger index.
  ASSERT_TRUE(ComputeTileKey(Vec2{1000.0, 0.0}, grid, k));
  EXPECT_EQ(k.ix, 1);
  EXPECT_EQ(k.iy, 0);
  ASSERT_TRUE(ComputeTileKey(Vec2{999.9999, 1999.9999}, grid, k));
  EXPECT_EQ(k.ix, 0);
  EXPECT_EQ(k.iy, 1);

  // Points left of / below the origin get negative keys (floor, not truncation).
  ASSERT_TRUE(ComputeTileKey(Vec2{-0.5, -1000.0}, grid, k));
  EXPECT_EQ(k.ix, -1);
  EXPECT_EQ(k.iy, -1);

  // Offset origin.
  grid.minBound = Vec2{250.0, -750.0};
  ASSERT_TRUE(ComputeTileKey(Vec2{1250.0, 249.0}, grid, k));
  EXPECT_EQ(k.ix, 1);
  EXPECT_EQ(k.iy, 0);

  // Same input, same key, every time.
  TileKey again;
  ASSERT_TRUE(ComputeTileKey(Vec2{1250.0, 249.0}, grid, again));
  EXPECT_TRUE(k == again);

  EXPECT_FALSE(ComputeTileKey(Vec2{std::numeric_limits<double>::quiet_NaN(), 0.0}, grid, k));
  EXPECT_FALSE(ComputeTileKey(Vec2{1e300, 0.0}, TileGrid{Vec2{}, 1e-300}, k));
}

void TestTileKeyText()
{
  EXPECT_EQ(TileKeyToString(TileKey{1, 2}), std::string("1,2"));
  EXPECT_EQ(TileKeyToString(TileKey{-3, 0}), std::string("-3,0"));

  TileKey k;
  EXPECT_TRUE(ParseTileKey("-3,7", k));
  EXPECT_EQ(k.ix, -3);
  EXPECT_EQ(k.iy, 7);
  EXPECT_FALSE(ParseTileKey("1", k));
  EXPECT_FALSE(ParseTileKey("1,2,3", k));
  EXPECT_FALSE(ParseTileKey("1, 2", k));
  EXPECT_FALSE(ParseTileKey("a,b", k));

  EXPECT_TRUE((TileKey{0, 5} < TileKey{1, 0}));
  EXPECT_TRUE((TileKey{1, -1} < TileKey{1, 0}));
}

void TestHeightRules()
{
  HeightConfig cfg;
  cfg.defaultHeight = 5.0;
  cfg.levelHeight = 5.0;

  {
    const HeightEstimate h = EstimateHeight(TagMap{{"height", "12m"}}, cfg);
    EXPECT_EQ(h.height, 12.0);
    EXPECT_TRUE(h.source == HeightSource::ExplicitHeight);
    EXPECT_EQ(h.fallbacks(), 0);
  }
  {
    const HeightEstimate h = EstimateHeight(TagMap{{"height", " 12.5 m "}}, cfg);
    EXPECT_EQ(h.height, 12.5);
  }
  {
    // Only a lowercase unit is dropped; "M" makes the value unusable.
    const HeightEstimate h = EstimateHeight(TagMap{{"height", "12.5 M"}}, cfg);
    EXPECT_EQ(h.height, 5.0);
    EXPECT_TRUE(h.source == HeightSource::Default);
    EXPECT_TRUE(h.heightRejected);

    double v = 0.0;
    EXPECT_TRUE(ParseHeightValue("1m2", v));
    EXPECT_EQ(v, 12.0);
    EXPECT_FALSE(ParseHeightValue("12M", v));
  }
  {
    const HeightEstimate h = EstimateHeight(TagMap{{"building:levels", "3"}}, cfg);
    EXPECT_EQ(h.height, 15.0);
    EXPECT_TRUE(h.source == HeightSource::Levels);
  }
  {
    const HeightEstimate h = EstimateHeight(TagMap{}, cfg);
    EXPECT_EQ(h.height, 5.0);
    EXPECT_TRUE(h.source == HeightSource::Default);
    EXPECT_EQ(h.fallbacks(), 0);
  }
  {
    // Unparseable height falls through to levels without failing.
    const HeightEstimate h = EstimateHeight(TagMap{{"height", "not-a-number"}, {"building:levels", "2"}}, cfg);
    EXPECT_EQ(h.height, 10.0);
    EXPECT_TRUE(h.source == HeightSource::Levels);
    EXPECT_TRUE(h.heightRejected);
    EXPECT_EQ(h.fallbacks(), 1);
  }
  {
    const HeightEstimate h = EstimateHeight(TagMap{{"height", "not-a-number"}}, cfg);
    EXPECT_EQ(h.height, 5.0);
    EXPECT_TRUE(h.source == HeightSource::Default);
  }
  {
    // Non-positive and non-finite values are rejected.
    EXPECT_TRUE(EstimateHeight(TagMap{{"height", "-4"}}, cfg).source == HeightSource::Default);
    EXPECT_TRUE(EstimateHeight(TagMap{{"height", "0"}}, cfg).source == HeightSource::Default);
    EXPECT_TRUE(EstimateHeight(TagMap{{"height", "inf"}}, cfg).source == HeightSource::Default);
    EXPECT_TRUE(EstimateHeight(TagMap{{"building:levels", "nan"}}, cfg).source == HeightSource::Default);
    EXPECT_TRUE(EstimateHeight(TagMap{{"building:levels", "0x10"}}, cfg).source == HeightSource::Default);
  }
  {
    // Empty values count as absent, not as a failed rule.
    const HeightEstimate h = EstimateHeight(TagMap{{"height", ""}}, cfg);
    EXPECT_EQ(h.fallbacks(), 0);
  }
  {
    HeightConfig custom = cfg;
    custom.heightTag = "est_height";
    custom.levelHeight = 3.0;
    EXPECT_EQ(EstimateHeight(TagMap{{"est_height", "9"}, {"height", "40"}}, custom).height, 9.0);
    EXPECT_EQ(EstimateHeight(TagMap{{"building:levels", "4"}}, custom).height, 12.0);
  }
}

void TestNormalizeValidPolygon()
{
  // Open ring: the normalizer closes it.
  Ring open = Square(0.0, 0.0, 10.0);
  open.pop_back();
  const NormalizeResult r = NormalizeGeometry(PolygonGeometry({open}));
  ASSERT_TRUE(r.polygons.size() == 1);
  EXPECT_TRUE(r.skipped.empty());

  const NormalizedPolygon& p = r.polygons[0];
  EXPECT_EQ(p.exterior.size(), static_cast<std::size_t>(5));
  EXPECT_TRUE(p.exterior.front() == p.exterior.back());
  EXPECT_NEAR(p.centroid.x, 5.0, 1e-9);
  EXPECT_NEAR(p.centroid.y, 5.0, 1e-9);

  // A hole moves the centroid but not the footprint.
  const Ring hole{{1.0, 1.0}, {4.0, 1.0}, {4.0, 9.0}, {1.0, 9.0}, {1.0, 1.0}};
  const NormalizeResult withHole = NormalizeGeometry(PolygonGeometry({Square(0.0, 0.0, 10.0), hole}));
  ASSERT_TRUE(withHole.polygons.size() == 1);
  EXPECT_EQ(withHole.polygons[0].exterior.size(), static_cast<std::size_t>(5));
  EXPECT_TRUE(withHole.polygons[0].centroid.x > 5.0);
  EXPECT_NEAR(withHole.polygons[0].centroid.y, 5.0, 1e-9);
}

void TestNormalizeSkipReasons()
{
  auto reasonOf = [](const RawGeometry& g) -> SkipReason {
    const NormalizeResult r = NormalizeGeometry(g);
    return r.skipped.empty() ? static_cast<SkipReason>(255) : r.skipped.front().reason;
  };

  RawGeometry nullGeom;
  EXPECT_TRUE(reasonOf(nullGeom) == SkipReason::NullGeometry);

  RawGeometry point;
  point.type = RawGeometry::Type::Unsupported;
  point.typeName = "Point";
  EXPECT_TRUE(reasonOf(point) == SkipReason::UnsupportedType);

  RawGeometry empty;
  empty.type = RawGeometry::Type::MultiPolygon;
  EXPECT_TRUE(reasonOf(empty) == SkipReason::EmptyGeometry);

  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();
  EXPECT_TRUE(reasonOf(PolygonGeometry({Ring{{nan, 0.0}, {1.0, 0.0}, {1.0, 1.0}, {nan, 0.0}}})) ==
              SkipReason::NonFiniteCoordinate);
  EXPECT_TRUE(reasonOf(PolygonGeometry({Ring{{0.0, 0.0}, {inf, 0.0}, {1.0, 1.0}, {0.0, 0.0}}})) ==
              SkipReason::NonFiniteCoordinate);
  // A non-finite hole drops the polygon too.
  EXPECT_TRUE(reasonOf(PolygonGeometry({Square(0.0, 0.0, 10.0), Ring{{1.0, 1.0}, {2.0, nan}, {2.0, 2.0}}})) ==
              SkipReason::NonFiniteCoordinate);

  EXPECT_TRUE(reasonOf(PolygonGeometry({Ring{{0.0, 0.0}, {1.0, 0.0}, {0.0, 0.0}}})) == SkipReason::TooFewPoints);
  EXPECT_TRUE(reasonOf(PolygonGeometry({Ring{{0.0, 0.0}, {1.0, 0.0}, {2.0, 0.0}, {0.0, 0.0}}})) ==
              SkipReason::ZeroArea);
  // Crossing edges with non-zero signed area.
  EXPECT_TRUE(reasonOf(PolygonGeometry({Ring{{0.0, 0.0}, {10.0, 10.0}, {10.0, 0.0}, {0.0, 20.0}, {0.0, 0.0}}})) ==
              SkipReason::SelfIntersection);

  // One bad part does not drop its siblings.
  RawGeometry multi;
  multi.type = RawGeometry::Type::MultiPolygon;
  RawPolygon good;
  good.rings.push_back(Square(0.0, 0.0, 10.0));
  RawPolygon bad;
  bad.rings.push_back(Ring{});
  bad.rings.push_back(Square(1.0, 1.0, 2.0));
  multi.polygons.push_back(good);
  multi.polygons.push_back(bad);
  const NormalizeResult r = NormalizeGeometry(multi);
  EXPECT_EQ(r.polygons.size(), static_cast<std::size_t>(1));
  ASSERT_TRUE(r.skipped.size() == 1);
  EXPECT_TRUE(r.skipped[0].reason == SkipReason::MissingExterior);
  EXPECT_EQ(r.skipped[0].part, static_cast<std::size_t>(1));

  EXPECT_EQ(std::string(SkipReasonName(SkipReason::NonFiniteCoordinate)), std::string("non_finite_coordinate"));
}

void TestHoleValidity()
{
  auto reasonOf = [](const RawGeometry& g) -> SkipReason {
    const NormalizeResult r = NormalizeGeometry(g);
    return r.skipped.empty() ? static_cast<SkipReason>(255) : r.skipped.front().reason;
  };

  // Hole sticking out through the shell's right edge.
  const Ring crossing{{5.0, 2.0}, {15.0, 2.0}, {15.0, 8.0}, {5.0, 8.0}, {5.0, 2.0}};
  EXPECT_TRUE(reasonOf(PolygonGeometry({Square(0.0, 0.0, 10.0), crossing})) == SkipReason::SelfIntersection);

  // Bowtie hole, fully inside the shell.
  const Ring bowtie{{2.0, 2.0}, {8.0, 8.0}, {8.0, 2.0}, {2.0, 5.0}, {2.0, 2.0}};
  EXPECT_TRUE(reasonOf(PolygonGeometry({Square(0.0, 0.0, 10.0), bowtie})) == SkipReason::SelfIntersection);

  // Hole entirely outside the shell.
  EXPECT_TRUE(reasonOf(PolygonGeometry({Square(0.0, 0.0, 10.0), Square(20.0, 20.0, 2.0)})) ==
              SkipReason::SelfIntersection);

  // Two overlapping holes, and one hole nested in another.
  EXPECT_TRUE(reasonOf(PolygonGeometry({Square(0.0, 0.0, 10.0), Square(1.0, 1.0, 4.0), Square(3.0, 3.0, 4.0)})) ==
              SkipReason::SelfIntersection);
  EXPECT_TRUE(reasonOf(PolygonGeometry({Square(0.0, 0.0, 10.0), Square(1.0, 1.0, 8.0), Square(3.0, 3.0, 2.0)})) ==
              SkipReason::SelfIntersection);

  // Disjoint holes inside are fine.
  const NormalizeResult ok =
      NormalizeGeometry(PolygonGeometry({Square(0.0, 0.0, 10.0), Square(1.0, 1.0, 2.0), Square(6.0, 6.0, 2.0)}));
  EXPECT_EQ(ok.polygons.size(), static_cast<std::size_t>(1));
  EXPECT_TRUE(ok.skipped.empty());
}

void TestFormatJsonNumber()
{
  auto fmt = [](double v) {
    std::string s;
    return FormatJsonNumber(v, s) ? s : std::string("<fail>");
  };

  EXPECT_EQ(fmt(12.0), std::string("12.0"));
  EXPECT_EQ(fmt(0.0), std::string("0.0"));
  EXPECT_EQ(fmt(-0.0), std::string("-0.0"));
  EXPECT_EQ(fmt(0.1), std::string("0.1"));
  EXPECT_EQ(fmt(1500.25), std::string("1500.25"));
  EXPECT_EQ(fmt(-73.98765), std::string("-73.98765"));
  EXPECT_EQ(fmt(0.0001), std::string("0.0001"));
  EXPECT_EQ(fmt(0.00001), std::string("1e-05"));
  EXPECT_EQ(fmt(1e15), std::string("1000000000000000.0"));
  EXPECT_EQ(fmt(1e16), std::string("1e+16"));
  EXPECT_EQ(fmt(1.5e22), std::string("1.5e+22"));
  EXPECT_EQ(fmt(123456789.123), std::string("123456789.123"));
  EXPECT_EQ(fmt(std::numeric_limits<double>::quiet_NaN()), std::string("<fail>"));
  EXPECT_EQ(fmt(std::numeric_limits<double>::infinity()), std::string("<fail>"));
}

void TestCanonicalEncoding()
{
  std::vector<BuildingRecord> buildings;
  BuildingRecord b;
  b.footprint = Ring{{0.0, 0.0}, {10.0, 0.0}, {10.0, 10.0}, {0.0, 0.0}};
  b.height = 12.0;
  buildings.push_back(b);
  b.footprint = Ring{{0.5, -1.25}, {3.0, -1.25}, {3.0, 2.0}, {0.5, -1.25}};
  b.height = 7.5;
  buildings.push_back(b);

  std::string enc;
  std::string err;
  ASSERT_TRUE(EncodeTileBuildings(buildings, enc, err));
  EXPECT_EQ(enc, std::string("[{\"footprint\":[[0.0,0.0],[10.0,0.0],[10.0,10.0],[0.0,0.0]],\"height\":12.0},"
                             "{\"footprint\":[[0.5,-1.25],[3.0,-1.25],[3.0,2.0],[0.5,-1.25]],\"height\":7.5}]"));

  // Same records, same bytes.
  std::string again;
  ASSERT_TRUE(EncodeTileBuildings(buildings, again, err));
  EXPECT_EQ(enc, again);

  std::vector<BuildingRecord> decoded;
  ASSERT_TRUE(DecodeTileBuildings(enc, decoded, err));
  ASSERT_TRUE(decoded.size() == 2);
  EXPECT_TRUE(decoded[1].footprint == buildings[1].footprint);
  EXPECT_EQ(decoded[1].height, 7.5);

  EXPECT_FALSE(DecodeTileBuildings("{\"footprint\":[]}", decoded, err));
  EXPECT_FALSE(DecodeTileBuildings("[{\"footprint\":[[1,2,3]],\"height\":1}]", decoded, err));

  // Non-finite values never reach the encoding.
  buildings[0].height = std::numeric_limits<double>::infinity();
  EXPECT_FALSE(EncodeTileBuildings(buildings, enc, err));
}

void TestCompressionRoundTrips()
{
  std::vector<BuildingRecord> buildings;
  for (int i = 0; i < 40; ++i) buildings.push_back(MakeBuilding(i * 12.0, 3.0, 10.0, 5.0 + i));
  std::string payload;
  std::string err;
  ASSERT_TRUE(EncodeTileBuildings(buildings, payload, err));
  const auto* data = reinterpret_cast<const std::uint8_t*>(payload.data());

  for (CompressionMethod m : {CompressionMethod::Zlib, CompressionMethod::SLLZ, CompressionMethod::None}) {
    std::vector<std::uint8_t> packed;
    ASSERT_TRUE(CompressPayload(m, kDefaultZlibLevel, data, payload.size(), packed, err));
    if (m != CompressionMethod::None) EXPECT_TRUE(packed.size() < payload.size());

    std::vector<std::uint8_t> raw;
    ASSERT_TRUE(DecompressPayload(m, packed.data(), packed.size(), raw, err));
    EXPECT_EQ(std::string(raw.begin(), raw.end()), payload);
  }

  // Same stream as zlib.compress(b"") in other zlib front ends.
  std::vector<std::uint8_t> empty;
  ASSERT_TRUE(CompressPayload(CompressionMethod::Zlib, kDefaultZlibLevel, nullptr, 0, empty, err));
  const std::vector<std::uint8_t> expected = {0x78, 0x9c, 0x03, 0x00, 0x00, 0x00, 0x00, 0x01};
  EXPECT_TRUE(empty == expected);

  CompressionMethod m = CompressionMethod::None;
  EXPECT_TRUE(ParseCompressionMethod("sllz", m));
  EXPECT_TRUE(m == CompressionMethod::SLLZ);
  EXPECT_FALSE(ParseCompressionMethod("lz4", m));
  EXPECT_EQ(std::string(CompressionMethodName(CompressionMethod::Zlib)), std::string("zlib"));
}

void TestCorruptPayloadDetection()
{
  const std::string payload = "[{\"footprint\":[[0.0,0.0],[1.0,0.0],[1.0,1.0],[0.0,0.0]],\"height\":5.0}]";
  const auto* data = reinterpret_cast<const std::uint8_t*>(payload.data());
  std::string err;
  std::vector<std::uint8_t> out;

  std::vector<std::uint8_t> z;
  ASSERT_TRUE(CompressPayload(CompressionMethod::Zlib, 6, data, payload.size(), z, err));

  // Checksum mismatch.
  std::vector<std::uint8_t> flipped = z;
  flipped.back() ^= 0xFFu;
  EXPECT_FALSE(DecompressPayload(CompressionMethod::Zlib, flipped.data(), flipped.size(), out, err));
  EXPECT_FALSE(err.empty());

  // Truncated stream.
  EXPECT_FALSE(DecompressPayload(CompressionMethod::Zlib, z.data(), z.size() - 3, out, err));

  // Trailing garbage after a complete stream.
  std::vector<std::uint8_t> trailing = z;
  trailing.push_back(0x00);
  EXPECT_FALSE(DecompressPayload(CompressionMethod::Zlib, trailing.data(), trailing.size(), out, err));

  std::vector<std::uint8_t> s;
  ASSERT_TRUE(CompressPayload(CompressionMethod::SLLZ, 0, data, payload.size(), s, err));
  EXPECT_FALSE(DecompressPayload(CompressionMethod::SLLZ, s.data(), 3, out, err));
  EXPECT_FALSE(DecompressPayload(CompressionMethod::SLLZ, s.data(), s.size() - 1, out, err));
  std::vector<std::uint8_t> wrongSize = s;
  wrongSize[0] = static_cast<std::uint8_t>(wrongSize[0] + 1);
  EXPECT_FALSE(DecompressPayload(CompressionMethod::SLLZ, wrongSize.data(), wrongSize.size(), out, err));
}

TileGrouping SampleGrouping()
{
  // Deliberately inserted out of key order.
  TileGrouping g;
  g.add(TileKey{2, 0}, MakeBuilding(2005.0, 5.0, 10.0, 5.0));
  g.add(TileKey{0, 1}, MakeBuilding(5.0, 1005.0, 10.0, 6.0));
  g.add(TileKey{-1, 3}, MakeBuilding(-500.0, 3100.0, 20.0, 30.0));
  g.add(TileKey{0, 1}, MakeBuilding(40.0, 1040.0, 8.0, 9.0));
  g.add(TileKey{0, 0}, MakeBuilding(1.0, 1.0, 4.0, 4.0));
  return g;
}

void TestTileGrouping()
{
  const TileGrouping g = SampleGrouping();
  EXPECT_EQ(g.tileCount(), static_cast<std::size_t>(4));
  EXPECT_EQ(g.buildingCount(), static_cast<std::size_t>(5));

  // First-seen order is kept, sorted view is ascending.
  EXPECT_TRUE(g.tiles().front().key == (TileKey{2, 0}));
  const std::vector<const Tile*> sorted = g.sortedTiles();
  ASSERT_TRUE(sorted.size() == 4);
  EXPECT_TRUE(sorted[0]->key == (TileKey{-1, 3}));
  EXPECT_TRUE(sorted[1]->key == (TileKey{0, 0}));
  EXPECT_TRUE(sorted[2]->key == (TileKey{0, 1}));
  EXPECT_TRUE(sorted[3]->key == (TileKey{2, 0}));

  const Tile* t = g.find(TileKey{0, 1});
  ASSERT_TRUE(t != nullptr);
  ASSERT_TRUE(t->buildings.size() == 2);
  EXPECT_EQ(t->buildings[0].height, 6.0);
  EXPECT_EQ(t->buildings[1].height, 9.0);
  EXPECT_TRUE(g.find(TileKey{9, 9}) == nullptr);
}

void TestPackIndexIntegrity()
{
  const TileGrouping g = SampleGrouping();

  for (CompressionMethod m : {CompressionMethod::Zlib, CompressionMethod::SLLZ, CompressionMethod::None}) {
    PackEncodeOptions opt;
    opt.method = m;
    opt.threads = 3;

    EncodedPack pack;
    std::string err;
    ASSERT_TRUE(EncodePack(g, opt, pack, err));
    ASSERT_TRUE(pack.index.size() == g.tileCount());

    std::uint64_t sum = 0;
    for (std::size_t i = 0; i < pack.index.size(); ++i) {
      const PackIndexEntry& e = pack.index[i];
      if (i > 0) {
        EXPECT_TRUE(pack.index[i - 1].key < e.key);
        EXPECT_EQ(e.offset, pack.index[i - 1].offset + pack.index[i - 1].length);
      } else {
        EXPECT_EQ(e.offset, static_cast<std::uint64_t>(0));
      }
      sum += e.length;

      // decompress(blob[offset:offset+length]) == canonical encoding of the tile.
      std::vector<std::uint8_t> raw;
      ASSERT_TRUE(DecompressPayload(m, pack.blob.data() + e.offset, static_cast<std::size_t>(e.length), raw, err));
      std::string expected;
      ASSERT_TRUE(EncodeTileBuildings(g.find(e.key)->buildings, expected, err));
      EXPECT_EQ(std::string(raw.begin(), raw.end()), expected);
    }
    EXPECT_EQ(sum, static_cast<std::uint64_t>(pack.blob.size()));
  }
}

void TestPackIndexJsonLayout()
{
  std::vector<PackIndexEntry> index;
  index.push_back(PackIndexEntry{TileKey{-1, 3}, 0, 57});
  index.push_back(PackIndexEntry{TileKey{0, 0}, 57, 40});

  std::ostringstream oss;
  std::string err;
  ASSERT_TRUE(WritePackIndexJson(oss, index, err));
  EXPECT_EQ(oss.str(), std::string("{\n"
                                   "  \"-1,3\": {\n"
                                   "    \"offset\": 0,\n"
                                   "    \"length\": 57\n"
                                   "  },\n"
                                   "  \"0,0\": {\n"
                                   "    \"offset\": 57,\n"
                                   "    \"length\": 40\n"
                                   "  }\n"
                                   "}"));

  std::ostringstream empty;
  ASSERT_TRUE(WritePackIndexJson(empty, {}, err));
  EXPECT_EQ(empty.str(), std::string("{}"));

  JsonValue root;
  ASSERT_TRUE(ParseJson(oss.str(), root, err));
  std::vector<PackIndexEntry> parsed;
  ASSERT_TRUE(ParsePackIndexJson(root, parsed, err));
  ASSERT_TRUE(parsed.size() == 2);
  EXPECT_EQ(parsed[1].offset, static_cast<std::uint64_t>(57));

  ASSERT_TRUE(ParseJson("{\"1,1\": {\"offset\": -1, \"length\": 3}}", root, err));
  EXPECT_FALSE(ParsePackIndexJson(root, parsed, err));
  ASSERT_TRUE(ParseJson("{\"1;1\": {\"offset\": 0, \"length\": 3}}", root, err));
  EXPECT_FALSE(ParsePackIndexJson(root, parsed, err));
  ASSERT_TRUE(ParseJson("{\"1,1\": {\"offset\": 0.5, \"length\": 3}}", root, err));
  EXPECT_FALSE(ParsePackIndexJson(root, parsed, err));
}

void TestPackCommitAndReader()
{
  const fs::path dir = MakeTempPath("footpack_reader");
  const TileGrouping g = SampleGrouping();

  PackEncodeOptions opt;
  EncodedPack pack;
  std::string err;
  ASSERT_TRUE(EncodePack(g, opt, pack, err));

  PackError perr;
  ASSERT_TRUE(CommitPack(pack, dir / "buildings.pack", dir / "buildings.index.json", perr));
  EXPECT_TRUE(fs::exists(dir / "buildings.pack"));
  EXPECT_FALSE(fs::exists(dir / "buildings.pack.tmp"));
  EXPECT_FALSE(fs::exists(dir / "buildings.index.json.tmp"));
  EXPECT_EQ(ReadFileBytes(dir / "buildings.pack").size(), pack.blob.size());

  PackReader reader;
  ASSERT_TRUE(reader.open((dir / "buildings.pack").string(), (dir / "buildings.index.json").string(),
                          CompressionMethod::Zlib, err));
  EXPECT_EQ(reader.entries().size(), g.tileCount());

  const PackIndexEntry* e = reader.find(TileKey{0, 1});
  ASSERT_TRUE(e != nullptr);
  std::vector<BuildingRecord> decoded;
  ASSERT_TRUE(reader.decodeTile(TileKey{0, 1}, decoded, err));
  ASSERT_TRUE(decoded.size() == 2);
  EXPECT_TRUE(decoded[0].footprint == g.find(TileKey{0, 1})->buildings[0].footprint);
  EXPECT_EQ(decoded[1].height, 9.0);

  EXPECT_TRUE(reader.find(TileKey{7, 7}) == nullptr);
  std::string encoded;
  EXPECT_FALSE(reader.readTile(TileKey{7, 7}, encoded, err));

  PackVerifyReport report;
  VerifyPack(reader, report);
  EXPECT_TRUE(report.ok());
  EXPECT_EQ(report.buildings, static_cast<std::size_t>(5));
  EXPECT_EQ(report.indexedBytes, report.blobBytes);

  // Reading with the wrong method is caught.
  PackReader wrong;
  ASSERT_TRUE(wrong.open((dir / "buildings.pack").string(), (dir / "buildings.index.json").string(),
                         CompressionMethod::SLLZ, err));
  VerifyPack(wrong, report);
  EXPECT_FALSE(report.ok());

  // A truncated blob fails verification.
  std::string blob = ReadFileBytes(dir / "buildings.pack");
  blob.resize(blob.size() - 4);
  ASSERT_TRUE(WriteFileBytes(dir / "buildings.pack", blob));
  PackReader truncated;
  ASSERT_TRUE(truncated.open((dir / "buildings.pack").string(), (dir / "buildings.index.json").string(),
                             CompressionMethod::Zlib, err));
  VerifyPack(truncated, report);
  EXPECT_FALSE(report.ok());

  std::error_code ec;
  fs::remove_all(dir, ec);
}

void TestCommitFailureIsIOFailure()
{
  const fs::path dir = MakeTempPath("footpack_commit_fail");
  std::error_code ec;
  fs::create_directories(dir, ec);

  // The blob's parent "directory" is a regular file.
  ASSERT_TRUE(WriteFileBytes(dir / "blocker", "x"));

  EncodedPack pack;
  pack.blob = {1, 2, 3};
  PackError perr;
  EXPECT_FALSE(CommitPack(pack, dir / "blocker" / "buildings.pack", dir / "buildings.index.json", perr));
  EXPECT_TRUE(perr.kind == ErrorKind::IOFailure);
  EXPECT_TRUE(IsFatal(perr.kind));
  EXPECT_FALSE(fs::exists(dir / "buildings.index.json"));
  EXPECT_TRUE(FormatPackError(perr).rfind("IOFailure: ", 0) == 0);

  fs::remove_all(dir, ec);
}

void TestStagedFileDiscard()
{
  const fs::path dir = MakeTempPath("footpack_staged");
  const fs::path target = dir / "out.bin";
  std::string err;
  {
    StagedFile f;
    ASSERT_TRUE(f.open(target, err));
    ASSERT_TRUE(f.write(std::string("partial"), err));
    EXPECT_TRUE(fs::exists(f.tempPath()));
  }
  EXPECT_FALSE(fs::exists(target));
  EXPECT_FALSE(fs::exists(dir / "out.bin.tmp"));

  {
    StagedFile f;
    ASSERT_TRUE(f.open(target, err));
    ASSERT_TRUE(f.write(std::string("complete"), err));
    ASSERT_TRUE(f.finish(err));
    EXPECT_EQ(f.bytesWritten(), static_cast<std::uint64_t>(8));
    ASSERT_TRUE(f.commit(err));
  }
  EXPECT_EQ(ReadFileBytes(target), std::string("complete"));

  std::error_code ec;
  fs::remove_all(dir, ec);
}

void TestTileFileShape()
{
  TileGrid grid;
  grid.minBound = Vec2{0.0, 0.0};
  grid.tileSize = 1000.0;

  Tile tile;
  tile.key = TileKey{1, 2};
  BuildingRecord b;
  b.footprint = Ring{{1500.0, 2500.0}, {1510.0, 2500.0}, {1510.0, 2510.0}, {1500.0, 2500.0}};
  b.height = 15.0;
  tile.buildings.push_back(b);

  std::ostringstream oss;
  std::string err;
  ASSERT_TRUE(WriteTileFileJson(oss, tile, grid, err));
  EXPECT_EQ(oss.str(), std::string("{\"tile_origin\": [1000.0, 2000.0], \"tile_size\": 1000.0, \"buildings\": "
                                   "[{\"footprint\": [[1500.0, 2500.0], [1510.0, 2500.0], [1510.0, 2510.0], "
                                   "[1500.0, 2500.0]], \"height\": 15.0}]}"));
  EXPECT_EQ(TileFileName(tile.key), std::string("tile_1_2.json"));
  EXPECT_EQ(TileFileName(TileKey{-4, 0}), std::string("tile_-4_0.json"));

  grid.tileSize = 250.5;
  std::ostringstream frac;
  ASSERT_TRUE(WriteTileFileJson(frac, tile, grid, err));
  EXPECT_TRUE(frac.str().find("\"tile_size\": 250.5,") != std::string::npos);
}

void TestGeoJsonInput()
{
  JsonValue root;
  std::string err;
  JsonParseOptions opt;
  opt.allowNonFinite = true;
  ASSERT_TRUE(ParseJson(kSampleGeoJson, root, err, opt));

  std::vector<RawFeature> features;
  GeoJsonReadStats stats;
  ASSERT_TRUE(ParseGeoJsonFeatures(root, features, err, &stats));
  ASSERT_TRUE(features.size() == 6);
  EXPECT_EQ(stats.features, static_cast<std::size_t>(6));

  EXPECT_TRUE(features[0].geometry.type == RawGeometry::Type::Polygon);
  EXPECT_EQ(features[0].tags.at("height"), std::string("12m"));
  // Integral numbers become plain integers so level parsing sees "3".
  EXPECT_EQ(features[1].tags.at("building:levels"), std::string("3"));
  EXPECT_TRUE(std::isnan(features[2].geometry.polygons[0].rings[0][0].x));
  EXPECT_TRUE(features[3].geometry.type == RawGeometry::Type::Null);
  EXPECT_TRUE(features[4].geometry.type == RawGeometry::Type::Unsupported);
  EXPECT_EQ(features[4].geometry.typeName, std::string("Point"));
  EXPECT_TRUE(features[5].geometry.type == RawGeometry::Type::MultiPolygon);
  EXPECT_EQ(features[5].geometry.polygons.size(), static_cast<std::size_t>(2));

  ASSERT_TRUE(ParseJson("{\"a\": 12.5, \"b\": true, \"c\": null, \"d\": \"x\"}", root, err));
  const TagMap tags = TagsFromProperties(root);
  EXPECT_EQ(tags.at("a"), std::string("12.5"));
  EXPECT_EQ(tags.at("b"), std::string("yes"));
  EXPECT_TRUE(tags.count("c") == 0);
  EXPECT_EQ(tags.at("d"), std::string("x"));

  // Non-finite tokens are rejected unless explicitly allowed.
  EXPECT_FALSE(ParseJson("[NaN]", root, err));

  // Broken coordinates spoil one geometry, not the document.
  ASSERT_TRUE(ParseJson("{\"type\": \"Feature\", \"properties\": {}, "
                        "\"geometry\": {\"type\": \"Polygon\", \"coordinates\": [[1, 2]]}}",
                        root, err));
  ASSERT_TRUE(ParseGeoJsonFeatures(root, features, err, &stats));
  ASSERT_TRUE(features.size() == 1);
  EXPECT_TRUE(features[0].geometry.type == RawGeometry::Type::Unsupported);
  EXPECT_EQ(stats.malformedGeometries, static_cast<std::size_t>(1));

  ASSERT_TRUE(ParseJson("{\"type\": \"FeatureCollection\"}", root, err));
  EXPECT_FALSE(ParseGeoJsonFeatures(root, features, err));
  ASSERT_TRUE(ParseJson("[1, 2]", root, err));
  EXPECT_FALSE(ParseGeoJsonFeatures(root, features, err));
}

void TestBuildTilesFromSample()
{
  JsonValue root;
  std::string err;
  JsonParseOptions opt;
  opt.allowNonFinite = true;
  ASSERT_TRUE(ParseJson(kSampleGeoJson, root, err, opt));
  std::vector<RawFeature> features;
  ASSERT_TRUE(ParseGeoJsonFeatures(root, features, err));

  PackConfig cfg;
  cfg.threads = 2;
  TileGrouping tiles;
  TileGrid grid;
  RunStats stats;
  BuildTiles(features, cfg, tiles, grid, stats);

  EXPECT_EQ(stats.features, static_cast<std::size_t>(6));
  EXPECT_EQ(grid.minBound.x, 0.0);
  EXPECT_EQ(grid.minBound.y, 0.0);
  EXPECT_EQ(stats.inputBounds.maxx, 2010.0);
  EXPECT_EQ(stats.inputBounds.maxy, 2510.0);

  EXPECT_EQ(stats.polygons, static_cast<std::size_t>(4));
  EXPECT_EQ(stats.buildings, static_cast<std::size_t>(4));
  EXPECT_EQ(stats.tiles, static_cast<std::size_t>(3));
  EXPECT_EQ(stats.skipped[static_cast<std::size_t>(SkipReason::NonFiniteCoordinate)], static_cast<std::size_t>(1));
  EXPECT_EQ(stats.skipped[static_cast<std::size_t>(SkipReason::NullGeometry)], static_cast<std::size_t>(1));
  EXPECT_EQ(stats.skipped[static_cast<std::size_t>(SkipReason::UnsupportedType)], static_cast<std::size_t>(1));
  EXPECT_EQ(stats.skippedTotal(), static_cast<std::size_t>(3));

  EXPECT_EQ(stats.heightExplicit, static_cast<std::size_t>(1));
  EXPECT_EQ(stats.heightLevels, static_cast<std::size_t>(1));
  EXPECT_EQ(stats.heightDefault, static_cast<std::size_t>(2));
  EXPECT_EQ(stats.heightFallbacks, static_cast<std::size_t>(2));
  EXPECT_EQ(stats.heightExplicit + stats.heightLevels + stats.heightDefault, stats.buildings);

  const Tile* home = tiles.find(TileKey{0, 0});
  ASSERT_TRUE(home != nullptr);
  ASSERT_TRUE(home->buildings.size() == 2);
  EXPECT_EQ(home->buildings[0].height, 12.0);
  EXPECT_EQ(home->buildings[1].height, 5.0);

  const Tile* far = tiles.find(TileKey{1, 2});
  ASSERT_TRUE(far != nullptr);
  EXPECT_EQ(far->buildings[0].height, 15.0);
  EXPECT_TRUE(far->buildings[0].footprint.front() == far->buildings[0].footprint.back());
  EXPECT_TRUE(tiles.find(TileKey{2, 0}) != nullptr);
}

void TestAoiFiltering()
{
  JsonValue root;
  std::string err;
  JsonParseOptions opt;
  opt.allowNonFinite = true;
  ASSERT_TRUE(ParseJson(kSampleGeoJson, root, err, opt));
  std::vector<RawFeature> features;
  ASSERT_TRUE(ParseGeoJsonFeatures(root, features, err));

  Bounds box;
  ASSERT_TRUE(ParseBBox("1000,2000,2000,3000", box));

  PackConfig cfg;
  cfg.aoi = AreaOfInterest::MakeBBox(box);
  TileGrouping tiles;
  TileGrid grid;
  RunStats stats;
  BuildTiles(features, cfg, tiles, grid, stats);

  // Only the building centered at (1505, 2505) survives; the origin is still
  // the minimum over all input.
  EXPECT_EQ(stats.buildings, static_cast<std::size_t>(1));
  EXPECT_EQ(stats.aoiRejected, static_cast<std::size_t>(3));
  EXPECT_EQ(grid.minBound.x, 0.0);
  EXPECT_TRUE(tiles.find(TileKey{1, 2}) != nullptr);

  // Polygon AOI with a hole: even-odd rule.
  const AreaOfInterest poly = AreaOfInterest::MakePolygon({Square(0.0, 0.0, 100.0), Square(15.0, 15.0, 20.0)});
  EXPECT_TRUE(poly.contains(Vec2{5.0, 5.0}));
  EXPECT_FALSE(poly.contains(Vec2{25.0, 25.0}));
  EXPECT_FALSE(poly.contains(Vec2{150.0, 5.0}));

  EXPECT_FALSE(ParseBBox("0,0,0,10", box));
  EXPECT_FALSE(ParseBBox("0,0,10", box));
  EXPECT_FALSE(ParseBBox("0,0,10,10,5", box));
  EXPECT_FALSE(ParseBBox("0,0,nan,10", box));

  // Origin override shifts keys.
  PackConfig shifted;
  shifted.hasOrigin = true;
  shifted.origin = Vec2{-1000.0, -1000.0};
  RunStats s2;
  BuildTiles(features, shifted, tiles, grid, s2);
  EXPECT_TRUE(tiles.find(TileKey{2, 3}) != nullptr);
  EXPECT_TRUE(tiles.find(TileKey{1, 1}) != nullptr);
}

void TestConfigValidation()
{
  PackConfig cfg;
  std::string err;
  EXPECT_TRUE(ValidatePackConfig(cfg, err));

  PackConfig bad = cfg;
  bad.tileSize = 0.0;
  EXPECT_FALSE(ValidatePackConfig(bad, err));
  bad.tileSize = std::numeric_limits<double>::infinity();
  EXPECT_FALSE(ValidatePackConfig(bad, err));

  bad = cfg;
  bad.height.defaultHeight = -1.0;
  EXPECT_FALSE(ValidatePackConfig(bad, err));

  bad = cfg;
  bad.height.levelHeight = 0.0;
  EXPECT_FALSE(ValidatePackConfig(bad, err));

  bad = cfg;
  bad.compressionLevel = 10;
  EXPECT_FALSE(ValidatePackConfig(bad, err));
  bad.compression = CompressionMethod::None;
  EXPECT_TRUE(ValidatePackConfig(bad, err));

  bad = cfg;
  bad.indexName = bad.packName;
  EXPECT_FALSE(ValidatePackConfig(bad, err));

  bad = cfg;
  bad.outputDir.clear();
  EXPECT_FALSE(ValidatePackConfig(bad, err));
}

void TestConfigJson()
{
  PackConfig cfg;
  JsonValue root;
  std::string err;

  ASSERT_TRUE(ParseJson("{\"tile_size\": 500, \"compression\": \"sllz\", \"origin\": [10, 20], "
                        "\"aoi\": {\"bbox\": [0, 0, 100, 100]}, \"mode\": \"both\"}",
                        root, err));
  ASSERT_TRUE(ApplyPackConfigJson(root, cfg, "", err));
  EXPECT_EQ(cfg.tileSize, 500.0);
  EXPECT_TRUE(cfg.compression == CompressionMethod::SLLZ);
  EXPECT_TRUE(cfg.hasOrigin);
  EXPECT_EQ(cfg.origin.y, 20.0);
  EXPECT_TRUE(cfg.aoi.kind() == AreaOfInterest::Kind::BBox);
  EXPECT_TRUE(cfg.mode == OutputMode::Both);
  // Untouched keys keep their defaults.
  EXPECT_EQ(cfg.height.defaultHeight, 5.0);
  EXPECT_EQ(cfg.packName, std::string("buildings.pack"));

  // Type errors and unknown keys leave the config unchanged.
  ASSERT_TRUE(ParseJson("{\"tile_size\": \"big\"}", root, err));
  EXPECT_FALSE(ApplyPackConfigJson(root, cfg, "", err));
  EXPECT_EQ(cfg.tileSize, 500.0);
  ASSERT_TRUE(ParseJson("{\"tile_sise\": 10}", root, err));
  EXPECT_FALSE(ApplyPackConfigJson(root, cfg, "", err));
  ASSERT_TRUE(ParseJson("{\"compression\": \"zstd\"}", root, err));
  EXPECT_FALSE(ApplyPackConfigJson(root, cfg, "", err));
  ASSERT_TRUE(ParseJson("{\"threads\": 1.5}", root, err));
  EXPECT_FALSE(ApplyPackConfigJson(root, cfg, "", err));

  // Written config reads back to the same values.
  const std::string text = PackConfigToJson(cfg);
  PackConfig back;
  ASSERT_TRUE(ParseJson(text, root, err));
  ASSERT_TRUE(ApplyPackConfigJson(root, back, "", err));
  EXPECT_EQ(PackConfigToJson(back), text);

  // File loading resolves a relative AOI path against the config's folder.
  const fs::path dir = MakeTempPath("footpack_config");
  ASSERT_TRUE(WriteFileBytes(dir / "aoi.geojson",
                             "{\"type\": \"Polygon\", \"coordinates\": [[[0,0],[50,0],[50,50],[0,50],[0,0]]]}"));
  ASSERT_TRUE(WriteFileBytes(dir / "footpack.json", "{\"aoi\": {\"geojson\": \"aoi.geojson\"}, \"threads\": 2}"));
  PackConfig loaded;
  ASSERT_TRUE(LoadPackConfigJsonFile((dir / "footpack.json").string(), loaded, err));
  EXPECT_TRUE(loaded.aoi.kind() == AreaOfInterest::Kind::Polygon);
  EXPECT_TRUE(loaded.aoi.contains(Vec2{25.0, 25.0}));
  EXPECT_EQ(loaded.threads, 2);
  EXPECT_TRUE(ValidatePackConfig(loaded, err));

  EXPECT_FALSE(LoadPackConfigJsonFile((dir / "missing.json").string(), loaded, err));

  std::error_code ec;
  fs::remove_all(dir, ec);
}

void TestRunIsIdempotent()
{
  const fs::path dir = MakeTempPath("footpack_idempotent");
  const fs::path input = dir / "buildings.geojson";
  ASSERT_TRUE(WriteFileBytes(input, kSampleGeoJson));

  std::string previousPack;
  std::string previousIndex;
  std::uint64_t previousHash = 0;

  for (int threads : {1, 4, 1}) {
    PackConfig cfg;
    cfg.threads = threads;
    cfg.outputDir = (dir / ("out_" + std::to_string(threads) + "_" + std::to_string(previousHash))).string();

    RunStats stats;
    PackError perr;
    ASSERT_TRUE(RunPack(input.string(), cfg, stats, perr));
    EXPECT_EQ(stats.tiles, static_cast<std::size_t>(3));

    const std::string packBytes = ReadFileBytes(fs::path(cfg.outputDir) / cfg.packName);
    const std::string indexBytes = ReadFileBytes(fs::path(cfg.outputDir) / cfg.indexName);
    EXPECT_EQ(stats.packBytes, static_cast<std::uint64_t>(packBytes.size()));
    EXPECT_EQ(stats.packFnv1a64, Fnv1a64(packBytes.data(), packBytes.size()));

    if (!previousPack.empty()) {
      EXPECT_EQ(packBytes, previousPack);
      EXPECT_EQ(indexBytes, previousIndex);
      EXPECT_EQ(stats.packFnv1a64, previousHash);
    }
    previousPack = packBytes;
    previousIndex = indexBytes;
    previousHash = stats.packFnv1a64;
  }

  // The index lists tiles in ascending key order.
  EXPECT_TRUE(previousIndex.find("\"0,0\"") < previousIndex.find("\"1,2\""));
  EXPECT_TRUE(previousIndex.find("\"1,2\"") < previousIndex.find("\"2,0\""));

  std::error_code ec;
  fs::remove_all(dir, ec);
}

void TestRunBothModes()
{
  const fs::path dir = MakeTempPath("footpack_both");
  const fs::path input = dir / "buildings.geojson";
  ASSERT_TRUE(WriteFileBytes(input, kSampleGeoJson));

  PackConfig cfg;
  cfg.mode = OutputMode::Both;
  cfg.compression = CompressionMethod::SLLZ;
  cfg.outputDir = (dir / "out").string();

  RunStats stats;
  PackError perr;
  ASSERT_TRUE(RunPack(input.string(), cfg, stats, perr));
  EXPECT_EQ(stats.tileFiles, static_cast<std::size_t>(3));
  EXPECT_TRUE(fs::exists(dir / "out" / "buildings.pack"));
  EXPECT_TRUE(fs::exists(dir / "out" / "tiles" / "tile_1_2.json"));

  const std::string tile = ReadFileBytes(dir / "out" / "tiles" / "tile_1_2.json");
  EXPECT_TRUE(tile.rfind("{\"tile_origin\": [1000.0, 2000.0], \"tile_size\": 1000.0, ", 0) == 0);

  std::ostringstream summary;
  std::string err;
  ASSERT_TRUE(WriteRunSummaryJson(summary, stats, cfg, err));
  JsonValue root;
  ASSERT_TRUE(ParseJson(summary.str(), root, err));
  const JsonValue* buildings = FindJsonMember(root, "buildings");
  ASSERT_TRUE(buildings != nullptr);
  EXPECT_EQ(buildings->numberValue, 4.0);
  const JsonValue* skipped = FindJsonMember(root, "skipped");
  ASSERT_TRUE(skipped != nullptr);
  const JsonValue* nonFinite = FindJsonMember(*skipped, "non_finite_coordinate");
  ASSERT_TRUE(nonFinite != nullptr);
  EXPECT_EQ(nonFinite->numberValue, 1.0);

  // Missing input is an IOFailure.
  RunStats s2;
  EXPECT_FALSE(RunPack((dir / "nope.geojson").string(), cfg, s2, perr));
  EXPECT_TRUE(perr.kind == ErrorKind::IOFailure);

  std::error_code ec;
  fs::remove_all(dir, ec);
}

void TestLogLevels()
{
  const LogLevel saved = GetLogLevel();

  LogLevel l = LogLevel::Info;
  EXPECT_TRUE(ParseLogLevel("debug", l));
  EXPECT_TRUE(l == LogLevel::Debug);
  EXPECT_TRUE(ParseLogLevel("warning", l));
  EXPECT_TRUE(l == LogLevel::Warn);
  EXPECT_FALSE(ParseLogLevel("loud", l));

  SetLogLevel(LogLevel::Warn);
  EXPECT_FALSE(LogEnabled(LogLevel::Info));
  EXPECT_TRUE(LogEnabled(LogLevel::Warn));
  EXPECT_TRUE(LogEnabled(LogLevel::Error));
  SetLogLevel(LogLevel::Off);
  EXPECT_FALSE(LogEnabled(LogLevel::Error));

  // Messages for disabled levels are never built.
  int built = 0;
  LogLazy(LogLevel::Error, [&] {
    ++built;
    return std::string("never shown");
  });
  EXPECT_EQ(built, 0);
  SetLogLevel(LogLevel::Error);
  LogLazy(LogLevel::Debug, [&] {
    ++built;
    return std::string("never shown");
  });
  EXPECT_EQ(built, 0);
  LogLazy(LogLevel::Error, [&] {
    ++built;
    return std::string("footpack_tests: lazy log line");
  });
  EXPECT_EQ(built, 1);

  SetLogLevel(saved);
}

void TestFileDigest()
{
  EXPECT_EQ(Fnv1a64("", 0), kFnv1a64Basis);
  EXPECT_EQ(Fnv1a64("a", 1), 0xaf63dc4c8601ec8cull);
  EXPECT_EQ(HexU64(0xabcull), std::string("0000000000000abc"));

  const fs::path dir = MakeTempPath("footpack_digest");
  ASSERT_TRUE(WriteFileBytes(dir / "a.txt", "a"));
  FileDigest d;
  std::string err;
  ASSERT_TRUE(DigestFile((dir / "a.txt").string(), d, err));
  EXPECT_EQ(d.sizeBytes, static_cast<std::uint64_t>(1));
  EXPECT_EQ(d.fnv1a64, 0xaf63dc4c8601ec8cull);
  EXPECT_FALSE(DigestFile((dir / "missing").string(), d, err));

  std::error_code ec;
  fs::remove_all(dir, ec);
}

void TestInputBoundsCoverAllGeometry()
{
  JsonValue root;
  std::string err;
  ASSERT_TRUE(ParseJson("{\"type\": \"FeatureCollection\", \"features\": ["
                        "{\"type\": \"Feature\", \"properties\": {}, "
                        "\"geometry\": {\"type\": \"Point\", \"coordinates\": [-1500, 0]}},"
                        "{\"type\": \"Feature\", \"properties\": {}, \"geometry\": {\"type\": \"Polygon\", "
                        "\"coordinates\": [[[0, 0], [10, 0], [10, 10], [0, 10], [0, 0]]]}}]}",
                        root, err));
  std::vector<RawFeature> features;
  ASSERT_TRUE(ParseGeoJsonFeatures(root, features, err));

  PackConfig cfg;
  TileGrouping tiles;
  TileGrid grid;
  RunStats stats;
  BuildTiles(features, cfg, tiles, grid, stats);

  // The skipped point still sets the grid origin.
  EXPECT_EQ(grid.minBound.x, -1500.0);
  EXPECT_EQ(grid.minBound.y, 0.0);
  EXPECT_EQ(stats.buildings, static_cast<std::size_t>(1));
  EXPECT_EQ(stats.skipped[static_cast<std::size_t>(SkipReason::UnsupportedType)], static_cast<std::size_t>(1));
  ASSERT_TRUE(tiles.tileCount() == 1);
  EXPECT_TRUE(tiles.tiles().front().key == (TileKey{1, 0}));

  // Lines inside a collection and polygons with broken rings count too.
  ASSERT_TRUE(ParseJson("{\"type\": \"FeatureCollection\", \"features\": ["
                        "{\"type\": \"Feature\", \"properties\": {}, \"geometry\": {\"type\": \"GeometryCollection\", "
                        "\"geometries\": [{\"type\": \"LineString\", \"coordinates\": [[0, -2500], [5, -2400]]}]}},"
                        "{\"type\": \"Feature\", \"properties\": {}, "
                        "\"geometry\": {\"type\": \"Polygon\", \"coordinates\": [[-700, 40]]}}]}",
                        root, err));
  ASSERT_TRUE(ParseGeoJsonFeatures(root, features, err));
  const Bounds b = ComputeInputBounds(features);
  ASSERT_TRUE(b.valid);
  EXPECT_EQ(b.minx, -700.0);
  EXPECT_EQ(b.miny, -2500.0);
  EXPECT_EQ(b.maxx, 5.0);
  EXPECT_EQ(b.maxy, 40.0);
}

void TestZstdCodec()
{
  CompressionMethod m = CompressionMethod::None;
  EXPECT_TRUE(ParseCompressionMethod("zstd", m));
  EXPECT_TRUE(m == CompressionMethod::Zstd);
  EXPECT_EQ(std::string(CompressionMethodName(CompressionMethod::Zstd)), std::string("zstd"));

  PackConfig cfg;
  cfg.compression = CompressionMethod::Zstd;
  std::string err;
  EXPECT_TRUE(ValidatePackConfig(cfg, err));
  cfg.compressionLevel = 19;
  EXPECT_TRUE(ValidatePackConfig(cfg, err));
  cfg.compressionLevel = 0;
  EXPECT_FALSE(ValidatePackConfig(cfg, err));
  cfg.compressionLevel = 23;
  EXPECT_FALSE(ValidatePackConfig(cfg, err));

  std::vector<BuildingRecord> buildings;
  for (int i = 0; i < 40; ++i) buildings.push_back(MakeBuilding(i * 12.0, 3.0, 10.0, 5.0 + i));
  std::string payload;
  ASSERT_TRUE(EncodeTileBuildings(buildings, payload, err));
  const auto* data = reinterpret_cast<const std::uint8_t*>(payload.data());

  std::vector<std::uint8_t> packed;
  if (!ZstdAvailable()) {
    EXPECT_FALSE(CompressPayload(CompressionMethod::Zstd, kDefaultZlibLevel, data, payload.size(), packed, err));
    EXPECT_FALSE(err.empty());
    return;
  }

  for (int level : {kDefaultZlibLevel, 1, 19}) {
    ASSERT_TRUE(CompressPayload(CompressionMethod::Zstd, level, data, payload.size(), packed, err));
    EXPECT_TRUE(packed.size() < payload.size());
    // Frame magic.
    ASSERT_TRUE(packed.size() > 4);
    EXPECT_EQ(packed[0], static_cast<std::uint8_t>(0x28));
    EXPECT_EQ(packed[3], static_cast<std::uint8_t>(0xFD));

    std::vector<std::uint8_t> raw;
    ASSERT_TRUE(DecompressPayload(CompressionMethod::Zstd, packed.data(), packed.size(), raw, err));
    EXPECT_EQ(std::string(raw.begin(), raw.end()), payload);
  }

  std::vector<std::uint8_t> out;
  EXPECT_FALSE(DecompressPayload(CompressionMethod::Zstd, packed.data(), packed.size() - 2, out, err));
  std::vector<std::uint8_t> trailing = packed;
  trailing.push_back(0x00);
  EXPECT_FALSE(DecompressPayload(CompressionMethod::Zstd, trailing.data(), trailing.size(), out, err));
  const std::vector<std::uint8_t> junk = {1, 2, 3, 4, 5, 6, 7, 8};
  EXPECT_FALSE(DecompressPayload(CompressionMethod::Zstd, junk.data(), junk.size(), out, err));

  // A whole run through the pack writer and reader.
  const TileGrouping g = SampleGrouping();
  PackEncodeOptions opt;
  opt.method = CompressionMethod::Zstd;
  EncodedPack pack;
  ASSERT_TRUE(EncodePack(g, opt, pack, err));
  const fs::path dir = MakeTempPath("footpack_zstd");
  PackError perr;
  ASSERT_TRUE(CommitPack(pack, dir / "b.pack", dir / "b.index.json", perr));
  PackReader reader;
  ASSERT_TRUE(reader.open((dir / "b.pack").string(), (dir / "b.index.json").string(), CompressionMethod::Zstd, err));
  PackVerifyReport report;
  VerifyPack(reader, report);
  EXPECT_TRUE(report.ok());
  EXPECT_EQ(report.buildings, static_cast<std::size_t>(5));

  std::error_code ec;
  fs::remove_all(dir, ec);
}

void TestVerifyRejectsNonCanonicalPayload()
{
  const fs::path dir = MakeTempPath("footpack_noncanonical");
  std::error_code ec;
  fs::create_directories(dir, ec);

  // Decodes fine, but the writer never emits spaces or reordered keys.
  const std::string loose = "[{\"height\": 5.0, \"footprint\": [[0.0, 0.0], [1.0, 0.0], [1.0, 1.0], [0.0, 0.0]]}]";
  std::string canonical;
  std::string err;
  std::vector<BuildingRecord> decoded;
  ASSERT_TRUE(DecodeTileBuildings(loose, decoded, err));
  ASSERT_TRUE(EncodeTileBuildings(decoded, canonical, err));
  ASSERT_TRUE(canonical != loose);

  std::vector<std::uint8_t> blob;
  const auto* data = reinterpret_cast<const std::uint8_t*>(loose.data());
  ASSERT_TRUE(CompressPayload(CompressionMethod::Zlib, kDefaultZlibLevel, data, loose.size(), blob, err));
  ASSERT_TRUE(WriteFileBytes(dir / "b.pack", std::string(blob.begin(), blob.end())));

  PackIndexEntry e;
  e.key = TileKey{0, 0};
  e.offset = 0;
  e.length = blob.size();
  std::ostringstream index;
  ASSERT_TRUE(WritePackIndexJson(index, {e}, err));
  ASSERT_TRUE(WriteFileBytes(dir / "b.index.json", index.str()));

  PackReader reader;
  ASSERT_TRUE(reader.open((dir / "b.pack").string(), (dir / "b.index.json").string(), CompressionMethod::Zlib, err));
  PackVerifyReport report;
  VerifyPack(reader, report);
  EXPECT_FALSE(report.ok());
  EXPECT_EQ(report.buildings, static_cast<std::size_t>(1));
  bool flagged = false;
  for (const std::string& p : report.problems) {
    if (p.find("canonical") != std::string::npos) flagged = true;
  }
  EXPECT_TRUE(flagged);

  fs::remove_all(dir, ec);
}

std::string SingleSquareGeoJson(double x0, double y0)
{
  std::ostringstream oss;
  oss << "{\"type\": \"FeatureCollection\", \"features\": [{\"type\": \"Feature\", \"properties\": {}, "
      << "\"geometry\": {\"type\": \"Polygon\", \"coordinates\": [[[" << x0 << ", " << y0 << "], [" << x0 + 10 << ", "
      << y0 << "], [" << x0 + 10 << ", " << y0 + 10 << "], [" << x0 << ", " << y0 + 10 << "], [" << x0 << ", " << y0
      << "]]]}}]}";
  return oss.str();
}

std::vector<std::string> TileFileNamesIn(const fs::path& dir)
{
  std::vector<std::string> names;
  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (name.rfind("tile_", 0) == 0) names.push_back(name);
  }
  return names;
}

void TestStaleTileFilesRemoved()
{
  TileKey k;
  EXPECT_TRUE(ParseTileFileName("tile_-3_7.json", k));
  EXPECT_TRUE(k == (TileKey{-3, 7}));
  EXPECT_TRUE(ParseTileFileName("tile_0_-12.json", k));
  EXPECT_TRUE(k == (TileKey{0, -12}));
  EXPECT_FALSE(ParseTileFileName("tile_1_2.json.tmp", k));
  EXPECT_FALSE(ParseTileFileName("tile_01_2.json", k));
  EXPECT_FALSE(ParseTileFileName("tile_1.json", k));
  EXPECT_FALSE(ParseTileFileName("tiles.json", k));

  const fs::path dir = MakeTempPath("footpack_stale");
  const fs::path input = dir / "in.geojson";
  const fs::path out = dir / "out";

  PackConfig cfg;
  cfg.mode = OutputMode::Tiles;
  cfg.hasOrigin = true;
  cfg.origin = Vec2{0.0, 0.0};
  cfg.outputDir = out.string();

  RunStats stats;
  PackError perr;
  ASSERT_TRUE(WriteFileBytes(input, SingleSquareGeoJson(5000.0, 0.0)));
  ASSERT_TRUE(RunPack(input.string(), cfg, stats, perr));
  EXPECT_TRUE(fs::exists(out / "tile_5_0.json"));
  ASSERT_TRUE(WriteFileBytes(out / "notes.txt", "keep me"));

  ASSERT_TRUE(WriteFileBytes(input, SingleSquareGeoJson(0.0, 0.0)));
  ASSERT_TRUE(RunPack(input.string(), cfg, stats, perr));

  const std::vector<std::string> names = TileFileNamesIn(out);
  ASSERT_TRUE(names.size() == 1);
  EXPECT_EQ(names[0], std::string("tile_0_0.json"));
  EXPECT_FALSE(fs::exists(out / "tile_5_0.json"));
  EXPECT_TRUE(fs::exists(out / "notes.txt"));

  std::error_code ec;
  fs::remove_all(dir, ec);
}

void TestBothModePublishesNothingOnTileFailure()
{
  const fs::path dir = MakeTempPath("footpack_both_fail");
  const fs::path input = dir / "in.geojson";
  ASSERT_TRUE(WriteFileBytes(input, SingleSquareGeoJson(0.0, 0.0)));

  // "tiles" is a regular file, so the tile directory cannot be created.
  ASSERT_TRUE(WriteFileBytes(dir / "out" / "tiles", "x"));

  PackConfig cfg;
  cfg.mode = OutputMode::Both;
  cfg.outputDir = (dir / "out").string();

  RunStats stats;
  PackError perr;
  EXPECT_FALSE(RunPack(input.string(), cfg, stats, perr));
  EXPECT_TRUE(perr.kind == ErrorKind::IOFailure);
  EXPECT_FALSE(fs::exists(dir / "out" / cfg.packName));
  EXPECT_FALSE(fs::exists(dir / "out" / cfg.indexName));
  EXPECT_FALSE(fs::exists(dir / "out" / (cfg.packName + ".tmp")));

  std::error_code ec;
  fs::remove_all(dir, ec);
}

void TestLogTeeWritesFile()
{
  const fs::path dir = MakeTempPath("footpack_logtee");
  const fs::path logPath = dir / "run.log";

  LogTeeOptions opt;
  opt.path = logPath;
  std::string err;
  {
    LogTee tee;
    EXPECT_FALSE(tee.active());
    ASSERT_TRUE(tee.start(opt, err));
    EXPECT_TRUE(tee.active());
    std::cerr << "logtee first session\n";
    tee.stop();
    EXPECT_FALSE(tee.active());
  }
  const std::string first = ReadFileBytes(logPath);
  EXPECT_TRUE(first.find("[ERR] logtee first session") != std::string::npos);

  {
    LogTee tee;
    ASSERT_TRUE(tee.start(opt, err));
    std::cerr << "logtee second session\n";
  }
  // The earlier log was rotated aside.
  EXPECT_TRUE(ReadFileBytes(logPath).find("second session") != std::string::npos);
  EXPECT_EQ(ReadFileBytes(dir / "run.log.1"), first);

  std::error_code ec;
  fs::remove_all(dir, ec);
}

} // namespace

int main()
{
  // Keep pipeline chatter out of the test output.
  footpack::SetLogLevel(footpack::LogLevel::Error);

  TestTileKeyAssignment();
  TestTileKeyText();
  TestHeightRules();
  TestNormalizeValidPolygon();
  TestNormalizeSkipReasons();
  TestHoleValidity();
  TestFormatJsonNumber();
  TestCanonicalEncoding();
  TestCompressionRoundTrips();
  TestCorruptPayloadDetection();
  TestTileGrouping();
  TestPackIndexIntegrity();
  TestPackIndexJsonLayout();
  TestPackCommitAndReader();
  TestCommitFailureIsIOFailure();
  TestStagedFileDiscard();
  TestTileFileShape();
  TestGeoJsonInput();
  TestBuildTilesFromSample();
  TestAoiFiltering();
  TestConfigValidation();
  TestConfigJson();
  TestRunIsIdempotent();
  TestRunBothModes();
  TestLogLevels();
  TestFileDigest();
  TestInputBoundsCoverAllGeometry();
  TestZstdCodec();
  TestVerifyRejectsNonCanonicalPayload();
  TestStaleTileFilesRemoved();
  TestBothModePublishesNothingOnTileFailure();
  TestLogTeeWritesFile();

  if (g_failures == 0) {
    std::cout << "footpack_tests: OK\n";
    return 0;
  }

  std::cerr << "footpack_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
