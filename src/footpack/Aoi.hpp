#pragma once

#include "footpack/Geometry.hpp"
#include "footpack/Types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace footpack {

// Area of interest: restricts which buildings are tiled.
//
// A building is kept iff its centroid lies inside. The AOI never moves the
// grid origin (the global minimum bound is computed over all input).
class AreaOfInterest {
public:
  enum class Kind : std::uint8_t {
    None,
    BBox,
    Polygon,
  };

  static AreaOfInterest MakeBBox(const Bounds& b);
  // Even-odd rule over all rings (exteriors and holes of every polygon).
  static AreaOfInterest MakePolygon(std::vector<Ring> rings, std::string sourcePath = {});

  Kind kind() const { return m_kind; }
  bool enabled() const { return m_kind != Kind::None; }
  const Bounds& bbox() const { return m_bbox; }
  const std::vector<Ring>& rings() const { return m_rings; }
  const std::string& sourcePath() const { return m_source; }

  bool contains(const Vec2& p) const;

private:
  Kind m_kind = Kind::None;
  Bounds m_bbox;
  std::vector<Ring> m_rings;
  std::string m_source;
};

// "minx,miny,maxx,maxy" with minx < maxx and miny < maxy.
bool ParseBBox(const std::string& s, Bounds& out);

// Load an AOI polygon from a GeoJSON file (Polygon, MultiPolygon, Feature or
// FeatureCollection; every polygon ring found is used).
bool LoadAoiGeoJson(const std::string& path, AreaOfInterest& out, std::string& outError);

} // namespace footpack
