#include "footpack/Aoi.hpp"

#include "footpack/GeoJsonInput.hpp"
#include "footpack/Json.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace footpack {

AreaOfInterest AreaOfInterest::MakeBBox(const Bounds& b)
{
  AreaOfInterest a;
  a.m_kind = Kind::BBox;
  a.m_bbox = b;
  return a;
}

AreaOfInterest AreaOfInterest::MakePolygon(std::vector<Ring> rings, std::string sourcePath)
{
  AreaOfInterest a;
  a.m_kind = Kind::Polygon;
  a.m_rings = std::move(rings);
  a.m_source = std::move(sourcePath);
  for (const Ring& r : a.m_rings) {
    for (const Vec2& p : r) a.m_bbox.extend(p);
  }
  return a;
}

bool AreaOfInterest::contains(const Vec2& p) const
{
  switch (m_kind) {
  case Kind::None: return true;
  case Kind::BBox: return m_bbox.contains(p);
  case Kind::Polygon: {
    if (!m_bbox.contains(p)) return false;
    bool inside = false;
    for (const Ring& r : m_rings) {
      if (PointInRing(p, r)) inside = !inside;
    }
    return inside;
  }
  }
  return false;
}

bool ParseBBox(const std::string& s, Bounds& out)
{
  double v[4] = {0.0, 0.0, 0.0, 0.0};
  std::size_t start = 0;
  for (int k = 0; k < 4; ++k) {
    const std::size_t comma = s.find(',', start);
    const bool last = (k == 3);
    if (last != (comma == std::string::npos)) return false;
    const std::string part = s.substr(start, last ? std::string::npos : comma - start);
    if (part.empty()) return false;
    char* end = nullptr;
    errno = 0;
    const double d = std::strtod(part.c_str(), &end);
    if (errno != 0 || !end || *end != '\0' || !std::isfinite(d)) return false;
    v[k] = d;
    start = comma + 1;
  }
  if (!(v[0] < v[2]) || !(v[1] < v[3])) return false;

  Bounds b;
  b.extend(Vec2{v[0], v[1]});
  b.extend(Vec2{v[2], v[3]});
  out = b;
  return true;
}

bool LoadAoiGeoJson(const std::string& path, AreaOfInterest& out, std::string& outError)
{
  std::vector<RawFeature> features;
  if (!ReadGeoJsonFile(path, features, outError)) return false;

  std::vector<Ring> rings;
  for (const RawFeature& f : features) {
    for (const RawPolygon& p : f.geometry.polygons) {
      for (const Ring& r : p.rings) {
        if (!RingIsFinite(r) || CountDistinctPoints(r) < 3) {
          outError = path + ": AOI contains a degenerate or non-finite ring";
          return false;
        }
        rings.push_back(r);
      }
    }
  }

  if (rings.empty()) {
    outError = path + ": no polygon found for the area of interest";
    return false;
  }

  out = AreaOfInterest::MakePolygon(std::move(rings), path);
  outError.clear();
  return true;
}

} // namespace footpack
