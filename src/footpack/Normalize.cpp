#include "footpack/Normalize.hpp"

#include "footpack/Geometry.hpp"

#include <cmath>
#include <utility>

namespace footpack {

namespace {

// Holes must be simple, lie strictly inside the shell and stay clear of each
// other (no crossing, touching or nesting).
bool HolesAreValid(const Ring& exterior, const std::vector<Ring>& holes)
{
  for (std::size_t i = 0; i < holes.size(); ++i) {
    const Ring& h = holes[i];
    if (!RingIsSimple(h)) return false;
    if (RingsIntersect(exterior, h)) return false;
    if (!PointInRing(h.front(), exterior)) return false;

    for (std::size_t j = i + 1; j < holes.size(); ++j) {
      const Ring& o = holes[j];
      if (RingsIntersect(h, o)) return false;
      if (PointInRing(h.front(), o) || PointInRing(o.front(), h)) return false;
    }
  }
  return true;
}

} // namespace

const char* SkipReasonName(SkipReason r)
{
  switch (r) {
  case SkipReason::NullGeometry: return "null_geometry";
  case SkipReason::EmptyGeometry: return "empty_geometry";
  case SkipReason::UnsupportedType: return "unsupported_type";
  case SkipReason::MissingExterior: return "missing_exterior";
  case SkipReason::NonFiniteCoordinate: return "non_finite_coordinate";
  case SkipReason::TooFewPoints: return "too_few_points";
  case SkipReason::ZeroArea: return "zero_area";
  case SkipReason::SelfIntersection: return "self_intersection";
  }
  return "unknown";
}

bool NormalizePolygon(const RawPolygon& polygon, NormalizedPolygon& out, SkipReason& outReason)
{
  if (polygon.rings.empty() || polygon.rings.front().empty()) {
    outReason = SkipReason::MissingExterior;
    return false;
  }

  for (const Ring& r : polygon.rings) {
    if (!RingIsFinite(r)) {
      outReason = SkipReason::NonFiniteCoordinate;
      return false;
    }
  }

  for (const Ring& r : polygon.rings) {
    if (CountDistinctPoints(r) < 3) {
      outReason = SkipReason::TooFewPoints;
      return false;
    }
  }

  const Ring& exterior = polygon.rings.front();
  const double area = RingSignedArea(exterior);
  if (!(std::fabs(area) > 0.0)) {
    outReason = SkipReason::ZeroArea;
    return false;
  }

  if (!RingIsSimple(exterior)) {
    outReason = SkipReason::SelfIntersection;
    return false;
  }

  const std::vector<Ring> holes(polygon.rings.begin() + 1, polygon.rings.end());
  if (!HolesAreValid(exterior, holes)) {
    outReason = SkipReason::SelfIntersection;
    return false;
  }

  Vec2 c;
  if (!PolygonCentroid(exterior, holes, c)) {
    // Holes cancel out the whole exterior.
    outReason = SkipReason::ZeroArea;
    return false;
  }

  out.exterior = CloseRing(exterior);
  out.centroid = c;
  return true;
}

NormalizeResult NormalizeGeometry(const RawGeometry& geometry)
{
  NormalizeResult res;

  switch (geometry.type) {
  case RawGeometry::Type::Null:
    res.skipped.push_back(SkippedPart{SkipReason::NullGeometry, 0});
    return res;
  case RawGeometry::Type::Unsupported:
    res.skipped.push_back(SkippedPart{SkipReason::UnsupportedType, 0});
    return res;
  case RawGeometry::Type::Polygon:
  case RawGeometry::Type::MultiPolygon:
    break;
  }

  bool anyRing = false;
  for (const RawPolygon& p : geometry.polygons) {
    for (const Ring& r : p.rings) {
      if (!r.empty()) anyRing = true;
    }
  }
  if (!anyRing) {
    res.skipped.push_back(SkippedPart{SkipReason::EmptyGeometry, 0});
    return res;
  }

  for (std::size_t i = 0; i < geometry.polygons.size(); ++i) {
    NormalizedPolygon np;
    SkipReason reason = SkipReason::EmptyGeometry;
    if (NormalizePolygon(geometry.polygons[i], np, reason)) {
      res.polygons.push_back(std::move(np));
    } else {
      res.skipped.push_back(SkippedPart{reason, i});
    }
  }
  return res;
}

} // namespace footpack
