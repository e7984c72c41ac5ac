#pragma once

#include "footpack/Types.hpp"

#include <cmath>
#include <cstddef>
#include <vector>

namespace footpack {

// -----------------------------------------------------------------------------------------------
// Planar polygon helpers (dependency-free)
//
// Rings are sequences of Vec2. Functions accept open or closed rings unless
// stated otherwise; a closing point equal to the first point is ignored.
// -----------------------------------------------------------------------------------------------

struct Bounds {
  double minx = 0.0;
  double miny = 0.0;
  double maxx = 0.0;
  double maxy = 0.0;
  bool valid = false;

  void extend(const Vec2& p);
  void extend(const Bounds& b);
  bool contains(const Vec2& p) const;
};

inline bool IsFinitePoint(const Vec2& p)
{
  return std::isfinite(p.x) && std::isfinite(p.y);
}

// True if every coordinate of the ring is finite.
bool RingIsFinite(const Ring& ring);

// Number of distinct points (exact comparison), ignoring order.
std::size_t CountDistinctPoints(const Ring& ring);

// Remove consecutive duplicates and the closing point. Result is an open ring.
Ring OpenRingWithoutDuplicates(const Ring& ring);

// Return a closed copy (appends the first point when missing).
Ring CloseRing(const Ring& ring);

// Shoelace signed area (counter-clockwise positive).
double RingSignedArea(const Ring& ring);

// True if no two edges of the ring intersect except adjacent edges at their
// shared vertex. Expects a ring with at least 3 distinct points.
bool RingIsSimple(const Ring& ring);

// Area-weighted centroid of a polygon (exterior minus holes).
//
// Returns false when the net area is zero.
// True if any edge of `a` touches or crosses any edge of `b`.
bool RingsIntersect(const Ring& a, const Ring& b);

bool PolygonCentroid(const Ring& exterior, const std::vector<Ring>& holes, Vec2& outCentroid);

// Even-odd point in ring test. Points exactly on an edge may land either way.
bool PointInRing(const Vec2& p, const Ring& ring);

} // namespace footpack
