#include "footpack/Geometry.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <utility>

namespace footpack {

namespace {

// Orientation of (a, b, c): >0 counter-clockwise, <0 clockwise, 0 collinear.
int Orient(const Vec2& a, const Vec2& b, const Vec2& c)
{
  const double v = (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
  if (v > 0.0) return 1;
  if (v < 0.0) return -1;
  return 0;
}

// q lies on segment [a, b], given a, b, q collinear.
bool OnSegment(const Vec2& a, const Vec2& b, const Vec2& q)
{
  return q.x >= std::min(a.x, b.x) && q.x <= std::max(a.x, b.x) &&
         q.y >= std::min(a.y, b.y) && q.y <= std::max(a.y, b.y);
}

bool SegmentsIntersect(const Vec2& p1, const Vec2& p2, const Vec2& q1, const Vec2& q2)
{
  const int o1 = Orient(p1, p2, q1);
  const int o2 = Orient(p1, p2, q2);
  const int o3 = Orient(q1, q2, p1);
  const int o4 = Orient(q1, q2, p2);

  if (o1 != o2 && o3 != o4) return true;

  if (o1 == 0 && OnSegment(p1, p2, q1)) return true;
  if (o2 == 0 && OnSegment(p1, p2, q2)) return true;
  if (o3 == 0 && OnSegment(q1, q2, p1)) return true;
  if (o4 == 0 && OnSegment(q1, q2, p2)) return true;
  return false;
}

std::size_t OpenSize(const Ring& ring)
{
  std::size_t n = ring.size();
  if (n >= 2 && ring.front() == ring.back()) --n;
  return n;
}

struct RingMoments {
  double area = 0.0; // signed
  double cx = 0.0;   // sum of (xi + xj) * cross, relative to origin
  double cy = 0.0;
};

// Accumulate shoelace moments relative to `origin` to keep precision with
// large projected coordinates.
RingMoments Moments(const Ring& ring, const Vec2& origin)
{
  RingMoments m;
  const std::size_t n = OpenSize(ring);
  if (n < 3) return m;
  for (std::size_t i = 0; i < n; ++i) {
    const Vec2& a = ring[i];
    const Vec2& b = ring[(i + 1) % n];
    const double ax = a.x - origin.x;
    const double ay = a.y - origin.y;
    const double bx = b.x - origin.x;
    const double by = b.y - origin.y;
    const double cross = ax * by - bx * ay;
    m.area += cross;
    m.cx += (ax + bx) * cross;
    m.cy += (ay + by) * cross;
  }
  m.area *= 0.5;
  return m;
}

} // namespace

void Bounds::extend(const Vec2& p)
{
  if (!valid) {
    minx = maxx = p.x;
    miny = maxy = p.y;
    valid = true;
    return;
  }
  minx = std::min(minx, p.x);
  miny = std::min(miny, p.y);
  maxx = std::max(maxx, p.x);
  maxy = std::max(maxy, p.y);
}

void Bounds::extend(const Bounds& b)
{
  if (!b.valid) return;
  extend(Vec2{b.minx, b.miny});
  extend(Vec2{b.maxx, b.maxy});
}

bool Bounds::contains(const Vec2& p) const
{
  return valid && p.x >= minx && p.x <= maxx && p.y >= miny && p.y <= maxy;
}

bool RingIsFinite(const Ring& ring)
{
  return std::all_of(ring.begin(), ring.end(), [](const Vec2& p) { return IsFinitePoint(p); });
}

std::size_t CountDistinctPoints(const Ring& ring)
{
  std::set<std::pair<double, double>> seen;
  for (const Vec2& p : ring) seen.emplace(p.x, p.y);
  return seen.size();
}

Ring OpenRingWithoutDuplicates(const Ring& ring)
{
  Ring out;
  out.reserve(ring.size());
  for (const Vec2& p : ring) {
    if (!out.empty() && out.back() == p) continue;
    out.push_back(p);
  }
  while (out.size() >= 2 && out.front() == out.back()) out.pop_back();
  return out;
}

Ring CloseRing(const Ring& ring)
{
  Ring out = ring;
  if (!out.empty() && out.front() != out.back()) out.push_back(out.front());
  return out;
}

double RingSignedArea(const Ring& ring)
{
  if (ring.empty()) return 0.0;
  return Moments(ring, ring.front()).area;
}

bool RingIsSimple(const Ring& ring)
{
  const Ring r = OpenRingWithoutDuplicates(ring);
  const std::size_t n = r.size();
  if (n < 3) return false;

  for (std::size_t i = 0; i < n; ++i) {
    const Vec2& a1 = r[i];
    const Vec2& a2 = r[(i + 1) % n];

    for (std::size_t j = i + 1; j < n; ++j) {
      const Vec2& b1 = r[j];
      const Vec2& b2 = r[(j + 1) % n];

      const bool nextAdjacent = (j == i + 1);
      const bool wrapAdjacent = (i == 0 && j == n - 1);

      if (nextAdjacent || wrapAdjacent) {
        // Adjacent edges share exactly one vertex. They are only allowed to
        // meet there, so a collinear fold-back is a self-overlap.
        const Vec2& shared = nextAdjacent ? a2 : a1;
        const Vec2& other1 = nextAdjacent ? a1 : a2;
        const Vec2& other2 = nextAdjacent ? b2 : b1;
        if (Orient(shared, other1, other2) == 0) {
          const double dx1 = other1.x - shared.x;
          const double dy1 = other1.y - shared.y;
          const double dx2 = other2.x - shared.x;
          const double dy2 = other2.y - shared.y;
          if (dx1 * dx2 + dy1 * dy2 > 0.0) return false;
        }
        // A triangle has every edge pair adjacent, nothing else to check.
        continue;
      }

      if (SegmentsIntersect(a1, a2, b1, b2)) return false;
    }
  }
  return true;
}

bool RingsIntersect(const Ring& a, const Ring& b)
{
  const Ring ra = OpenRingWithoutDuplicates(a);
  const Ring rb = OpenRingWithoutDuplicates(b);
  const std::size_t na = ra.size();
  const std::size_t nb = rb.size();
  for (std::size_t i = 0; i < na; ++i) {
    for (std::size_t j = 0; j < nb; ++j) {
      if (SegmentsIntersect(ra[i], ra[(i + 1) % na], rb[j], rb[(j + 1) % nb])) return true;
    }
  }
  return false;
}

bool PolygonCentroid(const Ring& exterior, const std::vector<Ring>& holes, Vec2& outCentroid)
{
  if (exterior.empty()) return false;
  const Vec2 origin = exterior.front();

  const RingMoments ext = Moments(exterior, origin);
  double area = std::fabs(ext.area);
  // Normalize orientation so the exterior contributes positively.
  const double extSign = ext.area < 0.0 ? -1.0 : 1.0;
  double cx = ext.cx * extSign;
  double cy = ext.cy * extSign;

  for (const Ring& h : holes) {
    const RingMoments hm = Moments(h, origin);
    const double hSign = hm.area < 0.0 ? -1.0 : 1.0;
    area -= std::fabs(hm.area);
    cx -= hm.cx * hSign;
    cy -= hm.cy * hSign;
  }

  if (!(area > 0.0) || !std::isfinite(area)) return false;

  // cx / (6 * A), with A the (positive) net area.
  outCentroid.x = origin.x + cx / (6.0 * area);
  outCentroid.y = origin.y + cy / (6.0 * area);
  return std::isfinite(outCentroid.x) && std::isfinite(outCentroid.y);
}

bool PointInRing(const Vec2& p, const Ring& ring)
{
  const std::size_t n = OpenSize(ring);
  if (n < 3) return false;
  bool inside = false;
  for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
    const Vec2& a = ring[i];
    const Vec2& b = ring[j];
    if ((a.y > p.y) != (b.y > p.y)) {
      const double xCross = (b.x - a.x) * (p.y - a.y) / (b.y - a.y) + a.x;
      if (p.x < xCross) inside = !inside;
    }
  }
  return inside;
}

} // namespace footpack
