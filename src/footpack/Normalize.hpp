#pragma once

#include "footpack/RawFeature.hpp"
#include "footpack/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace footpack {

// Why one raw geometry (or one part of a multi-polygon) was dropped.
enum class SkipReason : std::uint8_t {
  NullGeometry = 0,
  EmptyGeometry,
  UnsupportedType,
  MissingExterior,
  NonFiniteCoordinate,
  TooFewPoints,
  ZeroArea,
  SelfIntersection,
};

constexpr int kSkipReasonCount = 8;

// snake_case name used in logs and run summaries.
const char* SkipReasonName(SkipReason r);

struct SkippedPart {
  SkipReason reason = SkipReason::NullGeometry;
  // Index into RawGeometry::polygons (0 for whole-geometry failures).
  std::size_t part = 0;
};

// A simple polygon reduced to what the tiler needs.
struct NormalizedPolygon {
  Ring exterior;   // closed, >= 3 distinct points, finite
  Vec2 centroid;   // area centroid of the polygon (holes included)
};

struct NormalizeResult {
  std::vector<NormalizedPolygon> polygons;
  std::vector<SkippedPart> skipped;
};

// Validate and decompose one raw geometry.
//
// Multi-polygons are expanded into their parts; each part is validated on its
// own, so one bad part does not drop its siblings. Pure function.
NormalizeResult NormalizeGeometry(const RawGeometry& geometry);

// Validate a single polygon. Returns false and sets outReason when it must be skipped.
bool NormalizePolygon(const RawPolygon& polygon, NormalizedPolygon& out, SkipReason& outReason);

} // namespace footpack
