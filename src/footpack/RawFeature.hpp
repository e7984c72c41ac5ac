#pragma once

#include "footpack/Geometry.hpp"
#include "footpack/Types.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace footpack {

// Free-form attribute tags of one input feature (e.g. OSM tags).
// Ordered so iteration (and therefore logging) is deterministic.
using TagMap = std::map<std::string, std::string>;

// Polygon as read from the input: rings[0] is the exterior, the rest are holes.
// Rings may be empty, open or contain non-finite coordinates at this stage.
struct RawPolygon {
  std::vector<Ring> rings;
};

struct RawGeometry {
  enum class Type : std::uint8_t {
    Null,
    Polygon,
    MultiPolygon,
    Unsupported,
  };

  Type type = Type::Null;

  // Polygon: exactly one entry. MultiPolygon: zero or more.
  std::vector<RawPolygon> polygons;

  // GeoJSON type name as read (for diagnostics on Unsupported).
  std::string typeName;

  // Finite coordinates of the geometry as read, whatever its type (points,
  // lines, collections and malformed polygons included). Feeds the grid
  // origin.
  Bounds bounds;
};

struct RawFeature {
  RawGeometry geometry;
  TagMap tags;
};

} // namespace footpack
