#pragma once

#include "footpack/Json.hpp"
#include "footpack/RawFeature.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace footpack {

// GeoJSON reader for the building footprint input.
//
// Accepts a FeatureCollection, a single Feature, or a bare geometry. Input
// coordinates are expected in a planar meter reference already.
//
// Structural problems with the document itself (not JSON, no features array,
// a feature that is not an object) are errors. Problems inside one geometry
// (bad coordinate nesting, unknown type) are not: that feature's geometry is
// returned as Unsupported so the normalizer can skip it and the run goes on.

struct GeoJsonReadStats {
  std::size_t features = 0;
  std::size_t malformedGeometries = 0;
};

// Convert one GeoJSON geometry object (or null) to a RawGeometry.
// Returns false only when the value is neither null nor an object.
bool ParseGeoJsonGeometry(const JsonValue& geometry, RawGeometry& out, std::string& outError);

// Tag dictionary from a Feature's "properties". Strings are kept, numbers are
// rendered in shortest form ("3", "12.5"), booleans become "yes"/"no", other
// values are ignored.
TagMap TagsFromProperties(const JsonValue& properties);

bool ParseGeoJsonFeatures(const JsonValue& root, std::vector<RawFeature>& out, std::string& outError,
                          GeoJsonReadStats* outStats = nullptr);

// Read and parse a file. NaN/Infinity literals are accepted.
bool ReadGeoJsonFile(const std::string& path, std::vector<RawFeature>& out, std::string& outError,
                     GeoJsonReadStats* outStats = nullptr);

} // namespace footpack
