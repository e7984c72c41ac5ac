#include "footpack/GeoJsonInput.hpp"

#include <cmath>
#include <utility>

namespace footpack {

namespace {

bool ReadPosition(const JsonValue& v, Vec2& out)
{
  if (!v.isArray() || v.arrayValue.size() < 2) return false;
  const JsonValue& x = v.arrayValue[0];
  const JsonValue& y = v.arrayValue[1];
  if (!x.isNumber() || !y.isNumber()) return false;
  out.x = x.numberValue;
  out.y = y.numberValue;
  return true;
}

bool ReadRing(const JsonValue& v, Ring& out)
{
  if (!v.isArray()) return false;
  out.clear();
  out.reserve(v.arrayValue.size());
  for (const JsonValue& pv : v.arrayValue) {
    Vec2 p;
    if (!ReadPosition(pv, p)) return false;
    out.push_back(p);
  }
  return true;
}

bool ReadPolygonCoords(const JsonValue& v, RawPolygon& out)
{
  if (!v.isArray()) return false;
  out.rings.clear();
  out.rings.reserve(v.arrayValue.size());
  for (const JsonValue& rv : v.arrayValue) {
    Ring r;
    if (!ReadRing(rv, r)) return false;
    out.rings.push_back(std::move(r));
  }
  return true;
}

// Any nesting depth: a position is an array whose first two members are
// numbers, everything else is walked.
void ExtendCoordinateBounds(const JsonValue& v, Bounds& b)
{
  if (!v.isArray()) return;
  const auto& a = v.arrayValue;
  if (a.size() >= 2 && a[0].isNumber() && a[1].isNumber()) {
    const Vec2 p{a[0].numberValue, a[1].numberValue};
    if (IsFinitePoint(p)) b.extend(p);
    return;
  }
  for (const JsonValue& e : a) ExtendCoordinateBounds(e, b);
}

void ExtendGeometryBounds(const JsonValue& geometry, Bounds& b)
{
  if (!geometry.isObject()) return;
  if (const JsonValue* coords = FindJsonMember(geometry, "coordinates")) ExtendCoordinateBounds(*coords, b);
  if (const JsonValue* parts = FindJsonMember(geometry, "geometries")) {
    if (parts->isArray()) {
      for (const JsonValue& g : parts->arrayValue) ExtendGeometryBounds(g, b);
    }
  }
}

std::string NumberTag(double v)
{
  if (std::isnan(v)) return "nan";
  if (std::isinf(v)) return v > 0 ? "inf" : "-inf";
  if (v == std::floor(v) && std::fabs(v) < 1e15) {
    return std::to_string(static_cast<long long>(v));
  }
  std::string s;
  if (!FormatJsonNumber(v, s)) return std::string();
  return s;
}

} // namespace

bool ParseGeoJsonGeometry(const JsonValue& geometry, RawGeometry& out, std::string& outError)
{
  out = RawGeometry{};

  if (geometry.isNull()) {
    out.type = RawGeometry::Type::Null;
    return true;
  }
  if (!geometry.isObject()) {
    outError = "geometry must be an object or null";
    return false;
  }

  const JsonValue* type = FindJsonMember(geometry, "type");
  out.typeName = (type && type->isString()) ? type->stringValue : std::string();
  out.type = RawGeometry::Type::Unsupported;
  ExtendGeometryBounds(geometry, out.bounds);

  const JsonValue* coords = FindJsonMember(geometry, "coordinates");
  if (!coords || !coords->isArray()) return true;

  if (out.typeName == "Polygon") {
    RawPolygon p;
    if (!ReadPolygonCoords(*coords, p)) return true;
    out.type = RawGeometry::Type::Polygon;
    out.polygons.push_back(std::move(p));
    return true;
  }

  if (out.typeName == "MultiPolygon") {
    std::vector<RawPolygon> polys;
    polys.reserve(coords->arrayValue.size());
    for (const JsonValue& pv : coords->arrayValue) {
      RawPolygon p;
      if (!ReadPolygonCoords(pv, p)) return true;
      polys.push_back(std::move(p));
    }
    out.type = RawGeometry::Type::MultiPolygon;
    out.polygons = std::move(polys);
    return true;
  }

  return true;
}

TagMap TagsFromProperties(const JsonValue& properties)
{
  TagMap tags;
  if (!properties.isObject()) return tags;
  for (const auto& kv : properties.objectValue) {
    const JsonValue& v = kv.second;
    switch (v.type) {
    case JsonValue::Type::String: tags[kv.first] = v.stringValue; break;
    case JsonValue::Type::Number: tags[kv.first] = NumberTag(v.numberValue); break;
    case JsonValue::Type::Bool: tags[kv.first] = v.boolValue ? "yes" : "no"; break;
    default: break;
    }
  }
  return tags;
}

bool ParseGeoJsonFeatures(const JsonValue& root, std::vector<RawFeature>& out, std::string& outError,
                          GeoJsonReadStats* outStats)
{
  out.clear();
  GeoJsonReadStats stats;

  auto addFeature = [&](const JsonValue& feature, std::size_t index) -> bool {
    if (!feature.isObject()) {
      outError = "feature " + std::to_string(index) + " is not an object";
      return false;
    }
    RawFeature f;
    const JsonValue* geom = FindJsonMember(feature, "geometry");
    std::string err;
    if (geom && !ParseGeoJsonGeometry(*geom, f.geometry, err)) {
      outError = "feature " + std::to_string(index) + ": " + err;
      return false;
    }
    if (f.geometry.type == RawGeometry::Type::Unsupported &&
        (f.geometry.typeName == "Polygon" || f.geometry.typeName == "MultiPolygon")) {
      ++stats.malformedGeometries;
    }
    if (const JsonValue* props = FindJsonMember(feature, "properties")) {
      f.tags = TagsFromProperties(*props);
    }
    out.push_back(std::move(f));
    ++stats.features;
    return true;
  };

  if (!root.isObject()) {
    outError = "GeoJSON root must be an object";
    return false;
  }

  const JsonValue* type = FindJsonMember(root, "type");
  const std::string typeName = (type && type->isString()) ? type->stringValue : std::string();

  if (typeName == "FeatureCollection") {
    const JsonValue* features = FindJsonMember(root, "features");
    if (!features || !features->isArray()) {
      outError = "FeatureCollection without a features array";
      return false;
    }
    out.reserve(features->arrayValue.size());
    for (std::size_t i = 0; i < features->arrayValue.size(); ++i) {
      if (!addFeature(features->arrayValue[i], i)) return false;
    }
  } else if (typeName == "Feature") {
    if (!addFeature(root, 0)) return false;
  } else if (!typeName.empty()) {
    // Bare geometry: one feature without tags.
    RawFeature f;
    std::string err;
    if (!ParseGeoJsonGeometry(root, f.geometry, err)) {
      outError = err;
      return false;
    }
    out.push_back(std::move(f));
    ++stats.features;
  } else {
    outError = "GeoJSON object has no type";
    return false;
  }

  if (outStats) *outStats = stats;
  outError.clear();
  return true;
}

bool ReadGeoJsonFile(const std::string& path, std::vector<RawFeature>& out, std::string& outError,
                     GeoJsonReadStats* outStats)
{
  JsonParseOptions opt;
  opt.allowNonFinite = true;

  JsonValue root;
  if (!ParseJsonFile(path, root, outError, opt)) return false;

  std::string err;
  if (!ParseGeoJsonFeatures(root, out, err, outStats)) {
    outError = path + ": " + err;
    return false;
  }
  outError.clear();
  return true;
}

} // namespace footpack
