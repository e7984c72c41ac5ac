#include "footpack/TileCodec.hpp"

#include "footpack/Json.hpp"

#include <sstream>
#include <utility>

namespace footpack {

bool WriteBuildingsJson(JsonWriter& w, const std::vector<BuildingRecord>& buildings)
{
  w.beginArray();
  for (const BuildingRecord& b : buildings) {
    w.beginObject();
    w.key("footprint");
    w.beginArray();
    for (const Vec2& p : b.footprint) {
      w.beginArray();
      w.numberValue(p.x);
      w.numberValue(p.y);
      w.endArray();
    }
    w.endArray();
    w.key("height");
    w.numberValue(b.height);
    w.endObject();
    if (!w.ok()) return false;
  }
  w.endArray();
  return w.ok();
}

bool EncodeTileBuildings(const std::vector<BuildingRecord>& buildings, std::string& out, std::string& outError)
{
  std::ostringstream oss;
  JsonWriteOptions opt;
  opt.pretty = false;
  JsonWriter w(oss, opt);
  if (!WriteBuildingsJson(w, buildings)) {
    outError = "tile encoding failed: " + w.error();
    return false;
  }
  out = oss.str();
  outError.clear();
  return true;
}

namespace {

bool ReadPoint(const JsonValue& v, Vec2& out)
{
  if (!v.isArray() || v.arrayValue.size() != 2) return false;
  if (!v.arrayValue[0].isNumber() || !v.arrayValue[1].isNumber()) return false;
  out.x = v.arrayValue[0].numberValue;
  out.y = v.arrayValue[1].numberValue;
  return true;
}

} // namespace

bool DecodeTileBuildings(const std::string& text, std::vector<BuildingRecord>& out, std::string& outError)
{
  out.clear();

  JsonValue root;
  std::string err;
  if (!ParseJson(text, root, err)) {
    outError = "tile payload is not valid JSON: " + err;
    return false;
  }
  if (!root.isArray()) {
    outError = "tile payload must be a JSON array";
    return false;
  }

  out.reserve(root.arrayValue.size());
  for (std::size_t i = 0; i < root.arrayValue.size(); ++i) {
    const JsonValue& b = root.arrayValue[i];
    const JsonValue* fp = FindJsonMember(b, "footprint");
    const JsonValue* h = FindJsonMember(b, "height");
    if (!fp || !fp->isArray() || !h || !h->isNumber()) {
      outError = "building " + std::to_string(i) + ": expected {footprint:[...], height:number}";
      return false;
    }

    BuildingRecord rec;
    rec.height = h->numberValue;
    rec.footprint.reserve(fp->arrayValue.size());
    for (const JsonValue& pv : fp->arrayValue) {
      Vec2 p;
      if (!ReadPoint(pv, p)) {
        outError = "building " + std::to_string(i) + ": footprint point must be [x, y]";
        return false;
      }
      rec.footprint.push_back(p);
    }
    out.push_back(std::move(rec));
  }

  outError.clear();
  return true;
}

} // namespace footpack
