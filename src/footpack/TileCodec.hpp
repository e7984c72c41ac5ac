#pragma once

#include "footpack/Types.hpp"

#include <string>
#include <vector>

namespace footpack {

class JsonWriter;

// Canonical encoding of a tile's building list.
//
// Layout (no whitespace, fixed member order):
//   [{"footprint":[[x,y],[x,y],...],"height":h},...]
//
// Numbers use the shortest round-trip form with a ".0" suffix on integral
// values, so equal inputs always produce identical bytes.
bool EncodeTileBuildings(const std::vector<BuildingRecord>& buildings, std::string& out, std::string& outError);

// Parse a canonical encoding back into records. Strict about member types;
// tolerant about member order and whitespace.
bool DecodeTileBuildings(const std::string& text, std::vector<BuildingRecord>& out, std::string& outError);

// Write the building list as a JSON array in the writer's current context.
// Shared by the canonical encoder and the per-tile file writer.
bool WriteBuildingsJson(JsonWriter& w, const std::vector<BuildingRecord>& buildings);

} // namespace footpack
