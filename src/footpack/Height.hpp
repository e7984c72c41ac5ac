#pragma once

#include "footpack/RawFeature.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace footpack {

struct HeightConfig {
  // Used when neither an explicit height nor a level count is usable.
  double defaultHeight = 5.0;

  // Meters per storey, applied to the level-count tag.
  double levelHeight = 5.0;

  std::string heightTag = "height";
  std::string levelsTag = "building:levels";
};

enum class HeightSource : std::uint8_t {
  ExplicitHeight = 0,
  Levels,
  Default,
};

const char* HeightSourceName(HeightSource s);

// The recognized tags, pulled out of the free-form dictionary up front.
// Empty values count as absent.
struct HeightTags {
  std::optional<std::string> height;
  std::optional<std::string> levels;
};

HeightTags ExtractHeightTags(const TagMap& tags, const HeightConfig& cfg);

struct HeightEstimate {
  double height = 0.0;
  HeightSource source = HeightSource::Default;

  // Rules whose tag was present but did not produce a usable value.
  bool heightRejected = false;
  bool levelsRejected = false;

  int fallbacks() const { return (heightRejected ? 1 : 0) + (levelsRejected ? 1 : 0); }
};

// Ordered rules, first success wins:
//   1) explicit height tag ("12", "12m", " 12.5 m ")
//   2) level count * levelHeight
//   3) defaultHeight
// Never fails; a rule that cannot parse falls through to the next one.
HeightEstimate EstimateHeight(const HeightTags& tags, const HeightConfig& cfg);
HeightEstimate EstimateHeight(const TagMap& tags, const HeightConfig& cfg);

// Parse a height value after dropping every lowercase "m" ("12m", "12 m").
// An uppercase "M" is rejected. Accepts only finite values; the caller
// decides about the sign.
bool ParseHeightValue(std::string_view s, double& out);

// Parse a plain floating value (surrounding whitespace allowed, finite only).
bool ParseTagNumber(std::string_view s, double& out);

} // namespace footpack
