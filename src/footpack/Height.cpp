#include "footpack/Height.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <string>

namespace footpack {

namespace {

std::string_view Trim(std::string_view s)
{
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0) s.remove_suffix(1);
  return s;
}

bool Usable(double v)
{
  return std::isfinite(v) && v > 0.0;
}

} // namespace

const char* HeightSourceName(HeightSource s)
{
  switch (s) {
  case HeightSource::ExplicitHeight: return "height";
  case HeightSource::Levels: return "levels";
  case HeightSource::Default: return "default";
  }
  return "unknown";
}

bool ParseTagNumber(std::string_view s, double& out)
{
  s = Trim(s);
  if (s.empty()) return false;

  // strtod would also take hex floats; tag values never use them.
  for (char c : s) {
    if (c == 'x' || c == 'X') return false;
  }

  const std::string tmp(s);
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(tmp.c_str(), &end);
  if (end == tmp.c_str() || !end || *end != '\0') return false;
  if (errno == ERANGE && std::isinf(v)) return false;
  if (!std::isfinite(v)) return false;
  out = v;
  return true;
}

bool ParseHeightValue(std::string_view s, double& out)
{
  // Every lowercase 'm' goes, wherever it sits ("12m", "12 m"); "M" is not a unit.
  std::string tmp;
  tmp.reserve(s.size());
  for (char c : s) {
    if (c != 'm') tmp.push_back(c);
  }
  return ParseTagNumber(tmp, out);
}

HeightTags ExtractHeightTags(const TagMap& tags, const HeightConfig& cfg)
{
  HeightTags out;
  const auto h = tags.find(cfg.heightTag);
  if (h != tags.end() && !h->second.empty()) out.height = h->second;
  const auto l = tags.find(cfg.levelsTag);
  if (l != tags.end() && !l->second.empty()) out.levels = l->second;
  return out;
}

HeightEstimate EstimateHeight(const HeightTags& tags, const HeightConfig& cfg)
{
  HeightEstimate est;

  if (tags.height) {
    double v = 0.0;
    if (ParseHeightValue(*tags.height, v) && Usable(v)) {
      est.height = v;
      est.source = HeightSource::ExplicitHeight;
      return est;
    }
    est.heightRejected = true;
  }

  if (tags.levels) {
    double levels = 0.0;
    if (ParseTagNumber(*tags.levels, levels)) {
      const double v = levels * cfg.levelHeight;
      if (Usable(v)) {
        est.height = v;
        est.source = HeightSource::Levels;
        return est;
      }
    }
    est.levelsRejected = true;
  }

  est.height = cfg.defaultHeight;
  est.source = HeightSource::Default;
  return est;
}

HeightEstimate EstimateHeight(const TagMap& tags, const HeightConfig& cfg)
{
  return EstimateHeight(ExtractHeightTags(tags, cfg), cfg);
}

} // namespace footpack
