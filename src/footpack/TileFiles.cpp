#include "footpack/TileFiles.hpp"

#include "footpack/FileHash.hpp"
#include "footpack/FileSync.hpp"
#include "footpack/Json.hpp"
#include "footpack/TileCodec.hpp"

#include <set>
#include <sstream>

namespace footpack {

std::string TileFileName(const TileKey& key)
{
  return "tile_" + std::to_string(key.ix) + "_" + std::to_string(key.iy) + ".json";
}

bool WriteTileFileJson(std::ostream& os, const Tile& tile, const TileGrid& grid, std::string& outError)
{
  JsonWriteOptions opt;
  opt.pretty = false;
  opt.spacedSeparators = true;
  JsonWriter w(os, opt);

  const Vec2 origin = TileOrigin(tile.key, grid);

  w.beginObject();
  w.key("tile_origin");
  w.beginArray();
  w.numberValue(origin.x);
  w.numberValue(origin.y);
  w.endArray();

  w.key("tile_size");
  w.numberValue(grid.tileSize);

  w.key("buildings");
  if (!WriteBuildingsJson(w, tile.buildings) || !w.endObject()) {
    outError = w.error();
    return false;
  }
  if (!os) {
    outError = "stream write failed";
    return false;
  }
  return true;
}

bool ParseTileFileName(const std::string& name, TileKey& outKey)
{
  const std::string prefix = "tile_";
  const std::string suffix = ".json";
  if (name.size() <= prefix.size() + suffix.size()) return false;
  if (name.compare(0, prefix.size(), prefix) != 0) return false;
  if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) return false;

  std::string middle = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
  // "-3_7" -> "-3,7"; a minus sign never follows the separator position.
  const std::size_t sep = middle.find('_', 1);
  if (sep == std::string::npos) return false;
  middle[sep] = ',';

  TileKey k;
  if (!ParseTileKey(middle, k)) return false;
  if (TileFileName(k) != name) return false; // rejects "+1", "01" and friends
  outKey = k;
  return true;
}

bool StagedTileFiles::stage(const TileGrouping& tiles, const TileGrid& grid, const std::filesystem::path& dir,
                            PackError& outError)
{
  m_files.clear();
  m_result = TileFilesResult{};
  m_result.fnv1a64 = kFnv1a64Basis;
  m_dir = dir;

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    outError = MakeIOFailure("cannot create " + dir.string() + ": " + ec.message());
    return false;
  }

  const std::vector<const Tile*> sorted = tiles.sortedTiles();
  m_files.reserve(sorted.size());
  for (const Tile* tile : sorted) {
    std::string err;
    std::ostringstream body;
    if (!WriteTileFileJson(body, *tile, grid, err)) {
      outError = MakeIOFailure("tile " + TileKeyToString(tile->key) + ": " + err);
      m_files.clear();
      return false;
    }
    const std::string bytes = body.str();

    const std::filesystem::path path = dir / TileFileName(tile->key);
    auto f = std::make_unique<StagedFile>();
    if (!f->open(path, err) || !f->write(bytes, err) || !f->finish(err)) {
      outError = MakeIOFailure(path.string() + ": " + err);
      m_files.clear();
      return false;
    }
    m_files.push_back(std::move(f));

    m_result.files++;
    m_result.bytes += bytes.size();
    m_result.fnv1a64 = Fnv1a64(bytes.data(), bytes.size(), m_result.fnv1a64);
  }
  return true;
}

bool StagedTileFiles::commit(PackError& outError)
{
  std::set<std::string> fresh;
  for (const auto& f : m_files) fresh.insert(f->finalPath().filename().string());

  std::error_code ec;
  std::vector<std::filesystem::path> stale;
  for (std::filesystem::directory_iterator it(m_dir, ec), end; !ec && it != end; it.increment(ec)) {
    const std::string name = it->path().filename().string();
    TileKey k;
    if (!it->is_regular_file(ec) || !ParseTileFileName(name, k)) continue;
    if (fresh.count(name) == 0) stale.push_back(it->path());
  }
  if (ec) {
    outError = MakeIOFailure("cannot list " + m_dir.string() + ": " + ec.message());
    return false;
  }

  for (const std::filesystem::path& p : stale) {
    if (!std::filesystem::remove(p, ec) && ec) {
      outError = MakeIOFailure("cannot remove stale " + p.string() + ": " + ec.message());
      return false;
    }
  }

  for (const auto& f : m_files) {
    std::string err;
    if (!f->commit(err)) {
      outError = MakeIOFailure(f->finalPath().string() + ": " + err);
      return false;
    }
  }
  m_files.clear();
  return true;
}

} // namespace footpack
