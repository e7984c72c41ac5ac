#include "footpack/PackReader.hpp"

#include "footpack/TileCodec.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <unordered_set>

namespace footpack {

namespace {

// Largest integer a double holds exactly; index numbers are parsed as double.
constexpr double kMaxExactInteger = 9007199254740992.0;

bool ReadU64Member(const JsonValue& obj, const char* name, std::uint64_t& out, std::string& err)
{
  const JsonValue* v = FindJsonMember(obj, name);
  if (!v || !v->isNumber()) {
    err = std::string("missing numeric '") + name + "'";
    return false;
  }
  const double d = v->numberValue;
  if (!std::isfinite(d) || d < 0.0 || d != std::floor(d) || d > kMaxExactInteger) {
    err = std::string("'") + name + "' is not a non-negative integer";
    return false;
  }
  out = static_cast<std::uint64_t>(d);
  return true;
}

} // namespace

bool ParsePackIndexJson(const JsonValue& root, std::vector<PackIndexEntry>& out, std::string& outError)
{
  out.clear();
  if (!root.isObject()) {
    outError = "index root must be an object";
    return false;
  }

  std::unordered_set<TileKey, TileKeyHash> seen;
  out.reserve(root.objectValue.size());
  for (const auto& kv : root.objectValue) {
    PackIndexEntry e;
    if (!ParseTileKey(kv.first, e.key)) {
      outError = "bad tile key '" + kv.first + "'";
      return false;
    }
    if (!seen.insert(e.key).second) {
      outError = "duplicate tile key '" + kv.first + "'";
      return false;
    }
    if (!kv.second.isObject()) {
      outError = "entry '" + kv.first + "' is not an object";
      return false;
    }
    std::string err;
    if (!ReadU64Member(kv.second, "offset", e.offset, err) || !ReadU64Member(kv.second, "length", e.length, err)) {
      outError = "entry '" + kv.first + "': " + err;
      return false;
    }
    out.push_back(e);
  }

  std::sort(out.begin(), out.end(),
            [](const PackIndexEntry& a, const PackIndexEntry& b) { return a.key < b.key; });
  outError.clear();
  return true;
}

bool LoadPackIndex(const std::string& path, std::vector<PackIndexEntry>& out, std::string& outError)
{
  JsonValue root;
  std::string err;
  if (!ParseJsonFile(path, root, err)) {
    outError = path + ": " + err;
    return false;
  }
  if (!ParsePackIndexJson(root, out, err)) {
    outError = path + ": " + err;
    return false;
  }
  return true;
}

bool PackReader::open(const std::string& blobPath, const std::string& indexPath, CompressionMethod method,
                      std::string& outError)
{
  m_entries.clear();
  m_lookup.clear();
  if (m_blob.is_open()) m_blob.close();
  m_blob.clear();
  m_method = method;
  m_blobPath = blobPath;

  if (!LoadPackIndex(indexPath, m_entries, outError)) return false;

  std::error_code ec;
  const auto size = std::filesystem::file_size(blobPath, ec);
  if (ec) {
    outError = "cannot stat " + blobPath + ": " + ec.message();
    return false;
  }
  m_blobSize = static_cast<std::uint64_t>(size);

  m_blob.open(blobPath, std::ios::binary);
  if (!m_blob) {
    outError = "cannot open " + blobPath + ": " + std::strerror(errno);
    return false;
  }

  m_lookup.reserve(m_entries.size());
  for (std::size_t i = 0; i < m_entries.size(); ++i) m_lookup.emplace(m_entries[i].key, i);
  outError.clear();
  return true;
}

const PackIndexEntry* PackReader::find(const TileKey& key) const
{
  auto it = m_lookup.find(key);
  return it == m_lookup.end() ? nullptr : &m_entries[it->second];
}

bool PackReader::readCompressed(const PackIndexEntry& e, std::vector<std::uint8_t>& out, std::string& outError)
{
  out.clear();
  if (!m_blob.is_open()) {
    outError = "pack is not open";
    return false;
  }
  if (e.offset > m_blobSize || e.length > m_blobSize - e.offset) {
    outError = "range [" + std::to_string(e.offset) + ", +" + std::to_string(e.length) + ") exceeds blob size " +
               std::to_string(m_blobSize);
    return false;
  }

  out.resize(static_cast<std::size_t>(e.length));
  m_blob.clear();
  m_blob.seekg(static_cast<std::streamoff>(e.offset), std::ios::beg);
  if (e.length > 0) m_blob.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(e.length));
  if (!m_blob || static_cast<std::uint64_t>(m_blob.gcount()) != e.length) {
    out.clear();
    outError = "short read from " + m_blobPath;
    return false;
  }
  return true;
}

bool PackReader::readEncoded(const PackIndexEntry& e, std::string& out, std::string& outError)
{
  std::vector<std::uint8_t> packed;
  if (!readCompressed(e, packed, outError)) return false;

  std::vector<std::uint8_t> raw;
  if (!DecompressPayload(m_method, packed.data(), packed.size(), raw, outError)) return false;
  out.assign(raw.begin(), raw.end());
  return true;
}

bool PackReader::readTile(const TileKey& key, std::string& outEncoded, std::string& outError)
{
  const PackIndexEntry* e = find(key);
  if (!e) {
    outError = "tile " + TileKeyToString(key) + " not in index";
    return false;
  }
  return readEncoded(*e, outEncoded, outError);
}

bool PackReader::decodeTile(const TileKey& key, std::vector<BuildingRecord>& out, std::string& outError)
{
  std::string encoded;
  if (!readTile(key, encoded, outError)) return false;
  return DecodeTileBuildings(encoded, out, outError);
}

void VerifyPack(PackReader& reader, PackVerifyReport& out)
{
  out = PackVerifyReport{};
  out.blobBytes = reader.blobSize();
  out.tiles = reader.entries().size();

  std::uint64_t expectedOffset = 0;
  for (const PackIndexEntry& e : reader.entries()) {
    const std::string name = TileKeyToString(e.key);
    out.indexedBytes += e.length;

    if (e.offset != expectedOffset) {
      out.problems.push_back("tile " + name + ": offset " + std::to_string(e.offset) + ", expected " +
                             std::to_string(expectedOffset) +
                             (e.offset < expectedOffset ? " (overlap)" : " (gap)"));
    }
    expectedOffset = e.offset + e.length;

    if (e.length == 0) {
      out.problems.push_back("tile " + name + ": empty payload");
      continue;
    }

    std::string err;
    std::string encoded;
    if (!reader.readTile(e.key, encoded, err)) {
      out.problems.push_back("tile " + name + ": " + err);
      continue;
    }
    out.rawBytes += encoded.size();

    std::vector<BuildingRecord> buildings;
    if (!DecodeTileBuildings(encoded, buildings, err)) {
      out.problems.push_back("tile " + name + ": " + err);
      continue;
    }
    if (buildings.empty()) out.problems.push_back("tile " + name + ": no buildings");
    out.buildings += buildings.size();

    std::string canonical;
    if (!EncodeTileBuildings(buildings, canonical, err)) {
      out.problems.push_back("tile " + name + ": " + err);
    } else if (canonical != encoded) {
      out.problems.push_back("tile " + name + ": payload is not in canonical form");
    }
  }

  if (out.indexedBytes != out.blobBytes) {
    out.problems.push_back("indexed bytes " + std::to_string(out.indexedBytes) + " != blob size " +
                           std::to_string(out.blobBytes));
  }
}

} // namespace footpack
