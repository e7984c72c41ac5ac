#pragma once

#include "footpack/Compression.hpp"
#include "footpack/Json.hpp"
#include "footpack/PackWriter.hpp"
#include "footpack/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace footpack {

// Parse an index document. Entries come back in ascending key order.
// Rejects malformed keys, duplicates, and offsets/lengths that are not
// non-negative integers.
bool ParsePackIndexJson(const JsonValue& root, std::vector<PackIndexEntry>& out, std::string& outError);
bool LoadPackIndex(const std::string& path, std::vector<PackIndexEntry>& out, std::string& outError);

// Random access to a pack: one hash lookup plus one ranged read per tile.
// The index carries no compression tag, the caller supplies the method the
// pack was written with.
class PackReader {
public:
  bool open(const std::string& blobPath, const std::string& indexPath, CompressionMethod method,
            std::string& outError);

  const std::vector<PackIndexEntry>& entries() const { return m_entries; }
  std::uint64_t blobSize() const { return m_blobSize; }
  CompressionMethod method() const { return m_method; }

  const PackIndexEntry* find(const TileKey& key) const;

  // Compressed bytes of one tile, exactly `length` bytes read at `offset`.
  bool readCompressed(const PackIndexEntry& e, std::vector<std::uint8_t>& out, std::string& outError);

  // Canonical encoding of one tile.
  bool readTile(const TileKey& key, std::string& outEncoded, std::string& outError);

  bool decodeTile(const TileKey& key, std::vector<BuildingRecord>& out, std::string& outError);

private:
  bool readEncoded(const PackIndexEntry& e, std::string& out, std::string& outError);

  std::ifstream m_blob;
  std::string m_blobPath;
  std::uint64_t m_blobSize = 0;
  CompressionMethod m_method = CompressionMethod::Zlib;
  std::vector<PackIndexEntry> m_entries;
  std::unordered_map<TileKey, std::size_t, TileKeyHash> m_lookup;
};

struct PackVerifyReport {
  std::size_t tiles = 0;
  std::size_t buildings = 0;
  std::uint64_t blobBytes = 0;
  std::uint64_t indexedBytes = 0; // sum of lengths
  std::uint64_t rawBytes = 0;     // sum of decoded payload sizes
  std::vector<std::string> problems;

  bool ok() const { return problems.empty(); }
};

// Structural and payload check of an opened pack:
//  - every range lies inside the blob
//  - in key order, offsets start at 0 and are contiguous (no gaps, no overlaps)
//  - sum(length) == blob size
//  - every payload decompresses and decodes as a non-empty building list
//  - re-encoding the decoded buildings gives back the same bytes
// Problems are collected rather than stopping at the first one.
void VerifyPack(PackReader& reader, PackVerifyReport& out);

} // namespace footpack
