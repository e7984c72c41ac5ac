#pragma once

#include "footpack/Compression.hpp"
#include "footpack/Errors.hpp"
#include "footpack/FileSync.hpp"
#include "footpack/TileAggregator.hpp"
#include "footpack/Types.hpp"

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace footpack {

// Byte range of one compressed tile inside the pack blob.
struct PackIndexEntry {
  TileKey key;
  std::uint64_t offset = 0;
  std::uint64_t length = 0;
};

// Blob + index, fully built in memory before anything touches the disk.
//
// index is in ascending (ix, iy) order and its ranges tile the blob exactly:
// offset[0] == 0, offset[i+1] == offset[i] + length[i],
// offset.back() + length.back() == blob.size().
struct EncodedPack {
  std::vector<std::uint8_t> blob;
  std::vector<PackIndexEntry> index;
  std::uint64_t rawBytes = 0; // total canonical encoding size before compression
};

struct PackEncodeOptions {
  CompressionMethod method = CompressionMethod::Zlib;
  int level = kDefaultZlibLevel;
  int threads = 0;
};

// Encode and compress every tile (in parallel), then concatenate in
// ascending key order. The result does not depend on the grouping's order or
// on the thread count.
bool EncodePack(const TileGrouping& tiles, const PackEncodeOptions& opt, EncodedPack& out,
                std::string& outError);

// {"ix,iy": {"offset": o, "length": n}, ...} with 2-space indentation, no
// trailing newline. Entries are written in the given order.
bool WritePackIndexJson(std::ostream& os, const std::vector<PackIndexEntry>& index, std::string& outError);

// Blob and index written to synced temp files, published by commit(). Lets a
// caller finish every other artifact before anything becomes visible.
// Destroying an uncommitted instance deletes the temp files.
class StagedPack {
public:
  bool stage(const EncodedPack& pack, const std::filesystem::path& blobPath,
             const std::filesystem::path& indexPath, PackError& outError);

  // Blob first, then index. Errors are IOFailure.
  bool commit(PackError& outError);

private:
  StagedFile m_blob;
  StagedFile m_index;
};

// stage() + commit(). If anything fails before the blob is renamed nothing
// is published; on failure the error kind is IOFailure.
bool CommitPack(const EncodedPack& pack, const std::filesystem::path& blobPath,
                const std::filesystem::path& indexPath, PackError& outError);

} // namespace footpack
