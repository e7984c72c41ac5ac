#include "footpack/PackWriter.hpp"

#include "footpack/FileSync.hpp"
#include "footpack/Json.hpp"
#include "footpack/Parallel.hpp"
#include "footpack/TileCodec.hpp"

#include <ostream>

namespace footpack {

namespace {

struct CompressedTile {
  std::vector<std::uint8_t> bytes;
  std::uint64_t rawSize = 0;
  std::string error;
};

} // namespace

bool EncodePack(const TileGrouping& tiles, const PackEncodeOptions& opt, EncodedPack& out,
                std::string& outError)
{
  out = EncodedPack{};
  outError.clear();

  const std::vector<const Tile*> sorted = tiles.sortedTiles();
  std::vector<CompressedTile> parts(sorted.size());

  ParallelFor(sorted.size(), opt.threads, [&](std::size_t i) {
    CompressedTile& part = parts[i];
    std::string encoded;
    if (!EncodeTileBuildings(sorted[i]->buildings, encoded, part.error)) return;
    part.rawSize = encoded.size();
    if (!CompressPayload(opt.method, opt.level, reinterpret_cast<const std::uint8_t*>(encoded.data()),
                         encoded.size(), part.bytes, part.error)) {
      if (part.error.empty()) part.error = "compression failed";
    }
  });

  // Ordering is back to ascending keys here; offsets are assigned now and only now.
  std::uint64_t total = 0;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (!parts[i].error.empty()) {
      outError = "tile " + TileKeyToString(sorted[i]->key) + ": " + parts[i].error;
      out = EncodedPack{};
      return false;
    }
    total += parts[i].bytes.size();
  }

  out.blob.reserve(static_cast<std::size_t>(total));
  out.index.reserve(parts.size());
  for (std::size_t i = 0; i < parts.size(); ++i) {
    PackIndexEntry e;
    e.key = sorted[i]->key;
    e.offset = out.blob.size();
    e.length = parts[i].bytes.size();
    out.index.push_back(e);
    out.blob.insert(out.blob.end(), parts[i].bytes.begin(), parts[i].bytes.end());
    out.rawBytes += parts[i].rawSize;
    std::vector<std::uint8_t>().swap(parts[i].bytes);
  }
  return true;
}

bool WritePackIndexJson(std::ostream& os, const std::vector<PackIndexEntry>& index, std::string& outError)
{
  JsonWriteOptions opt;
  opt.pretty = true;
  opt.indent = 2;
  JsonWriter w(os, opt);

  w.beginObject();
  for (const PackIndexEntry& e : index) {
    w.key(TileKeyToString(e.key));
    w.beginObject();
    w.key("offset");
    w.uintValue(e.offset);
    w.key("length");
    w.uintValue(e.length);
    w.endObject();
  }
  w.endObject();

  if (!w.ok()) {
    outError = w.error();
    return false;
  }
  if (!os) {
    outError = "stream write failed";
    return false;
  }
  return true;
}

bool StagedPack::stage(const EncodedPack& pack, const std::filesystem::path& blobPath,
                       const std::filesystem::path& indexPath, PackError& outError)
{
  std::string err;
  auto fail = [&](const std::string& what) {
    m_blob.discard();
    m_index.discard();
    outError = MakeIOFailure(what + ": " + err);
    return false;
  };

  if (!m_blob.open(blobPath, err)) return fail("cannot stage pack blob");
  if (!m_blob.write(pack.blob.data(), pack.blob.size(), err)) return fail("cannot write pack blob");
  if (!m_blob.finish(err)) return fail("cannot flush pack blob");
  if (m_blob.bytesWritten() != pack.blob.size()) {
    err = "wrote " + std::to_string(m_blob.bytesWritten()) + " of " + std::to_string(pack.blob.size()) + " bytes";
    return fail("short write on pack blob");
  }

  if (!m_index.open(indexPath, err)) return fail("cannot stage pack index");
  if (!WritePackIndexJson(m_index.stream(), pack.index, err)) return fail("cannot write pack index");
  if (!m_index.finish(err)) return fail("cannot flush pack index");
  return true;
}

bool StagedPack::commit(PackError& outError)
{
  std::string err;
  // Blob first: an index must never point into a blob that is not there yet.
  if (!m_blob.commit(err)) {
    outError = MakeIOFailure("cannot publish pack blob: " + err);
    return false;
  }
  if (!m_index.commit(err)) {
    outError = MakeIOFailure("cannot publish pack index: " + err);
    return false;
  }
  return true;
}

bool CommitPack(const EncodedPack& pack, const std::filesystem::path& blobPath,
                const std::filesystem::path& indexPath, PackError& outError)
{
  StagedPack staged;
  return staged.stage(pack, blobPath, indexPath, outError) && staged.commit(outError);
}

} // namespace footpack
