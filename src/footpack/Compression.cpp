#include "footpack/Compression.hpp"

#include <zlib.h>

#if defined(FOOTPACK_HAVE_ZSTD)
#include <zstd.h>
#endif

#include <algorithm>
#include <limits>

namespace footpack {

namespace {

constexpr std::size_t kSllzMaxLiteral = 128;
constexpr std::size_t kSllzMinMatch = 4;
constexpr std::size_t kSllzMaxMatch = 130;
constexpr std::size_t kSllzHashBits = 16;
constexpr std::size_t kSllzHeaderBytes = 4;

inline std::uint32_t SllzHash(const std::uint8_t* p)
{
  std::uint32_t x = (static_cast<std::uint32_t>(p[0]) << 16u) | (static_cast<std::uint32_t>(p[1]) << 8u) |
                    static_cast<std::uint32_t>(p[2]);
  x *= 2654435761u;
  x ^= x >> 15;
  return x & ((1u << kSllzHashBits) - 1u);
}

void PutLiterals(std::vector<std::uint8_t>& out, const std::uint8_t* p, std::size_t n)
{
  while (n > 0) {
    const std::size_t run = std::min(n, kSllzMaxLiteral);
    out.push_back(static_cast<std::uint8_t>(run - 1));
    out.insert(out.end(), p, p + run);
    p += run;
    n -= run;
  }
}

void PutMatch(std::vector<std::uint8_t>& out, std::size_t offset, std::size_t len)
{
  out.push_back(static_cast<std::uint8_t>(0x80u | static_cast<std::uint8_t>(len - 3)));
  out.push_back(static_cast<std::uint8_t>(offset & 0xFFu));
  out.push_back(static_cast<std::uint8_t>((offset >> 8u) & 0xFFu));
}

bool ZlibCompress(int level, const std::uint8_t* data, std::size_t size, std::vector<std::uint8_t>& out,
                  std::string& outError)
{
  if (size > static_cast<std::size_t>(std::numeric_limits<uLong>::max())) {
    outError = "payload too large for zlib";
    return false;
  }

  uLongf bound = compressBound(static_cast<uLong>(size));
  out.resize(static_cast<std::size_t>(bound));
  const int rc = compress2(out.data(), &bound, data, static_cast<uLong>(size), level);
  if (rc != Z_OK) {
    out.clear();
    outError = std::string("zlib compress2 failed: ") + zError(rc);
    return false;
  }
  out.resize(static_cast<std::size_t>(bound));
  return true;
}

bool ZlibDecompress(const std::uint8_t* data, std::size_t size, std::vector<std::uint8_t>& out,
                    std::string& outError)
{
  if (size > static_cast<std::size_t>(std::numeric_limits<uInt>::max())) {
    outError = "payload too large for zlib";
    return false;
  }

  z_stream zs{};
  int rc = inflateInit(&zs);
  if (rc != Z_OK) {
    outError = std::string("zlib inflateInit failed: ") + zError(rc);
    return false;
  }

  zs.next_in = const_cast<Bytef*>(data);
  zs.avail_in = static_cast<uInt>(size);

  std::uint8_t chunk[64 * 1024];
  do {
    zs.next_out = chunk;
    zs.avail_out = static_cast<uInt>(sizeof(chunk));
    rc = inflate(&zs, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      const std::string msg = zs.msg ? zs.msg : zError(rc);
      inflateEnd(&zs);
      out.clear();
      outError = "zlib inflate failed: " + msg;
      return false;
    }
    out.insert(out.end(), chunk, chunk + (sizeof(chunk) - zs.avail_out));
    if (rc == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
      inflateEnd(&zs);
      out.clear();
      outError = "zlib stream is truncated";
      return false;
    }
  } while (rc != Z_STREAM_END);

  const uInt leftover = zs.avail_in;
  inflateEnd(&zs);
  if (leftover != 0) {
    out.clear();
    outError = "trailing bytes after zlib stream";
    return false;
  }
  return true;
}

#if defined(FOOTPACK_HAVE_ZSTD)

bool ZstdCompress(int level, const std::uint8_t* data, std::size_t size, std::vector<std::uint8_t>& out,
                  std::string& outError)
{
  const int lvl = (level == kDefaultZlibLevel) ? kDefaultZstdLevel : level;
  out.resize(ZSTD_compressBound(size));
  const std::size_t n = ZSTD_compress(out.data(), out.size(), data, size, lvl);
  if (ZSTD_isError(n)) {
    out.clear();
    outError = std::string("zstd compress failed: ") + ZSTD_getErrorName(n);
    return false;
  }
  out.resize(n);
  return true;
}

bool ZstdDecompress(const std::uint8_t* data, std::size_t size, std::vector<std::uint8_t>& out,
                    std::string& outError)
{
  const unsigned long long declared = ZSTD_getFrameContentSize(data, size);
  if (declared == ZSTD_CONTENTSIZE_ERROR) {
    outError = "zstd: not a zstd frame";
    return false;
  }
  if (declared == ZSTD_CONTENTSIZE_UNKNOWN) {
    outError = "zstd: frame has no content size";
    return false;
  }
  if (declared > static_cast<unsigned long long>(std::numeric_limits<std::size_t>::max())) {
    outError = "zstd: declared size too large";
    return false;
  }

  // The compressed frame must end exactly at the slice end.
  const std::size_t frame = ZSTD_findFrameCompressedSize(data, size);
  if (ZSTD_isError(frame)) {
    outError = std::string("zstd: ") + ZSTD_getErrorName(frame);
    return false;
  }
  if (frame != size) {
    outError = "trailing bytes after zstd frame";
    return false;
  }

  out.resize(static_cast<std::size_t>(declared));
  const std::size_t n = ZSTD_decompress(out.data(), out.size(), data, size);
  if (ZSTD_isError(n)) {
    out.clear();
    outError = std::string("zstd decompress failed: ") + ZSTD_getErrorName(n);
    return false;
  }
  if (n != out.size()) {
    out.clear();
    outError = "zstd: payload shorter than declared";
    return false;
  }
  return true;
}

#else

bool ZstdCompress(int, const std::uint8_t*, std::size_t, std::vector<std::uint8_t>&, std::string& outError)
{
  outError = "zstd support was not built (libzstd not found)";
  return false;
}

bool ZstdDecompress(const std::uint8_t*, std::size_t, std::vector<std::uint8_t>&, std::string& outError)
{
  outError = "zstd support was not built (libzstd not found)";
  return false;
}

#endif

} // namespace

bool ZstdAvailable()
{
#if defined(FOOTPACK_HAVE_ZSTD)
  return true;
#else
  return false;
#endif
}

const char* CompressionMethodName(CompressionMethod m)
{
  switch (m) {
  case CompressionMethod::None: return "none";
  case CompressionMethod::Zlib: return "zlib";
  case CompressionMethod::SLLZ: return "sllz";
  case CompressionMethod::Zstd: return "zstd";
  }
  return "unknown";
}

bool ParseCompressionMethod(const std::string& name, CompressionMethod& out)
{
  if (name == "none") {
    out = CompressionMethod::None;
    return true;
  }
  if (name == "zlib") {
    out = CompressionMethod::Zlib;
    return true;
  }
  if (name == "sllz") {
    out = CompressionMethod::SLLZ;
    return true;
  }
  if (name == "zstd") {
    out = CompressionMethod::Zstd;
    return true;
  }
  return false;
}

bool CompressSLLZ(const std::uint8_t* data, std::size_t size, std::vector<std::uint8_t>& out)
{
  out.clear();
  if (!data || size == 0) return true;

  // Most recent position per 3-byte hash (LZSS-style, greedy).
  std::vector<std::int64_t> last(std::size_t{1} << kSllzHashBits, -1);

  std::size_t i = 0;
  std::size_t pending = 0;

  while (i + 3 <= size) {
    const std::uint32_t h = SllzHash(data + i);
    const std::int64_t prev = last[h];
    last[h] = static_cast<std::int64_t>(i);

    std::size_t len = 0;
    std::size_t off = 0;
    if (prev >= 0) {
      off = i - static_cast<std::size_t>(prev);
      if (off <= 0xFFFFu) {
        const std::size_t limit = std::min(kSllzMaxMatch, size - i);
        const std::uint8_t* a = data + static_cast<std::size_t>(prev);
        const std::uint8_t* b = data + i;
        while (len < limit && a[len] == b[len]) ++len;
      }
    }

    if (len < kSllzMinMatch) {
      ++i;
      continue;
    }

    PutLiterals(out, data + pending, i - pending);
    PutMatch(out, off, len);

    for (std::size_t k = i + 1; k < i + len && k + 3 <= size; ++k) {
      last[SllzHash(data + k)] = static_cast<std::int64_t>(k);
    }
    i += len;
    pending = i;
  }

  PutLiterals(out, data + pending, size - pending);
  return true;
}

bool DecompressSLLZ(const std::uint8_t* data, std::size_t size, std::size_t expectedSize,
                    std::vector<std::uint8_t>& out, std::string& outError)
{
  out.clear();
  if (expectedSize == 0) {
    if (size != 0) {
      outError = "SLLZ: data present for empty payload";
      return false;
    }
    return true;
  }
  if (!data) {
    outError = "SLLZ: null input";
    return false;
  }

  // A 3-byte match token expands to at most kSllzMaxMatch bytes; a corrupt
  // header must not drive the reservation.
  out.reserve(std::min(expectedSize, size * (kSllzMaxMatch / 3 + 1)));
  std::size_t i = 0;
  while (i < size && out.size() < expectedSize) {
    const std::uint8_t tag = data[i++];
    if ((tag & 0x80u) == 0u) {
      const std::size_t len = static_cast<std::size_t>(tag) + 1u;
      if (len > size - i) {
        outError = "SLLZ: truncated literal run";
        return false;
      }
      if (out.size() + len > expectedSize) {
        outError = "SLLZ: literal run overflows payload";
        return false;
      }
      out.insert(out.end(), data + i, data + i + len);
      i += len;
      continue;
    }

    const std::size_t len = static_cast<std::size_t>(tag & 0x7Fu) + 3u;
    if (size - i < 2) {
      outError = "SLLZ: truncated match";
      return false;
    }
    const std::size_t off = static_cast<std::size_t>(data[i]) | (static_cast<std::size_t>(data[i + 1]) << 8u);
    i += 2;
    if (off == 0 || off > out.size()) {
      outError = "SLLZ: match offset out of range";
      return false;
    }
    if (out.size() + len > expectedSize) {
      outError = "SLLZ: match overflows payload";
      return false;
    }
    const std::size_t src = out.size() - off;
    for (std::size_t k = 0; k < len; ++k) out.push_back(out[src + k]);
  }

  if (out.size() != expectedSize) {
    outError = "SLLZ: payload shorter than declared";
    return false;
  }
  if (i != size) {
    outError = "SLLZ: trailing bytes";
    return false;
  }
  return true;
}

bool CompressPayload(CompressionMethod method, int level, const std::uint8_t* data, std::size_t size,
                     std::vector<std::uint8_t>& out, std::string& outError)
{
  out.clear();
  outError.clear();
  if (!data && size != 0) {
    outError = "null payload";
    return false;
  }

  switch (method) {
  case CompressionMethod::None:
    if (size != 0) out.assign(data, data + size);
    return true;

  case CompressionMethod::Zlib:
    return ZlibCompress(level, data, size, out, outError);

  case CompressionMethod::Zstd:
    return ZstdCompress(level, data, size, out, outError);

  case CompressionMethod::SLLZ: {
    if (size > 0xFFFFFFFFull) {
      outError = "payload too large for SLLZ";
      return false;
    }
    std::vector<std::uint8_t> body;
    if (!CompressSLLZ(data, size, body)) {
      outError = "SLLZ compression failed";
      return false;
    }
    out.reserve(kSllzHeaderBytes + body.size());
    const std::uint32_t n = static_cast<std::uint32_t>(size);
    for (std::size_t b = 0; b < kSllzHeaderBytes; ++b) {
      out.push_back(static_cast<std::uint8_t>((n >> (8u * b)) & 0xFFu));
    }
    out.insert(out.end(), body.begin(), body.end());
    return true;
  }
  }

  outError = "unknown compression method";
  return false;
}

bool DecompressPayload(CompressionMethod method, const std::uint8_t* data, std::size_t size,
                       std::vector<std::uint8_t>& out, std::string& outError)
{
  out.clear();
  outError.clear();
  if (!data && size != 0) {
    outError = "null payload";
    return false;
  }

  switch (method) {
  case CompressionMethod::None:
    if (size != 0) out.assign(data, data + size);
    return true;

  case CompressionMethod::Zlib:
    return ZlibDecompress(data, size, out, outError);

  case CompressionMethod::Zstd:
    return ZstdDecompress(data, size, out, outError);

  case CompressionMethod::SLLZ: {
    if (size < kSllzHeaderBytes) {
      outError = "SLLZ: missing size header";
      return false;
    }
    std::uint32_t n = 0;
    for (std::size_t b = 0; b < kSllzHeaderBytes; ++b) {
      n |= static_cast<std::uint32_t>(data[b]) << (8u * b);
    }
    return DecompressSLLZ(data + kSllzHeaderBytes, size - kSllzHeaderBytes, n, out, outError);
  }
  }

  outError = "unknown compression method";
  return false;
}

} // namespace footpack
