#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace footpack {

enum class CompressionMethod : std::uint8_t {
  None = 0,
  Zlib = 1,
  SLLZ = 2,
  Zstd = 3,
};

// "none", "zlib", "sllz", "zstd"
const char* CompressionMethodName(CompressionMethod m);
bool ParseCompressionMethod(const std::string& name, CompressionMethod& out);

// zlib level: -1 (library default) or 0..9.
// zstd level: -1 (kDefaultZstdLevel) or 1..22.
// Ignored by the other methods.
constexpr int kDefaultZlibLevel = -1;
constexpr int kDefaultZstdLevel = 3;
constexpr int kMaxZstdLevel = 22;

// False when the build found no libzstd; zstd payloads then fail with an error.
bool ZstdAvailable();

// Compress one tile payload.
//
//  - Zlib: a plain RFC 1950 stream (same bytes as Python's zlib.compress at
//    the same level).
//  - Zstd: a single zstd frame with the content size in its header.
//  - SLLZ: 4-byte little-endian uncompressed size followed by an SLLZ stream.
//  - None: the input bytes.
bool CompressPayload(CompressionMethod method, int level, const std::uint8_t* data, std::size_t size,
                     std::vector<std::uint8_t>& out, std::string& outError);

// Inverse of CompressPayload. Rejects truncated or trailing data.
bool DecompressPayload(CompressionMethod method, const std::uint8_t* data, std::size_t size,
                       std::vector<std::uint8_t>& out, std::string& outError);

// Tiny built-in compressor (Simple Literal/LZ), no external dependency.
//
// A stream of commands, each starting with a one-byte tag:
//
//   (tag & 0x80) == 0: literal run of (tag + 1) bytes follows (1..128).
//   (tag & 0x80) != 0: back-reference, length = (tag & 0x7F) + 3 (3..130),
//                      then a 16-bit little-endian offset (1..65535); copy
//                      `length` bytes from (out.size() - offset). Copies may
//                      overlap.
bool CompressSLLZ(const std::uint8_t* data, std::size_t size, std::vector<std::uint8_t>& out);

// Decompress an SLLZ stream expecting exactly `expectedSize` bytes.
bool DecompressSLLZ(const std::uint8_t* data, std::size_t size, std::size_t expectedSize,
                    std::vector<std::uint8_t>& out, std::string& outError);

} // namespace footpack
