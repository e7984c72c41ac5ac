#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace footpack {

// Non-cryptographic artifact fingerprints for run summaries and `verify`.
// Two runs over the same input and config must report the same values.

constexpr std::uint64_t kFnv1a64Basis = 14695981039346656037ull;

std::uint64_t Fnv1a64(const void* data, std::size_t size, std::uint64_t seed = kFnv1a64Basis);

struct FileDigest {
  std::uint64_t sizeBytes = 0;
  std::uint64_t fnv1a64 = 0;
};

bool DigestFile(const std::string& path, FileDigest& out, std::string& outError);

// 16 lowercase hex digits.
std::string HexU64(std::uint64_t v);

} // namespace footpack
