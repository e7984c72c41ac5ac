#include "footpack/FileHash.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>

namespace footpack {

std::uint64_t Fnv1a64(const void* data, std::size_t size, std::uint64_t seed)
{
  constexpr std::uint64_t kPrime = 1099511628211ull;
  const auto* p = static_cast<const unsigned char*>(data);
  std::uint64_t h = seed;
  for (std::size_t i = 0; p && i < size; ++i) {
    h ^= p[i];
    h *= kPrime;
  }
  return h;
}

bool DigestFile(const std::string& path, FileDigest& out, std::string& outError)
{
  out = FileDigest{};
  out.fnv1a64 = kFnv1a64Basis;

  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "cannot open " + path + ": " + std::strerror(errno);
    return false;
  }

  char buf[64 * 1024];
  for (;;) {
    f.read(buf, sizeof(buf));
    const std::streamsize n = f.gcount();
    if (n > 0) {
      out.sizeBytes += static_cast<std::uint64_t>(n);
      out.fnv1a64 = Fnv1a64(buf, static_cast<std::size_t>(n), out.fnv1a64);
    }
    if (!f) break;
  }
  if (!f.eof()) {
    outError = "read error in " + path;
    return false;
  }
  outError.clear();
  return true;
}

std::string HexU64(std::uint64_t v)
{
  static const char* kDigits = "0123456789abcdef";
  std::string s(16, '0');
  for (int i = 15; i >= 0; --i) {
    s[static_cast<std::size_t>(i)] = kDigits[v & 0xFu];
    v >>= 4;
  }
  return s;
}

} // namespace footpack
