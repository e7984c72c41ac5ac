#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace footpack {

// Durable file commit helpers.
//
// Output artifacts are never written in place. The pattern is:
//   1) write <final>.tmp
//   2) fsync(tmp)
//   3) rename(tmp -> final)
//   4) fsync(parent directory)
// so a crash or a failed run leaves either the previous artifact or nothing,
// never a half-written file under the final name.

// Flush file contents/metadata to stable storage.
bool SyncFile(const std::filesystem::path& path, std::string& outError);

// Flush directory metadata to stable storage. Some filesystems refuse this;
// callers treat it as best-effort.
bool SyncDirectory(const std::filesystem::path& dir, std::string& outError);

void BestEffortSyncDirectory(const std::filesystem::path& dir);

// One output file staged under a temporary name.
//
// The temp file is removed on destruction unless commit() succeeded.
class StagedFile {
public:
  StagedFile() = default;
  ~StagedFile();

  StagedFile(const StagedFile&) = delete;
  StagedFile& operator=(const StagedFile&) = delete;

  // Create parent directories and open <finalPath>.tmp for writing.
  bool open(const std::filesystem::path& finalPath, std::string& outError);

  bool write(const void* data, std::size_t size, std::string& outError);
  bool write(const std::string& s, std::string& outError) { return write(s.data(), s.size(), outError); }

  // Direct stream access for streaming writers. Check with finish().
  std::ofstream& stream() { return m_out; }

  // Flush, close and fsync the temp file.
  bool finish(std::string& outError);

  // Rename the finished temp file over the final path.
  bool commit(std::string& outError);

  // Remove the temp file (no-op after commit).
  void discard();

  std::uint64_t bytesWritten() const { return m_bytes; }
  const std::filesystem::path& finalPath() const { return m_final; }
  const std::filesystem::path& tempPath() const { return m_temp; }

private:
  std::filesystem::path m_final;
  std::filesystem::path m_temp;
  std::ofstream m_out;
  std::uint64_t m_bytes = 0;
  bool m_finished = false;
  bool m_committed = false;
};

} // namespace footpack
