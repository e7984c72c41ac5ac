#include "footpack/FileSync.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>

#if defined(_WIN32)
  #ifndef NOMINMAX
    #define NOMINMAX
  #endif
  #ifndef WIN32_LEAN_AND_MEAN
    #define WIN32_LEAN_AND_MEAN
  #endif
  #include <windows.h>
#else
  #include <fcntl.h>
  #include <unistd.h>
#endif

namespace footpack {

namespace fs = std::filesystem;

namespace {

#if defined(_WIN32)

bool FlushPath(const fs::path& p, DWORD extraFlags, std::string& outError)
{
  HANDLE h = CreateFileW(p.wstring().c_str(),
                         GENERIC_READ | GENERIC_WRITE,
                         FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                         nullptr,
                         OPEN_EXISTING,
                         FILE_ATTRIBUTE_NORMAL | extraFlags,
                         nullptr);
  if (h == INVALID_HANDLE_VALUE) {
    outError = "unable to open for sync: " + p.string() + " (error " + std::to_string(GetLastError()) + ")";
    return false;
  }
  const BOOL ok = FlushFileBuffers(h);
  const DWORD e = ok ? 0 : GetLastError();
  CloseHandle(h);
  if (!ok) {
    outError = "FlushFileBuffers failed for " + p.string() + " (error " + std::to_string(e) + ")";
    return false;
  }
  return true;
}

#else

bool FsyncPath(const fs::path& p, int flags, std::string& outError)
{
  const int fd = ::open(p.c_str(), flags);
  if (fd < 0) {
    outError = "unable to open for sync: " + p.string() + ": " + std::strerror(errno);
    return false;
  }
  if (::fsync(fd) != 0) {
    outError = "fsync failed for " + p.string() + ": " + std::strerror(errno);
    ::close(fd);
    return false;
  }
  ::close(fd);
  return true;
}

#endif

} // namespace

bool SyncFile(const fs::path& path, std::string& outError)
{
  outError.clear();
  if (path.empty()) {
    outError = "SyncFile path is empty";
    return false;
  }
#if defined(_WIN32)
  return FlushPath(path, 0, outError);
#else
  return FsyncPath(path, O_RDONLY, outError);
#endif
}

bool SyncDirectory(const fs::path& dir, std::string& outError)
{
  outError.clear();
  if (dir.empty()) {
    outError = "SyncDirectory path is empty";
    return false;
  }
#if defined(_WIN32)
  return FlushPath(dir, FILE_FLAG_BACKUP_SEMANTICS, outError);
#else
  int flags = O_RDONLY;
#ifdef O_DIRECTORY
  flags |= O_DIRECTORY;
#endif
  return FsyncPath(dir, flags, outError);
#endif
}

void BestEffortSyncDirectory(const fs::path& dir)
{
  std::string err;
  (void)SyncDirectory(dir, err);
}

StagedFile::~StagedFile()
{
  discard();
}

bool StagedFile::open(const fs::path& finalPath, std::string& outError)
{
  discard();
  m_final = finalPath;
  m_temp = finalPath;
  m_temp += ".tmp";
  m_bytes = 0;
  m_finished = false;
  m_committed = false;

  std::error_code ec;
  if (m_final.has_parent_path()) {
    fs::create_directories(m_final.parent_path(), ec);
    if (ec) {
      outError = "cannot create directory " + m_final.parent_path().string() + ": " + ec.message();
      return false;
    }
  }

  // Stale temp from an interrupted run.
  fs::remove(m_temp, ec);

  m_out.open(m_temp, std::ios::binary | std::ios::trunc);
  if (!m_out) {
    outError = "cannot open " + m_temp.string() + " for writing: " + std::strerror(errno);
    return false;
  }
  return true;
}

bool StagedFile::write(const void* data, std::size_t size, std::string& outError)
{
  if (!m_out.is_open()) {
    outError = "write to a staged file that is not open";
    return false;
  }
  if (size == 0) return true;
  m_out.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
  if (!m_out) {
    outError = "write failed: " + m_temp.string() + ": " + std::strerror(errno);
    return false;
  }
  return true;
}

bool StagedFile::finish(std::string& outError)
{
  if (m_finished) return true;
  if (!m_out.is_open()) {
    outError = "finish on a staged file that is not open";
    return false;
  }

  m_out.flush();
  const std::streamoff pos = m_out.tellp();
  if (!m_out) {
    outError = "write failed: " + m_temp.string() + ": " + std::strerror(errno);
    m_out.close();
    return false;
  }
  m_out.close();
  if (m_out.fail()) {
    outError = "close failed: " + m_temp.string();
    return false;
  }
  m_bytes = pos > 0 ? static_cast<std::uint64_t>(pos) : 0;

  std::string err;
  if (!SyncFile(m_temp, err)) {
    outError = err;
    return false;
  }
  m_finished = true;
  return true;
}

bool StagedFile::commit(std::string& outError)
{
  if (!m_finished) {
    outError = "commit before finish: " + m_final.string();
    return false;
  }
  std::error_code ec;
  fs::rename(m_temp, m_final, ec);
  if (ec) {
    outError = "cannot rename " + m_temp.string() + " -> " + m_final.string() + ": " + ec.message();
    return false;
  }
  m_committed = true;
  if (m_final.has_parent_path()) BestEffortSyncDirectory(m_final.parent_path());
  return true;
}

void StagedFile::discard()
{
  if (m_out.is_open()) m_out.close();
  if (!m_committed && !m_temp.empty()) {
    std::error_code ec;
    fs::remove(m_temp, ec);
  }
  m_temp.clear();
}

} // namespace footpack
