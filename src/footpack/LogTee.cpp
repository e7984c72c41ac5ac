#include "footpack/LogTee.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iostream>
#include <system_error>
#include <utility>

namespace footpack {

namespace fs = std::filesystem;

namespace {

fs::path BackupPath(const fs::path& base, int n)
{
  if (n <= 0) return base;
  fs::path p = base;
  p += "." + std::to_string(n);
  return p;
}

std::string UtcTimestamp()
{
  using namespace std::chrono;
  const auto now = system_clock::now().time_since_epoch();
  const auto secs = duration_cast<seconds>(now);
  const long long ms = static_cast<long long>(duration_cast<milliseconds>(now - secs).count());

  const std::time_t tt = static_cast<std::time_t>(secs.count());
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03lldZ", tm.tm_year + 1900, tm.tm_mon + 1,
                tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
  return buf;
}

// Forwards every write to the console buffer unchanged and to the shared file
// buffer with a per-line prefix. Both tees share one mutex and one
// line-start flag so stdout and stderr lines never splice into each other.
class TeeBuf final : public std::streambuf {
public:
  TeeBuf(std::streambuf* console, std::streambuf* file, std::mutex& m, bool& atLineStart, std::string tag,
         bool timestamps)
      : m_console(console)
      , m_file(file)
      , m_mutex(m)
      , m_atLineStart(atLineStart)
      , m_tag(std::move(tag))
      , m_timestamps(timestamps)
  {
  }

protected:
  int overflow(int ch) override
  {
    if (ch == traits_type::eof()) return traits_type::not_eof(ch);
    const char c = static_cast<char>(ch);
    return xsputn(&c, 1) == 1 ? ch : traits_type::eof();
  }

  std::streamsize xsputn(const char* s, std::streamsize n) override
  {
    if (n <= 0) return 0;
    std::scoped_lock<std::mutex> lock(m_mutex);
    const std::streamsize a = m_console->sputn(s, n);
    const std::streamsize b = writeFileLocked(s, n);
    return std::min(a, b);
  }

  int sync() override
  {
    std::scoped_lock<std::mutex> lock(m_mutex);
    const int a = m_console->pubsync();
    const int b = m_file->pubsync();
    return (a == 0 && b == 0) ? 0 : -1;
  }

private:
  std::streamsize writeFileLocked(const char* s, std::streamsize n)
  {
    const char* p = s;
    const char* end = s + n;
    while (p < end) {
      if (m_atLineStart) {
        std::string prefix;
        if (m_timestamps) prefix = UtcTimestamp() + " ";
        prefix += "[" + m_tag + "] ";
        const auto len = static_cast<std::streamsize>(prefix.size());
        if (m_file->sputn(prefix.data(), len) != len) return p - s;
        m_atLineStart = false;
      }

      const char* nl = static_cast<const char*>(std::memchr(p, '\n', static_cast<std::size_t>(end - p)));
      const std::streamsize chunk = nl ? (nl - p) + 1 : (end - p);
      const std::streamsize wr = m_file->sputn(p, chunk);
      if (wr < chunk) return (p - s) + std::max<std::streamsize>(wr, 0);
      p += chunk;

      if (nl) {
        m_atLineStart = true;
        // Keep the file current line by line so a crash still leaves the diagnostics.
        m_file->pubsync();
      }
    }
    return n;
  }

  std::streambuf* m_console;
  std::streambuf* m_file;
  std::mutex& m_mutex;
  bool& m_atLineStart;
  std::string m_tag;
  bool m_timestamps;
};

} // namespace

struct LogTee::State {
  fs::path path;
  std::ofstream file;
  std::mutex mutex;
  bool atLineStart = true;

  std::streambuf* origOut = nullptr;
  std::streambuf* origErr = nullptr;
  std::unique_ptr<TeeBuf> outBuf;
  std::unique_ptr<TeeBuf> errBuf;
};

LogTee::LogTee() = default;

LogTee::~LogTee()
{
  stop();
}

const fs::path& LogTee::path() const
{
  static const fs::path kNone;
  return m_state ? m_state->path : kNone;
}

bool LogTee::Rotate(const fs::path& basePath, int keepFiles, std::string& outError)
{
  outError.clear();
  if (keepFiles <= 0) return true;

  std::error_code ec;
  for (int i = keepFiles; i >= 1; --i) {
    const fs::path from = BackupPath(basePath, i - 1);
    const fs::path to = BackupPath(basePath, i);
    if (!fs::exists(from, ec)) continue;
    fs::remove(to, ec);
    fs::rename(from, to, ec);
    if (ec) {
      outError = "cannot rotate log " + from.string() + " -> " + to.string() + ": " + ec.message();
      return false;
    }
  }
  return true;
}

bool LogTee::start(const LogTeeOptions& opt, std::string& outError)
{
  outError.clear();
  stop();

  if (opt.path.empty()) {
    outError = "log path is empty";
    return false;
  }

  std::error_code ec;
  if (opt.path.has_parent_path()) {
    fs::create_directories(opt.path.parent_path(), ec);
    if (ec) {
      outError = "cannot create log directory " + opt.path.parent_path().string() + ": " + ec.message();
      return false;
    }
  }

  if (!Rotate(opt.path, opt.keepFiles, outError)) return false;

  auto st = std::make_unique<State>();
  st->path = opt.path;
  st->file.open(opt.path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!st->file) {
    outError = "cannot open log file " + opt.path.string() + ": " + std::strerror(errno);
    return false;
  }

  std::streambuf* fileBuf = st->file.rdbuf();
  if (opt.teeStdout) {
    st->origOut = std::cout.rdbuf();
    st->outBuf = std::make_unique<TeeBuf>(st->origOut, fileBuf, st->mutex, st->atLineStart, "OUT",
                                          opt.timestampLines);
    std::cout.rdbuf(st->outBuf.get());
  }
  if (opt.teeStderr) {
    st->origErr = std::cerr.rdbuf();
    st->errBuf = std::make_unique<TeeBuf>(st->origErr, fileBuf, st->mutex, st->atLineStart, "ERR",
                                          opt.timestampLines);
    std::cerr.rdbuf(st->errBuf.get());
  }

  m_state = std::move(st);
  return true;
}

void LogTee::stop()
{
  if (!m_state) return;

  // Restore first so teardown output never reaches a closed file.
  if (m_state->outBuf && std::cout.rdbuf() == m_state->outBuf.get()) std::cout.rdbuf(m_state->origOut);
  if (m_state->errBuf && std::cerr.rdbuf() == m_state->errBuf.get()) std::cerr.rdbuf(m_state->origErr);

  m_state->file.flush();
  m_state.reset();
}

} // namespace footpack
