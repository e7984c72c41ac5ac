#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace footpack {

// Duplicates std::cerr (and optionally std::cout) into a log file for the
// lifetime of the object (`--log <file>`).
//
// Each file line gets a UTC timestamp and a stream tag:
//   2026-03-02T09:14:55.120Z [ERR] [warn] skipped feature 17: zero_area
// Console output is left untouched.
//
// An existing log is rotated first: <log> -> <log>.1 -> ... -> <log>.<keepFiles>.

struct LogTeeOptions {
  std::filesystem::path path;

  // Rotated backups to keep. 0 truncates the existing file instead.
  int keepFiles = 3;

  bool teeStdout = false;
  bool teeStderr = true;

  bool timestampLines = true;
};

class LogTee {
public:
  LogTee();
  ~LogTee();

  LogTee(const LogTee&) = delete;
  LogTee& operator=(const LogTee&) = delete;

  // Stops a previous session first.
  bool start(const LogTeeOptions& opt, std::string& outError);

  // Restore the original stream buffers and close the file.
  void stop();

  bool active() const { return m_state != nullptr; }
  const std::filesystem::path& path() const;

  static bool Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError);

private:
  struct State;
  std::unique_ptr<State> m_state;
};

} // namespace footpack
