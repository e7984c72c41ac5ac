#pragma once

#include <string>
#include <utility>

namespace footpack {

// Leveled diagnostics on std::cerr.
//
// Lines look like "[warn] message". Output is serialized through one mutex so
// worker threads never interleave partial lines. std::cout is reserved for
// command results (summaries, extracted tiles), never for diagnostics.
//
// When a LogTee is active the same lines also land in the log file.

enum class LogLevel : int {
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3,
  Off = 4,
};

const char* LogLevelName(LogLevel l);
bool ParseLogLevel(const std::string& name, LogLevel& out);

void SetLogLevel(LogLevel l);
LogLevel GetLogLevel();
bool LogEnabled(LogLevel l);

void LogMessage(LogLevel l, const std::string& msg);

inline void LogDebug(const std::string& msg) { LogMessage(LogLevel::Debug, msg); }
inline void LogInfo(const std::string& msg) { LogMessage(LogLevel::Info, msg); }
inline void LogWarn(const std::string& msg) { LogMessage(LogLevel::Warn, msg); }
inline void LogError(const std::string& msg) { LogMessage(LogLevel::Error, msg); }

// Calls `build` (returning the message) only when the level is enabled, so
// per-record logging in hot loops costs nothing when filtered out.
template <class BuildFn>
void LogLazy(LogLevel l, BuildFn&& build)
{
  if (LogEnabled(l)) LogMessage(l, std::forward<BuildFn>(build)());
}

} // namespace footpack
