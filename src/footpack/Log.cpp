#include "footpack/Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace footpack {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};

std::mutex& LogMutex()
{
  static std::mutex m;
  return m;
}

} // namespace

const char* LogLevelName(LogLevel l)
{
  switch (l) {
  case LogLevel::Debug: return "debug";
  case LogLevel::Info: return "info";
  case LogLevel::Warn: return "warn";
  case LogLevel::Error: return "error";
  case LogLevel::Off: return "off";
  }
  return "unknown";
}

bool ParseLogLevel(const std::string& name, LogLevel& out)
{
  if (name == "debug") out = LogLevel::Debug;
  else if (name == "info") out = LogLevel::Info;
  else if (name == "warn" || name == "warning") out = LogLevel::Warn;
  else if (name == "error") out = LogLevel::Error;
  else if (name == "off" || name == "quiet") out = LogLevel::Off;
  else return false;
  return true;
}

void SetLogLevel(LogLevel l)
{
  g_level.store(static_cast<int>(l), std::memory_order_relaxed);
}

LogLevel GetLogLevel()
{
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool LogEnabled(LogLevel l)
{
  return l != LogLevel::Off && static_cast<int>(l) >= g_level.load(std::memory_order_relaxed);
}

void LogMessage(LogLevel l, const std::string& msg)
{
  if (!LogEnabled(l)) return;

  std::string line;
  line.reserve(msg.size() + 10);
  line += '[';
  line += LogLevelName(l);
  line += "] ";
  line += msg;
  line += '\n';

  std::scoped_lock<std::mutex> lock(LogMutex());
  std::cerr << line;
  std::cerr.flush();
}

} // namespace footpack
