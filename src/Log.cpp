#include <Attest/Log.hpp>

#include <atomic>
#include <initializer_list>
#include <iostream>
#include <mutex>
#include <string>

namespace Attest
{

  namespace
  {
    std::atomic<LogLevel> g_level{LogLevel::Warning};
    LogSink g_sink{};
    std::mutex g_writeMutex;
  } // namespace

  void SetLogLevel(LogLevel level) noexcept { g_level.store(level, std::memory_order_relaxed); }

  LogLevel GetLogLevel() noexcept { return g_level.load(std::memory_order_relaxed); }

  bool IsLogEnabled(LogLevel level) noexcept
  {
    const auto current = GetLogLevel();
    return current != LogLevel::Off && level >= current && level != LogLevel::Off;
  }

  void SetLogSink(LogSink sink) { g_sink = std::move(sink); }

  std::string_view LogLevelName(LogLevel level) noexcept
  {
    switch (level)
    {
      case LogLevel::Trace: return "trace";
      case LogLevel::Debug: return "debug";
      case LogLevel::Info: return "info";
      case LogLevel::Warning: return "warning";
      case LogLevel::Error: return "error";
      case LogLevel::Off: return "off";
      default: break;
    }
    return "unknown";
  }

  std::optional<LogLevel> ParseLogLevel(std::string_view name) noexcept
  {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warning, LogLevel::Error, LogLevel::Off})
    {
      if (LogLevelName(level) == name)
        return level;
    }
    if (name == "warn")
      return LogLevel::Warning;
    return std::nullopt;
  }

  namespace detail
  {
    void WriteLog(LogLevel level, std::string_view message)
    {
      std::lock_guard<std::mutex> lock(g_writeMutex);
      if (g_sink)
      {
        g_sink(level, message);
        return;
      }
      std::clog << "[attest] " << LogLevelName(level) << ": " << message << '\n';
    }
  } // namespace detail

} // namespace Attest
