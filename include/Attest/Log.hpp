// Log.hpp
// Process-wide leveled logger. Formatting goes through fmt and is skipped
// entirely when the level is disabled.
#pragma once

#include <Attest/Export.hpp>

#include <fmt/format.h>

#include <functional>
#include <optional>
#include <string_view>
#include <utility>

namespace Attest
{

  enum class LogLevel : unsigned char
  {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Off = 5,
  };

  using LogSink = std::function<void(LogLevel, std::string_view)>;

  ATTEST_API void SetLogLevel(LogLevel level) noexcept;
  [[nodiscard]] ATTEST_API LogLevel GetLogLevel() noexcept;
  [[nodiscard]] ATTEST_API bool IsLogEnabled(LogLevel level) noexcept;

  // Replace the sink (default writes to std::clog). An empty sink restores the default.
  // Not synchronised with concurrent logging; install sinks during startup.
  ATTEST_API void SetLogSink(LogSink sink);

  [[nodiscard]] ATTEST_API std::string_view LogLevelName(LogLevel level) noexcept;
  [[nodiscard]] ATTEST_API std::optional<LogLevel> ParseLogLevel(std::string_view name) noexcept;

  namespace detail
  {
    ATTEST_API void WriteLog(LogLevel level, std::string_view message);

    template <class... Args>
    void Log(LogLevel level, fmt::format_string<Args...> format, Args &&...args)
    {
      WriteLog(level, fmt::format(format, std::forward<Args>(args)...));
    }
  } // namespace detail

} // namespace Attest

#define ATTEST_LOG(Level, ...)                                                   \
  do                                                                             \
  {                                                                              \
    if (::Attest::IsLogEnabled(::Attest::LogLevel::Level))                       \
      ::Attest::detail::Log(::Attest::LogLevel::Level, __VA_ARGS__);             \
  } while (0)
