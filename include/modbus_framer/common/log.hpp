#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>

namespace mbframer {

enum class LogLevel : uint8_t { kDebug, kWarning };

/**
 * @brief Receives one formatted, null-terminated log line (no trailing newline)
 *
 * The library has no output device of its own. Install a sink to see what the framer drops.
 */
using LogSink = void (*)(LogLevel level, const char *message);

/**
 * @brief Install the process-wide sink, or nullptr to silence logging
 */
void SetLogSink(LogSink sink) noexcept;

[[nodiscard]] LogSink GetLogSink() noexcept;

namespace detail {

// Longest formatted line including the null terminator; longer lines are truncated
static constexpr size_t kMaxLogMessageSize = 160;

[[nodiscard]] constexpr const char *Basename(const char *path) {
  const char *basename = path;
  for (const char *c = path; *c != '\0'; ++c) {
    if (*c == '/' || *c == '\\') {
      basename = c + 1;
    }
  }
  return basename;
}

/**
 * @brief Format into a stack buffer and hand the line to the sink
 *
 * Nothing is formatted when no sink is installed.
 */
template <typename... Args>
void Logf(LogLevel level, const char *file, int line, const char *format, Args... args) {
  LogSink sink = GetLogSink();
  if (sink == nullptr) {
    return;
  }

  char buffer[kMaxLogMessageSize];
  int prefix = std::snprintf(buffer, sizeof(buffer), "[%s:%d] ", Basename(file), line);
  if (prefix < 0 || static_cast<size_t>(prefix) >= sizeof(buffer)) {
    prefix = 0;
  }
  if constexpr (sizeof...(Args) == 0) {
    std::snprintf(buffer + prefix, sizeof(buffer) - static_cast<size_t>(prefix), "%s", format);
  } else {
    std::snprintf(buffer + prefix, sizeof(buffer) - static_cast<size_t>(prefix), format, args...);
  }
  sink(level, buffer);
}

}  // namespace detail

}  // namespace mbframer

#ifdef MODBUS_FRAMER_DISABLE_LOGGING
#define MODBUS_FRAMER_LOG_DEBUG(...) ((void)0)
#define MODBUS_FRAMER_LOG_WARNING(...) ((void)0)
#else
#define MODBUS_FRAMER_LOG_DEBUG(...) \
  ::mbframer::detail::Logf(::mbframer::LogLevel::kDebug, __FILE__, __LINE__, __VA_ARGS__)
#define MODBUS_FRAMER_LOG_WARNING(...) \
  ::mbframer::detail::Logf(::mbframer::LogLevel::kWarning, __FILE__, __LINE__, __VA_ARGS__)
#endif
