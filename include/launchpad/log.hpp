#pragma once

/// @file log.hpp
/// @brief Diagnostic logging for launchpad.
///
/// launchpad writes through a single process-wide sink. The default sink
/// prints `launchpad [level] message` lines to stderr. Messages below the
/// configured level are dropped before they are formatted; the initial
/// level comes from LAUNCHPAD_LOG_LEVEL and defaults to warning.
///
/// Sinks are called with an internal mutex held and must not log.

#include <cstdint>
#include <functional>
#include <string_view>

namespace launchpad {

/// @brief Message severity, lowest first.
enum class LogLevel : std::uint8_t { trace, debug, info, warning, error, off };

/// @brief Receives every message at or above the current level.
using LogSink = std::function<void(LogLevel level, std::string_view message)>;

/// @brief Replace the sink; an empty function restores the stderr sink.
void set_log_sink(LogSink sink);
/// @brief Set the minimum level that reaches the sink.
void set_log_level(LogLevel level) noexcept;
/// @brief Current minimum level.
[[nodiscard]] LogLevel log_level() noexcept;

/// @brief Install a sink (and optionally a level) for the lifetime of the object.
class ScopedLogSink {
 public:
  explicit ScopedLogSink(LogSink sink);
  ScopedLogSink(LogSink sink, LogLevel level);
  ~ScopedLogSink();
  ScopedLogSink(const ScopedLogSink&) = delete;
  ScopedLogSink& operator=(const ScopedLogSink&) = delete;

 private:
  LogSink previous_;
  LogLevel previous_level_;
};

namespace internal {

[[nodiscard]] bool log_enabled(LogLevel level) noexcept;
void log_message(LogLevel level, std::string_view message);

}  // namespace internal

}  // namespace launchpad

/// @brief Log a message built from an expression only when the level is enabled.
#define LAUNCHPAD_LOG(level, expr)                                  \
  do {                                                              \
    if (::launchpad::internal::log_enabled(level)) {                \
      ::launchpad::internal::log_message(level, (expr));            \
    }                                                               \
  } while (0)

#define LAUNCHPAD_LOG_DEBUG(expr) LAUNCHPAD_LOG(::launchpad::LogLevel::debug, expr)
#define LAUNCHPAD_LOG_WARNING(expr) LAUNCHPAD_LOG(::launchpad::LogLevel::warning, expr)
