#include "launchpad/config.hpp"

#include <sys/resource.h>
#include <unistd.h>

#include <cstdlib>
#include <fstream>
#include <string>

namespace launchpad {

std::optional<Strategy> parse_strategy(std::string_view text) noexcept {
  if (text == "auto" || text == "automatic") {
    return Strategy::automatic;
  }
  if (text == "fork_exec" || text == "fork") {
    return Strategy::fork_exec;
  }
  if (text == "posix_spawn" || text == "spawn") {
    return Strategy::posix_spawn;
  }
  return std::nullopt;
}

std::string_view to_string(Strategy strategy) noexcept {
  switch (strategy) {
    case Strategy::automatic:
      return "auto";
    case Strategy::fork_exec:
      return "fork_exec";
    case Strategy::posix_spawn:
      return "posix_spawn";
  }
  return "unknown";
}

std::optional<LogLevel> parse_log_level(std::string_view text) noexcept {
  if (text == "trace") {
    return LogLevel::trace;
  }
  if (text == "debug") {
    return LogLevel::debug;
  }
  if (text == "info") {
    return LogLevel::info;
  }
  if (text == "warning" || text == "warn") {
    return LogLevel::warning;
  }
  if (text == "error") {
    return LogLevel::error;
  }
  if (text == "off" || text == "none") {
    return LogLevel::off;
  }
  return std::nullopt;
}

std::string_view to_string(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::trace:
      return "trace";
    case LogLevel::debug:
      return "debug";
    case LogLevel::info:
      return "info";
    case LogLevel::warning:
      return "warning";
    case LogLevel::error:
      return "error";
    case LogLevel::off:
      return "off";
  }
  return "unknown";
}

Strategy strategy_from_env() {
  const char* value = std::getenv(kStrategyEnvVar);
  if (value == nullptr || *value == '\0') {
    return Strategy::automatic;
  }
  if (auto parsed = parse_strategy(value)) {
    return *parsed;
  }
  LAUNCHPAD_LOG_WARNING(std::string("ignoring unknown ") + kStrategyEnvVar + "=" + value);
  return Strategy::automatic;
}

// Must not log: it seeds the logger's own level.
LogLevel log_level_from_env() {
  const char* value = std::getenv(kLogLevelEnvVar);
  if (value == nullptr) {
    return LogLevel::warning;
  }
  return parse_log_level(value).value_or(LogLevel::warning);
}

std::optional<std::size_t> resident_set_bytes() {
#if LAUNCHPAD_PLATFORM_LINUX
  std::ifstream statm("/proc/self/statm");
  std::size_t total_pages = 0;
  std::size_t resident_pages = 0;
  if (statm >> total_pages >> resident_pages) {
    long page_size = ::sysconf(_SC_PAGESIZE);
    if (page_size > 0) {
      return resident_pages * static_cast<std::size_t>(page_size);
    }
  }
#endif
  // Peak rather than current, but the best portable figure.
  rusage usage{};
  if (::getrusage(RUSAGE_SELF, &usage) != 0) {
    return std::nullopt;
  }
#if LAUNCHPAD_PLATFORM_MACOS
  return static_cast<std::size_t>(usage.ru_maxrss);
#else
  return static_cast<std::size_t>(usage.ru_maxrss) * 1024;
#endif
}

}  // namespace launchpad
