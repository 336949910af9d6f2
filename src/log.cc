#include "launchpad/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>

#include "launchpad/config.hpp"

namespace launchpad {

namespace {

void stderr_sink(LogLevel level, std::string_view message) {
  std::string line = "launchpad [";
  line.append(to_string(level));
  line.append("] ");
  line.append(message);
  line.push_back('\n');
  std::cerr << line << std::flush;
}

struct SinkState {
  std::mutex mutex;
  LogSink sink{stderr_sink};
};

SinkState& sink_state() {
  static SinkState state;
  return state;
}

std::atomic<LogLevel>& level_storage() {
  static std::atomic<LogLevel> level{log_level_from_env()};
  return level;
}

LogSink exchange_sink(LogSink sink) {
  auto& state = sink_state();
  std::lock_guard<std::mutex> lock(state.mutex);
  if (!sink) {
    sink = stderr_sink;
  }
  return std::exchange(state.sink, std::move(sink));
}

}  // namespace

void set_log_sink(LogSink sink) { (void)exchange_sink(std::move(sink)); }

void set_log_level(LogLevel level) noexcept { level_storage().store(level); }

LogLevel log_level() noexcept { return level_storage().load(); }

ScopedLogSink::ScopedLogSink(LogSink sink)
    : previous_(exchange_sink(std::move(sink))), previous_level_(log_level()) {}

ScopedLogSink::ScopedLogSink(LogSink sink, LogLevel level)
    : previous_(exchange_sink(std::move(sink))), previous_level_(log_level()) {
  set_log_level(level);
}

ScopedLogSink::~ScopedLogSink() {
  set_log_level(previous_level_);
  (void)exchange_sink(std::move(previous_));
}

namespace internal {

bool log_enabled(LogLevel level) noexcept {
  LogLevel threshold = log_level();
  return level != LogLevel::off && threshold != LogLevel::off && level >= threshold;
}

void log_message(LogLevel level, std::string_view message) {
  auto& state = sink_state();
  std::lock_guard<std::mutex> lock(state.mutex);
  state.sink(level, message);
}

}  // namespace internal

}  // namespace launchpad
