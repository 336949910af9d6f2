#pragma once

#include <chrono>

namespace launchpad::internal {

/// @brief Time source for bounded waits; replaced by a fake in tests.
class Clock {
 public:
  virtual ~Clock() = default;
  virtual std::chrono::steady_clock::time_point now() = 0;
  virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

/// @brief Clock backed by std::chrono::steady_clock.
Clock& steady_clock();

}  // namespace launchpad::internal
