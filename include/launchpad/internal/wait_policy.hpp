#pragma once

#include <chrono>
#include <functional>
#include <optional>

#include "launchpad/internal/clock.hpp"
#include "launchpad/result.hpp"
#include "launchpad/status.hpp"

namespace launchpad::internal {

struct WaitOps {
  std::function<Result<std::optional<ExitStatus>>()> try_wait;
  std::function<Result<ExitStatus>()> wait_blocking;
  std::function<Result<void>()> terminate;
  std::function<Result<void>()> kill;
  /// @brief Optional: move the child's routed output for up to the given time.
  /// Returns false when there is nothing to move; the wait then sleeps instead.
  std::function<Result<bool>(std::chrono::milliseconds)> pump;
};

/// @brief Poll until timeout, then SIGTERM, then SIGKILL after kill_grace.
///
/// Returns the status if the child ends before the timeout, otherwise
/// errc::timeout once the child has been stopped and reaped.
Result<ExitStatus> wait_with_timeout(WaitOps& ops, Clock& clock,
                                     std::optional<std::chrono::milliseconds> timeout,
                                     std::chrono::milliseconds kill_grace);

}  // namespace launchpad::internal
