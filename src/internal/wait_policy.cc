#include "launchpad/internal/wait_policy.hpp"

#include <algorithm>
#include <string>

namespace launchpad::internal {

namespace {

constexpr std::chrono::milliseconds kFirstPoll{1};
constexpr std::chrono::milliseconds kMaxPoll{20};

Error timeout_error(std::chrono::milliseconds timeout) {
  return Error{.code = make_error_code(errc::timeout),
               .context = "child still running after " + std::to_string(timeout.count()) + "ms"};
}

// Poll try_wait until deadline with a growing interval. Returns the status, or
// nullopt if the deadline passed first.
Result<std::optional<ExitStatus>> poll_until(WaitOps& ops, Clock& clock,
                                             std::chrono::steady_clock::time_point deadline) {
  auto step = kFirstPoll;
  while (true) {
    auto status = ops.try_wait();
    if (!status || status->has_value()) {
      return status;
    }
    auto now = clock.now();
    if (now >= deadline) {
      return std::optional<ExitStatus>();
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    auto pause = std::clamp(left, std::chrono::milliseconds(1), step);
    // A child blocked on a full output pipe only finishes if someone reads it.
    bool pumped = false;
    if (ops.pump) {
      auto moved = ops.pump(pause);
      if (!moved) {
        return moved.error();
      }
      pumped = *moved;
    }
    if (!pumped) {
      clock.sleep_for(pause);
    }
    step = std::min(step * 2, kMaxPoll);
  }
}

}  // namespace

Result<ExitStatus> wait_with_timeout(WaitOps& ops, Clock& clock,
                                     std::optional<std::chrono::milliseconds> timeout,
                                     std::chrono::milliseconds kill_grace) {
  if (!timeout) {
    return ops.wait_blocking();
  }

  auto finished = poll_until(ops, clock, clock.now() + *timeout);
  if (!finished) {
    return finished.error();
  }
  if (finished->has_value()) {
    return **finished;
  }

  auto terminated = ops.terminate();
  if (!terminated) {
    return terminated.error();
  }
  auto graceful = poll_until(ops, clock, clock.now() + kill_grace);
  if (!graceful) {
    return graceful.error();
  }
  if (!graceful->has_value()) {
    auto killed = ops.kill();
    if (!killed) {
      return killed.error();
    }
    auto reaped = ops.wait_blocking();
    if (!reaped) {
      return reaped.error();
    }
  }
  return timeout_error(*timeout);
}

}  // namespace launchpad::internal
