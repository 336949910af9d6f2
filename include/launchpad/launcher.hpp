#pragma once

#include "launchpad/child.hpp"
#include "launchpad/request.hpp"
#include "launchpad/result.hpp"
#include "launchpad/status.hpp"

namespace launchpad {

/// @brief Start a child process and return a handle without waiting.
///
/// Fails with errc::executable_not_found when the program cannot be located
/// or executed, errc::resource_exhausted when the platform cannot create a
/// process, and with a validation code for malformed requests. On failure no
/// process is left behind.
Result<Child> spawn(const LaunchRequest& request);

/// @brief Start a child process, wait for it, and report how it ended.
///
/// Streams configured as Stdio::piped() are captured into the result;
/// Stdio::stream() sinks receive the bytes as they arrive. A child killed by
/// a signal is a successful launch whose status is ExitStatus::Kind::signaled.
Result<LaunchResult> launch(const LaunchRequest& request);

/// @brief As launch(), but stdout and stderr default to capture when unset.
Result<LaunchResult> launch_capture(const LaunchRequest& request);

/// @brief launch() that throws LaunchError on failure.
LaunchResult launch_or_throw(const LaunchRequest& request);

}  // namespace launchpad
