#pragma once

#include <chrono>
#include <memory>
#include <optional>

#include "launchpad/pipe.hpp"
#include "launchpad/request.hpp"
#include "launchpad/result.hpp"
#include "launchpad/status.hpp"

namespace launchpad {

namespace internal {
struct ChildAccess;
}  // namespace internal

/// @brief Bounded-wait configuration.
struct WaitOptions {
  /// @brief Default grace period between SIGTERM and SIGKILL.
  static constexpr std::chrono::milliseconds kDefaultKillGrace{200};
  /// @brief Give up after this long; unset waits indefinitely.
  std::optional<std::chrono::milliseconds> timeout;
  /// @brief Grace period after SIGTERM before SIGKILL.
  std::chrono::milliseconds kill_grace{kDefaultKillGrace};
};

/// @brief Handle on a running (or terminated) child process.
///
/// Destroying a handle whose child has not been reaped leaves a zombie until
/// the caller exits; a warning is logged when that happens.
class Child {
 public:
  Child() = default;
  Child(Child&& other) noexcept;
  Child& operator=(Child&& other) noexcept;
  Child(const Child&) = delete;
  Child& operator=(const Child&) = delete;
  ~Child();

  /// @brief Process id, or -1 for an empty handle.
  [[nodiscard]] int id() const noexcept;
  /// @brief Strategy that created the process.
  [[nodiscard]] Strategy strategy() const noexcept;
  /// @brief True once the child's status has been collected.
  [[nodiscard]] bool reaped() const noexcept;

  /// @brief Take ownership of the stdin pipe, if one was requested.
  std::optional<PipeWriter> take_stdin() noexcept;
  /// @brief Take ownership of the stdout pipe, if one was requested.
  std::optional<PipeReader> take_stdout() noexcept;
  /// @brief Take ownership of the stderr pipe, if one was requested.
  std::optional<PipeReader> take_stderr() noexcept;

  /// @brief Block until this child terminates.
  ///
  /// An untaken stdin pipe is closed so the child sees EOF. Output routed to
  /// caller streams is drained first. Stdio::piped() output is not read: a
  /// child that fills such a pipe blocks until the caller reads it, so take
  /// and read those pipes before waiting. Once reaped, later calls return the
  /// cached status.
  Result<ExitStatus> wait();
  /// @brief Wait with a timeout, escalating SIGTERM then SIGKILL on expiry.
  ///
  /// Output routed to caller streams keeps flowing while the wait polls, so
  /// only a child that is still running at the deadline is stopped.
  Result<ExitStatus> wait(WaitOptions options);
  /// @brief Collect the status if the child has already terminated.
  Result<std::optional<ExitStatus>> try_wait();

  /// @brief Send SIGTERM.
  Result<void> terminate();
  /// @brief Send SIGKILL.
  Result<void> kill();
  /// @brief Send an arbitrary signal (to the group for new_process_group children).
  Result<void> signal(int signo);

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

  friend struct internal::ChildAccess;
};

}  // namespace launchpad
