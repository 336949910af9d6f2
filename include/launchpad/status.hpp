#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "launchpad/result.hpp"

namespace launchpad {

/// @brief How a reaped child process ended.
class ExitStatus {
 public:
  /// @brief The kind of termination.
  enum class Kind : std::uint8_t {
    /// @brief Process exited normally with an exit code.
    exited,
    /// @brief Process was terminated by a signal.
    signaled,
  };

  /// @brief Construct a normal exit status.
  static ExitStatus exited(int code, std::uint32_t native = 0) noexcept;
  /// @brief Construct a status for a signal-terminated process.
  static ExitStatus signaled(int signo, std::uint32_t native = 0) noexcept;
  /// @brief Decode a raw wait status as returned by waitpid().
  static ExitStatus from_wait_status(int status) noexcept;

  /// @brief Kind discriminator.
  [[nodiscard]] Kind kind() const noexcept { return kind_; }
  /// @brief True if exited with code 0.
  [[nodiscard]] bool success() const noexcept { return kind_ == Kind::exited && value_ == 0; }
  /// @brief Exit code (0-255), if the process exited normally.
  [[nodiscard]] std::optional<int> code() const noexcept;
  /// @brief Terminating signal, if the process was killed by one.
  [[nodiscard]] std::optional<int> signal() const noexcept;
  /// @brief Raw wait status.
  [[nodiscard]] std::uint32_t native() const noexcept { return native_; }

  /// @brief "exited with code N" or "terminated by signal S".
  [[nodiscard]] std::string describe() const;

 private:
  Kind kind_{Kind::exited};
  int value_{0};
  std::uint32_t native_{0};
};

/// @brief Report for one launched and reaped child.
struct LaunchResult {
  /// @brief Process identifier the child ran under.
  int pid = -1;
  /// @brief How the child ended.
  ExitStatus status;
  /// @brief Bytes captured from stdout when it was routed to a pipe.
  std::string stdout_data;
  /// @brief Bytes captured from stderr when it was routed to a pipe.
  std::string stderr_data;
};

/// @brief Exit code of a status, or errc::abnormal_termination for a signaled child.
Result<int> checked_exit_code(const ExitStatus& status);

}  // namespace launchpad
