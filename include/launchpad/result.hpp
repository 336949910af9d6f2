#pragma once

#include <cstdint>
#include <string>
#include <system_error>
#include <type_traits>

#include "launchpad/platform.hpp"

#include "launchpad/internal/expected.hpp"

namespace launchpad {

/// @brief Error codes for launchpad operations.
enum class errc : std::uint8_t {
  /// @brief No error.
  ok = 0,

  // Request validation
  /// @brief Request names no program.
  empty_program,
  /// @brief Request has no argv entries.
  empty_argv,
  /// @brief Invalid stdio configuration.
  invalid_stdio,
  /// @brief Descriptor listed for inheritance is not usable.
  invalid_fd,

  // Process creation
  /// @brief The platform could not allocate a new process.
  resource_exhausted,
  /// @brief The program is missing or not executable.
  executable_not_found,
  /// @brief The working directory could not be entered.
  chdir_failed,
  /// @brief Process creation failed for another reason.
  spawn_failed,
  /// @brief Pipe creation failed.
  pipe_failed,
  /// @brief Opening a redirection target failed.
  open_failed,

  // Monitoring
  /// @brief Collecting the child's status failed.
  wait_failed,
  /// @brief Delivering a signal failed.
  signal_failed,
  /// @brief A bounded wait expired.
  timeout,
  /// @brief The child ended by a signal rather than an exit code.
  abnormal_termination,

  // Stream I/O
  /// @brief Read operation failed.
  read_failed,
  /// @brief Write operation failed.
  write_failed,
};

/// @brief Error payload returned by launchpad APIs.
struct Error {
  /// @brief Error code in the launchpad category.
  std::error_code code;
  /// @brief Short description of the failing step.
  std::string context;
  /// @brief Underlying OS error, if any.
  std::error_code cause{};
};

/// @brief launchpad error category for std::error_code.
const std::error_category& error_category() noexcept;
/// @brief Create an error_code in the launchpad category.
std::error_code make_error_code(errc value) noexcept;

/// @brief Map an errno from process creation or image replacement to launchpad's taxonomy.
errc classify_spawn_errno(int error) noexcept;

/// @brief Build an Error from an errc and an OS errno.
Error make_os_error(errc value, int error, std::string context);

/// @brief Exception thrown by the *_or_throw helpers.
class LaunchError : public std::system_error {
 public:
  explicit LaunchError(Error error);

  /// @brief The full error payload.
  [[nodiscard]] const Error& error() const noexcept { return error_; }

 private:
  Error error_;
};

/// @brief Result type used by launchpad APIs.
/// Errors convert implicitly, so functions may `return Error{...};`.
template <typename T>
using Result = expected<T, Error>;

namespace internal {
/// @brief Throw an error as a LaunchError.
[[noreturn]] void throw_error(const Error& error);
}  // namespace internal

}  // namespace launchpad

namespace std {

/// @brief Enable implicit conversion from launchpad::errc to std::error_code.
template <>
struct is_error_code_enum<launchpad::errc> : true_type {};

}  // namespace std
