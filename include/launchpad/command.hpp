#pragma once

#include <cstddef>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>

#include "launchpad/child.hpp"
#include "launchpad/platform.hpp"
#include "launchpad/request.hpp"
#include "launchpad/result.hpp"
#include "launchpad/status.hpp"
#include "launchpad/stdio.hpp"

#if LAUNCHPAD_HAS_STD_SPAN
#include <span>
#endif

namespace launchpad {

/// @brief Builder for a LaunchRequest.
///
/// @code
/// auto result = Command("python3").arg("job.py").arg("--fast").output();
/// @endcode
class Command {
 public:
  /// @brief Start a request for program, with argv[0] = program.
  explicit Command(std::string program);

  Command& arg(std::string value);
  Command& arg(const char* value);
  Command& arg(std::string_view value);
  Command& args(std::initializer_list<std::string_view> values);
  Command& args(const std::string* values, std::size_t count);
#if LAUNCHPAD_HAS_STD_SPAN
  Command& args(std::span<const std::string> values);
#endif
  /// @brief Replace argv[0] without changing the program that is executed.
  Command& arg0(std::string value);

  Command& current_dir(std::filesystem::path path);

  /// @brief Set or override an environment variable.
  Command& env(std::string key, std::string value);
  /// @brief Remove an environment variable.
  Command& env_remove(std::string_view key);
  /// @brief Start from an empty environment instead of the caller's.
  Command& env_clear();

  Command& stdin(Stdio value);
  Command& stdout(Stdio value);
  Command& stderr(Stdio value);

  Command& strategy(Strategy value);
  /// @brief Keep fd open in the child under the same number.
  Command& inherit_fd(int fd);
  /// @brief Replace all launch options.
  Command& options(LaunchOptions value);

  /// @brief The request built so far.
  [[nodiscard]] const LaunchRequest& request() const noexcept { return request_; }

  /// @brief Start the child without waiting.
  [[nodiscard]] Result<Child> spawn() const;
  /// @brief Start, wait, and report; unset streams are inherited.
  [[nodiscard]] Result<LaunchResult> launch() const;
  /// @brief Start, capture stdout/stderr, wait; unset streams are captured.
  [[nodiscard]] Result<LaunchResult> output() const;

  [[nodiscard]] Child spawn_or_throw() const;
  [[nodiscard]] LaunchResult launch_or_throw() const;
  [[nodiscard]] LaunchResult output_or_throw() const;

 private:
  LaunchRequest request_;
};

}  // namespace launchpad
