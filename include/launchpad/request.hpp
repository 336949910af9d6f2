#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "launchpad/stdio.hpp"

namespace launchpad {

/// @brief How the child process is created.
enum class Strategy : std::uint8_t {
  /// @brief Honor LAUNCHPAD_STRATEGY, else posix_spawn when the request allows it.
  automatic,
  /// @brief fork() then execve() in the duplicate.
  fork_exec,
  /// @brief posix_spawn(); no duplicated process is ever visible.
  posix_spawn,
};

/// @brief Options that affect process creation.
struct LaunchOptions {
  /// @brief Resident set size above which a fork/exec fallback is logged.
  static constexpr std::size_t kDefaultLargeFootprint = std::size_t{64} * 1024 * 1024;

  /// @brief Creation strategy.
  Strategy strategy = Strategy::automatic;
  /// @brief Threshold for the large-footprint warning; 0 disables it.
  std::size_t large_footprint_bytes = kDefaultLargeFootprint;
  /// @brief Place the child in a new process group led by itself.
  bool new_process_group = false;
  /// @brief Point the child's stderr at wherever its stdout goes.
  bool merge_stderr_into_stdout = false;
  /// @brief Descriptors above 2 the child keeps, under the same numbers.
  /// Every other descriptor above 2 is closed in the child.
  std::vector<int> inherit_fds;
};

/// @brief Everything needed to start one child process.
struct LaunchRequest {
  /// @brief Path (containing '/') or bare name searched on the child's PATH.
  std::string program;
  /// @brief Full argument vector; args[0] is conventionally the program name.
  std::vector<std::string> args;

  /// @brief Start from the caller's environment.
  bool inherit_env = true;
  /// @brief Environment overrides; std::nullopt removes the key.
  std::map<std::string, std::optional<std::string>, std::less<>> env;

  /// @brief Working directory for the child.
  std::optional<std::filesystem::path> cwd;

  /// @brief stdin configuration; unset inherits.
  std::optional<Stdio> stdin_io;
  /// @brief stdout configuration; unset inherits (or captures, for output()).
  std::optional<Stdio> stdout_io;
  /// @brief stderr configuration; unset inherits (or captures, for output()).
  std::optional<Stdio> stderr_io;

  /// @brief Creation options.
  LaunchOptions options;
};

}  // namespace launchpad
