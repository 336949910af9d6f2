#pragma once

#include <string>
#include <vector>

#include "launchpad/internal/fd.hpp"
#include "launchpad/internal/spawn_spec.hpp"
#include "launchpad/result.hpp"
#include "launchpad/status.hpp"
#include "launchpad/stdio.hpp"

namespace launchpad::internal {

/// @brief Exit code of a child whose setup failed before execve.
inline constexpr int kExecFailureExitCode = 127;
/// @brief Permissions for files created by a redirection without explicit perms.
inline constexpr int kDefaultFileMode = 0666;

/// @brief Resolve the executable and check the working directory before any process exists.
Result<void> prepare_spawn(SpawnSpec& spec);

/// @brief Validate, pick a strategy, and create the child.
Result<Spawned> spawn_process(SpawnSpec spec);

/// @brief Duplicate-then-replace backend.
Result<Spawned> spawn_fork_exec(const SpawnSpec& spec);
/// @brief Direct-spawn backend.
Result<Spawned> spawn_posix_spawn(const SpawnSpec& spec);

/// @brief Block until the child terminates; returns the cached status once reaped.
Result<ExitStatus> wait_blocking(Spawned& spawned);
/// @brief Non-blocking status check.
Result<std::optional<ExitStatus>> try_wait(Spawned& spawned);
/// @brief Signal the child, or its group when it leads one.
Result<void> send_signal(const Spawned& spawned, int signo);

// Shared by both backends.

/// @brief Descriptors backing one standard stream of a child being created.
struct StreamEnds {
  /// @brief Descriptor the child installs on the target; -1 for dup_stdout.
  int child_fd = -1;
  /// @brief Set when child_fd was opened for this launch; closed once the child exists.
  unique_fd child_owned;
  /// @brief Parent end of a pipe.
  unique_fd parent_end;
};

/// @brief Open files, /dev/null or a pipe for spec in the parent, all close-on-exec.
Result<StreamEnds> open_stream(const StdioSpec& spec, int target);

int open_flags_for(OpenMode mode);
std::vector<int> list_open_fds();

/// @brief Null-terminated pointer array into values, which must outlive it.
std::vector<char*> to_c_array(std::vector<std::string>& values);

}  // namespace launchpad::internal
