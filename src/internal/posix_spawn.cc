#include <spawn.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <string>

#include "launchpad/internal/fd.hpp"
#include "launchpad/internal/spawn.hpp"
#include "launchpad/platform.hpp"

namespace launchpad::internal {

namespace {

struct SpawnActionState {
  posix_spawn_file_actions_t actions;
  posix_spawnattr_t attr;
  bool actions_ready = false;
  bool attr_ready = false;

  SpawnActionState() = default;
  SpawnActionState(const SpawnActionState&) = delete;
  SpawnActionState& operator=(const SpawnActionState&) = delete;

  ~SpawnActionState() {
    if (actions_ready) {
      posix_spawn_file_actions_destroy(&actions);
    }
    if (attr_ready) {
      posix_spawnattr_destroy(&attr);
    }
  }
};

Result<void> check_rc(int rc, const char* context) {
  if (rc != 0) {
    errc code = (rc == ENOMEM) ? errc::resource_exhausted : errc::spawn_failed;
    return make_os_error(code, rc, context);
  }
  return {};
}

// Closes every descriptor above stderr except keep (sorted). Actions run in
// order, so these must be queued after the dup2 actions.
Result<void> add_close_actions(posix_spawn_file_actions_t* actions, const std::vector<int>& keep) {
#if LAUNCHPAD_HAS_CLOSE_RANGE
  const int close_from = keep.empty() ? STDERR_FILENO + 1 : keep.back() + 1;
  for (int fd : list_open_fds()) {
    if (fd <= STDERR_FILENO || fd >= close_from || std::ranges::binary_search(keep, fd)) {
      continue;
    }
    auto added = check_rc(posix_spawn_file_actions_addclose(actions, fd),
                          "posix_spawn_file_actions_addclose");
    if (!added) {
      return added;
    }
  }
  return check_rc(posix_spawn_file_actions_addclosefrom_np(actions, close_from),
                  "posix_spawn_file_actions_addclosefrom_np");
#else
  for (int fd : list_open_fds()) {
    if (fd <= STDERR_FILENO || std::ranges::binary_search(keep, fd)) {
      continue;
    }
    auto added = check_rc(posix_spawn_file_actions_addclose(actions, fd),
                          "posix_spawn_file_actions_addclose");
    if (!added) {
      return added;
    }
  }
  return {};
#endif
}

}  // namespace

Result<Spawned> spawn_posix_spawn(const SpawnSpec& spec) {
  SpawnActionState state;
  auto init_actions = check_rc(posix_spawn_file_actions_init(&state.actions),
                               "posix_spawn_file_actions_init");
  if (!init_actions) {
    return init_actions.error();
  }
  state.actions_ready = true;
  auto init_attr = check_rc(posix_spawnattr_init(&state.attr), "posix_spawnattr_init");
  if (!init_attr) {
    return init_attr.error();
  }
  state.attr_ready = true;

  std::array<StreamEnds, 3> streams;
  const std::array<const StdioSpec*, 3> stdio = {&spec.stdin_spec, &spec.stdout_spec,
                                                 &spec.stderr_spec};
  for (int target = STDIN_FILENO; target <= STDERR_FILENO; ++target) {
    auto ends = open_stream(*stdio[target], target);
    if (!ends) {
      return ends.error();
    }
    streams[target] = std::move(ends.value());

    int source = streams[target].child_fd;
    if (stdio[target]->kind == StdioSpec::Kind::dup_stdout) {
      source = STDOUT_FILENO;
    }
    if (source == target) {
      continue;
    }
    auto dup = check_rc(posix_spawn_file_actions_adddup2(&state.actions, source, target),
                        "posix_spawn_file_actions_adddup2");
    if (!dup) {
      return dup.error();
    }
  }

  // dup2 onto the same number is not guaranteed to clear close-on-exec, so
  // each inherited descriptor is reinstalled from a temporary copy.
  std::vector<unique_fd> temporaries;
  temporaries.reserve(spec.inherit_fds.size());
  for (int fd : spec.inherit_fds) {
    auto copy = dup_cloexec(fd);
    if (!copy) {
      return copy.error();
    }
    auto dup = check_rc(posix_spawn_file_actions_adddup2(&state.actions, copy->get(), fd),
                        "posix_spawn_file_actions_adddup2");
    if (!dup) {
      return dup.error();
    }
    temporaries.push_back(std::move(copy.value()));
  }

  if (spec.cwd) {
#if LAUNCHPAD_HAS_SPAWN_CHDIR
    auto chdir_action = check_rc(
        posix_spawn_file_actions_addchdir_np(&state.actions, spec.cwd->c_str()),
        "posix_spawn_file_actions_addchdir_np");
    if (!chdir_action) {
      return chdir_action.error();
    }
#else
    return Error{.code = make_error_code(errc::chdir_failed),
                 .context = "posix_spawn cannot change directory on this platform"};
#endif
  }

  short flags = 0;
  if (spec.new_process_group) {
#ifdef POSIX_SPAWN_SETPGROUP
    flags = static_cast<short>(flags | POSIX_SPAWN_SETPGROUP);
    auto pgroup = check_rc(posix_spawnattr_setpgroup(&state.attr, 0), "posix_spawnattr_setpgroup");
    if (!pgroup) {
      return pgroup.error();
    }
#else
    return Error{.code = make_error_code(errc::spawn_failed),
                 .context = "posix_spawn cannot create a process group on this platform"};
#endif
  }
#ifdef POSIX_SPAWN_CLOEXEC_DEFAULT
  flags = static_cast<short>(flags | POSIX_SPAWN_CLOEXEC_DEFAULT);
#else
  auto closes = add_close_actions(&state.actions, spec.inherit_fds);
  if (!closes) {
    return closes.error();
  }
#endif
  if (flags != 0) {
    auto set_flags = check_rc(posix_spawnattr_setflags(&state.attr, flags),
                              "posix_spawnattr_setflags");
    if (!set_flags) {
      return set_flags.error();
    }
  }

  std::vector<std::string> argv = spec.argv;
  std::vector<std::string> envp = spec.envp;
  std::vector<char*> argv_c = to_c_array(argv);
  std::vector<char*> envp_c = to_c_array(envp);

  pid_t pid = -1;
  int rc = ::posix_spawn(&pid, spec.exec_path.c_str(), &state.actions, &state.attr,
                         argv_c.data(), envp_c.data());
  if (rc != 0) {
    return make_os_error(classify_spawn_errno(rc), rc, "posix_spawn " + spec.exec_path);
  }

  Spawned spawned;
  spawned.pid = pid;
  if (spec.new_process_group) {
    spawned.pgid = pid;
  }
  std::array<std::optional<int>*, 3> parent_fds = {&spawned.stdin_fd, &spawned.stdout_fd,
                                                   &spawned.stderr_fd};
  for (int target = STDIN_FILENO; target <= STDERR_FILENO; ++target) {
    if (streams[target].parent_end) {
      *parent_fds[target] = streams[target].parent_end.release();
    }
  }
  return spawned;
}

}  // namespace launchpad::internal
