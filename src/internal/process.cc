#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <string>

#include "launchpad/config.hpp"
#include "launchpad/internal/exec_path.hpp"
#include "launchpad/internal/spawn.hpp"
#include "launchpad/internal/strategy.hpp"
#include "launchpad/log.hpp"

namespace launchpad::internal {

namespace {

constexpr long kFallbackMaxFd = 256;

Result<void> check_working_dir(const std::filesystem::path& cwd) {
  struct stat info{};
  if (::stat(cwd.c_str(), &info) == -1) {
    return make_os_error(errc::chdir_failed, errno, "working directory " + cwd.string());
  }
  if (!S_ISDIR(info.st_mode)) {
    return make_os_error(errc::chdir_failed, ENOTDIR, "working directory " + cwd.string());
  }
  if (::access(cwd.c_str(), X_OK) == -1) {
    return make_os_error(errc::chdir_failed, errno, "working directory " + cwd.string());
  }
  return {};
}

Result<unique_fd> open_for_child(const char* path, int flags, mode_t perms) {
  int fd = ::open(path, flags | O_CLOEXEC, perms);
  if (fd == -1) {
    int error = errno;
    errc code = (error == EMFILE || error == ENFILE) ? errc::resource_exhausted : errc::open_failed;
    return make_os_error(code, error, std::string("open ") + path);
  }
  return unique_fd(fd);
}

}  // namespace

Result<StreamEnds> open_stream(const StdioSpec& spec, int target) {
  const bool input = (target == STDIN_FILENO);
  StreamEnds ends;
  switch (spec.kind) {
    case StdioSpec::Kind::inherit:
      ends.child_fd = target;
      return ends;
    case StdioSpec::Kind::dup_stdout:
      return ends;
    case StdioSpec::Kind::fd: {
      if (spec.fd > STDERR_FILENO || spec.fd == target) {
        ends.child_fd = spec.fd;
        return ends;
      }
      // Streams are installed 0, 1, 2 in order, so a standard descriptor used
      // as a source may already be replaced; the child reads from a copy.
      auto copy = dup_cloexec(spec.fd);
      if (!copy) {
        return copy.error();
      }
      ends.child_owned = std::move(copy.value());
      break;
    }
    case StdioSpec::Kind::null: {
      auto fd = open_for_child("/dev/null", input ? O_RDONLY : O_WRONLY, 0);
      if (!fd) {
        return fd.error();
      }
      ends.child_owned = std::move(fd.value());
      break;
    }
    case StdioSpec::Kind::file: {
      auto perms = spec.perms.value_or(static_cast<FilePerms>(kDefaultFileMode));
      auto fd = open_for_child(spec.path.c_str(), open_flags_for(spec.mode), perms);
      if (!fd) {
        return fd.error();
      }
      ends.child_owned = std::move(fd.value());
      break;
    }
    case StdioSpec::Kind::piped: {
      auto pipe_result = create_pipe();
      if (!pipe_result) {
        return pipe_result.error();
      }
      auto [read_end, write_end] = std::move(pipe_result.value());
      if (input) {
        ends.child_owned = std::move(read_end);
        ends.parent_end = std::move(write_end);
      } else {
        ends.child_owned = std::move(write_end);
        ends.parent_end = std::move(read_end);
      }
      break;
    }
  }
  ends.child_fd = ends.child_owned.get();
  return ends;
}

int open_flags_for(OpenMode mode) {
  switch (mode) {
    case OpenMode::read:
      return O_RDONLY;
    case OpenMode::write_truncate:
      return O_WRONLY | O_CREAT | O_TRUNC;
    case OpenMode::write_append:
      return O_WRONLY | O_CREAT | O_APPEND;
    case OpenMode::read_write:
      return O_RDWR | O_CREAT;
  }
  return O_RDONLY;
}

std::vector<int> list_open_fds() {
  std::vector<int> fds;
#if LAUNCHPAD_PLATFORM_LINUX
  if (DIR* dir = ::opendir("/proc/self/fd")) {
    int dir_fd = ::dirfd(dir);
    while (dirent* entry = ::readdir(dir)) {
      if (entry->d_name[0] == '.') {
        continue;
      }
      char* end = nullptr;
      long value = std::strtol(entry->d_name, &end, 10);
      if (end == nullptr || *end != '\0' || value == dir_fd) {
        continue;
      }
      fds.push_back(static_cast<int>(value));
    }
    ::closedir(dir);
    std::ranges::sort(fds);
    return fds;
  }
#endif
  long max_fd = ::sysconf(_SC_OPEN_MAX);
  if (max_fd < 0) {
    max_fd = kFallbackMaxFd;
  }
  for (int fd = 0; fd < max_fd; ++fd) {
    errno = 0;
    if (::fcntl(fd, F_GETFD) != -1 || errno != EBADF) {
      fds.push_back(fd);
    }
  }
  return fds;
}

std::vector<char*> to_c_array(std::vector<std::string>& values) {
  std::vector<char*> pointers;
  pointers.reserve(values.size() + 1);
  for (auto& value : values) {
    pointers.push_back(value.data());
  }
  pointers.push_back(nullptr);
  return pointers;
}

Result<void> prepare_spawn(SpawnSpec& spec) {
  if (spec.cwd) {
    auto cwd_ok = check_working_dir(*spec.cwd);
    if (!cwd_ok) {
      return cwd_ok.error();
    }
  }
  auto exec_path = resolve_exec_path(spec.program, spec.envp, spec.cwd);
  if (!exec_path) {
    return exec_path.error();
  }
  spec.exec_path = std::move(exec_path.value());
  return {};
}

Result<Spawned> spawn_process(SpawnSpec spec) {
  auto prepared = prepare_spawn(spec);
  if (!prepared) {
    LAUNCHPAD_LOG_DEBUG("not spawning " + spec.program + ": " + prepared.error().context + ": " +
                        prepared.error().code.message());
    return prepared.error();
  }

  Strategy env_choice = spec.strategy == Strategy::automatic ? strategy_from_env()
                                                             : Strategy::automatic;
  std::optional<std::size_t> resident;
  if (!can_use_posix_spawn(spec)) {
    resident = resident_set_bytes();
  }
  Strategy strategy = select_strategy(spec, env_choice, resident);

  auto spawned = strategy == Strategy::posix_spawn ? spawn_posix_spawn(spec)
                                                   : spawn_fork_exec(spec);
  if (!spawned) {
    LAUNCHPAD_LOG_DEBUG(std::string(to_string(strategy)) + " failed for " + spec.exec_path +
                        ": " + spawned.error().context + ": " + spawned.error().code.message());
    return spawned.error();
  }

  spawned->strategy = strategy;
  spawned->stdout_sink = spec.stdout_spec.sink;
  spawned->stderr_sink = spec.stderr_spec.sink;
  LAUNCHPAD_LOG_DEBUG("spawned " + spec.exec_path + " as pid " + std::to_string(spawned->pid) +
                      " via " + std::string(to_string(strategy)));
  return spawned;
}

Result<ExitStatus> wait_blocking(Spawned& spawned) {
  if (spawned.exit_status) {
    return *spawned.exit_status;
  }
  int status = 0;
  while (::waitpid(spawned.pid, &status, 0) == -1) {
    if (errno != EINTR) {
      return make_os_error(errc::wait_failed, errno, "waitpid " + std::to_string(spawned.pid));
    }
  }
  spawned.exit_status = ExitStatus::from_wait_status(status);
  return *spawned.exit_status;
}

Result<std::optional<ExitStatus>> try_wait(Spawned& spawned) {
  if (spawned.exit_status) {
    return spawned.exit_status;
  }
  int status = 0;
  while (true) {
    pid_t rv = ::waitpid(spawned.pid, &status, WNOHANG);
    if (rv == spawned.pid) {
      spawned.exit_status = ExitStatus::from_wait_status(status);
      return spawned.exit_status;
    }
    if (rv == 0) {
      return std::optional<ExitStatus>();
    }
    if (errno != EINTR) {
      return make_os_error(errc::wait_failed, errno, "waitpid " + std::to_string(spawned.pid));
    }
  }
}

Result<void> send_signal(const Spawned& spawned, int signo) {
  if (spawned.exit_status) {
    // The pid may already belong to another process.
    return make_os_error(errc::signal_failed, ESRCH, "child already reaped");
  }
  pid_t target = spawned.pgid ? -*spawned.pgid : spawned.pid;
  if (::kill(target, signo) == -1) {
    return make_os_error(errc::signal_failed, errno, "kill " + std::to_string(target));
  }
  return {};
}

}  // namespace launchpad::internal
