#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <string>

#include "launchpad/internal/fd.hpp"
#include "launchpad/internal/spawn.hpp"
#include "launchpad/platform.hpp"

namespace launchpad::internal {

namespace {

constexpr long kFallbackMaxFd = 256;

// Step that failed between fork() and execve(), reported over the error pipe.
enum class ChildStage : int { setpgid = 1, chdir, redirect, inherit, exec };

struct ChildFailure {
  int stage;
  int error;
};

[[noreturn]] void report_and_exit(int error_fd, ChildStage stage) {
  ChildFailure failure{static_cast<int>(stage), errno};
  // Nothing is left to do if this write fails; the parent then sees exit 127.
  while (::write(error_fd, &failure, sizeof(failure)) == -1 && errno == EINTR) {
  }
  _exit(kExecFailureExitCode);
}

Error failure_error(const ChildFailure& failure) {
  switch (static_cast<ChildStage>(failure.stage)) {
    case ChildStage::exec:
      return make_os_error(classify_spawn_errno(failure.error), failure.error, "execve");
    case ChildStage::chdir:
      return make_os_error(errc::chdir_failed, failure.error, "chdir in child");
    case ChildStage::setpgid:
      return make_os_error(errc::spawn_failed, failure.error, "setpgid in child");
    case ChildStage::redirect:
    case ChildStage::inherit: {
      errc code = classify_spawn_errno(failure.error);
      if (code == errc::executable_not_found) {
        code = errc::spawn_failed;
      }
      return make_os_error(code, failure.error,
                           failure.stage == static_cast<int>(ChildStage::redirect)
                               ? "dup2 in child"
                               : "inherit descriptor in child");
    }
  }
  return make_os_error(errc::spawn_failed, failure.error, "child setup");
}

// Inclusive range; close_range() when the libc has it, a close() loop otherwise.
void close_between(unsigned first, unsigned last, long max_fd) {
  if (first > last) {
    return;
  }
#if LAUNCHPAD_HAS_CLOSE_RANGE
  if (::close_range(first, last, 0) == 0) {
    return;
  }
#endif
  long end = std::min(static_cast<long>(last), max_fd - 1);
  for (long fd = first; fd <= end; ++fd) {
    ::close(static_cast<int>(fd));
  }
}

// keep is sorted and every entry is above stderr.
void close_all_except(const std::vector<int>& keep, long max_fd) {
  unsigned next = STDERR_FILENO + 1;
  for (int fd : keep) {
    if (fd > 0 && static_cast<unsigned>(fd) > next) {
      close_between(next, static_cast<unsigned>(fd) - 1, max_fd);
    }
    next = std::max(next, static_cast<unsigned>(fd) + 1);
  }
  close_between(next, ~0U, max_fd);
}

void reap(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
  }
}

long max_open_fd_limit() {
  long max_fd = ::sysconf(_SC_OPEN_MAX);
  return max_fd < 0 ? kFallbackMaxFd : max_fd;
}

}  // namespace

Result<Spawned> spawn_fork_exec(const SpawnSpec& spec) {
  std::array<StreamEnds, 3> streams;
  const std::array<const StdioSpec*, 3> stdio = {&spec.stdin_spec, &spec.stdout_spec,
                                                 &spec.stderr_spec};
  for (int target = STDIN_FILENO; target <= STDERR_FILENO; ++target) {
    auto ends = open_stream(*stdio[target], target);
    if (!ends) {
      return ends.error();
    }
    streams[target] = std::move(ends.value());
  }

  // Carries a ChildFailure from the child; closes by itself on a successful execve.
  auto error_pipe = create_pipe();
  if (!error_pipe) {
    return error_pipe.error();
  }
  auto [error_read, error_write] = std::move(error_pipe.value());

  std::vector<int> keep = spec.inherit_fds;
  keep.push_back(error_write.get());
  std::ranges::sort(keep);

  // Everything the child touches is prepared here: after fork() only
  // async-signal-safe calls are allowed.
  std::vector<std::string> argv = spec.argv;
  std::vector<std::string> envp = spec.envp;
  std::vector<char*> argv_c = to_c_array(argv);
  std::vector<char*> envp_c = to_c_array(envp);
  const char* exec_path = spec.exec_path.c_str();
  const char* cwd = spec.cwd ? spec.cwd->c_str() : nullptr;
  const long max_fd = max_open_fd_limit();
  const int error_fd = error_write.get();
  const bool merge_stderr = spec.stderr_spec.kind == StdioSpec::Kind::dup_stdout;
  const std::array<int, 3> child_fds = {streams[0].child_fd, streams[1].child_fd,
                                        streams[2].child_fd};

  pid_t pid = ::fork();
  if (pid == -1) {
    int error = errno;
    return make_os_error(classify_spawn_errno(error), error, "fork");
  }

  if (pid == 0) {
    if (spec.new_process_group && ::setpgid(0, 0) == -1) {
      report_and_exit(error_fd, ChildStage::setpgid);
    }
    if (cwd != nullptr && ::chdir(cwd) == -1) {
      report_and_exit(error_fd, ChildStage::chdir);
    }
    for (int target = STDIN_FILENO; target <= STDERR_FILENO; ++target) {
      int source = child_fds[target];
      if (target == STDERR_FILENO && merge_stderr) {
        source = STDOUT_FILENO;
      }
      if (source != target && ::dup2(source, target) == -1) {
        report_and_exit(error_fd, ChildStage::redirect);
      }
    }
    for (int fd : spec.inherit_fds) {
      int flags = ::fcntl(fd, F_GETFD);
      if (flags == -1 || ::fcntl(fd, F_SETFD, flags & ~FD_CLOEXEC) == -1) {
        report_and_exit(error_fd, ChildStage::inherit);
      }
    }
    close_all_except(keep, max_fd);
    ::execve(exec_path, argv_c.data(), envp_c.data());
    report_and_exit(error_fd, ChildStage::exec);
  }

  error_write.reset(-1);
  for (auto& ends : streams) {
    ends.child_owned.reset(-1);
  }

  ChildFailure failure{};
  ssize_t got = 0;
  while (true) {
    got = ::read(error_read.get(), &failure, sizeof(failure));
    if (got != -1 || errno != EINTR) {
      break;
    }
  }
  if (got == -1) {
    int error = errno;
    ::kill(pid, SIGKILL);
    reap(pid);
    return make_os_error(errc::spawn_failed, error, "read child error pipe");
  }
  if (got > 0) {
    reap(pid);
    if (got != static_cast<ssize_t>(sizeof(failure))) {
      return make_os_error(errc::spawn_failed, EIO, "short child error report");
    }
    return failure_error(failure);
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
