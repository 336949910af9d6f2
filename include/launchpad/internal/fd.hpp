#pragma once

#include <fcntl.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <utility>

#include "launchpad/platform.hpp"
#include "launchpad/result.hpp"

namespace launchpad::internal {

/// @brief Owning file descriptor.
class unique_fd {
 public:
  unique_fd() = default;
  explicit unique_fd(int fd) : fd_(fd) {}
  unique_fd(unique_fd&& other) noexcept : fd_(other.release()) {}
  unique_fd& operator=(unique_fd&& other) noexcept {
    if (this != &other) {
      reset(other.release());
    }
    return *this;
  }
  unique_fd(const unique_fd&) = delete;
  unique_fd& operator=(const unique_fd&) = delete;
  ~unique_fd() { reset(-1); }

  [[nodiscard]] int get() const noexcept { return fd_; }
  [[nodiscard]] int release() noexcept { return std::exchange(fd_, -1); }

  void reset(int fd) noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

  explicit operator bool() const noexcept { return fd_ >= 0; }

 private:
  int fd_{-1};
};

inline Result<void> set_cloexec(int fd) {
  int flags = ::fcntl(fd, F_GETFD);
  if (flags == -1 || ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == -1) {
    return make_os_error(errc::spawn_failed, errno, "fcntl(FD_CLOEXEC)");
  }
  return {};
}

inline Result<void> set_nonblocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL);
  if (flags == -1 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
    return make_os_error(errc::read_failed, errno, "fcntl(O_NONBLOCK)");
  }
  return {};
}

/// @brief True if fd names an open descriptor.
inline bool is_open_fd(int fd) noexcept { return fd >= 0 && ::fcntl(fd, F_GETFD) != -1; }

/// @brief Duplicate fd to a close-on-exec descriptor numbered above stderr.
inline Result<unique_fd> dup_cloexec(int fd) {
  int copy = ::fcntl(fd, F_DUPFD_CLOEXEC, STDERR_FILENO + 1);
  if (copy == -1) {
    return make_os_error(errno == EMFILE ? errc::resource_exhausted : errc::spawn_failed, errno,
                         "fcntl(F_DUPFD_CLOEXEC)");
  }
  return unique_fd(copy);
}

/// @brief Create a pipe whose both ends are close-on-exec.
inline Result<std::pair<unique_fd, unique_fd>> create_pipe() {
  std::array<int, 2> fds{};
#if LAUNCHPAD_PLATFORM_LINUX
  if (::pipe2(fds.data(), O_CLOEXEC) == -1) {
    return make_os_error(errc::pipe_failed, errno, "pipe2");
  }
  return std::make_pair(unique_fd(fds[0]), unique_fd(fds[1]));
#else
  if (::pipe(fds.data()) == -1) {
    return make_os_error(errc::pipe_failed, errno, "pipe");
  }
  unique_fd read_end(fds[0]);
  unique_fd write_end(fds[1]);
  auto cloexec_read = set_cloexec(read_end.get());
  if (!cloexec_read) {
    return cloexec_read.error();
  }
  auto cloexec_write = set_cloexec(write_end.get());
  if (!cloexec_write) {
    return cloexec_write.error();
  }
  return std::make_pair(std::move(read_end), std::move(write_end));
#endif
}

}  // namespace launchpad::internal
