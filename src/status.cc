#include "launchpad/status.hpp"

#include <sys/wait.h>

namespace launchpad {

ExitStatus ExitStatus::exited(
    int code, std::uint32_t native) noexcept {  // NOLINT(bugprone-easily-swappable-parameters)
  ExitStatus status;
  status.kind_ = Kind::exited;
  status.value_ = code;
  status.native_ = native;
  return status;
}

ExitStatus ExitStatus::signaled(
    int signo, std::uint32_t native) noexcept {  // NOLINT(bugprone-easily-swappable-parameters)
  ExitStatus status;
  status.kind_ = Kind::signaled;
  status.value_ = signo;
  status.native_ = native;
  return status;
}

ExitStatus ExitStatus::from_wait_status(int status) noexcept {
  auto native = static_cast<std::uint32_t>(status);
  if (WIFSIGNALED(status)) {
    return signaled(WTERMSIG(status), native);
  }
  return exited(WEXITSTATUS(status), native);
}

std::optional<int> ExitStatus::code() const noexcept {
  if (kind_ != Kind::exited) {
    return std::nullopt;
  }
  return value_;
}

std::optional<int> ExitStatus::signal() const noexcept {
  if (kind_ != Kind::signaled) {
    return std::nullopt;
  }
  return value_;
}

std::string ExitStatus::describe() const {
  if (kind_ == Kind::signaled) {
    return "terminated by signal " + std::to_string(value_);
  }
  return "exited with code " + std::to_string(value_);
}

Result<int> checked_exit_code(const ExitStatus& status) {
  if (auto code = status.code()) {
    return *code;
  }
  return Error{.code = make_error_code(errc::abnormal_termination), .context = status.describe()};
}

}  // namespace launchpad
