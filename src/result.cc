#include "launchpad/result.hpp"

#include <cerrno>
#include <utility>

namespace launchpad {

namespace {

class launchpad_error_category : public std::error_category {
 public:
  [[nodiscard]] const char* name() const noexcept override { return "launchpad"; }

  [[nodiscard]] std::string message(int value) const override {
    switch (static_cast<errc>(value)) {
      case errc::ok:
        return "ok";
      case errc::empty_program:
        return "no program given";
      case errc::empty_argv:
        return "empty argument list";
      case errc::invalid_stdio:
        return "invalid stdio configuration";
      case errc::invalid_fd:
        return "invalid inherited descriptor";
      case errc::resource_exhausted:
        return "resources exhausted creating process";
      case errc::executable_not_found:
        return "executable not found";
      case errc::chdir_failed:
        return "cannot enter working directory";
      case errc::spawn_failed:
        return "spawn failed";
      case errc::pipe_failed:
        return "pipe failed";
      case errc::open_failed:
        return "open failed";
      case errc::wait_failed:
        return "wait failed";
      case errc::signal_failed:
        return "signal delivery failed";
      case errc::timeout:
        return "timeout";
      case errc::abnormal_termination:
        return "terminated by signal";
      case errc::read_failed:
        return "read failed";
      case errc::write_failed:
        return "write failed";
    }
    return "unknown error";
  }
};

std::string describe(const Error& error) {
  std::string what = error.context;
  if (!what.empty()) {
    what.append(": ");
  }
  what.append(error.code.message());
  if (error.cause) {
    what.append(" (");
    what.append(error.cause.message());
    what.push_back(')');
  }
  return what;
}

}  // namespace

const std::error_category& error_category() noexcept {
  static launchpad_error_category category;
  return category;
}

std::error_code make_error_code(errc value) noexcept {
  return {static_cast<int>(value), error_category()};
}

errc classify_spawn_errno(int error) noexcept {
  switch (error) {
    case EAGAIN:
    case ENOMEM:
    case EMFILE:
    case ENFILE:
      return errc::resource_exhausted;
    case ENOENT:
    case EACCES:
    case ENOEXEC:
    case ENOTDIR:
    case ELOOP:
    case ENAMETOOLONG:
    case EISDIR:
      return errc::executable_not_found;
    default:
      return errc::spawn_failed;
  }
}

Error make_os_error(errc value, int error, std::string context) {
  return Error{.code = make_error_code(value),
               .context = std::move(context),
               .cause = std::error_code(error, std::system_category())};
}

LaunchError::LaunchError(Error error)
    : std::system_error(error.code, describe(error)), error_(std::move(error)) {}

namespace internal {

[[noreturn]] void throw_error(const Error& error) { throw LaunchError(error); }

}  // namespace internal

}  // namespace launchpad
