#include "launchpad/child.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <ostream>
#include <string>
#include <utility>

#include "launchpad/internal/access.hpp"
#include "launchpad/internal/clock.hpp"
#include "launchpad/internal/io_drain.hpp"
#include "launchpad/internal/spawn.hpp"
#include "launchpad/internal/wait_policy.hpp"
#include "launchpad/log.hpp"

namespace launchpad {

struct Child::Impl {
  explicit Impl(internal::Spawned spawned_in) : spawned(std::move(spawned_in)) {
    if (spawned.stdin_fd) {
      stdin_pipe.emplace(*spawned.stdin_fd);
    }
    if (spawned.stdout_fd) {
      stdout_pipe.emplace(*spawned.stdout_fd);
    }
    if (spawned.stderr_fd) {
      stderr_pipe.emplace(*spawned.stderr_fd);
    }
  }

  internal::Spawned spawned;
  std::optional<PipeWriter> stdin_pipe;
  std::optional<PipeReader> stdout_pipe;
  std::optional<PipeReader> stderr_pipe;
};

namespace {

Error empty_handle(errc code, const char* operation) {
  return Error{.code = make_error_code(code), .context = std::string(operation) + " on empty Child"};
}

internal::ByteSink to_stream(std::ostream* sink) {
  if (sink == nullptr) {
    return {};
  }
  return [sink](std::string_view bytes) {
    sink->write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  };
}

PipeReader* sink_pipe(std::optional<PipeReader>& pipe, std::ostream* sink) {
  if (sink == nullptr || !pipe || !pipe->is_open()) {
    return nullptr;
  }
  return &*pipe;
}

// Copy output routed to caller streams until the child closes it.
Result<void> drain_to_sinks(const internal::Spawned& spawned, std::optional<PipeReader>& stdout_pipe,
                            std::optional<PipeReader>& stderr_pipe) {
  std::ostream* out_sink = spawned.stdout_sink;
  std::ostream* err_sink = spawned.stderr_sink;
  PipeReader* out = sink_pipe(stdout_pipe, out_sink);
  PipeReader* err = sink_pipe(stderr_pipe, err_sink);
  if (out == nullptr && err == nullptr) {
    return {};
  }
  auto drained = internal::drain_pipes(out, to_stream(out_sink), err, to_stream(err_sink));
  if (!drained) {
    return drained;
  }
  for (std::ostream* sink : {out_sink, err_sink}) {
    if (sink != nullptr && !sink->flush()) {
      return make_os_error(errc::write_failed, EIO, "write child output to stream");
    }
  }
  return {};
}

// One bounded round of drain_to_sinks, run while a timed wait polls.
Result<bool> pump_sinks(const internal::Spawned& spawned, std::optional<PipeReader>& stdout_pipe,
                        std::optional<PipeReader>& stderr_pipe, std::chrono::milliseconds budget) {
  std::ostream* out_sink = spawned.stdout_sink;
  std::ostream* err_sink = spawned.stderr_sink;
  return internal::drain_pipes_for(sink_pipe(stdout_pipe, out_sink), to_stream(out_sink),
                                   sink_pipe(stderr_pipe, err_sink), to_stream(err_sink), budget);
}

void warn_if_unreaped(const internal::Spawned& spawned) {
  if (!spawned.exit_status) {
    LAUNCHPAD_LOG_WARNING("child " + std::to_string(spawned.pid) +
                          " dropped without being waited for; it stays a zombie until reaped");
  }
}

}  // namespace

Child::Child(Child&& other) noexcept = default;

Child& Child::operator=(Child&& other) noexcept {
  if (this != &other) {
    if (impl_) {
      warn_if_unreaped(impl_->spawned);
    }
    impl_ = std::move(other.impl_);
  }
  return *this;
}

Child::~Child() {
  if (impl_) {
    warn_if_unreaped(impl_->spawned);
  }
}

namespace internal {

Child ChildAccess::from_spawned(Spawned spawned) {
  Child child;
  child.impl_ = std::make_unique<Child::Impl>(std::move(spawned));
  return child;
}

Spawned& ChildAccess::spawned(Child& child) { return child.impl_->spawned; }

}  // namespace internal

int Child::id() const noexcept { return impl_ ? impl_->spawned.pid : -1; }

Strategy Child::strategy() const noexcept {
  return impl_ ? impl_->spawned.strategy : Strategy::automatic;
}

bool Child::reaped() const noexcept { return impl_ && impl_->spawned.exit_status.has_value(); }

std::optional<PipeWriter> Child::take_stdin() noexcept {
  if (!impl_) {
    return std::nullopt;
  }
  return std::exchange(impl_->stdin_pipe, std::nullopt);
}

std::optional<PipeReader> Child::take_stdout() noexcept {
  if (!impl_) {
    return std::nullopt;
  }
  return std::exchange(impl_->stdout_pipe, std::nullopt);
}

std::optional<PipeReader> Child::take_stderr() noexcept {
  if (!impl_) {
    return std::nullopt;
  }
  return std::exchange(impl_->stderr_pipe, std::nullopt);
}

Result<ExitStatus> Child::wait() {
  if (!impl_) {
    return empty_handle(errc::wait_failed, "wait");
  }
  if (impl_->spawned.exit_status) {
    return *impl_->spawned.exit_status;
  }
  // A child reading stdin would otherwise never see EOF.
  impl_->stdin_pipe.reset();
  auto drained = drain_to_sinks(impl_->spawned, impl_->stdout_pipe, impl_->stderr_pipe);
  auto status = internal::wait_blocking(impl_->spawned);
  if (!drained) {
    return drained.error();
  }
  return status;
}

Result<ExitStatus> Child::wait(WaitOptions options) {
  if (!impl_) {
    return empty_handle(errc::wait_failed, "wait");
  }
  if (!options.timeout) {
    return wait();
  }
  impl_->stdin_pipe.reset();
  internal::Spawned& spawned = impl_->spawned;
  internal::WaitOps ops{
      .try_wait = [&spawned] { return internal::try_wait(spawned); },
      .wait_blocking = [&spawned] { return internal::wait_blocking(spawned); },
      .terminate = [&spawned] { return internal::send_signal(spawned, SIGTERM); },
      .kill = [&spawned] { return internal::send_signal(spawned, SIGKILL); },
      .pump =
          [impl = impl_.get()](std::chrono::milliseconds budget) {
            return pump_sinks(impl->spawned, impl->stdout_pipe, impl->stderr_pipe, budget);
          },
  };
  auto status = internal::wait_with_timeout(ops, internal::steady_clock(), options.timeout,
                                            options.kill_grace);
  // Whatever the child left in routed pipes is still delivered once it is gone.
  if (spawned.exit_status) {
    auto drained = drain_to_sinks(impl_->spawned, impl_->stdout_pipe, impl_->stderr_pipe);
    if (!drained && status) {
      return drained.error();
    }
  }
  return status;
}

Result<std::optional<ExitStatus>> Child::try_wait() {
  if (!impl_) {
    return empty_handle(errc::wait_failed, "try_wait");
  }
  return internal::try_wait(impl_->spawned);
}

Result<void> Child::terminate() { return signal(SIGTERM); }

Result<void> Child::kill() { return signal(SIGKILL); }

Result<void> Child::signal(int signo) {
  if (!impl_) {
    return empty_handle(errc::signal_failed, "signal");
  }
  return internal::send_signal(impl_->spawned, signo);
}

}  // namespace launchpad
