#include "launchpad/launcher.hpp"

#include <cerrno>
#include <ostream>
#include <string>
#include <utility>

#include "launchpad/internal/access.hpp"
#include "launchpad/internal/io_drain.hpp"
#include "launchpad/internal/lowering.hpp"
#include "launchpad/internal/spawn.hpp"

namespace launchpad {

namespace {

// Routed output goes to the caller's stream when one was given, otherwise
// into the result.
internal::ByteSink collect_into(std::ostream* sink, std::string& captured) {
  if (sink != nullptr) {
    return [sink](std::string_view bytes) {
      sink->write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    };
  }
  return [&captured](std::string_view bytes) { captured.append(bytes); };
}

Result<void> flush_sinks(std::ostream* out, std::ostream* err) {
  for (std::ostream* sink : {out, err}) {
    if (sink != nullptr && !sink->flush()) {
      return make_os_error(errc::write_failed, EIO, "write child output to stream");
    }
  }
  return {};
}

Result<Child> start(const LaunchRequest& request, internal::SpawnMode mode) {
  auto spec = internal::lower_request(request, mode);
  if (!spec) {
    return spec.error();
  }
  auto spawned = internal::spawn_process(std::move(spec.value()));
  if (!spawned) {
    return spawned.error();
  }
  return internal::ChildAccess::from_spawned(std::move(spawned.value()));
}

Result<LaunchResult> run_to_completion(const LaunchRequest& request, internal::SpawnMode mode) {
  auto started = start(request, mode);
  if (!started) {
    return started.error();
  }
  Child child = std::move(started.value());
  const internal::Spawned& spawned = internal::ChildAccess::spawned(child);
  std::ostream* out_sink = spawned.stdout_sink;
  std::ostream* err_sink = spawned.stderr_sink;

  LaunchResult result;
  result.pid = child.id();

  // Nothing will be written to a piped stdin; the child sees EOF at once.
  child.take_stdin().reset();
  auto stdout_pipe = child.take_stdout();
  auto stderr_pipe = child.take_stderr();
  auto drained = internal::drain_pipes(
      stdout_pipe ? &*stdout_pipe : nullptr, collect_into(out_sink, result.stdout_data),
      stderr_pipe ? &*stderr_pipe : nullptr, collect_into(err_sink, result.stderr_data));

  // Reap even when draining failed so no zombie is left behind.
  auto status = child.wait();
  if (!drained) {
    return drained.error();
  }
  if (!status) {
    return status.error();
  }
  auto flushed = flush_sinks(out_sink, err_sink);
  if (!flushed) {
    return flushed.error();
  }
  result.status = *status;
  return result;
}

}  // namespace

Result<Child> spawn(const LaunchRequest& request) {
  return start(request, internal::SpawnMode::spawn);
}

Result<LaunchResult> launch(const LaunchRequest& request) {
  return run_to_completion(request, internal::SpawnMode::spawn);
}

Result<LaunchResult> launch_capture(const LaunchRequest& request) {
  return run_to_completion(request, internal::SpawnMode::capture);
}

LaunchResult launch_or_throw(const LaunchRequest& request) {
  auto result = launch(request);
  if (!result) {
    internal::throw_error(result.error());
  }
  return std::move(result.value());
}

}  // namespace launchpad
