#include "launchpad/internal/lowering.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <map>

#include "launchpad/internal/fd.hpp"

#if LAUNCHPAD_PLATFORM_MACOS
#include <crt_externs.h>
#else
extern char** environ;
#endif

namespace launchpad::internal {

namespace {

char** process_environ() {
#if LAUNCHPAD_PLATFORM_MACOS
  char*** envp = _NSGetEnviron();
  return (envp != nullptr) ? *envp : nullptr;
#else
  return ::environ;
#endif
}

enum class StdioTarget : std::uint8_t { stdin, stdout, stderr };

Error invalid(errc code, const char* context) {
  return Error{.code = make_error_code(code), .context = context};
}

OpenMode default_open_mode(StdioTarget target) {
  return target == StdioTarget::stdin ? OpenMode::read : OpenMode::write_truncate;
}

bool mode_fits(OpenMode mode, StdioTarget target) {
  if (target == StdioTarget::stdin) {
    return mode == OpenMode::read || mode == OpenMode::read_write;
  }
  return mode != OpenMode::read;
}

Result<StdioSpec> resolve_stdio(const std::optional<Stdio>& value, bool capture_default,
                                StdioTarget target) {
  StdioSpec spec;
  if (!value) {
    spec.kind = capture_default ? StdioSpec::Kind::piped : StdioSpec::Kind::inherit;
    return spec;
  }

  const auto& choice = value->value;
  if (std::holds_alternative<Stdio::Inherit>(choice)) {
    spec.kind = StdioSpec::Kind::inherit;
  } else if (std::holds_alternative<Stdio::Null>(choice)) {
    spec.kind = StdioSpec::Kind::null;
  } else if (std::holds_alternative<Stdio::Piped>(choice)) {
    spec.kind = StdioSpec::Kind::piped;
  } else if (const auto* fd = std::get_if<Stdio::Fd>(&choice)) {
    if (fd->fd < 0) {
      return invalid(errc::invalid_stdio, "negative stdio fd");
    }
    spec.kind = StdioSpec::Kind::fd;
    spec.fd = fd->fd;
  } else if (const auto* file = std::get_if<Stdio::File>(&choice)) {
    OpenMode mode = file->mode.value_or(default_open_mode(target));
    if (!mode_fits(mode, target)) {
      return invalid(errc::invalid_stdio, "file mode does not fit stream direction");
    }
    spec.kind = StdioSpec::Kind::file;
    spec.path = file->path;
    spec.mode = mode;
    spec.perms = file->perms;
  } else if (const auto* stream = std::get_if<Stdio::Stream>(&choice)) {
    if (target == StdioTarget::stdin) {
      return invalid(errc::invalid_stdio, "stdin cannot be routed to an output stream");
    }
    if (stream->sink == nullptr) {
      return invalid(errc::invalid_stdio, "null output stream");
    }
    spec.kind = StdioSpec::Kind::piped;
    spec.sink = stream->sink;
  }
  return spec;
}

std::vector<std::string> build_envp(const LaunchRequest& request) {
  std::map<std::string, std::string, std::less<>> env_map;
  if (request.inherit_env) {
    for (char** env = process_environ(); env != nullptr && *env != nullptr; ++env) {
      std::string_view entry(*env);
      auto pos = entry.find('=');
      if (pos == std::string_view::npos) {
        continue;
      }
      env_map.emplace(entry.substr(0, pos), entry.substr(pos + 1));
    }
  }
  for (const auto& [key, value] : request.env) {
    if (value.has_value()) {
      env_map[key] = *value;
    } else if (auto it = env_map.find(key); it != env_map.end()) {
      env_map.erase(it);
    }
  }

  std::vector<std::string> envp;
  envp.reserve(env_map.size());
  for (const auto& [key, value] : env_map) {
    envp.push_back(key + "=" + value);
  }
  return envp;
}

Result<void> check_inherit_fds(const std::vector<int>& fds) {
  for (int fd : fds) {
    if (fd <= STDERR_FILENO) {
      return invalid(errc::invalid_fd, "stdio descriptors are configured through Stdio");
    }
    if (!is_open_fd(fd)) {
      return invalid(errc::invalid_fd, "inherited descriptor is not open");
    }
  }
  return {};
}

}  // namespace

Result<SpawnSpec> lower_request(const LaunchRequest& request, SpawnMode mode) {
  if (request.program.empty()) {
    return invalid(errc::empty_program, "program");
  }
  if (request.args.empty()) {
    return invalid(errc::empty_argv, "args");
  }
  auto fds_ok = check_inherit_fds(request.options.inherit_fds);
  if (!fds_ok) {
    return fds_ok.error();
  }

  SpawnSpec spec;
  spec.program = request.program;
  spec.argv = request.args;
  spec.cwd = request.cwd;
  spec.envp = build_envp(request);
  spec.strategy = request.options.strategy;
  spec.large_footprint_bytes = request.options.large_footprint_bytes;
  spec.new_process_group = request.options.new_process_group;
  spec.inherit_fds = request.options.inherit_fds;
  std::sort(spec.inherit_fds.begin(), spec.inherit_fds.end());
  spec.inherit_fds.erase(std::unique(spec.inherit_fds.begin(), spec.inherit_fds.end()),
                         spec.inherit_fds.end());

  const bool capture = (mode == SpawnMode::capture);
  auto stdin_spec = resolve_stdio(request.stdin_io, false, StdioTarget::stdin);
  if (!stdin_spec) {
    return stdin_spec.error();
  }
  auto stdout_spec = resolve_stdio(request.stdout_io, capture, StdioTarget::stdout);
  if (!stdout_spec) {
    return stdout_spec.error();
  }
  auto stderr_spec = resolve_stdio(request.stderr_io, capture, StdioTarget::stderr);
  if (!stderr_spec) {
    return stderr_spec.error();
  }
  spec.stdin_spec = std::move(stdin_spec.value());
  spec.stdout_spec = std::move(stdout_spec.value());
  spec.stderr_spec = std::move(stderr_spec.value());

  if (request.options.merge_stderr_into_stdout) {
    spec.stderr_spec = StdioSpec{};
    spec.stderr_spec.kind = StdioSpec::Kind::dup_stdout;
  }
  return spec;
}

}  // namespace launchpad::internal
