#include "launchpad/command.hpp"

#include <utility>

#include "launchpad/launcher.hpp"

namespace launchpad {

Command::Command(std::string program) {
  request_.args.push_back(program);
  request_.program = std::move(program);
}

Command& Command::arg(std::string value) {
  request_.args.push_back(std::move(value));
  return *this;
}

Command& Command::arg(const char* value) {
  request_.args.emplace_back(value);
  return *this;
}

Command& Command::arg(std::string_view value) {
  request_.args.emplace_back(value);
  return *this;
}

Command& Command::args(std::initializer_list<std::string_view> values) {
  request_.args.insert(request_.args.end(), values.begin(), values.end());
  return *this;
}

Command& Command::args(const std::string* values, std::size_t count) {
  request_.args.insert(request_.args.end(), values, values + count);
  return *this;
}

#if LAUNCHPAD_HAS_STD_SPAN
Command& Command::args(std::span<const std::string> values) {
  request_.args.insert(request_.args.end(), values.begin(), values.end());
  return *this;
}
#endif

Command& Command::arg0(std::string value) {
  request_.args.front() = std::move(value);
  return *this;
}

Command& Command::current_dir(std::filesystem::path path) {
  request_.cwd = std::move(path);
  return *this;
}

Command& Command::env(std::string key, std::string value) {
  request_.env[std::move(key)] = std::move(value);
  return *this;
}

Command& Command::env_remove(std::string_view key) {
  request_.env[std::string(key)] = std::nullopt;
  return *this;
}

Command& Command::env_clear() {
  request_.inherit_env = false;
  // Overrides made so far still apply; removals of inherited keys become moot.
  std::erase_if(request_.env, [](const auto& entry) { return !entry.second.has_value(); });
  return *this;
}

Command& Command::stdin(Stdio value) {
  request_.stdin_io = std::move(value);
  return *this;
}

Command& Command::stdout(Stdio value) {
  request_.stdout_io = std::move(value);
  return *this;
}

Command& Command::stderr(Stdio value) {
  request_.stderr_io = std::move(value);
  return *this;
}

Command& Command::strategy(Strategy value) {
  request_.options.strategy = value;
  return *this;
}

Command& Command::inherit_fd(int fd) {
  request_.options.inherit_fds.push_back(fd);
  return *this;
}

Command& Command::options(LaunchOptions value) {
  request_.options = std::move(value);
  return *this;
}

Result<Child> Command::spawn() const { return launchpad::spawn(request_); }

Result<LaunchResult> Command::launch() const { return launchpad::launch(request_); }

Result<LaunchResult> Command::output() const { return launch_capture(request_); }

Child Command::spawn_or_throw() const {
  auto child = spawn();
  if (!child) {
    internal::throw_error(child.error());
  }
  return std::move(child.value());
}

LaunchResult Command::launch_or_throw() const { return launchpad::launch_or_throw(request_); }

LaunchResult Command::output_or_throw() const {
  auto result = output();
  if (!result) {
    internal::throw_error(result.error());
  }
  return std::move(result.value());
}

}  // namespace launchpad
