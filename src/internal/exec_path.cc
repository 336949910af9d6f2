#include "launchpad/internal/exec_path.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string_view>

namespace launchpad::internal {

namespace {

std::filesystem::path against_cwd(const std::filesystem::path& path,
                                  const std::optional<std::filesystem::path>& cwd) {
  if (cwd && path.is_relative()) {
    return *cwd / path;
  }
  return path;
}

// 0 when path names an executable regular file, else the errno explaining why not.
int check_executable(const std::filesystem::path& path) {
  struct stat info{};
  if (::stat(path.c_str(), &info) == -1) {
    return errno;
  }
  if (S_ISDIR(info.st_mode)) {
    return EACCES;
  }
  if (::access(path.c_str(), X_OK) == -1) {
    return errno;
  }
  return 0;
}

// The child changes directory before exec, so a path checked relative to the
// caller must be made absolute when a cwd is given.
std::string exec_form(const std::filesystem::path& candidate,
                      const std::optional<std::filesystem::path>& cwd) {
  if (cwd && candidate.is_relative()) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(candidate, ec);
    if (!ec) {
      return absolute.string();
    }
  }
  return candidate.string();
}

}  // namespace

std::optional<std::string> find_env_value(const std::vector<std::string>& envp, const char* key) {
  std::string_view wanted(key);
  for (const auto& entry : envp) {
    if (entry.size() > wanted.size() && entry[wanted.size()] == '=' &&
        std::string_view(entry).substr(0, wanted.size()) == wanted) {
      return entry.substr(wanted.size() + 1);
    }
  }
  return std::nullopt;
}

Result<std::string> resolve_exec_path(const std::string& program,
                                      const std::vector<std::string>& envp,
                                      const std::optional<std::filesystem::path>& cwd) {
  if (program.find('/') != std::string::npos) {
    std::filesystem::path candidate = against_cwd(program, cwd);
    if (int error = check_executable(candidate); error != 0) {
      return make_os_error(errc::executable_not_found, error, "exec path " + candidate.string());
    }
    return exec_form(candidate, cwd);
  }

  std::string search = find_env_value(envp, "PATH").value_or(kDefaultSearchPath);
  // Report EACCES over ENOENT when some candidate existed but was not executable.
  int last_error = ENOENT;
  std::string_view remaining(search);
  while (true) {
    auto colon = remaining.find(':');
    std::string_view dir = remaining.substr(0, colon);
    std::filesystem::path base = dir.empty() ? std::filesystem::path(".")
                                             : std::filesystem::path(dir);
    std::filesystem::path candidate = against_cwd(base, cwd) / program;
    int error = check_executable(candidate);
    if (error == 0) {
      return exec_form(candidate, cwd);
    }
    if (error == EACCES) {
      last_error = EACCES;
    }
    if (colon == std::string_view::npos) {
      break;
    }
    remaining.remove_prefix(colon + 1);
  }
  return make_os_error(errc::executable_not_found, last_error, "search PATH for " + program);
}

}  // namespace launchpad::internal
