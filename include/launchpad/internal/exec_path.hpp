#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "launchpad/result.hpp"

namespace launchpad::internal {

/// @brief Search list used when the child environment has no PATH.
inline constexpr const char* kDefaultSearchPath = "/usr/bin:/bin";

/// @brief Value of key in a KEY=VALUE list.
std::optional<std::string> find_env_value(const std::vector<std::string>& envp, const char* key);

/// @brief Locate the executable the child should run.
///
/// A program containing '/' is taken as a path (relative to cwd when given).
/// Otherwise each entry of the child's PATH is tried in order; relative entries
/// are resolved against cwd. Fails with errc::executable_not_found when no
/// executable candidate exists.
Result<std::string> resolve_exec_path(const std::string& program,
                                      const std::vector<std::string>& envp,
                                      const std::optional<std::filesystem::path>& cwd);

}  // namespace launchpad::internal
