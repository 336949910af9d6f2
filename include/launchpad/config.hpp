#pragma once

/// @file config.hpp
/// @brief Runtime configuration read from the environment.
///
/// | Variable              | Values                                        |
/// |-----------------------|-----------------------------------------------|
/// | LAUNCHPAD_STRATEGY    | auto, fork_exec (fork), posix_spawn (spawn)   |
/// | LAUNCHPAD_LOG_LEVEL   | trace, debug, info, warning, error, off       |

#include <cstddef>
#include <optional>
#include <string_view>

#include "launchpad/log.hpp"
#include "launchpad/request.hpp"

namespace launchpad {

/// @brief Environment variable naming the strategy used for Strategy::automatic.
inline constexpr const char* kStrategyEnvVar = "LAUNCHPAD_STRATEGY";
/// @brief Environment variable holding the initial log level.
inline constexpr const char* kLogLevelEnvVar = "LAUNCHPAD_LOG_LEVEL";

std::optional<Strategy> parse_strategy(std::string_view text) noexcept;
std::string_view to_string(Strategy strategy) noexcept;

std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;
std::string_view to_string(LogLevel level) noexcept;

/// @brief Strategy named by LAUNCHPAD_STRATEGY; automatic when unset or invalid.
Strategy strategy_from_env();
/// @brief Level named by LAUNCHPAD_LOG_LEVEL; warning when unset or invalid.
LogLevel log_level_from_env();

/// @brief Resident set size of the calling process in bytes, if it can be measured.
std::optional<std::size_t> resident_set_bytes();

}  // namespace launchpad
