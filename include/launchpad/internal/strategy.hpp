#pragma once

#include <cstddef>
#include <optional>

#include "launchpad/internal/spawn_spec.hpp"
#include "launchpad/request.hpp"

namespace launchpad::internal {

/// @brief Whether posix_spawn on this platform can express everything spec asks for.
bool can_use_posix_spawn(const SpawnSpec& spec);

/// @brief Resolve the concrete strategy for spec.
///
/// @param env_choice Strategy from LAUNCHPAD_STRATEGY, used when spec asks for automatic.
/// @param resident Caller's resident set size, for the large-footprint warning.
Strategy select_strategy(const SpawnSpec& spec, Strategy env_choice,
                         std::optional<std::size_t> resident);

}  // namespace launchpad::internal
