#pragma once

#include <cstdint>

#include "launchpad/internal/spawn_spec.hpp"
#include "launchpad/request.hpp"
#include "launchpad/result.hpp"

namespace launchpad::internal {

/// @brief What the caller intends to do with unset output streams.
enum class SpawnMode : std::uint8_t { spawn, capture };

/// @brief Validate a request and resolve its environment and stream configuration.
///
/// Does not touch the filesystem; program and cwd checks happen in prepare_spawn().
Result<SpawnSpec> lower_request(const LaunchRequest& request, SpawnMode mode);

}  // namespace launchpad::internal
