#include "launchpad/internal/strategy.hpp"

#include <spawn.h>

#include <string>

#include "launchpad/config.hpp"
#include "launchpad/log.hpp"

namespace launchpad::internal {

namespace {

constexpr bool kHasSpawnPgroup =
#ifdef POSIX_SPAWN_SETPGROUP
    true;
#else
    false;
#endif

constexpr bool kHasSpawnChdir = LAUNCHPAD_HAS_SPAWN_CHDIR != 0;

constexpr std::size_t kMiB = std::size_t{1024} * 1024;

}  // namespace

bool can_use_posix_spawn(const SpawnSpec& spec) {
  if (spec.cwd && !kHasSpawnChdir) {
    return false;
  }
  if (spec.new_process_group && !kHasSpawnPgroup) {
    return false;
  }
  return true;
}

Strategy select_strategy(const SpawnSpec& spec, Strategy env_choice,
                         std::optional<std::size_t> resident) {
  Strategy wanted = spec.strategy == Strategy::automatic ? env_choice : spec.strategy;
  if (wanted == Strategy::fork_exec) {
    return Strategy::fork_exec;
  }
  if (can_use_posix_spawn(spec)) {
    return Strategy::posix_spawn;
  }

  if (wanted == Strategy::posix_spawn) {
    LAUNCHPAD_LOG_DEBUG("posix_spawn cannot express this request; using fork_exec for " +
                        spec.program);
  }
  if (resident && spec.large_footprint_bytes != 0 && *resident >= spec.large_footprint_bytes) {
    LAUNCHPAD_LOG_WARNING("falling back to fork_exec for " + spec.program + " with " +
                          std::to_string(*resident / kMiB) + " MiB resident");
  }
  return Strategy::fork_exec;
}

}  // namespace launchpad::internal
