#pragma once

#include <memory>

#include "launchpad/child.hpp"
#include "launchpad/internal/spawn_spec.hpp"

namespace launchpad::internal {

struct ChildAccess {
  static Child from_spawned(Spawned spawned);
  static Spawned& spawned(Child& child);
};

}  // namespace launchpad::internal
