#pragma once

#include <cstdint>
#include <entt/entt.hpp>

#include "core/Time.h"       // IWYU pragma: keep
#include "ecs/Components.h"  // IWYU pragma: keep
#include "ecs/Entity.h"

class CollisionMap;

class World {
 public:
  EntityId create();
  void destroy(EntityId);

  // One fixed step against `map`: input, movement, then queued events are delivered.
  void step(const CollisionMap& map, TimeStep ts);

  entt::registry registry;
  entt::dispatcher events;

  // debug/test-friendly counters
  std::uint64_t steps = 0;
  int jumps = 0;
  int landings = 0;
  int rejectedSteps = 0;

  // external handle: "currently controlled player"
  EntityId player = kInvalidEntity;
};
