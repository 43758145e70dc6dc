#include "ecs/World.h"

#include "ecs/Systems.h"

EntityId World::create() {
  return registry.create();
}

void World::destroy(EntityId id) {
  registry.destroy(id);
}

void World::step(const CollisionMap& map, TimeStep ts) {
  Systems::movement(*this, map, ts);
  events.update();
  ++steps;
}
