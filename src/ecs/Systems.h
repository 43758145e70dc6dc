#pragma once

#include "ecs/Components.h"
#include "ecs/Entity.h"

class CollisionMap;
class World;
struct MovementTuning;
struct TimeStep;

namespace Systems {

// Creates an actor with a fresh body (zero velocity, airborne). Returns kInvalidEntity when the
// position is not finite or the half-extents are not positive.
EntityId spawnBody(World& w, Vec2 pos, Vec2 halfExtents, const MovementTuning& tuning);

// Puts a body back at `pos` at rest, as after a spawn.
bool resetBody(World& w, EntityId id, Vec2 pos);

// Stores the sample for the next step. A pressed edge is latched until a step consumes it.
void applyInput(World& w, EntityId id, const MoveInput& input);

void movement(World& w, const CollisionMap& map, TimeStep ts);

}  // namespace Systems
