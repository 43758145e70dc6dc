#pragma once

#include "ecs/Components.h"

class CollisionMap;
struct MovementTuning;

// What happened during one step; the caller turns these into events.
struct StepOutcome {
  bool rejected = false;  // body failed the precondition check and was left untouched
  bool jumped = false;
  bool landed = false;
  float landingSpeed = 0.0F;
  bool hitCeiling = false;
  int hitWall = 0;  // -1 / 0 / 1
};

namespace MovementResolver {

// Finite position/velocity/timers and positive half-extents.
[[nodiscard]] bool validBody(const KinematicBody& body);

// NaN axis becomes 0; the axis is clamped to [-1, 1].
[[nodiscard]] MoveInput sanitize(MoveInput input);

// Advances one fixed step: input + gravity, jump handling, then x-then-y sweep resolution.
StepOutcome step(KinematicBody& body,
                 const MoveInput& input,
                 const CollisionMap& map,
                 const MovementTuning& tuning,
                 float dt);

}  // namespace MovementResolver
