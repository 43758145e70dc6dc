#pragma once

#include <string>

#include "ecs/Entity.h"
#include "util/Geometry.h"

// Kinematic state of one actor. `pos` is the top-left corner of the AABB in world px (y down);
// the box spans [pos, pos + 2*halfExtents). Mutated only by the movement resolver.
struct KinematicBody {
  Vec2 pos{};
  Vec2 vel{};  // px/s
  Vec2 halfExtents{16.0F, 16.0F};
  bool grounded = false;
  float coyoteTimer = 0.0F;      // s, counts down while airborne
  float jumpBufferTimer = 0.0F;  // s, counts down after a jump press

  [[nodiscard]] Vec2 size() const { return halfExtents * 2.0F; }
  [[nodiscard]] Rect aabb() const { return {pos.x, pos.y, halfExtents.x * 2.0F, halfExtents.y * 2.0F}; }
};

// Per-step input sample. `jumpPressed` is an edge and is consumed by the first step that sees it.
struct MoveInput {
  float axis = 0.0F;  // -1 (left) .. 1 (right)
  bool jumpPressed = false;
  bool jumpHeld = false;
};

struct PlayerTag {};

struct DebugName {
  std::string name;
};
