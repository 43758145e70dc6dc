#include "movement/MovementResolver.h"

#include <algorithm>
#include <cmath>

#include "level/CollisionMap.h"
#include "movement/MovementTuning.h"
#include "util/Math.h"

namespace MovementResolver {

bool validBody(const KinematicBody& body) {
  return isFinite(body.pos) && isFinite(body.vel) && isFinite(body.halfExtents) &&
         body.halfExtents.x > 0.0F && body.halfExtents.y > 0.0F &&
         std::isfinite(body.coyoteTimer) && std::isfinite(body.jumpBufferTimer) &&
         body.coyoteTimer >= 0.0F && body.jumpBufferTimer >= 0.0F;
}

MoveInput sanitize(MoveInput input) {
  if (!std::isfinite(input.axis)) {
    input.axis = 0.0F;
  }
  input.axis = util::clampf(input.axis, -1.0F, 1.0F);
  return input;
}

// NOLINTNEXTLINE
StepOutcome step(KinematicBody& body,
                 const MoveInput& input,
                 const CollisionMap& map,
                 const MovementTuning& tuning,
                 float dt) {
  StepOutcome out{};
  if (!validBody(body) || !std::isfinite(dt) || dt <= 0.0F) {
    out.rejected = true;
    return out;
  }

  const bool wasGrounded = body.grounded;

  // Timers. Coyote holds its full window while standing and drains once airborne.
  if (body.grounded) {
    body.coyoteTimer = tuning.jump.coyoteTime;
  } else {
    body.coyoteTimer = std::max(0.0F, body.coyoteTimer - dt);
  }
  body.jumpBufferTimer = std::max(0.0F, body.jumpBufferTimer - dt);
  if (input.jumpPressed) {
    body.jumpBufferTimer = tuning.jump.bufferTime;
  }

  // Horizontal: approach the wished speed instead of setting it.
  const float wish = input.axis;
  const float maxSpeed = body.grounded ? tuning.move.maxSpeedGround : tuning.move.maxSpeedAir;
  if (wish != 0.0F) {
    const float accel = body.grounded ? tuning.move.accelGround : tuning.move.accelAir;
    body.vel.x = util::approach(body.vel.x, wish * maxSpeed, accel * dt);
  } else {
    const float decel = body.grounded ? tuning.move.decelGround : tuning.move.decelAir;
    body.vel.x = util::approach(body.vel.x, 0.0F, decel * dt);
  }

  if (!body.grounded) {
    body.vel.y = std::min(body.vel.y + tuning.physics.gravity * dt, tuning.physics.maxFallSpeed);
  }

  if (body.jumpBufferTimer > 0.0F && (body.grounded || body.coyoteTimer > 0.0F)) {
    body.vel.y = -tuning.jump.launchSpeed;
    body.grounded = false;
    body.coyoteTimer = 0.0F;
    body.jumpBufferTimer = 0.0F;
    out.jumped = true;
  }

  // X first, then Y from the updated x.
  const float dx = body.vel.x * dt;
  if (dx != 0.0F) {
    const SweepResult sx = map.sweepAABB(body.pos, body.halfExtents, dx, Axis::X);
    body.pos.x += sx.displacement;
    if (sx.hit) {
      out.hitWall = dx > 0.0F ? 1 : -1;
      body.vel.x = 0.0F;
    }
  }

  const float dy = body.vel.y * dt;
  if (dy > 0.0F) {
    const SweepResult sy = map.sweepAABB(body.pos, body.halfExtents, dy, Axis::Y);
    body.pos.y += sy.displacement;
    if (sy.hit) {
      out.landingSpeed = body.vel.y;
      body.vel.y = 0.0F;
      body.grounded = true;
    } else {
      body.grounded = false;
    }
  } else if (dy < 0.0F) {
    const SweepResult sy = map.sweepAABB(body.pos, body.halfExtents, dy, Axis::Y);
    body.pos.y += sy.displacement;
    if (sy.hit) {
      body.vel.y = 0.0F;
      out.hitCeiling = true;
    } else {
      body.grounded = false;
    }
  } else if (body.grounded) {
    // Resting: probe just below the feet so walking off a ledge is noticed.
    const SweepResult probe =
        map.sweepAABB(body.pos, body.halfExtents, tuning.collision.groundProbe, Axis::Y);
    if (probe.hit) {
      body.pos.y += probe.displacement;
    } else {
      body.grounded = false;
    }
  }

  out.landed = body.grounded && !wasGrounded;
  return out;
}

}  // namespace MovementResolver
