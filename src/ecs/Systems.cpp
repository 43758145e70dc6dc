#include "ecs/Systems.h"

#include "core/Time.h"
#include "ecs/Events.h"
#include "ecs/World.h"
#include "level/CollisionMap.h"
#include "movement/MovementResolver.h"
#include "movement/MovementTuning.h"
#include "util/Log.h"

namespace Systems {

EntityId spawnBody(World& w, Vec2 pos, Vec2 halfExtents, const MovementTuning& tuning) {
  if (!isFinite(pos) || !isFinite(halfExtents) || halfExtents.x <= 0.0F ||
      halfExtents.y <= 0.0F) {
    Log::error("spawn rejected: pos ({}, {}) half extents ({}, {})", pos.x, pos.y, halfExtents.x,
               halfExtents.y);
    return kInvalidEntity;
  }
  if (!tuning.valid()) {
    Log::error("spawn rejected: invalid movement tuning");
    return kInvalidEntity;
  }

  const EntityId e = w.create();
  KinematicBody body{};
  body.pos = pos;
  body.halfExtents = halfExtents;
  w.registry.emplace<KinematicBody>(e, body);
  w.registry.emplace<MoveInput>(e);
  w.registry.emplace<MovementTuning>(e, tuning);
  return e;
}

bool resetBody(World& w, EntityId id, Vec2 pos) {
  if (!isFinite(pos)) {
    return false;
  }
  auto* body = w.registry.try_get<KinematicBody>(id);
  if (body == nullptr) {
    return false;
  }
  const Vec2 halfExtents = body->halfExtents;
  *body = KinematicBody{};
  body->pos = pos;
  body->halfExtents = halfExtents;
  if (auto* in = w.registry.try_get<MoveInput>(id)) {
    *in = MoveInput{};
  }
  return true;
}

void applyInput(World& w, EntityId id, const MoveInput& input) {
  auto* in = w.registry.try_get<MoveInput>(id);
  if (in == nullptr) {
    return;
  }
  const MoveInput clean = MovementResolver::sanitize(input);
  const bool latched = in->jumpPressed;
  *in = clean;
  in->jumpPressed = clean.jumpPressed || latched;
}

void movement(World& w, const CollisionMap& map, TimeStep ts) {
  auto view = w.registry.view<KinematicBody, MoveInput, MovementTuning>();
  for (auto entity : view) {
    auto& body = view.get<KinematicBody>(entity);
    auto& in = view.get<MoveInput>(entity);
    const auto& tuning = view.get<MovementTuning>(entity);

    const StepOutcome r = MovementResolver::step(body, in, map, tuning, ts.dt);
    in.jumpPressed = false;

    if (r.rejected) {
      ++w.rejectedSteps;
      continue;
    }
    if (r.jumped) {
      ++w.jumps;
      w.events.enqueue(BodyJumped{entity});
    }
    if (r.landed) {
      ++w.landings;
      w.events.enqueue(BodyLanded{entity, r.landingSpeed});
    }
    if (r.hitCeiling) {
      w.events.enqueue(BodyHitCeiling{entity});
    }
    if (r.hitWall != 0) {
      w.events.enqueue(BodyHitWall{entity, r.hitWall});
    }
  }
}

}  // namespace Systems
