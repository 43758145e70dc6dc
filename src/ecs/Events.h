#pragma once

#include "ecs/Entity.h"

// Movement notifications, queued during a fixed step and delivered after it.

struct BodyJumped {
  EntityId entity = kInvalidEntity;
};

struct BodyLanded {
  EntityId entity = kInvalidEntity;
  float impactSpeed = 0.0F;  // px/s downward at contact
};

struct BodyHitCeiling {
  EntityId entity = kInvalidEntity;
};

struct BodyHitWall {
  EntityId entity = kInvalidEntity;
  int direction = 0;  // -1 left, 1 right
};
