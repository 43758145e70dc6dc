#pragma once

#include "util/Geometry.h"

// Top-left of the visible window in world px. Follows a target with exponential smoothing and
// stays inside the level; a level smaller than the view is centered on that axis.
struct Camera {
  static constexpr float kDefaultFollowSpeed = 6.0F;

  Vec2 pos{};
  float followSpeed = kDefaultFollowSpeed;

  void follow(Vec2 target, Vec2 viewSize, Vec2 levelSize, float dt);
  void snapTo(Vec2 target, Vec2 viewSize, Vec2 levelSize);

  [[nodiscard]] static Vec2 clampToLevel(Vec2 desired, Vec2 viewSize, Vec2 levelSize);
};
