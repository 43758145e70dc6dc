#include "core/Camera.h"

#include <algorithm>

#include "util/Math.h"

namespace {

float clampAxis(float desired, float view, float level) {
  if (level <= view) {
    return (level - view) * 0.5F;
  }
  return std::clamp(desired, 0.0F, level - view);
}

}  // namespace

Vec2 Camera::clampToLevel(Vec2 desired, Vec2 viewSize, Vec2 levelSize) {
  return {clampAxis(desired.x, viewSize.x, levelSize.x),
          clampAxis(desired.y, viewSize.y, levelSize.y)};
}

void Camera::follow(Vec2 target, Vec2 viewSize, Vec2 levelSize, float dt) {
  const Vec2 desired = clampToLevel(target - viewSize * 0.5F, viewSize, levelSize);
  const float t = util::expSmoothing(followSpeed, dt);
  pos = clampToLevel(pos + (desired - pos) * t, viewSize, levelSize);
}

void Camera::snapTo(Vec2 target, Vec2 viewSize, Vec2 levelSize) {
  pos = clampToLevel(target - viewSize * 0.5F, viewSize, levelSize);
}
