#pragma once

#include <algorithm>
#include <cmath>

namespace util {

// Moves `v` toward `target` by at most `delta`, never overshooting.
inline float approach(float v, float target, float delta) {
  if (v < target) {
    return std::min(v + delta, target);
  }
  if (v > target) {
    return std::max(v - delta, target);
  }
  return v;
}

inline float clampf(float v, float lo, float hi) {
  return std::min(std::max(v, lo), hi);
}

// Frame-rate independent exponential smoothing factor.
inline float expSmoothing(float rate, float dt) {
  return 1.0F - std::exp(-rate * dt);
}

}  // namespace util
