#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>

struct TimeStep {
  float dt = 0.0F;  // seconds
  uint64_t frame = 0;
};

// Accumulates real frame time and hands out whole fixed steps, so simulation speed does not
// depend on the render frame rate.
class FixedStepClock {
 public:
  FixedStepClock() = default;
  FixedStepClock(float stepSeconds, float maxFrameSeconds)
      : step_(stepSeconds), maxFrame_(maxFrameSeconds) {}

  void configure(float stepSeconds, float maxFrameSeconds) {
    step_ = stepSeconds;
    maxFrame_ = maxFrameSeconds;
    accumulator_ = std::min(accumulator_, step_);
  }

  // Returns how many steps to run for this frame. Long frames are clamped to maxFrame.
  int advance(float realSeconds) {
    if (!std::isfinite(realSeconds) || realSeconds <= 0.0F || step_ <= 0.0F) {
      return 0;
    }
    accumulator_ += std::min(realSeconds, maxFrame_);
    int steps = 0;
    while (accumulator_ >= step_) {
      accumulator_ -= step_;
      ++steps;
    }
    return steps;
  }

  void reset() { accumulator_ = 0.0F; }

  [[nodiscard]] float stepSeconds() const { return step_; }
  // Fraction of a step left in the accumulator, for render interpolation.
  [[nodiscard]] float alpha() const { return step_ > 0.0F ? accumulator_ / step_ : 0.0F; }

 private:
  float step_ = 1.0F / 120.0F;
  float maxFrame_ = 0.25F;
  float accumulator_ = 0.0F;
};
