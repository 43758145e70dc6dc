#include "core/LevelTransition.h"

#include <algorithm>
#include <cmath>

bool LevelTransition::start(const std::string& targetLevel) {
  if (active()) {
    return false;
  }
  phase_ = Phase::FadeOut;
  elapsed_ = 0.0F;
  target_ = targetLevel;
  return true;
}

bool LevelTransition::update(float dt) {
  if (!active() || !std::isfinite(dt) || dt < 0.0F) {
    return false;
  }
  elapsed_ += dt;
  if (phase_ == Phase::FadeOut) {
    if (elapsed_ < kFadeOutSeconds) {
      return false;
    }
    phase_ = Phase::FadeIn;
    elapsed_ = 0.0F;
    return true;
  }
  if (elapsed_ >= kFadeInSeconds) {
    phase_ = Phase::Idle;
    elapsed_ = 0.0F;
    target_.clear();
  }
  return false;
}

float LevelTransition::opacity() const {
  switch (phase_) {
    case Phase::FadeOut:
      return std::clamp(elapsed_ / kFadeOutSeconds, 0.0F, 1.0F);
    case Phase::FadeIn:
      return std::clamp(1.0F - elapsed_ / kFadeInSeconds, 0.0F, 1.0F);
    case Phase::Idle:
      break;
  }
  return 0.0F;
}
