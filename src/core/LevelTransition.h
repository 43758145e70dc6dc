#pragma once

#include <cstdint>
#include <string>

// Fade-to-black level change: fade out, swap at the midpoint, fade back in.
class LevelTransition {
 public:
  enum class Phase : std::uint8_t { Idle, FadeOut, FadeIn };

  static constexpr float kFadeOutSeconds = 0.5F;
  static constexpr float kFadeInSeconds = 0.5F;

  // Ignored (returns false) while a transition is already running.
  bool start(const std::string& targetLevel);

  // Returns true exactly once per transition, on the update that crosses the midpoint.
  bool update(float dt);

  [[nodiscard]] bool active() const { return phase_ != Phase::Idle; }
  [[nodiscard]] Phase phase() const { return phase_; }
  [[nodiscard]] const std::string& target() const { return target_; }
  // 0 = fully visible, 1 = black.
  [[nodiscard]] float opacity() const;

 private:
  Phase phase_ = Phase::Idle;
  float elapsed_ = 0.0F;
  std::string target_;
};
