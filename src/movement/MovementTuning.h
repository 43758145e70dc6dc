#pragma once

// Gameplay tuning for one kinematic actor. Units: px, seconds (velocities px/s, accelerations
// px/s^2). Player vs. other actors differ only by these values.
struct MovementTuning {
  int version = 0;

  struct Physics {
    float gravity = 1150.0F;
    float maxFallSpeed = 1800.0F;
  } physics;

  struct Move {
    float accelGround = 1600.0F;
    float accelAir = 1200.0F;
    float decelGround = 1600.0F;
    float decelAir = 1200.0F;
    float maxSpeedGround = 325.0F;
    float maxSpeedAir = 275.0F;
  } move;

  struct Jump {
    float launchSpeed = 480.0F;
    float coyoteTime = 0.1F;  // grace after leaving a ledge
    float bufferTime = 0.1F;  // grace for a press before landing
  } jump;

  struct Collision {
    float groundProbe = 1.0F;  // px checked below the feet when not moving vertically
  } collision;

  struct Body {
    float width = 32.0F;
    float height = 32.0F;
  } body;

  struct Simulation {
    int stepHz = 120;
    float maxFrameTime = 0.25F;  // longest real frame fed into the accumulator
  } simulation;

  [[nodiscard]] float stepSeconds() const { return 1.0F / static_cast<float>(simulation.stepHz); }

  // Unset keys keep their defaults. On failure nothing is modified.
  bool loadFromToml(const char* path);
  [[nodiscard]] bool valid() const;
};
