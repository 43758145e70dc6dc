#pragma once

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_gamepad.h>
#include <SDL3/SDL_scancode.h>

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "ecs/Components.h"

struct AppCommands {
  bool quit = false;
  bool togglePause = false;
  bool reloadLevel = false;
  bool toggleDebugOverlay = false;
  bool toggleDebugCollision = false;
  bool dumpCollision = false;
};

class Input {
 public:
  void init();
  void shutdown();

  void handleEvent(const SDL_Event& e);

  [[nodiscard]] const char* gamepadName() const;
  void appendLegend(std::vector<std::string>& out) const;

  // Consume the jump edge. Held state and the axis are preserved.
  MoveInput consume();

  // Consume non-gameplay commands (pause/reload/debug toggles).
  AppCommands consumeCommands();

 private:
  void updateDerivedActions();
  void clearGamepadState();
  void tryOpenFirstGamepad();

  std::array<bool, SDL_SCANCODE_COUNT> scancodeDown_{};
  MoveInput state_{};
  AppCommands commands_{};

  SDL_Gamepad* gamepad_ = nullptr;
  uint32_t gamepadId_ = 0;
  int axisLeftX_ = 0;
  int axisDeadzone_ = 8000;
  bool dpadLeft_ = false;
  bool dpadRight_ = false;
  bool btnSouth_ = false;  // jump
  bool btnStart_ = false;  // pause

  bool escHeld_ = false;
  bool rHeld_ = false;
  bool tHeld_ = false;
  bool f1Held_ = false;
  bool f2Held_ = false;
};
