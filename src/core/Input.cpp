#include "core/Input.h"

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_gamepad.h>
#include <SDL3/SDL_joystick.h>
#include <SDL3/SDL_keyboard.h>
#include <SDL3/SDL_scancode.h>
#include <SDL3/SDL_stdinc.h>

#include <algorithm>
#include <memory>

namespace {

// SDL key mappings live here and are consumed by both input processing and UI legends.
constexpr SDL_Scancode kMoveLeftPrimary = SDL_SCANCODE_LEFT;
constexpr SDL_Scancode kMoveLeftAlt = SDL_SCANCODE_A;
constexpr SDL_Scancode kMoveRightPrimary = SDL_SCANCODE_RIGHT;
constexpr SDL_Scancode kMoveRightAlt = SDL_SCANCODE_D;

constexpr SDL_Scancode kJumpPrimary = SDL_SCANCODE_SPACE;
constexpr SDL_Scancode kJumpAlt1 = SDL_SCANCODE_W;
constexpr SDL_Scancode kJumpAlt2 = SDL_SCANCODE_UP;

constexpr SDL_Scancode kPauseKey = SDL_SCANCODE_ESCAPE;
constexpr SDL_Scancode kReloadKey = SDL_SCANCODE_R;
constexpr SDL_Scancode kDumpCollisionKey = SDL_SCANCODE_T;
constexpr SDL_Scancode kToggleOverlayKey = SDL_SCANCODE_F1;
constexpr SDL_Scancode kToggleCollisionKey = SDL_SCANCODE_F2;

constexpr SDL_GamepadAxis kMoveAxisX = SDL_GAMEPAD_AXIS_LEFTX;
constexpr SDL_GamepadButton kDpadLeftButton = SDL_GAMEPAD_BUTTON_DPAD_LEFT;
constexpr SDL_GamepadButton kDpadRightButton = SDL_GAMEPAD_BUTTON_DPAD_RIGHT;
constexpr SDL_GamepadButton kJumpButton = SDL_GAMEPAD_BUTTON_SOUTH;
constexpr SDL_GamepadButton kPauseButton = SDL_GAMEPAD_BUTTON_START;

constexpr float kAxisMax = 32767.0F;

const char* prettyScancode(SDL_Scancode sc) {
  switch (sc) {
    case SDL_SCANCODE_LEFT:
      return "←";
    case SDL_SCANCODE_RIGHT:
      return "→";
    case SDL_SCANCODE_UP:
      return "↑";
    default:
      break;
  }

  const char* name = SDL_GetScancodeName(sc);
  if (!name || !*name)
    return "?";
  return name;
}

}  // namespace

void Input::clearGamepadState() {
  axisLeftX_ = 0;
  dpadLeft_ = false;
  dpadRight_ = false;
  btnSouth_ = false;
  btnStart_ = false;
}

void Input::tryOpenFirstGamepad() {
  if (gamepad_)
    return;

  int count = 0;
  using GamepadListPtr = std::unique_ptr<SDL_JoystickID, decltype(&SDL_free)>;
  GamepadListPtr ids(SDL_GetGamepads(&count), SDL_free);
  if (!ids || count <= 0) {
    return;
  }

  for (int i = 0; i < count; ++i) {
    SDL_Gamepad* gp = SDL_OpenGamepad(ids.get()[i]);
    if (!gp)
      continue;
    gamepad_ = gp;
    gamepadId_ = ids.get()[i];
    break;
  }
}

void Input::init() {
  SDL_SetGamepadEventsEnabled(true);
  tryOpenFirstGamepad();
}

void Input::shutdown() {
  if (gamepad_) {
    SDL_CloseGamepad(gamepad_);
    gamepad_ = nullptr;
  }
  gamepadId_ = 0;
  clearGamepadState();
}

// NOLINTNEXTLINE
void Input::handleEvent(const SDL_Event& e) {
  if (e.type == SDL_EVENT_GAMEPAD_ADDED) {
    if (!gamepad_) {
      SDL_Gamepad* gp = SDL_OpenGamepad(e.gdevice.which);
      if (gp) {
        gamepad_ = gp;
        gamepadId_ = e.gdevice.which;
      }
    }
    return;
  }
  if (e.type == SDL_EVENT_GAMEPAD_REMOVED) {
    if (gamepad_ && e.gdevice.which == gamepadId_) {
      SDL_CloseGamepad(gamepad_);
      gamepad_ = nullptr;
      gamepadId_ = 0;
      clearGamepadState();
      tryOpenFirstGamepad();
      updateDerivedActions();
    }
    return;
  }
  if (e.type == SDL_EVENT_GAMEPAD_AXIS_MOTION) {
    if (gamepad_ && e.gaxis.which == gamepadId_ && e.gaxis.axis == kMoveAxisX) {
      axisLeftX_ = static_cast<int>(e.gaxis.value);
      updateDerivedActions();
    }
    return;
  }
  if (e.type == SDL_EVENT_GAMEPAD_BUTTON_DOWN || e.type == SDL_EVENT_GAMEPAD_BUTTON_UP) {
    if (gamepad_ && e.gbutton.which == gamepadId_) {
      const bool down = e.gbutton.down;
      switch (e.gbutton.button) {
        case kDpadLeftButton:
          dpadLeft_ = down;
          break;
        case kDpadRightButton:
          dpadRight_ = down;
          break;
        case kJumpButton:
          btnSouth_ = down;
          break;
        case kPauseButton:
          if (down && !btnStart_)
            commands_.togglePause = true;
          btnStart_ = down;
          break;
        default:
          break;
      }
      updateDerivedActions();
    }
    return;
  }

  if (e.type == SDL_EVENT_QUIT) {
    commands_.quit = true;
    return;
  }

  if (e.type != SDL_EVENT_KEY_DOWN && e.type != SDL_EVENT_KEY_UP)
    return;

  const int sc = static_cast<int>(e.key.scancode);
  if (sc < 0 || sc >= static_cast<int>(scancodeDown_.size()))
    return;

  scancodeDown_[sc] = e.key.down;
  updateDerivedActions();
}

const char* Input::gamepadName() const {
  if (!gamepad_)
    return nullptr;
  const char* name = SDL_GetGamepadName(gamepad_);
  if (!name || !*name)
    return nullptr;
  return name;
}

void Input::appendLegend(std::vector<std::string>& out) const {
  out.push_back(std::string("Move: ") + prettyScancode(kMoveLeftPrimary) + "/" +
                prettyScancode(kMoveRightPrimary) + " or " + prettyScancode(kMoveLeftAlt) + "/" +
                prettyScancode(kMoveRightAlt) + "  (pad: D-pad / left stick)");
  out.push_back(std::string("Jump: ") + prettyScancode(kJumpPrimary) + ", " +
                prettyScancode(kJumpAlt1) + " or " + prettyScancode(kJumpAlt2) +
                "  (pad: South)");
  if (const char* gpName = gamepadName())
    out.push_back(std::string("Gamepad: ") + gpName);
  out.push_back(std::string("Pause: ") + prettyScancode(kPauseKey) + "  Reload: " +
                prettyScancode(kReloadKey) + "  Collision dump: " +
                prettyScancode(kDumpCollisionKey));
  out.push_back(std::string("Toggles: ") + prettyScancode(kToggleOverlayKey) + " overlay  " +
                prettyScancode(kToggleCollisionKey) + " collision");
}

MoveInput Input::consume() {
  MoveInput out = state_;
  state_.jumpPressed = false;
  return out;
}

AppCommands Input::consumeCommands() {
  AppCommands out = commands_;
  commands_ = AppCommands{};
  return out;
}

// NOLINTNEXTLINE
void Input::updateDerivedActions() {
  const bool leftKey = scancodeDown_[kMoveLeftPrimary] || scancodeDown_[kMoveLeftAlt];
  const bool rightKey = scancodeDown_[kMoveRightPrimary] || scancodeDown_[kMoveRightAlt];

  // Digital input wins over the stick; the stick is analog past the deadzone.
  float axis = 0.0F;
  if (leftKey || dpadLeft_)
    axis -= 1.0F;
  if (rightKey || dpadRight_)
    axis += 1.0F;
  if (axis == 0.0F && (axisLeftX_ < -axisDeadzone_ || axisLeftX_ > axisDeadzone_)) {
    axis = std::clamp(static_cast<float>(axisLeftX_) / kAxisMax, -1.0F, 1.0F);
  }
  state_.axis = axis;

  const bool jumpNow =
      scancodeDown_[kJumpPrimary] || scancodeDown_[kJumpAlt1] || scancodeDown_[kJumpAlt2] ||
      btnSouth_;
  if (jumpNow && !state_.jumpHeld)
    state_.jumpPressed = true;
  state_.jumpHeld = jumpNow;

  const bool escNow = scancodeDown_[kPauseKey];
  if (escNow && !escHeld_)
    commands_.togglePause = true;
  escHeld_ = escNow;

  const bool rNow = scancodeDown_[kReloadKey];
  if (rNow && !rHeld_)
    commands_.reloadLevel = true;
  rHeld_ = rNow;

  const bool tNow = scancodeDown_[kDumpCollisionKey];
  if (tNow && !tHeld_)
    commands_.dumpCollision = true;
  tHeld_ = tNow;

  const bool f1Now = scancodeDown_[kToggleOverlayKey];
  if (f1Now && !f1Held_)
    commands_.toggleDebugOverlay = true;
  f1Held_ = f1Now;

  const bool f2Now = scancodeDown_[kToggleCollisionKey];
  if (f2Now && !f2Held_)
    commands_.toggleDebugCollision = true;
  f2Held_ = f2Now;
}
