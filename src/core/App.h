#pragma once

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_render.h>
#include <SDL3/SDL_video.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "core/AudioCues.h"
#include "core/Camera.h"
#include "core/DebugUI.h"
#include "core/Input.h"
#include "core/InputScript.h"
#include "core/LevelTransition.h"
#include "core/Time.h"
#include "ecs/Components.h"
#include "ecs/Entity.h"
#include "ecs/World.h"
#include "level/LevelConfig.h"
#include "level/LevelRegistry.h"
#include "movement/MovementTuning.h"

struct AppConfig {
  const char* title = "Dungeon Platformer";
  int width = 1280;
  int height = 720;
  int maxFrames = -1;
  const char* levelsTomlPath = "assets/levels.toml";
  const char* movementTomlPath = "assets/movement.toml";
  const char* inputScriptTomlPath = nullptr;
  const char* startLevel = nullptr;  // catalog id; default is the catalog's start level
  const char* argv0 = nullptr;
  bool noUi = false;
};

class App {
 public:
  // World px are drawn at this many screen pixels.
  static constexpr float kRenderScale = 2.0F;
  // How far below the level the player may fall before being put back at the start.
  static constexpr float kKillPlaneMargin = 256.0F;

  bool init(const AppConfig& cfg);
  void run();
  // One frame: events, simulation, render. Returns false once the app should stop.
  bool frame();
  void shutdown();

  [[nodiscard]] bool playerBody(KinematicBody& out) const;
  [[nodiscard]] const LevelRegistry& levels() const { return levels_; }

 private:
  void handleCommands(const AppCommands& cmds);
  void simulate(float realDt);
  void updateTransition(float realDt);
  bool loadLevelNow(const std::string& levelId);
  void finishTransition(const std::string& levelId);
  void respawnPlayer(const LevelConfig& cfg);
  void applyKillPlane(const ActiveLevel& level);
  void dumpCollision() const;
  void render(float realDt);
  [[nodiscard]] Vec2 viewSize() const;

  AppConfig cfg_{};
  SDL_Window* window_ = nullptr;
  SDL_Renderer* renderer_ = nullptr;
  bool running_ = true;
  bool paused_ = false;
  bool debugOverlay_ = false;
  bool debugCollision_ = false;
  bool uiEnabled_ = true;

  uint64_t lastTicksNs_ = 0;
  uint64_t frameCount_ = 0;
  uint64_t simFrame_ = 0;
  float lastDt_ = 0.0F;

  Input input_;
  InputScript inputScript_;
  bool inputScriptEnabled_ = false;
  DebugUI debugUi_;
  AudioCues audio_;
  std::vector<std::string> legend_;

  LevelCatalog catalog_;
  LevelRegistry levels_;
  LevelRegistry::Ticket pendingTicket_ = 0;
  LevelTransition transition_;
  MovementTuning tuning_;
  FixedStepClock clock_;
  World world_;
  Camera camera_;
};
