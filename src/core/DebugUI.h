#pragma once

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_render.h>
#include <SDL3/SDL_video.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct MovementTuning;

struct DebugUIOverlayModel {
  uint64_t frame = 0;
  uint64_t simSteps = 0;
  float dt = 0.0F;
  bool paused = false;
  bool debugCollision = false;
  float camX = 0.0F;
  float camY = 0.0F;

  bool hasLevel = false;
  std::string levelId;
  std::string levelIid;
  int mapW = 0;
  int mapH = 0;
  int cellSize = 0;
  std::size_t solidCells = 0;

  bool hasPlayer = false;
  float posX = 0.0F;
  float posY = 0.0F;
  float velX = 0.0F;
  float velY = 0.0F;
  bool grounded = false;
  float coyoteTimer = 0.0F;
  float jumpBufferTimer = 0.0F;
  int jumps = 0;
  int landings = 0;

  const std::vector<std::string>* legend = nullptr;
};

class DebugUI {
 public:
  bool init(SDL_Window* window, SDL_Renderer* renderer);
  void shutdown();

  void processEvent(const SDL_Event& e);
  void beginFrame();
  void endFrame(SDL_Renderer* renderer);

  bool initialized() const { return initialized_; }

  bool wantCaptureKeyboard() const;

  void drawOverlay(const DebugUIOverlayModel& model);

  // Sliders over the live tuning. Returns true when a value changed this frame.
  bool drawTuning(MovementTuning& tuning);

 private:
  bool initialized_ = false;
};
