#include "core/DebugUI.h"

#include <imgui.h>
#include <imgui_impl_sdl3.h>
#include <imgui_impl_sdlrenderer3.h>

#include "movement/MovementTuning.h"

bool DebugUI::init(SDL_Window* window, SDL_Renderer* renderer) {
  if (initialized_)
    return true;

  IMGUI_CHECKVERSION();
  ImGui::CreateContext();
  ImGui::StyleColorsDark();

  ImGuiIO& io = ImGui::GetIO();
  io.IniFilename = nullptr;
  io.LogFilename = nullptr;

  if (!ImGui_ImplSDL3_InitForSDLRenderer(window, renderer)) {
    ImGui::DestroyContext();
    return false;
  }

  if (!ImGui_ImplSDLRenderer3_Init(renderer)) {
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();
    return false;
  }

  initialized_ = true;
  return true;
}

void DebugUI::shutdown() {
  if (!initialized_)
    return;
  ImGui_ImplSDLRenderer3_Shutdown();
  ImGui_ImplSDL3_Shutdown();
  ImGui::DestroyContext();
  initialized_ = false;
}

void DebugUI::processEvent(const SDL_Event& e) {
  if (!initialized_)
    return;
  (void)ImGui_ImplSDL3_ProcessEvent(&e);
}

void DebugUI::beginFrame() {
  if (!initialized_)
    return;
  ImGui_ImplSDLRenderer3_NewFrame();
  ImGui_ImplSDL3_NewFrame();
  ImGui::NewFrame();
}

void DebugUI::endFrame(SDL_Renderer* renderer) {
  if (!initialized_)
    return;
  ImGui::Render();
  ImGui_ImplSDLRenderer3_RenderDrawData(ImGui::GetDrawData(), renderer);
}

bool DebugUI::wantCaptureKeyboard() const {
  if (!initialized_)
    return false;
  return ImGui::GetIO().WantCaptureKeyboard;
}

// NOLINTNEXTLINE
void DebugUI::drawOverlay(const DebugUIOverlayModel& model) {
  if (!initialized_)
    return;

  ImGui::SetNextWindowPos(ImVec2(16.0F, 16.0F), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowBgAlpha(0.75F);

  const ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_AlwaysAutoResize |
                                 ImGuiWindowFlags_NoFocusOnAppearing | ImGuiWindowFlags_NoNav;

  if (ImGui::Begin("Overlay", nullptr, flags)) {
    ImGui::Text("frame: %llu  steps: %llu  dt: %.5F", static_cast<unsigned long long>(model.frame),
                static_cast<unsigned long long>(model.simSteps), model.dt);
    ImGui::Text("paused: %d  collision view: %d", model.paused ? 1 : 0,
                model.debugCollision ? 1 : 0);
    ImGui::Text("camera: (%.1F, %.1F)", model.camX, model.camY);

    if (model.hasLevel) {
      ImGui::Separator();
      ImGui::Text("level: %s  (%s)", model.levelId.c_str(), model.levelIid.c_str());
      ImGui::Text("map: %dx%d cells @ %dpx  solid: %zu", model.mapW, model.mapH, model.cellSize,
                  model.solidCells);
    }

    if (model.hasPlayer) {
      ImGui::Separator();
      ImGui::Text("pos: (%.2F, %.2F)", model.posX, model.posY);
      ImGui::Text("vel: (%.1F, %.1F)", model.velX, model.velY);
      ImGui::Text("grounded: %d", model.grounded ? 1 : 0);
      ImGui::Text("coyote=%.3F  jumpbuf=%.3F", model.coyoteTimer, model.jumpBufferTimer);
      ImGui::Text("jumps=%d  landings=%d", model.jumps, model.landings);
    }

    if (model.legend) {
      ImGui::Separator();
      for (const std::string& line : *model.legend)
        ImGui::TextUnformatted(line.c_str());
    }
  }
  ImGui::End();
}

bool DebugUI::drawTuning(MovementTuning& tuning) {
  if (!initialized_)
    return false;

  ImGui::SetNextWindowPos(ImVec2(16.0F, 320.0F), ImGuiCond_FirstUseEver);
  bool changed = false;
  if (ImGui::Begin("Tuning")) {
    if (ImGui::CollapsingHeader("Physics", ImGuiTreeNodeFlags_DefaultOpen)) {
      changed |= ImGui::SliderFloat("gravity", &tuning.physics.gravity, 0.0F, 4000.0F);
      changed |= ImGui::SliderFloat("max fall", &tuning.physics.maxFallSpeed, 50.0F, 4000.0F);
    }
    if (ImGui::CollapsingHeader("Move", ImGuiTreeNodeFlags_DefaultOpen)) {
      changed |= ImGui::SliderFloat("accel ground", &tuning.move.accelGround, 0.0F, 6000.0F);
      changed |= ImGui::SliderFloat("accel air", &tuning.move.accelAir, 0.0F, 6000.0F);
      changed |= ImGui::SliderFloat("decel ground", &tuning.move.decelGround, 0.0F, 6000.0F);
      changed |= ImGui::SliderFloat("decel air", &tuning.move.decelAir, 0.0F, 6000.0F);
      changed |= ImGui::SliderFloat("max speed ground", &tuning.move.maxSpeedGround, 0.0F, 1000.0F);
      changed |= ImGui::SliderFloat("max speed air", &tuning.move.maxSpeedAir, 0.0F, 1000.0F);
    }
    if (ImGui::CollapsingHeader("Jump", ImGuiTreeNodeFlags_DefaultOpen)) {
      changed |= ImGui::SliderFloat("launch speed", &tuning.jump.launchSpeed, 0.0F, 1500.0F);
      changed |= ImGui::SliderFloat("coyote time", &tuning.jump.coyoteTime, 0.0F, 0.5F, "%.3F s");
      changed |= ImGui::SliderFloat("buffer time", &tuning.jump.bufferTime, 0.0F, 0.5F, "%.3F s");
    }
  }
  ImGui::End();
  return changed;
}
