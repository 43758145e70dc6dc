#include "core/App.h"

#include <SDL3/SDL.h>

#include <string>
#include <utility>

#include "core/LevelRenderer.h"
#include "ecs/Systems.h"
#include "util/Log.h"
#include "util/Paths.h"

bool App::init(const AppConfig& cfg) {
  cfg_ = cfg;
  uiEnabled_ = !cfg_.noUi;

  const std::string movementPath = Paths::resolveAssetPath(cfg_.movementTomlPath, cfg_.argv0);
  if (!tuning_.loadFromToml(movementPath.c_str())) {
    Log::warn("using default movement tuning ({} not loaded)", movementPath);
  }
  clock_.configure(tuning_.stepSeconds(), tuning_.simulation.maxFrameTime);

  const std::string levelsPath = Paths::resolveAssetPath(cfg_.levelsTomlPath, cfg_.argv0);
  if (!catalog_.loadFromToml(levelsPath.c_str())) {
    Log::error("cannot load level catalog {}", levelsPath);
    return false;
  }

  if (cfg_.inputScriptTomlPath) {
    const std::string scriptPath = Paths::resolveAssetPath(cfg_.inputScriptTomlPath, cfg_.argv0);
    inputScriptEnabled_ = inputScript_.loadFromToml(scriptPath.c_str());
    if (!inputScriptEnabled_) {
      Log::error("cannot load input script {}", scriptPath);
      return false;
    }
  }

  if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_GAMEPAD | SDL_INIT_AUDIO)) {
    Log::error("SDL_Init failed: {}", SDL_GetError());
    return false;
  }

  window_ = SDL_CreateWindow(cfg_.title, cfg_.width, cfg_.height, SDL_WINDOW_RESIZABLE);
  if (!window_) {
    Log::error("SDL_CreateWindow failed: {}", SDL_GetError());
    return false;
  }

  renderer_ = SDL_CreateRenderer(window_, nullptr);
  if (renderer_) {
    SDL_SetRenderVSync(renderer_, 1);
  } else {
    Log::error("SDL_CreateRenderer failed: {}", SDL_GetError());
    return false;
  }

  input_.init();
  input_.appendLegend(legend_);
  if (uiEnabled_ && !debugUi_.init(window_, renderer_)) {
    Log::warn("debug UI unavailable");
  }

  if (!audio_.init(Paths::resolveAssetPath("assets/audio", cfg_.argv0))) {
    Log::info("audio cues disabled");
  }
  audio_.connect(world_);

  const std::string startId = cfg_.startLevel ? cfg_.startLevel : catalog_.startLevel();
  if (!loadLevelNow(startId)) {
    return false;
  }

  lastTicksNs_ = SDL_GetTicksNS();
  return true;
}

void App::run() {
  while (frame()) {
  }
}

bool App::frame() {
  if (!running_) {
    return false;
  }

  SDL_Event e;
  while (SDL_PollEvent(&e)) {
    debugUi_.processEvent(e);
    const bool uiOwnsKeys = debugUi_.wantCaptureKeyboard() &&
                            (e.type == SDL_EVENT_KEY_DOWN || e.type == SDL_EVENT_KEY_UP);
    if (!uiOwnsKeys) {
      input_.handleEvent(e);
    }
  }
  handleCommands(input_.consumeCommands());

  const uint64_t now = SDL_GetTicksNS();
  const float realDt = static_cast<float>(now - lastTicksNs_) / 1.0e9F;
  lastTicksNs_ = now;
  lastDt_ = realDt;

  updateTransition(realDt);
  simulate(realDt);
  render(realDt);

  ++frameCount_;
  if (cfg_.maxFrames > 0 && frameCount_ >= static_cast<uint64_t>(cfg_.maxFrames)) {
    running_ = false;
  }
  return running_;
}

void App::shutdown() {
  audio_.disconnect(world_);
  audio_.shutdown();
  debugUi_.shutdown();
  input_.shutdown();

  if (renderer_) {
    SDL_DestroyRenderer(renderer_);
    renderer_ = nullptr;
  }
  if (window_) {
    SDL_DestroyWindow(window_);
    window_ = nullptr;
  }

  SDL_Quit();
}

bool App::playerBody(KinematicBody& out) const {
  if (!validEntity(world_.player)) {
    return false;
  }
  const auto* body = world_.registry.try_get<KinematicBody>(world_.player);
  if (body == nullptr) {
    return false;
  }
  out = *body;
  return true;
}

void App::handleCommands(const AppCommands& cmds) {
  if (cmds.quit) {
    running_ = false;
  }
  if (cmds.togglePause) {
    paused_ = !paused_;
    clock_.reset();
  }
  if (cmds.toggleDebugOverlay) {
    debugOverlay_ = !debugOverlay_;
  }
  if (cmds.toggleDebugCollision) {
    debugCollision_ = !debugCollision_;
  }
  if (cmds.dumpCollision) {
    dumpCollision();
  }
  if (cmds.reloadLevel && !transition_.active()) {
    if (const auto level = levels_.active()) {
      if (transition_.start(level->config.id)) {
        pendingTicket_ = levels_.beginLoad();
      }
    }
  }
}

bool App::loadLevelNow(const std::string& levelId) {
  const LevelConfig* cfg = catalog_.find(levelId);
  if (cfg == nullptr) {
    Log::error("unknown level '{}'", levelId);
    return false;
  }
  const LevelStatus st = levels_.loadLevel(*cfg);
  if (!st.ok()) {
    Log::error("level '{}': {} ({})", levelId, st.detail, levelErrorName(st.error));
    return false;
  }
  respawnPlayer(*cfg);
  return true;
}

void App::finishTransition(const std::string& levelId) {
  const LevelConfig* cfg = catalog_.find(levelId);
  if (cfg == nullptr) {
    Log::error("transition to unknown level '{}'", levelId);
    return;
  }
  std::shared_ptr<const ActiveLevel> next;
  const LevelStatus st = LevelRegistry::prepareLevel(*cfg, next);
  if (!st.ok()) {
    Log::error("level '{}' not loaded, staying on the current level: {} ({})", levelId, st.detail,
               levelErrorName(st.error));
    return;
  }
  if (!levels_.commit(pendingTicket_, std::move(next))) {
    Log::info("level '{}' load superseded", levelId);
    return;
  }
  Log::info("entered level '{}'", levelId);
  respawnPlayer(*cfg);
}

void App::respawnPlayer(const LevelConfig& cfg) {
  if (!validEntity(world_.player) || !world_.registry.valid(world_.player)) {
    const Vec2 half{tuning_.body.width * 0.5F, tuning_.body.height * 0.5F};
    world_.player = Systems::spawnBody(world_, cfg.start, half, tuning_);
    if (validEntity(world_.player)) {
      world_.registry.emplace<PlayerTag>(world_.player);
      world_.registry.emplace<DebugName>(world_.player, DebugName{"player"});
    }
  } else if (!Systems::resetBody(world_, world_.player, cfg.start)) {
    Log::error("cannot respawn player at ({}, {})", cfg.start.x, cfg.start.y);
  }
  clock_.reset();
  if (const auto level = levels_.active()) {
    const Vec2 levelSize{level->collision.pixelWidth(), level->collision.pixelHeight()};
    const Vec2 half{tuning_.body.width * 0.5F, tuning_.body.height * 0.5F};
    camera_.snapTo(cfg.start + half, viewSize(), levelSize);
  }
}

void App::updateTransition(float realDt) {
  if (!transition_.active()) {
    return;
  }
  if (transition_.update(realDt)) {
    finishTransition(transition_.target());
  }
}

void App::simulate(float realDt) {
  // The world holds still while paused or while the screen is fading.
  if (paused_ || transition_.active()) {
    return;
  }

  const int steps = clock_.advance(realDt);
  if (!inputScriptEnabled_ && validEntity(world_.player)) {
    Systems::applyInput(world_, world_.player, input_.consume());
  }

  for (int i = 0; i < steps; ++i) {
    // Captured once per step: a swap requested mid-step is seen from the next step on.
    const std::shared_ptr<const ActiveLevel> level = levels_.active();
    if (!level) {
      return;
    }
    if (inputScriptEnabled_ && validEntity(world_.player)) {
      Systems::applyInput(world_, world_.player, inputScript_.sample(simFrame_));
    }

    world_.step(level->collision, TimeStep{clock_.stepSeconds(), simFrame_});
    ++simFrame_;

    applyKillPlane(*level);

    KinematicBody body;
    if (!level->config.next.empty() && playerBody(body) &&
        level->touchesTrigger(body.pos, body.halfExtents)) {
      if (transition_.start(level->config.next)) {
        pendingTicket_ = levels_.beginLoad();
        Log::info("exit reached in '{}', going to '{}'", level->config.id, level->config.next);
      }
      return;
    }
  }
}

void App::applyKillPlane(const ActiveLevel& level) {
  KinematicBody body;
  if (!playerBody(body)) {
    return;
  }
  const float limit = level.collision.originY() + level.collision.pixelHeight() + kKillPlaneMargin;
  if (body.pos.y > limit) {
    Log::info("player fell out of '{}', respawning", level.config.id);
    respawnPlayer(level.config);
  }
}

void App::dumpCollision() const {
  const auto level = levels_.active();
  KinematicBody body;
  if (!level || !playerBody(body)) {
    Log::info("collision dump: no level or player");
    return;
  }
  const CollisionMap& map = level->collision;
  Log::info("collision dump: level '{}' ({}) layer '{}' {}x{} @ {}px, {} solid cells",
            level->config.id, level->iid, map.layerName(), map.width(), map.height(),
            map.cellSize(), map.solidCount());
  const int cx0 = map.worldToCellX(body.pos.x);
  const int cy0 = map.worldToCellY(body.pos.y);
  const int cx1 = map.worldToCellX(body.pos.x + body.halfExtents.x * 2.0F);
  const int cy1 = map.worldToCellY(body.pos.y + body.halfExtents.y * 2.0F);
  Log::info("  player pos ({:.3f}, {:.3f}) vel ({:.1f}, {:.1f}) grounded={} cells [{}..{}]x[{}..{}]",
            body.pos.x, body.pos.y, body.vel.x, body.vel.y, body.grounded, cx0, cx1, cy0, cy1);
  for (int y = cy0 - 1; y <= cy1 + 1; ++y) {
    std::string row;
    for (int x = cx0 - 1; x <= cx1 + 1; ++x) {
      const bool inside = x >= cx0 && x <= cx1 && y >= cy0 && y <= cy1;
      row += map.isSolid(x, y) ? (inside ? 'X' : '#') : (inside ? 'o' : '.');
    }
    Log::info("  {}", row);
  }
}

Vec2 App::viewSize() const {
  int w = cfg_.width;
  int h = cfg_.height;
  if (renderer_) {
    SDL_GetRenderOutputSize(renderer_, &w, &h);
  }
  return {static_cast<float>(w) / kRenderScale, static_cast<float>(h) / kRenderScale};
}

// NOLINTNEXTLINE
void App::render(float realDt) {
  if (!renderer_) {
    return;
  }

  const auto level = levels_.active();
  const Vec2 view = viewSize();
  KinematicBody body;
  const bool hasPlayer = playerBody(body);
  if (level && hasPlayer && !paused_) {
    const Vec2 levelSize{level->collision.pixelWidth(), level->collision.pixelHeight()};
    camera_.follow(body.pos + body.halfExtents, view, levelSize, realDt);
  }

  SDL_SetRenderDrawColor(renderer_, 20, 20, 24, 255);
  SDL_RenderClear(renderer_);

  SDL_SetRenderScale(renderer_, kRenderScale, kRenderScale);
  if (level) {
    LevelRenderer::drawTiles(*renderer_, *level, camera_.pos, view);
    LevelRenderer::drawBodies(*renderer_, world_, camera_.pos);
    if (debugCollision_) {
      LevelRenderer::drawDebugCollision(*renderer_, *level, world_, camera_.pos, view);
    }
  }
  SDL_SetRenderScale(renderer_, 1.0F, 1.0F);

  if (paused_) {
    SDL_SetRenderDrawColor(renderer_, 255, 255, 255, 255);
    SDL_RenderDebugText(renderer_, 16.0F, 16.0F, "Paused - press ESC to resume");
  }
  LevelRenderer::drawFade(*renderer_, transition_.opacity());

  if (uiEnabled_ && debugUi_.initialized()) {
    debugUi_.beginFrame();
    if (debugOverlay_) {
      DebugUIOverlayModel m;
      m.frame = frameCount_;
      m.simSteps = world_.steps;
      m.dt = lastDt_;
      m.paused = paused_;
      m.debugCollision = debugCollision_;
      m.camX = camera_.pos.x;
      m.camY = camera_.pos.y;
      if (level) {
        m.hasLevel = true;
        m.levelId = level->config.id;
        m.levelIid = level->iid;
        m.mapW = level->collision.width();
        m.mapH = level->collision.height();
        m.cellSize = level->collision.cellSize();
        m.solidCells = level->collision.solidCount();
      }
      if (hasPlayer) {
        m.hasPlayer = true;
        m.posX = body.pos.x;
        m.posY = body.pos.y;
        m.velX = body.vel.x;
        m.velY = body.vel.y;
        m.grounded = body.grounded;
        m.coyoteTimer = body.coyoteTimer;
        m.jumpBufferTimer = body.jumpBufferTimer;
      }
      m.jumps = world_.jumps;
      m.landings = world_.landings;
      m.legend = &legend_;
      debugUi_.drawOverlay(m);

      auto* tuning = validEntity(world_.player)
                         ? world_.registry.try_get<MovementTuning>(world_.player)
                         : nullptr;
      if (tuning != nullptr) {
        MovementTuning edited = *tuning;
        if (debugUi_.drawTuning(edited) && edited.valid()) {
          *tuning = edited;
        }
      }
    }
    debugUi_.endFrame(renderer_);
  }

  SDL_RenderPresent(renderer_);
}
