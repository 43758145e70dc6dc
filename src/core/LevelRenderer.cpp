#include "core/LevelRenderer.h"

#include <SDL3/SDL_blendmode.h>
#include <SDL3/SDL_pixels.h>
#include <SDL3/SDL_rect.h>

#include <algorithm>
#include <cmath>
#include <cstdint>

#include "ecs/Components.h"
#include "ecs/World.h"
#include "level/LevelRegistry.h"

namespace {

constexpr SDL_Color kTile = {74, 64, 96, 255};
constexpr SDL_Color kTileEdge = {110, 98, 140, 255};
constexpr SDL_Color kPlayer = {90, 180, 240, 255};
constexpr SDL_Color kDebugSolid = {255, 128, 0, 255};   // orange
constexpr SDL_Color kDebugTrigger = {255, 255, 0, 255};  // yellow
constexpr SDL_Color kDebugBounds = {80, 120, 255, 255};  // blue

void setColor(SDL_Renderer& r, SDL_Color c) {
  SDL_SetRenderDrawColor(&r, c.r, c.g, c.b, c.a);
}

struct CellRange {
  int x0 = 0;
  int y0 = 0;
  int x1 = -1;
  int y1 = -1;
};

CellRange visibleCells(const CollisionMap& map, Vec2 cam, Vec2 viewSize) {
  CellRange out;
  out.x0 = std::max(map.worldToCellX(cam.x), 0);
  out.y0 = std::max(map.worldToCellY(cam.y), 0);
  out.x1 = std::min(map.worldToCellX(cam.x + viewSize.x), map.width() - 1);
  out.y1 = std::min(map.worldToCellY(cam.y + viewSize.y), map.height() - 1);
  return out;
}

}  // namespace

namespace LevelRenderer {

void drawTiles(SDL_Renderer& r, const ActiveLevel& level, Vec2 cam, Vec2 viewSize) {
  const CollisionMap& map = level.collision;
  const float cs = static_cast<float>(map.cellSize());
  const CellRange range = visibleCells(map, cam, viewSize);
  for (int y = range.y0; y <= range.y1; ++y) {
    for (int x = range.x0; x <= range.x1; ++x) {
      if (!map.isSolid(x, y)) {
        continue;
      }
      const SDL_FRect fr{map.cellToWorldX(x) - cam.x, map.cellToWorldY(y) - cam.y, cs, cs};
      setColor(r, kTile);
      SDL_RenderFillRect(&r, &fr);
      // Light top edge where the cell is walkable from above.
      if (!map.isSolid(x, y - 1)) {
        const SDL_FRect edge{fr.x, fr.y, cs, 2.0F};
        setColor(r, kTileEdge);
        SDL_RenderFillRect(&r, &edge);
      }
    }
  }
}

void drawBodies(SDL_Renderer& r, const World& w, Vec2 cam) {
  setColor(r, kPlayer);
  auto view = w.registry.view<const KinematicBody>();
  for (auto entity : view) {
    const Rect box = view.get<const KinematicBody>(entity).aabb();
    const SDL_FRect fr{box.x - cam.x, box.y - cam.y, box.w, box.h};
    SDL_RenderFillRect(&r, &fr);
  }
}

// NOLINTNEXTLINE
void drawDebugCollision(SDL_Renderer& r,
                        const ActiveLevel& level,
                        const World& w,
                        Vec2 cam,
                        Vec2 viewSize) {
  const CollisionMap& map = level.collision;
  const float cs = static_cast<float>(map.cellSize());
  const CellRange range = visibleCells(map, cam, viewSize);

  setColor(r, kDebugSolid);
  for (int y = range.y0; y <= range.y1; ++y) {
    for (int x = range.x0; x <= range.x1; ++x) {
      if (map.isSolid(x, y)) {
        const SDL_FRect fr{map.cellToWorldX(x) - cam.x, map.cellToWorldY(y) - cam.y, cs, cs};
        SDL_RenderRect(&r, &fr);
      }
    }
  }

  if (level.hasTriggers) {
    const GridLayer& t = level.triggers;
    const float tcs = static_cast<float>(t.cellSize);
    setColor(r, kDebugTrigger);
    for (int y = 0; y < t.height; ++y) {
      for (int x = 0; x < t.width; ++x) {
        std::int32_t v = 0;
        if (!t.valueAt(x, y, v) || v != level.config.triggerValue) {
          continue;
        }
        const SDL_FRect fr{static_cast<float>(t.offsetX) + static_cast<float>(x) * tcs - cam.x,
                           static_cast<float>(t.offsetY) + static_cast<float>(y) * tcs - cam.y,
                           tcs, tcs};
        SDL_RenderRect(&r, &fr);
      }
    }
    SDL_RenderDebugText(&r, 8.0F, 16.0F, "yellow: level exit");
  }

  setColor(r, kDebugBounds);
  const SDL_FRect bounds{map.originX() - cam.x, map.originY() - cam.y, map.pixelWidth(),
                         map.pixelHeight()};
  SDL_RenderRect(&r, &bounds);

  auto view = w.registry.view<const KinematicBody>();
  for (auto entity : view) {
    const KinematicBody& body = view.get<const KinematicBody>(entity);
    if (body.grounded) {
      SDL_SetRenderDrawColor(&r, 0, 255, 0, 255);
    } else {
      SDL_SetRenderDrawColor(&r, 255, 0, 0, 255);
    }
    const Rect box = body.aabb();
    const SDL_FRect fr{box.x - cam.x, box.y - cam.y, box.w, box.h};
    SDL_RenderRect(&r, &fr);
  }
}

void drawFade(SDL_Renderer& r, float opacity) {
  if (opacity <= 0.0F) {
    return;
  }
  const auto alpha = static_cast<Uint8>(std::lround(std::clamp(opacity, 0.0F, 1.0F) * 255.0F));
  SDL_SetRenderDrawBlendMode(&r, SDL_BLENDMODE_BLEND);
  SDL_SetRenderDrawColor(&r, 0, 0, 0, alpha);
  SDL_RenderFillRect(&r, nullptr);
  SDL_SetRenderDrawBlendMode(&r, SDL_BLENDMODE_NONE);
}

}  // namespace LevelRenderer
