#pragma once

#include <SDL3/SDL_render.h>

#include "util/Geometry.h"

struct ActiveLevel;
struct KinematicBody;
class World;

namespace LevelRenderer {

// `cam` is the top-left of the view in world px; the renderer's scale maps world px to pixels.
void drawTiles(SDL_Renderer& r, const ActiveLevel& level, Vec2 cam, Vec2 viewSize);
void drawBodies(SDL_Renderer& r, const World& w, Vec2 cam);
void drawDebugCollision(SDL_Renderer& r, const ActiveLevel& level, const World& w, Vec2 cam,
                        Vec2 viewSize);
void drawFade(SDL_Renderer& r, float opacity);

}  // namespace LevelRenderer
