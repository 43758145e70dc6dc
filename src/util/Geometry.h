#pragma once

#include <cmath>

struct Vec2 {
  float x = 0.0F;
  float y = 0.0F;
  Vec2 operator+(const Vec2& o) const { return {x + o.x, y + o.y}; }
  Vec2 operator-(const Vec2& o) const { return {x - o.x, y - o.y}; }
  Vec2 operator*(float s) const { return {x * s, y * s}; }
};

struct Rect {
  float x = 0.0F;
  float y = 0.0F;
  float w = 0.0F;
  float h = 0.0F;
};

inline bool isFinite(Vec2 v) {
  return std::isfinite(v.x) && std::isfinite(v.y);
}
