#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "level/LevelError.h"

// One integer-valued grid layer as authored in the level editor.
struct GridLayer {
  // Upper bound on width*height; larger grids are rejected as unsupported.
  static constexpr std::int64_t kMaxCells = std::int64_t{1} << 24;

  std::string identifier;
  int cellSize = 0;  // px
  int width = 0;     // cells
  int height = 0;    // cells
  int offsetX = 0;   // px, total layer offset in world space
  int offsetY = 0;
  std::vector<std::int32_t> cells;  // row-major, width*height

  [[nodiscard]] bool contains(int x, int y) const {
    return x >= 0 && y >= 0 && x < width && y < height;
  }

  // Out-of-range coordinates are rejected (returns false), never clamped.
  [[nodiscard]] bool valueAt(int x, int y, std::int32_t& out) const;

  // UnsupportedDimensions when cell size, grid size or cell count is inconsistent.
  LevelStatus validate() const;
};
