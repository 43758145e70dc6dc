#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "level/GridLayer.h"
#include "level/LevelError.h"
#include "util/Geometry.h"

enum class Axis : std::uint8_t { X, Y };

struct CellCoord {
  int x = 0;
  int y = 0;
  bool operator==(const CellCoord&) const = default;
};

struct SweepResult {
  float displacement = 0.0F;  // clamped; equals the request when nothing was hit
  bool hit = false;
  CellCoord hitCell{};  // valid when hit
};

// Immutable solidity grid built from one IntGrid layer. A cell is solid iff its source value is
// non-zero; space outside the grid is open.
//
// Positions passed to queries are the top-left corner of an AABB spanning [pos, pos + 2*half).
// All faces are treated as open intervals: a box flush against a solid cell does not overlap it.
class CollisionMap {
 public:
  static constexpr float kEdgeEpsilon = 1.0e-3F;

  static LevelStatus build(const GridLayer& layer, CollisionMap& out);

  [[nodiscard]] const std::string& layerName() const { return layerName_; }
  [[nodiscard]] int cellSize() const { return cellSize_; }
  [[nodiscard]] int width() const { return width_; }
  [[nodiscard]] int height() const { return height_; }
  [[nodiscard]] float originX() const { return originX_; }
  [[nodiscard]] float originY() const { return originY_; }
  [[nodiscard]] float pixelWidth() const { return static_cast<float>(width_ * cellSize_); }
  [[nodiscard]] float pixelHeight() const { return static_cast<float>(height_ * cellSize_); }
  [[nodiscard]] std::size_t solidCount() const { return solidCount_; }

  [[nodiscard]] bool isSolid(int cellX, int cellY) const;

  // floor((w - origin) / cellSize)
  [[nodiscard]] int worldToCellX(float wx) const;
  [[nodiscard]] int worldToCellY(float wy) const;
  [[nodiscard]] float cellToWorldX(int cx) const;
  [[nodiscard]] float cellToWorldY(int cy) const;

  [[nodiscard]] bool overlapsSolid(Vec2 position, Vec2 halfExtents) const;

  // Moves the box along one axis by `displacement`, stopping at the face of the first solid
  // cell its leading edge would enter. Cells already overlapped at the start are ignored.
  [[nodiscard]] SweepResult sweepAABB(Vec2 position,
                                      Vec2 halfExtents,
                                      float displacement,
                                      Axis axis) const;

 private:
  std::string layerName_;
  int cellSize_ = 0;
  int width_ = 0;
  int height_ = 0;
  float originX_ = 0.0F;
  float originY_ = 0.0F;
  std::size_t solidCount_ = 0;
  std::vector<std::uint64_t> bits_;
};
