#include "level/CollisionMap.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace {

constexpr std::size_t kWordBits = 64;

// Cell index of a coordinate already expressed relative to the grid origin. Huge inputs saturate
// well outside any supported grid instead of overflowing the int conversion.
int floorCell(float v, float cellSize) {
  constexpr double kLimit = 1.0e9;
  const double c = std::floor(static_cast<double>(v) / static_cast<double>(cellSize));
  return static_cast<int>(std::clamp(c, -kLimit, kLimit));
}

int ceilCell(float v, float cellSize) {
  constexpr double kLimit = 1.0e9;
  const double c = std::ceil(static_cast<double>(v) / static_cast<double>(cellSize));
  return static_cast<int>(std::clamp(c, -kLimit, kLimit));
}

}  // namespace

LevelStatus CollisionMap::build(const GridLayer& layer, CollisionMap& out) {
  LevelStatus dims = layer.validate();
  if (!dims.ok()) {
    return dims;
  }

  CollisionMap next;
  next.layerName_ = layer.identifier;
  next.cellSize_ = layer.cellSize;
  next.width_ = layer.width;
  next.height_ = layer.height;
  next.originX_ = static_cast<float>(layer.offsetX);
  next.originY_ = static_cast<float>(layer.offsetY);

  const std::size_t count = layer.cells.size();
  next.bits_.assign((count + kWordBits - 1) / kWordBits, 0);
  for (std::size_t i = 0; i < count; ++i) {
    if (layer.cells[i] != 0) {
      next.bits_[i / kWordBits] |= std::uint64_t{1} << (i % kWordBits);
      ++next.solidCount_;
    }
  }

  out = std::move(next);
  return LevelStatus::success();
}

bool CollisionMap::isSolid(int cellX, int cellY) const {
  if (cellX < 0 || cellY < 0 || cellX >= width_ || cellY >= height_) {
    return false;
  }
  const std::size_t i = static_cast<std::size_t>(cellY) * static_cast<std::size_t>(width_) +
                        static_cast<std::size_t>(cellX);
  return ((bits_[i / kWordBits] >> (i % kWordBits)) & 1U) != 0;
}

int CollisionMap::worldToCellX(float wx) const {
  return floorCell(wx - originX_, static_cast<float>(cellSize_));
}

int CollisionMap::worldToCellY(float wy) const {
  return floorCell(wy - originY_, static_cast<float>(cellSize_));
}

float CollisionMap::cellToWorldX(int cx) const {
  return originX_ + static_cast<float>(cx * cellSize_);
}

float CollisionMap::cellToWorldY(int cy) const {
  return originY_ + static_cast<float>(cy * cellSize_);
}

bool CollisionMap::overlapsSolid(Vec2 position, Vec2 halfExtents) const {
  if (cellSize_ <= 0) {
    return false;
  }
  const float cs = static_cast<float>(cellSize_);
  const float minX = position.x - originX_;
  const float minY = position.y - originY_;
  const int x0 = std::max(floorCell(minX + kEdgeEpsilon, cs), 0);
  const int x1 = std::min(ceilCell(minX + 2.0F * halfExtents.x - kEdgeEpsilon, cs) - 1, width_ - 1);
  const int y0 = std::max(floorCell(minY + kEdgeEpsilon, cs), 0);
  const int y1 =
      std::min(ceilCell(minY + 2.0F * halfExtents.y - kEdgeEpsilon, cs) - 1, height_ - 1);
  for (int y = y0; y <= y1; ++y) {
    for (int x = x0; x <= x1; ++x) {
      if (isSolid(x, y)) {
        return true;
      }
    }
  }
  return false;
}

// NOLINTNEXTLINE
SweepResult CollisionMap::sweepAABB(Vec2 position,
                                    Vec2 halfExtents,
                                    float displacement,
                                    Axis axis) const {
  SweepResult out{};
  out.displacement = displacement;
  if (displacement == 0.0F || cellSize_ <= 0) {
    return out;
  }

  const bool alongX = axis == Axis::X;
  const float cs = static_cast<float>(cellSize_);
  const int mainCount = alongX ? width_ : height_;
  const int crossCount = alongX ? height_ : width_;

  // Grid-relative extents on the moving axis and on the perpendicular one.
  const float mainMin = alongX ? position.x - originX_ : position.y - originY_;
  const float mainSize = 2.0F * (alongX ? halfExtents.x : halfExtents.y);
  const float crossMin = alongX ? position.y - originY_ : position.x - originX_;
  const float crossSize = 2.0F * (alongX ? halfExtents.y : halfExtents.x);

  const int crossFirst = std::max(floorCell(crossMin + kEdgeEpsilon, cs), 0);
  const int crossLast = std::min(ceilCell(crossMin + crossSize - kEdgeEpsilon, cs) - 1,
                                 crossCount - 1);
  if (crossFirst > crossLast) {
    return out;
  }

  auto solidAt = [&](int mainCell, int crossCell) {
    return alongX ? isSolid(mainCell, crossCell) : isSolid(crossCell, mainCell);
  };
  auto cellAt = [alongX](int mainCell, int crossCell) {
    return alongX ? CellCoord{mainCell, crossCell} : CellCoord{crossCell, mainCell};
  };

  if (displacement > 0.0F) {
    const float lead = mainMin + mainSize;
    // First cell the leading edge is not already inside; last cell it reaches.
    const int first = std::max(ceilCell(lead - kEdgeEpsilon, cs), 0);
    const int last = std::min(ceilCell(lead + displacement, cs) - 1, mainCount - 1);
    for (int c = first; c <= last; ++c) {
      for (int k = crossFirst; k <= crossLast; ++k) {
        if (!solidAt(c, k)) {
          continue;
        }
        out.displacement = std::max(0.0F, static_cast<float>(c) * cs - lead);
        out.hit = true;
        out.hitCell = cellAt(c, k);
        return out;
      }
    }
    return out;
  }

  const float lead = mainMin;
  const int first = std::min(floorCell(lead + kEdgeEpsilon, cs) - 1, mainCount - 1);
  const int last = std::max(floorCell(lead + displacement, cs), 0);
  for (int c = first; c >= last; --c) {
    for (int k = crossFirst; k <= crossLast; ++k) {
      if (!solidAt(c, k)) {
        continue;
      }
      out.displacement = std::min(0.0F, static_cast<float>(c + 1) * cs - lead);
      out.hit = true;
      out.hitCell = cellAt(c, k);
      return out;
    }
  }
  return out;
}
