#include "level/GridLayer.h"

#include <cstddef>
#include <format>

bool GridLayer::valueAt(int x, int y, std::int32_t& out) const {
  if (!contains(x, y)) {
    return false;
  }
  const std::size_t idx = static_cast<std::size_t>(y) * static_cast<std::size_t>(width) +
                          static_cast<std::size_t>(x);
  if (idx >= cells.size()) {
    return false;
  }
  out = cells[idx];
  return true;
}

LevelStatus GridLayer::validate() const {
  if (cellSize <= 0) {
    return LevelStatus::fail(LevelError::UnsupportedDimensions,
                             std::format("layer '{}': cell size {} must be positive", identifier,
                                         cellSize));
  }
  if (width <= 0 || height <= 0) {
    return LevelStatus::fail(LevelError::UnsupportedDimensions,
                             std::format("layer '{}': grid size {}x{} must be positive",
                                         identifier, width, height));
  }
  const std::int64_t count = static_cast<std::int64_t>(width) * static_cast<std::int64_t>(height);
  if (count > kMaxCells) {
    return LevelStatus::fail(LevelError::UnsupportedDimensions,
                             std::format("layer '{}': {} cells exceeds limit {}", identifier,
                                         count, kMaxCells));
  }
  if (static_cast<std::int64_t>(cells.size()) != count) {
    return LevelStatus::fail(LevelError::UnsupportedDimensions,
                             std::format("layer '{}': {} cell values for a {}x{} grid",
                                         identifier, cells.size(), width, height));
  }
  return LevelStatus::success();
}
