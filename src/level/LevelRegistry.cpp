#include "level/LevelRegistry.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <format>
#include <utility>

#include "level/LdtkParser.h"
#include "util/Log.h"

bool ActiveLevel::touchesTrigger(Vec2 position, Vec2 halfExtents) const {
  if (!hasTriggers || triggers.cellSize <= 0) {
    return false;
  }
  const float cs = static_cast<float>(triggers.cellSize);
  const float minX = position.x - static_cast<float>(triggers.offsetX);
  const float minY = position.y - static_cast<float>(triggers.offsetY);
  const float eps = CollisionMap::kEdgeEpsilon;
  const int x0 = static_cast<int>(std::floor((minX + eps) / cs));
  const int x1 = static_cast<int>(std::ceil((minX + 2.0F * halfExtents.x - eps) / cs)) - 1;
  const int y0 = static_cast<int>(std::floor((minY + eps) / cs));
  const int y1 = static_cast<int>(std::ceil((minY + 2.0F * halfExtents.y - eps) / cs)) - 1;
  for (int y = std::max(y0, 0); y <= std::min(y1, triggers.height - 1); ++y) {
    for (int x = std::max(x0, 0); x <= std::min(x1, triggers.width - 1); ++x) {
      std::int32_t v = 0;
      if (triggers.valueAt(x, y, v) && v == config.triggerValue) {
        return true;
      }
    }
  }
  return false;
}

LevelStatus LevelRegistry::prepareLevel(const LevelConfig& config,
                                        std::shared_ptr<const ActiveLevel>& out) {
  ParsedLevel parsed;
  LevelStatus st =
      Ldtk::parseFile(config.projectPath, config.ldtkLevel, config.collisionLayer, parsed);
  if (!st.ok()) {
    return st;
  }

  auto level = std::make_shared<ActiveLevel>();
  level->config = config;
  level->ldtkIdentifier = parsed.identifier;
  level->iid = parsed.iid;
  level->pxWidth = parsed.pxWidth;
  level->pxHeight = parsed.pxHeight;

  st = CollisionMap::build(*parsed.findLayer(config.collisionLayer), level->collision);
  if (!st.ok()) {
    return st;
  }

  if (!config.triggerLayer.empty()) {
    const GridLayer* triggers = parsed.findLayer(config.triggerLayer);
    if (triggers == nullptr) {
      return LevelStatus::fail(LevelError::MissingLayer,
                               std::format("level '{}': no IntGrid trigger layer named '{}'",
                                           parsed.identifier, config.triggerLayer));
    }
    level->triggers = *triggers;
    level->hasTriggers = true;
  }

  out = std::move(level);
  return LevelStatus::success();
}

bool LevelRegistry::commit(Ticket ticket, std::shared_ptr<const ActiveLevel> level) {
  if (ticket != latestTicket_ || level == nullptr) {
    return false;
  }
  active_ = std::move(level);
  ++activations_;
  return true;
}

LevelStatus LevelRegistry::loadLevel(const LevelConfig& config) {
  // A direct load also supersedes any two-phase load still in flight.
  const Ticket ticket = beginLoad();
  std::shared_ptr<const ActiveLevel> level;
  LevelStatus st = prepareLevel(config, level);
  if (!st.ok()) {
    Log::warn("level '{}' failed to load ({}): {}", config.id, levelErrorName(st.error),
              st.detail);
    return st;
  }
  const bool committed = commit(ticket, std::move(level));
  (void)committed;  // nothing can issue a newer ticket between beginLoad and here
  Log::info("level '{}' active ({}x{} cells, {} solid)", config.id, active_->collision.width(),
            active_->collision.height(), active_->collision.solidCount());
  return LevelStatus::success();
}

const CollisionMap& LevelRegistry::activeMap() const {
  if (!active_) {
    throw LevelException(LevelError::NoLevelLoaded, "no level has been loaded");
  }
  return active_->collision;
}
