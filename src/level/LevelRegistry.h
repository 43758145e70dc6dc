#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "level/CollisionMap.h"
#include "level/GridLayer.h"
#include "level/LevelConfig.h"
#include "level/LevelError.h"

// Everything the simulation needs from one loaded level. Never mutated after it is built.
struct ActiveLevel {
  LevelConfig config;
  std::string ldtkIdentifier;
  std::string iid;
  int pxWidth = 0;
  int pxHeight = 0;
  CollisionMap collision;
  bool hasTriggers = false;
  GridLayer triggers;

  // True when the box overlaps a cell of the trigger layer holding the configured trigger value.
  [[nodiscard]] bool touchesTrigger(Vec2 position, Vec2 halfExtents) const;
};

// Owns the single active level. Replacement swaps a shared snapshot, so a caller that captured
// active() keeps a consistent level for as long as it holds it.
class LevelRegistry {
 public:
  using Ticket = std::uint64_t;

  // Parse + build without touching any registry state. Safe to run off the simulation thread.
  static LevelStatus prepareLevel(const LevelConfig& config,
                                  std::shared_ptr<const ActiveLevel>& out);

  // Every ticket supersedes the ones issued before it.
  Ticket beginLoad() { return ++latestTicket_; }

  // Activates `level` if `ticket` is still the newest request; otherwise the result is dropped.
  bool commit(Ticket ticket, std::shared_ptr<const ActiveLevel> level);

  // prepareLevel + commit. On failure the previous level stays active.
  LevelStatus loadLevel(const LevelConfig& config);

  // Throws LevelException(NoLevelLoaded) before the first successful load.
  [[nodiscard]] const CollisionMap& activeMap() const;

  [[nodiscard]] std::shared_ptr<const ActiveLevel> active() const { return active_; }
  [[nodiscard]] bool hasActiveLevel() const { return active_ != nullptr; }
  [[nodiscard]] std::uint64_t activationCount() const { return activations_; }

 private:
  std::shared_ptr<const ActiveLevel> active_;
  Ticket latestTicket_ = 0;
  std::uint64_t activations_ = 0;
};
