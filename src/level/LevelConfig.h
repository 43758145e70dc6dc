#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "util/Geometry.h"

struct LevelConfig {
  static constexpr std::int32_t kDefaultTriggerValue = 2;

  std::string id;                  // catalog id ("level1")
  std::string projectPath;         // .ldtk file
  std::string ldtkLevel;           // LDtk level identifier; empty = first level
  std::string collisionLayer = "Collision";
  std::string triggerLayer;        // optional IntGrid layer holding transition triggers
  std::int32_t triggerValue = kDefaultTriggerValue;
  std::string next;                // catalog id loaded when a trigger is touched
  Vec2 start{};                    // player spawn, world px (top-left of the body)
};

// The list of playable levels, read from a TOML catalog.
class LevelCatalog {
 public:
  bool loadFromToml(const char* path);

  [[nodiscard]] const LevelConfig* find(std::string_view id) const;
  [[nodiscard]] const std::string& startLevel() const { return startLevel_; }
  [[nodiscard]] const std::vector<LevelConfig>& levels() const { return levels_; }
  [[nodiscard]] const std::string& path() const { return path_; }

 private:
  std::vector<LevelConfig> levels_;
  std::string startLevel_;
  std::string path_;
};
