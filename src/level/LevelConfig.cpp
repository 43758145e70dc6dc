#include "level/LevelConfig.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <format>
#include <limits>
#include <string>
#include <utility>

#include <toml++/toml.h>

#include "util/Log.h"
#include "util/TomlUtil.h"

const LevelConfig* LevelCatalog::find(std::string_view id) const {
  for (const LevelConfig& cfg : levels_) {
    if (cfg.id == id) {
      return &cfg;
    }
  }
  return nullptr;
}

// NOLINTNEXTLINE
bool LevelCatalog::loadFromToml(const char* path) {
  if (path == nullptr || path[0] == '\0') {
    return false;
  }

  toml::table tbl;
  try {
    tbl = toml::parse_file(path);
  } catch (const toml::parse_error& e) {
    Log::error("{}: {}", path, e.description());
    return false;
  }

  TomlUtil::warnUnknownKeys(tbl, path, "root", {"version", "start", "level"});

  int version = 1;
  if (auto v = tbl["version"].value<int>())
    version = *v;
  if (version != 1) {
    TomlUtil::warnf(path, "level catalog version {} (expected 1)", version);
  }

  const std::filesystem::path baseDir = std::filesystem::path(path).parent_path();
  std::vector<LevelConfig> nextLevels;

  const toml::array* arr = tbl["level"].as_array();
  if (arr == nullptr || arr->empty()) {
    Log::error("{}: no [[level]] entries", path);
    return false;
  }

  std::size_t idx = 0;
  for (const auto& node : *arr) {
    const std::string scope = std::format("level[{}]", idx++);
    const toml::table* t = node.as_table();
    if (t == nullptr) {
      Log::error("{}: {} is not a table", path, scope);
      return false;
    }
    TomlUtil::warnUnknownKeys(*t, path, scope,
                              {"id", "file", "ldtk_level", "collision_layer", "trigger_layer",
                               "trigger_value", "next", "start"});

    LevelConfig cfg;
    const auto id = (*t)["id"].value<std::string>();
    const auto file = (*t)["file"].value<std::string>();
    if (!id || id->empty() || !file || file->empty()) {
      Log::error("{}: {} needs non-empty 'id' and 'file'", path, scope);
      return false;
    }
    cfg.id = *id;
    const std::filesystem::path filePath(*file);
    cfg.projectPath =
        filePath.is_absolute() ? filePath.string() : (baseDir / filePath).lexically_normal().string();

    if (auto v = t->get("ldtk_level"))
      cfg.ldtkLevel = v->value_or(cfg.ldtkLevel);
    if (auto v = t->get("collision_layer"))
      cfg.collisionLayer = v->value_or(cfg.collisionLayer);
    if (auto v = t->get("trigger_layer"))
      cfg.triggerLayer = v->value_or(cfg.triggerLayer);
    if (auto v = t->get("next"))
      cfg.next = v->value_or(cfg.next);
    if (auto v = t->get("trigger_value")) {
      const auto value = v->value<std::int64_t>();
      if (!value || *value == 0 || *value < std::numeric_limits<std::int32_t>::min() ||
          *value > std::numeric_limits<std::int32_t>::max()) {
        Log::error("{}: {}.trigger_value must be a non-zero integer", path, scope);
        return false;
      }
      cfg.triggerValue = static_cast<std::int32_t>(*value);
    }
    if (const toml::node* start = t->get("start")) {
      if (!TomlUtil::readVec2(*start, cfg.start)) {
        Log::error("{}: {}.start must be [x, y]", path, scope);
        return false;
      }
    }
    if (cfg.collisionLayer.empty()) {
      Log::error("{}: {}.collision_layer must not be empty", path, scope);
      return false;
    }

    for (const LevelConfig& other : nextLevels) {
      if (other.id == cfg.id) {
        Log::error("{}: duplicate level id '{}'", path, cfg.id);
        return false;
      }
    }
    nextLevels.push_back(std::move(cfg));
  }

  std::string nextStart = nextLevels.front().id;
  if (auto v = tbl["start"].value<std::string>())
    nextStart = *v;

  auto known = [&nextLevels](std::string_view id) {
    for (const LevelConfig& cfg : nextLevels) {
      if (cfg.id == id)
        return true;
    }
    return false;
  };
  if (!known(nextStart)) {
    Log::error("{}: start level '{}' is not in the catalog", path, nextStart);
    return false;
  }
  for (const LevelConfig& cfg : nextLevels) {
    if (!cfg.next.empty() && !known(cfg.next)) {
      TomlUtil::warnf(path, "level '{}' links to unknown level '{}'", cfg.id, cfg.next);
    }
  }

  levels_ = std::move(nextLevels);
  startLevel_ = std::move(nextStart);
  path_ = path;
  return true;
}
