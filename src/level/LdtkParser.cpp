#include "level/LdtkParser.h"

#include <cstddef>
#include <cstdint>
#include <format>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

const GridLayer* ParsedLevel::findLayer(std::string_view layerIdentifier) const {
  for (const GridLayer& layer : layers) {
    if (layer.identifier == layerIdentifier) {
      return &layer;
    }
  }
  return nullptr;
}

namespace {

constexpr std::string_view kIntGridType = "IntGrid";

LevelStatus malformed(std::string what) {
  return LevelStatus::fail(LevelError::MalformedLevelFile, std::move(what));
}

bool readText(const std::filesystem::path& path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return !in.bad();
}

LevelStatus parseJson(std::string_view text, std::string_view what, json& out) {
  try {
    out = json::parse(text.begin(), text.end());
  } catch (const json::parse_error& e) {
    return malformed(std::format("{}: invalid JSON: {}", what, e.what()));
  }
  if (!out.is_object()) {
    return malformed(std::format("{}: root is not an object", what));
  }
  return LevelStatus::success();
}

bool readInt(const json& obj, const char* key, int& out) {
  const auto it = obj.find(key);
  if (it == obj.end() || !it->is_number_integer()) {
    return false;
  }
  const auto v = it->get<std::int64_t>();
  if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
    return false;
  }
  out = static_cast<int>(v);
  return true;
}

bool readString(const json& obj, const char* key, std::string& out) {
  const auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    return false;
  }
  out = it->get<std::string>();
  return true;
}

// Optional integer: absent is fine, present-but-not-an-integer is not.
bool readOptionalInt(const json& obj, const char* key, int& out) {
  if (!obj.contains(key)) {
    return true;
  }
  return readInt(obj, key, out);
}

LevelStatus parseIntGridLayer(const json& layerJson, std::size_t index, GridLayer& out) {
  GridLayer layer;
  if (!readString(layerJson, "__identifier", layer.identifier)) {
    return malformed(std::format("layerInstances[{}]: missing __identifier", index));
  }
  if (!readInt(layerJson, "__gridSize", layer.cellSize) ||
      !readInt(layerJson, "__cWid", layer.width) || !readInt(layerJson, "__cHei", layer.height)) {
    return malformed(
        std::format("layer '{}': missing __gridSize/__cWid/__cHei", layer.identifier));
  }
  if (!readOptionalInt(layerJson, "__pxTotalOffsetX", layer.offsetX) ||
      !readOptionalInt(layerJson, "__pxTotalOffsetY", layer.offsetY)) {
    return malformed(std::format("layer '{}': non-integer pixel offset", layer.identifier));
  }

  const auto csv = layerJson.find("intGridCsv");
  if (csv == layerJson.end() || !csv->is_array()) {
    return malformed(std::format("layer '{}': missing intGridCsv", layer.identifier));
  }
  layer.cells.reserve(csv->size());
  for (const json& v : *csv) {
    if (!v.is_number_integer()) {
      return malformed(std::format("layer '{}': non-integer cell value", layer.identifier));
    }
    const auto cell = v.get<std::int64_t>();
    if (cell < std::numeric_limits<std::int32_t>::min() ||
        cell > std::numeric_limits<std::int32_t>::max()) {
      return malformed(std::format("layer '{}': cell value {} out of range", layer.identifier,
                                   cell));
    }
    layer.cells.push_back(static_cast<std::int32_t>(cell));
  }

  LevelStatus dims = layer.validate();
  if (!dims.ok()) {
    return dims;
  }
  out = std::move(layer);
  return LevelStatus::success();
}

// Levels sit in the root "levels" array, or per world in multi-world projects.
const json* findLevel(const json& root, std::string_view identifier) {
  auto search = [identifier](const json& levels) -> const json* {
    if (!levels.is_array()) {
      return nullptr;
    }
    for (const json& level : levels) {
      if (!level.is_object()) {
        continue;
      }
      if (identifier.empty()) {
        return &level;
      }
      const auto id = level.find("identifier");
      if (id != level.end() && id->is_string() && id->get_ref<const std::string&>() == identifier) {
        return &level;
      }
    }
    return nullptr;
  };

  if (const auto levels = root.find("levels"); levels != root.end()) {
    if (const json* found = search(*levels)) {
      return found;
    }
  }
  if (const auto worlds = root.find("worlds"); worlds != root.end() && worlds->is_array()) {
    for (const json& world : *worlds) {
      if (!world.is_object()) {
        continue;
      }
      if (const auto levels = world.find("levels"); levels != world.end()) {
        if (const json* found = search(*levels)) {
          return found;
        }
      }
    }
  }
  return nullptr;
}

}  // namespace

namespace Ldtk {

// NOLINTNEXTLINE
LevelStatus parseText(std::string_view text,
                      std::string_view levelIdentifier,
                      std::string_view requiredLayer,
                      ParsedLevel& out,
                      const std::filesystem::path& baseDir) {
  json root;
  if (LevelStatus st = parseJson(text, "project", root); !st.ok()) {
    return st;
  }
  if (!root.contains("levels") && !root.contains("worlds")) {
    return malformed("project has no 'levels' array");
  }

  const json* level = findLevel(root, levelIdentifier);
  if (level == nullptr) {
    return malformed(levelIdentifier.empty()
                         ? std::string("project contains no levels")
                         : std::format("level '{}' not found in project", levelIdentifier));
  }

  ParsedLevel next;
  if (!readString(*level, "identifier", next.identifier) || !readString(*level, "iid", next.iid)) {
    return malformed("level is missing identifier/iid");
  }
  if (!readInt(*level, "pxWid", next.pxWidth) || !readInt(*level, "pxHei", next.pxHeight)) {
    return malformed(std::format("level '{}': missing pxWid/pxHei", next.identifier));
  }
  if (!readOptionalInt(*level, "worldX", next.worldX) ||
      !readOptionalInt(*level, "worldY", next.worldY)) {
    return malformed(std::format("level '{}': non-integer world position", next.identifier));
  }

  // "Save levels to separate files": layerInstances is null and the data lives beside the project.
  json external;
  const json* layers = nullptr;
  if (const auto it = level->find("layerInstances"); it != level->end() && it->is_array()) {
    layers = &*it;
  } else {
    std::string relPath;
    if (!readString(*level, "externalRelPath", relPath)) {
      return malformed(std::format("level '{}': missing layerInstances", next.identifier));
    }
    std::string externalText;
    const std::filesystem::path externalPath = baseDir / relPath;
    if (!readText(externalPath, externalText)) {
      return malformed(std::format("level '{}': cannot read external level '{}'",
                                   next.identifier, externalPath.string()));
    }
    if (LevelStatus st = parseJson(externalText, externalPath.string(), external); !st.ok()) {
      return st;
    }
    const auto it = external.find("layerInstances");
    if (it == external.end() || !it->is_array()) {
      return malformed(std::format("level '{}': external file has no layerInstances",
                                   next.identifier));
    }
    layers = &*it;
  }

  bool requiredIsOtherType = false;
  std::size_t index = 0;
  for (const json& layerJson : *layers) {
    const std::size_t i = index++;
    if (!layerJson.is_object()) {
      return malformed(std::format("layerInstances[{}] is not an object", i));
    }
    std::string type;
    if (!readString(layerJson, "__type", type)) {
      return malformed(std::format("layerInstances[{}]: missing __type", i));
    }
    if (type != kIntGridType) {
      std::string id;
      if (!requiredLayer.empty() && readString(layerJson, "__identifier", id) &&
          id == requiredLayer) {
        requiredIsOtherType = true;
      }
      continue;
    }
    GridLayer layer;
    if (LevelStatus st = parseIntGridLayer(layerJson, i, layer); !st.ok()) {
      return st;
    }
    next.layers.push_back(std::move(layer));
  }

  if (!requiredLayer.empty() && next.findLayer(requiredLayer) == nullptr) {
    return LevelStatus::fail(
        LevelError::MissingLayer,
        requiredIsOtherType
            ? std::format("level '{}': layer '{}' is not an IntGrid layer", next.identifier,
                          requiredLayer)
            : std::format("level '{}': no IntGrid layer named '{}'", next.identifier,
                          requiredLayer));
  }

  out = std::move(next);
  return LevelStatus::success();
}

LevelStatus parseFile(const std::filesystem::path& path,
                      std::string_view levelIdentifier,
                      std::string_view requiredLayer,
                      ParsedLevel& out) {
  std::string text;
  if (!readText(path, text)) {
    return malformed(std::format("cannot read level file '{}'", path.string()));
  }
  return parseText(text, levelIdentifier, requiredLayer, out, path.parent_path());
}

}  // namespace Ldtk
