#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "level/GridLayer.h"
#include "level/LevelError.h"

// A single level extracted from an LDtk project: metadata plus every IntGrid layer, in file order.
struct ParsedLevel {
  std::string identifier;
  std::string iid;
  int worldX = 0;
  int worldY = 0;
  int pxWidth = 0;
  int pxHeight = 0;
  std::vector<GridLayer> layers;

  [[nodiscard]] const GridLayer* findLayer(std::string_view layerIdentifier) const;
};

namespace Ldtk {

// `levelIdentifier` empty selects the first level. `requiredLayer` empty skips the layer check.
// `out` is only written on success. `baseDir` resolves external level files ("externalRelPath").
LevelStatus parseText(std::string_view text,
                      std::string_view levelIdentifier,
                      std::string_view requiredLayer,
                      ParsedLevel& out,
                      const std::filesystem::path& baseDir = {});

LevelStatus parseFile(const std::filesystem::path& path,
                      std::string_view levelIdentifier,
                      std::string_view requiredLayer,
                      ParsedLevel& out);

}  // namespace Ldtk
