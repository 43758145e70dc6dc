#pragma once

#include <SDL3/SDL.h>

#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>
#include <system_error>

namespace Paths {

inline bool pathExists(const std::filesystem::path& p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec) && !ec;
}

// Looks for `relativePath` as given, then beside the executable (argv0 and SDL's base path),
// then one directory above it. Falls back to the relative path unchanged.
inline std::string resolveAssetPath(std::string_view relativePath, const char* argv0 = nullptr) {
  namespace fs = std::filesystem;

  fs::path rel(relativePath);
  if (rel.is_absolute() || pathExists(rel)) {
    return rel.string();
  }

  auto tryBase = [&rel](const fs::path& base, std::string& out) {
    for (const fs::path& candidate : {base / rel, base / ".." / rel}) {
      if (pathExists(candidate)) {
        out = candidate.lexically_normal().string();
        return true;
      }
    }
    return false;
  };

  std::string found;
  if ((argv0 != nullptr) && (*argv0 != 0)) {
    std::error_code ec;
    const fs::path exe = fs::absolute(fs::path(argv0), ec);
    if (!ec && tryBase(exe.parent_path(), found)) {
      return found;
    }
  }

  const char* basePathC = SDL_GetBasePath();
  if ((basePathC != nullptr) && (*basePathC != 0) && tryBase(fs::path(basePathC), found)) {
    return found;
  }

  return rel.string();
}

}  // namespace Paths
