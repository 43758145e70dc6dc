#pragma once

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <format>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

#include <toml++/toml.h>

#include "util/Geometry.h"

namespace TomlUtil {

inline int& warningCounter() {
  static int counter = 0;
  return counter;
}

inline void resetWarningCount() {
  warningCounter() = 0;
}

inline int warningCount() {
  return warningCounter();
}

inline void warnLine(std::string_view prefix, std::string_view message) {
  static constexpr std::string_view kWarningPrefix = ": warning: ";
  (void)std::fwrite(prefix.data(), 1, prefix.size(), stderr);
  (void)std::fwrite(kWarningPrefix.data(), 1, kWarningPrefix.size(), stderr);
  (void)std::fwrite(message.data(), 1, message.size(), stderr);
  (void)std::fwrite("\n", 1, 1, stderr);
}

template <typename... Args>
inline void warnf(const char* path, std::format_string<Args...> fmt, Args&&... args) {
  ++warningCounter();
  const std::string message = std::format(fmt, std::forward<Args>(args)...);
  const std::string_view prefix =
      (path != nullptr) ? std::string_view{path} : std::string_view{"<toml>"};
  warnLine(prefix, message);
}

inline bool allowedKey(std::string_view key, std::initializer_list<std::string_view> allowed) {
  return std::ranges::any_of(allowed, [key](std::string_view a) { return key == a; });
}

inline void warnUnknownKeys(const toml::table& tbl,
                            const char* path,
                            std::string_view scope,
                            std::initializer_list<std::string_view> allowed) {
  for (const auto& [key, node] : tbl) {
    (void)node;
    std::string_view k = key.str();
    if (allowedKey(k, allowed)) {
      continue;
    }
    warnf(path, "unknown key '{}' in {}", k, scope);
  }
}

// Reads an optional number (integer or float) into `out`. Returns false only when the key exists
// with a non-numeric or non-finite value; `out` is untouched in that case.
inline bool readFloat(const toml::table& tbl, std::string_view key, float& out) {
  const toml::node* node = tbl.get(key);
  if (node == nullptr) {
    return true;
  }
  const auto v = node->value<double>();
  if (!v || !std::isfinite(*v)) {
    return false;
  }
  out = static_cast<float>(*v);
  return true;
}

// `[x, y]` pair of numbers.
inline bool readVec2(const toml::node& node, Vec2& out) {
  const toml::array* arr = node.as_array();
  if (arr == nullptr || arr->size() != 2) {
    return false;
  }
  const auto x = (*arr)[0].value<double>();
  const auto y = (*arr)[1].value<double>();
  if (!x || !y || !std::isfinite(*x) || !std::isfinite(*y)) {
    return false;
  }
  out = Vec2{static_cast<float>(*x), static_cast<float>(*y)};
  return true;
}

}  // namespace TomlUtil
