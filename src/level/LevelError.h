#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

enum class LevelError : std::uint8_t {
  None,
  MalformedLevelFile,     // structurally invalid source file
  MissingLayer,           // designated collision layer absent
  UnsupportedDimensions,  // cell size / grid size / cell count out of range
  NoLevelLoaded,          // query before any successful load
};

constexpr const char* levelErrorName(LevelError e) {
  switch (e) {
    case LevelError::None:
      return "None";
    case LevelError::MalformedLevelFile:
      return "MalformedLevelFile";
    case LevelError::MissingLayer:
      return "MissingLayer";
    case LevelError::UnsupportedDimensions:
      return "UnsupportedDimensions";
    case LevelError::NoLevelLoaded:
      return "NoLevelLoaded";
  }
  return "?";
}

struct [[nodiscard]] LevelStatus {
  LevelError error = LevelError::None;
  std::string detail;

  bool ok() const { return error == LevelError::None; }

  static LevelStatus success() { return {}; }
  static LevelStatus fail(LevelError e, std::string what) { return {e, std::move(what)}; }
};

class LevelException : public std::runtime_error {
 public:
  LevelException(LevelError error, const std::string& what)
      : std::runtime_error(what), error_(error) {}

  [[nodiscard]] LevelError error() const noexcept { return error_; }

 private:
  LevelError error_;
};
