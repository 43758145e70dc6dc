#pragma once

#include <cstdio>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace Log {

enum class Level : int { Info = 0, Warn = 1, Error = 2 };

inline Level& minLevel() {
  static Level level = Level::Info;
  return level;
}

inline void setMinLevel(Level level) {
  minLevel() = level;
}

inline const char* levelTag(Level level) {
  switch (level) {
    case Level::Info:
      return "info";
    case Level::Warn:
      return "warning";
    case Level::Error:
      return "error";
  }
  return "?";
}

inline void line(Level level, std::string_view message) {
  if (static_cast<int>(level) < static_cast<int>(minLevel())) {
    return;
  }
  const char* tag = levelTag(level);
  (void)std::fwrite(tag, 1, std::string_view{tag}.size(), stderr);
  (void)std::fwrite(": ", 1, 2, stderr);
  (void)std::fwrite(message.data(), 1, message.size(), stderr);
  (void)std::fwrite("\n", 1, 1, stderr);
}

template <typename... Args>
inline void info(std::format_string<Args...> fmt, Args&&... args) {
  line(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
inline void warn(std::format_string<Args...> fmt, Args&&... args) {
  line(Level::Warn, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
inline void error(std::format_string<Args...> fmt, Args&&... args) {
  line(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

}  // namespace Log
