#include "core/InputScript.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <toml++/toml.h>

#include "util/Log.h"
#include "util/TomlUtil.h"

bool InputScript::appendFromToml(const std::filesystem::path& path,
                                 std::unordered_set<std::string>& seen) {
  const std::filesystem::path normalized = path.lexically_normal();
  const std::string pathStr = normalized.string();
  if (pathStr.empty()) {
    return false;
  }

  if (!seen.insert(pathStr).second) {
    TomlUtil::warnf(pathStr.c_str(), "input script include cycle detected; skipping");
    return true;
  }

  toml::table tbl;
  try {
    tbl = toml::parse_file(pathStr);
  } catch (const toml::parse_error& e) {
    Log::error("{}: {}", pathStr, e.description());
    return false;
  }

  TomlUtil::warnUnknownKeys(tbl, pathStr.c_str(), "root", {"version", "keyframes", "include"});

  int version = 1;
  if (auto v = tbl["version"].value<int>())
    version = *v;
  if (version != 1) {
    TomlUtil::warnf(pathStr.c_str(), "input script version {} (expected 1)", version);
  }

  if (auto include = tbl["include"].value<std::string>()) {
    if (!appendFromToml(normalized.parent_path() / *include, seen)) {
      return false;
    }
  } else if (tbl.contains("include")) {
    TomlUtil::warnf(pathStr.c_str(), "include must be a string path");
  }

  const toml::array* framesArr = tbl["keyframes"].as_array();
  if (framesArr == nullptr) {
    return true;
  }

  std::size_t idx = 0;
  for (const auto& node : *framesArr) {
    const std::string scope = "keyframes[" + std::to_string(idx++) + "]";
    const toml::table* t = node.as_table();
    if (t == nullptr) {
      TomlUtil::warnf(pathStr.c_str(), "{} is not a table", scope);
      continue;
    }
    TomlUtil::warnUnknownKeys(*t, pathStr.c_str(), scope, {"frame", "left", "right", "jump"});

    const auto frame = (*t)["frame"].value<int64_t>();
    if (!frame || *frame < 0) {
      TomlUtil::warnf(pathStr.c_str(), "{} missing frame (use frame = N)", scope);
      continue;
    }

    Keyframe kf{};
    kf.frame = static_cast<uint64_t>(*frame);
    if (auto v = t->get("left")) {
      kf.mask |= kLeft;
      kf.values.left = v->value_or(false);
    }
    if (auto v = t->get("right")) {
      kf.mask |= kRight;
      kf.values.right = v->value_or(false);
    }
    if (auto v = t->get("jump")) {
      kf.mask |= kJump;
      kf.values.jump = v->value_or(false);
    }
    keyframes_.push_back(kf);
  }
  return true;
}

bool InputScript::loadFromToml(const char* path) {
  keyframes_.clear();
  reset();
  loaded_ = false;
  path_ = path ? path : "";

  std::unordered_set<std::string> seen;
  if (!appendFromToml(path_, seen)) {
    return false;
  }

  std::stable_sort(keyframes_.begin(), keyframes_.end(),
                   [](const Keyframe& a, const Keyframe& b) { return a.frame < b.frame; });

  loaded_ = true;
  return true;
}

void InputScript::reset() {
  held_ = Held{};
  prevHeld_ = Held{};
  nextIndex_ = 0;
  lastFrame_ = 0;
  hasLastFrame_ = false;
}

MoveInput InputScript::sample(uint64_t frame) {
  if (!loaded_)
    return MoveInput{};

  if (!hasLastFrame_ || frame < lastFrame_) {
    reset();
  }

  while (nextIndex_ < keyframes_.size() && keyframes_[nextIndex_].frame <= frame) {
    const Keyframe& kf = keyframes_[nextIndex_];
    if ((kf.mask & kLeft) != 0U)
      held_.left = kf.values.left;
    if ((kf.mask & kRight) != 0U)
      held_.right = kf.values.right;
    if ((kf.mask & kJump) != 0U)
      held_.jump = kf.values.jump;
    ++nextIndex_;
  }

  MoveInput out{};
  out.axis = (held_.right ? 1.0F : 0.0F) - (held_.left ? 1.0F : 0.0F);
  out.jumpHeld = held_.jump;
  out.jumpPressed = held_.jump && !prevHeld_.jump;

  prevHeld_ = held_;
  lastFrame_ = frame;
  hasLastFrame_ = true;
  return out;
}
