#include "movement/MovementTuning.h"

#include <cmath>
#include <initializer_list>
#include <string_view>

#include <toml++/toml.h>

#include "util/Log.h"
#include "util/TomlUtil.h"

namespace {

bool finiteNonNegative(float v) {
  return std::isfinite(v) && v >= 0.0F;
}

bool finitePositive(float v) {
  return std::isfinite(v) && v > 0.0F;
}

struct FloatKey {
  std::string_view key;
  float* dst;
};

bool readSection(const toml::table& root,
                 const char* path,
                 std::string_view section,
                 std::initializer_list<FloatKey> keys) {
  const toml::table* t = root[section].as_table();
  if (t == nullptr) {
    if (root.contains(section)) {
      Log::error("{}: [{}] must be a table", path, section);
      return false;
    }
    return true;
  }
  for (const auto& [key, node] : *t) {
    (void)node;
    bool known = false;
    for (const FloatKey& k : keys) {
      known = known || k.key == key.str();
    }
    if (!known) {
      TomlUtil::warnf(path, "unknown key '{}' in {}", key.str(), section);
    }
  }
  for (const FloatKey& k : keys) {
    if (!TomlUtil::readFloat(*t, k.key, *k.dst)) {
      Log::error("{}: {}.{} must be a finite number", path, section, k.key);
      return false;
    }
  }
  return true;
}

}  // namespace

bool MovementTuning::valid() const {
  return finiteNonNegative(physics.gravity) && finitePositive(physics.maxFallSpeed) &&
         finiteNonNegative(move.accelGround) && finiteNonNegative(move.accelAir) &&
         finiteNonNegative(move.decelGround) && finiteNonNegative(move.decelAir) &&
         finiteNonNegative(move.maxSpeedGround) && finiteNonNegative(move.maxSpeedAir) &&
         finiteNonNegative(jump.launchSpeed) && finiteNonNegative(jump.coyoteTime) &&
         finiteNonNegative(jump.bufferTime) && finitePositive(collision.groundProbe) &&
         finitePositive(body.width) && finitePositive(body.height) && simulation.stepHz > 0 &&
         finitePositive(simulation.maxFrameTime);
}

// NOLINTNEXTLINE
bool MovementTuning::loadFromToml(const char* path) {
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

  TomlUtil::warnUnknownKeys(tbl, path, "root",
                            {"version", "physics", "move", "jump", "collision", "body",
                             "simulation"});

  MovementTuning next = *this;
  if (auto v = tbl["version"].value<int>())
    next.version = *v;

  const bool ok =
      readSection(tbl, path, "physics",
                  {{"gravity", &next.physics.gravity},
                   {"max_fall_speed", &next.physics.maxFallSpeed}}) &&
      readSection(tbl, path, "move",
                  {{"accel_ground", &next.move.accelGround},
                   {"accel_air", &next.move.accelAir},
                   {"decel_ground", &next.move.decelGround},
                   {"decel_air", &next.move.decelAir},
                   {"max_speed_ground", &next.move.maxSpeedGround},
                   {"max_speed_air", &next.move.maxSpeedAir}}) &&
      readSection(tbl, path, "jump",
                  {{"launch_speed", &next.jump.launchSpeed},
                   {"coyote_time", &next.jump.coyoteTime},
                   {"buffer_time", &next.jump.bufferTime}}) &&
      readSection(tbl, path, "collision", {{"ground_probe", &next.collision.groundProbe}}) &&
      readSection(tbl, path, "body",
                  {{"width", &next.body.width}, {"height", &next.body.height}});
  if (!ok) {
    return false;
  }

  if (const toml::table* sim = tbl["simulation"].as_table()) {
    TomlUtil::warnUnknownKeys(*sim, path, "simulation", {"step_hz", "max_frame_time"});
    if (const toml::node* hz = sim->get("step_hz")) {
      const auto v = hz->value<int>();
      if (!v) {
        Log::error("{}: simulation.step_hz must be an integer", path);
        return false;
      }
      next.simulation.stepHz = *v;
    }
    if (!TomlUtil::readFloat(*sim, "max_frame_time", next.simulation.maxFrameTime)) {
      Log::error("{}: simulation.max_frame_time must be a finite number", path);
      return false;
    }
  }

  if (!next.valid()) {
    Log::error("{}: tuning values must be finite, non-negative, with positive sizes and rate",
               path);
    return false;
  }

  *this = next;
  return true;
}
