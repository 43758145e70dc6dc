#pragma once

#include <entt/entt.hpp>

using EntityId = entt::entity;
inline constexpr EntityId kInvalidEntity = entt::null;

inline bool validEntity(EntityId id) {
  return id != kInvalidEntity;
}
