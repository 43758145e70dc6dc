#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "ecs/Events.h"
#include "ecs/Systems.h"
#include "ecs/World.h"
#include "movement/MovementTuning.h"
#include "TestLevels.h"

using testlevels::mapFromRows;

namespace {

struct Recorder {
  std::vector<EntityId> jumped;
  std::vector<BodyLanded> landed;
  int ceilings = 0;
  std::vector<int> walls;

  void onJumped(const BodyJumped& e) { jumped.push_back(e.entity); }
  void onLanded(const BodyLanded& e) { landed.push_back(e); }
  void onCeiling(const BodyHitCeiling&) { ++ceilings; }
  void onWall(const BodyHitWall& e) { walls.push_back(e.direction); }

  void connect(World& w) {
    w.events.sink<BodyJumped>().connect<&Recorder::onJumped>(*this);
    w.events.sink<BodyLanded>().connect<&Recorder::onLanded>(*this);
    w.events.sink<BodyHitCeiling>().connect<&Recorder::onCeiling>(*this);
    w.events.sink<BodyHitWall>().connect<&Recorder::onWall>(*this);
  }
};

TimeStep fixedStep(const MovementTuning& tuning, std::uint64_t frame = 0) {
  return TimeStep{tuning.stepSeconds(), frame};
}

const std::vector<std::string> kRoom = {
    "##########",
    "#........#",
    "#........#",
    "#........#",
    "#........#",
    "##########",
};

}  // namespace

TEST(WorldTest, SpawnCreatesRestingBody) {
  World w;
  const MovementTuning tuning;
  const EntityId e = Systems::spawnBody(w, Vec2{32.0F, 16.0F}, Vec2{8.0F, 12.0F}, tuning);
  ASSERT_TRUE(validEntity(e));

  const auto& body = w.registry.get<KinematicBody>(e);
  EXPECT_FLOAT_EQ(body.pos.x, 32.0F);
  EXPECT_FLOAT_EQ(body.pos.y, 16.0F);
  EXPECT_FLOAT_EQ(body.vel.x, 0.0F);
  EXPECT_FLOAT_EQ(body.vel.y, 0.0F);
  EXPECT_FLOAT_EQ(body.halfExtents.y, 12.0F);
  EXPECT_FALSE(body.grounded);
  EXPECT_TRUE(w.registry.all_of<MoveInput>(e));
  EXPECT_TRUE(w.registry.all_of<MovementTuning>(e));
}

TEST(WorldTest, SpawnRejectsInvalidInput) {
  World w;
  const MovementTuning tuning;
  const float nan = std::numeric_limits<float>::quiet_NaN();
  EXPECT_FALSE(validEntity(Systems::spawnBody(w, Vec2{nan, 0.0F}, Vec2{8.0F, 8.0F}, tuning)));
  EXPECT_FALSE(validEntity(Systems::spawnBody(w, Vec2{0.0F, 0.0F}, Vec2{0.0F, 8.0F}, tuning)));
  EXPECT_FALSE(validEntity(Systems::spawnBody(w, Vec2{0.0F, 0.0F}, Vec2{8.0F, -1.0F}, tuning)));

  MovementTuning broken;
  broken.collision.groundProbe = 0.0F;
  EXPECT_FALSE(validEntity(Systems::spawnBody(w, Vec2{0.0F, 0.0F}, Vec2{8.0F, 8.0F}, broken)));
  EXPECT_TRUE(w.registry.view<KinematicBody>().empty());
}

TEST(WorldTest, StepDeliversLandingAfterTheStep) {
  World w;
  Recorder rec;
  rec.connect(w);
  const MovementTuning tuning;
  const CollisionMap map = mapFromRows(kRoom);
  const EntityId e = Systems::spawnBody(w, Vec2{32.0F, 16.0F}, Vec2{8.0F, 8.0F}, tuning);
  ASSERT_TRUE(validEntity(e));

  for (std::uint64_t i = 0; i < 240; ++i) {
    w.step(map, fixedStep(tuning, i));
  }
  ASSERT_EQ(rec.landed.size(), 1U);
  EXPECT_EQ(rec.landed.front().entity, e);
  EXPECT_GT(rec.landed.front().impactSpeed, 0.0F);
  EXPECT_EQ(w.landings, 1);
  EXPECT_EQ(w.steps, 240U);
  EXPECT_TRUE(w.registry.get<KinematicBody>(e).grounded);
  EXPECT_NEAR(w.registry.get<KinematicBody>(e).pos.y, 64.0F, 1.0e-3F);
}

TEST(WorldTest, LatchedPressSurvivesUntilAStepConsumesIt) {
  World w;
  Recorder rec;
  rec.connect(w);
  const MovementTuning tuning;
  const CollisionMap map = mapFromRows(kRoom);
  const EntityId e = Systems::spawnBody(w, Vec2{32.0F, 64.0F}, Vec2{8.0F, 8.0F}, tuning);
  w.step(map, fixedStep(tuning));
  ASSERT_TRUE(w.registry.get<KinematicBody>(e).grounded);

  // Press then release before the next step: the edge must not be lost.
  MoveInput down;
  down.jumpPressed = true;
  down.jumpHeld = true;
  Systems::applyInput(w, e, down);
  Systems::applyInput(w, e, MoveInput{});
  EXPECT_TRUE(w.registry.get<MoveInput>(e).jumpPressed);
  EXPECT_FALSE(w.registry.get<MoveInput>(e).jumpHeld);

  w.step(map, fixedStep(tuning));
  ASSERT_EQ(rec.jumped.size(), 1U);
  EXPECT_EQ(rec.jumped.front(), e);
  EXPECT_FALSE(w.registry.get<MoveInput>(e).jumpPressed);

  // No new edge: no second jump.
  for (int i = 0; i < 240; ++i) {
    w.step(map, fixedStep(tuning));
  }
  EXPECT_EQ(rec.jumped.size(), 1U);
  EXPECT_EQ(w.jumps, 1);
}

TEST(WorldTest, ApplyInputSanitizesAxis) {
  World w;
  const MovementTuning tuning;
  const EntityId e = Systems::spawnBody(w, Vec2{32.0F, 16.0F}, Vec2{8.0F, 8.0F}, tuning);
  MoveInput in;
  in.axis = 7.0F;
  Systems::applyInput(w, e, in);
  EXPECT_FLOAT_EQ(w.registry.get<MoveInput>(e).axis, 1.0F);
  in.axis = std::numeric_limits<float>::quiet_NaN();
  Systems::applyInput(w, e, in);
  EXPECT_FLOAT_EQ(w.registry.get<MoveInput>(e).axis, 0.0F);
}

TEST(WorldTest, WallAndCeilingEvents) {
  World w;
  Recorder rec;
  rec.connect(w);
  const MovementTuning tuning;
  const CollisionMap map = mapFromRows({
      "######",
      "#....#",
      "#....#",
      "#....#",
      "######",
  });
  const EntityId e = Systems::spawnBody(w, Vec2{32.0F, 48.0F}, Vec2{8.0F, 8.0F}, tuning);
  w.step(map, fixedStep(tuning));

  MoveInput right;
  right.axis = 1.0F;
  for (int i = 0; i < 60; ++i) {
    Systems::applyInput(w, e, right);
    w.step(map, fixedStep(tuning));
  }
  ASSERT_FALSE(rec.walls.empty());
  EXPECT_EQ(rec.walls.front(), 1);

  MoveInput jump;
  jump.jumpPressed = true;
  Systems::applyInput(w, e, jump);
  for (int i = 0; i < 60; ++i) {
    w.step(map, fixedStep(tuning));
    Systems::applyInput(w, e, MoveInput{});
  }
  EXPECT_EQ(rec.ceilings, 1);
}

TEST(WorldTest, RejectedBodyIsCountedNotMoved) {
  World w;
  const MovementTuning tuning;
  const CollisionMap map = mapFromRows(kRoom);
  const EntityId e = Systems::spawnBody(w, Vec2{32.0F, 16.0F}, Vec2{8.0F, 8.0F}, tuning);
  w.registry.get<KinematicBody>(e).vel.y = std::numeric_limits<float>::infinity();
  w.step(map, fixedStep(tuning));
  EXPECT_EQ(w.rejectedSteps, 1);
  EXPECT_FLOAT_EQ(w.registry.get<KinematicBody>(e).pos.y, 16.0F);
}

TEST(WorldTest, ResetBodyReturnsToRest) {
  World w;
  const MovementTuning tuning;
  const CollisionMap map = mapFromRows(kRoom);
  const EntityId e = Systems::spawnBody(w, Vec2{32.0F, 16.0F}, Vec2{8.0F, 8.0F}, tuning);
  for (int i = 0; i < 120; ++i) {
    w.step(map, fixedStep(tuning));
  }
  ASSERT_TRUE(w.registry.get<KinematicBody>(e).grounded);

  ASSERT_TRUE(Systems::resetBody(w, e, Vec2{100.0F, 20.0F}));
  const auto& body = w.registry.get<KinematicBody>(e);
  EXPECT_FLOAT_EQ(body.pos.x, 100.0F);
  EXPECT_FLOAT_EQ(body.pos.y, 20.0F);
  EXPECT_FLOAT_EQ(body.vel.y, 0.0F);
  EXPECT_FALSE(body.grounded);
  EXPECT_FLOAT_EQ(body.halfExtents.x, 8.0F);

  EXPECT_FALSE(Systems::resetBody(w, e, Vec2{std::numeric_limits<float>::infinity(), 0.0F}));
  EXPECT_FALSE(Systems::resetBody(w, w.create(), Vec2{0.0F, 0.0F}));
}

TEST(WorldTest, BodiesMoveIndependently) {
  World w;
  const CollisionMap map = mapFromRows(kRoom);
  MovementTuning heavy;
  heavy.physics.gravity = 3000.0F;
  const MovementTuning light;
  const EntityId a = Systems::spawnBody(w, Vec2{32.0F, 16.0F}, Vec2{8.0F, 8.0F}, heavy);
  const EntityId b = Systems::spawnBody(w, Vec2{96.0F, 16.0F}, Vec2{8.0F, 8.0F}, light);
  for (int i = 0; i < 10; ++i) {
    w.step(map, fixedStep(light));
  }
  EXPECT_GT(w.registry.get<KinematicBody>(a).pos.y, w.registry.get<KinematicBody>(b).pos.y);
}
