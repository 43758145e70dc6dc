#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "level/LdtkParser.h"
#include "TestLevels.h"

using testlevels::LayerSpec;
using testlevels::layerFromRows;
using testlevels::levelJson;
using testlevels::projectJson;

namespace {

LayerSpec floorLayer() {
  return layerFromRows("Collision", {"....", "....", "####"});
}

}  // namespace

// ============================================================================
// Extraction
// ============================================================================

TEST(LdtkParserTest, ExtractsIntGridLayersInFileOrder) {
  LayerSpec entities;
  entities.identifier = "Entities";
  entities.type = "Entities";
  LayerSpec deco = layerFromRows("Decoration", {"1.1.", "....", "...."});
  deco.offsetX = 8;
  deco.offsetY = -4;

  const std::string text = projectJson({entities, floorLayer(), deco});
  ParsedLevel level;
  const LevelStatus st = Ldtk::parseText(text, "Level_0", "Collision", level);
  ASSERT_TRUE(st.ok()) << st.detail;

  EXPECT_EQ(level.identifier, "Level_0");
  EXPECT_EQ(level.iid, "iid-Level_0");
  EXPECT_EQ(level.pxWidth, 64);
  EXPECT_EQ(level.pxHeight, 48);
  ASSERT_EQ(level.layers.size(), 2U);
  EXPECT_EQ(level.layers[0].identifier, "Collision");
  EXPECT_EQ(level.layers[1].identifier, "Decoration");

  const GridLayer& collision = level.layers[0];
  EXPECT_EQ(collision.cellSize, 16);
  EXPECT_EQ(collision.width, 4);
  EXPECT_EQ(collision.height, 3);
  std::int32_t v = -1;
  ASSERT_TRUE(collision.valueAt(0, 2, v));
  EXPECT_EQ(v, 1);
  ASSERT_TRUE(collision.valueAt(3, 1, v));
  EXPECT_EQ(v, 0);

  EXPECT_EQ(level.layers[1].offsetX, 8);
  EXPECT_EQ(level.layers[1].offsetY, -4);
}

TEST(LdtkParserTest, SelectsLevelByIdentifier) {
  const std::string text =
      projectJson({levelJson("Level_0", {floorLayer()}),
                   levelJson("Level_1", {layerFromRows("Collision", {"##", ".."})})});
  ParsedLevel level;
  ASSERT_TRUE(Ldtk::parseText(text, "Level_1", "Collision", level).ok());
  EXPECT_EQ(level.identifier, "Level_1");
  EXPECT_EQ(level.layers.at(0).width, 2);
}

TEST(LdtkParserTest, EmptyIdentifierSelectsFirstLevel) {
  const std::string text = projectJson(
      {levelJson("First", {floorLayer()}), levelJson("Second", {floorLayer()})});
  ParsedLevel level;
  ASSERT_TRUE(Ldtk::parseText(text, "", "Collision", level).ok());
  EXPECT_EQ(level.identifier, "First");
}

TEST(LdtkParserTest, FindsLevelsInsideWorlds) {
  const std::string text =
      "{\"levels\":[],\"worlds\":[{\"identifier\":\"W\",\"levels\":[" +
      levelJson("Deep", {floorLayer()}) + "]}]}";
  ParsedLevel level;
  const LevelStatus st = Ldtk::parseText(text, "Deep", "Collision", level);
  ASSERT_TRUE(st.ok()) << st.detail;
  EXPECT_EQ(level.identifier, "Deep");
}

TEST(LdtkParserTest, ReadsExternalLevelFile) {
  testlevels::TempDir dir;
  dir.write("proj/Level_0.ldtkl",
            "{\"identifier\":\"Level_0\",\"layerInstances\":[" +
                testlevels::layerJson(floorLayer()) + "]}");
  const std::string project =
      "{\"levels\":[{\"identifier\":\"Level_0\",\"iid\":\"abc\",\"pxWid\":64,\"pxHei\":48,"
      "\"layerInstances\":null,\"externalRelPath\":\"proj/Level_0.ldtkl\"}]}";
  const auto path = dir.write("game.ldtk", project);

  ParsedLevel level;
  const LevelStatus st = Ldtk::parseFile(path, "Level_0", "Collision", level);
  ASSERT_TRUE(st.ok()) << st.detail;
  ASSERT_EQ(level.layers.size(), 1U);
  EXPECT_EQ(level.layers[0].cells.size(), 12U);
}

TEST(LdtkParserTest, SameInputGivesSameOutput) {
  const std::string text = projectJson({floorLayer()});
  ParsedLevel a;
  ParsedLevel b;
  ASSERT_TRUE(Ldtk::parseText(text, "Level_0", "Collision", a).ok());
  ASSERT_TRUE(Ldtk::parseText(text, "Level_0", "Collision", b).ok());
  ASSERT_EQ(a.layers.size(), b.layers.size());
  EXPECT_EQ(a.layers[0].cells, b.layers[0].cells);
  EXPECT_EQ(a.iid, b.iid);
}

TEST(GridLayerTest, RejectsOutOfRangeCoordinates) {
  const GridLayer layer = testlevels::gridFromRows({"#.", ".#"});
  std::int32_t v = 42;
  EXPECT_FALSE(layer.valueAt(-1, 0, v));
  EXPECT_FALSE(layer.valueAt(0, 2, v));
  EXPECT_FALSE(layer.valueAt(2, 0, v));
  EXPECT_EQ(v, 42);
  ASSERT_TRUE(layer.valueAt(1, 1, v));
  EXPECT_EQ(v, 1);
}

// ============================================================================
// Errors
// ============================================================================

TEST(LdtkParserTest, InvalidJsonIsMalformed) {
  ParsedLevel level;
  const LevelStatus st = Ldtk::parseText("{\"levels\": [", "Level_0", "Collision", level);
  EXPECT_EQ(st.error, LevelError::MalformedLevelFile);
  EXPECT_FALSE(st.detail.empty());
}

TEST(LdtkParserTest, ProjectWithoutLevelsIsMalformed) {
  ParsedLevel level;
  EXPECT_EQ(Ldtk::parseText("{\"jsonVersion\":\"1.5.3\"}", "", "Collision", level).error,
            LevelError::MalformedLevelFile);
  EXPECT_EQ(Ldtk::parseText("[1,2,3]", "", "Collision", level).error,
            LevelError::MalformedLevelFile);
}

TEST(LdtkParserTest, UnknownLevelIsMalformed) {
  ParsedLevel level;
  EXPECT_EQ(Ldtk::parseText(projectJson({floorLayer()}), "Nope", "Collision", level).error,
            LevelError::MalformedLevelFile);
}

TEST(LdtkParserTest, MissingRequiredLayerFieldIsMalformed) {
  const std::string text =
      "{\"levels\":[{\"identifier\":\"L\",\"iid\":\"i\",\"pxWid\":16,\"pxHei\":16,"
      "\"layerInstances\":[{\"__identifier\":\"Collision\",\"__type\":\"IntGrid\","
      "\"__gridSize\":16,\"__cHei\":1,\"intGridCsv\":[1]}]}]}";
  ParsedLevel level;
  EXPECT_EQ(Ldtk::parseText(text, "L", "Collision", level).error,
            LevelError::MalformedLevelFile);
}

TEST(LdtkParserTest, NonIntegerCellIsMalformed) {
  const std::string text =
      "{\"levels\":[{\"identifier\":\"L\",\"iid\":\"i\",\"pxWid\":32,\"pxHei\":16,"
      "\"layerInstances\":[{\"__identifier\":\"Collision\",\"__type\":\"IntGrid\","
      "\"__gridSize\":16,\"__cWid\":2,\"__cHei\":1,\"intGridCsv\":[1,\"x\"]}]}]}";
  ParsedLevel level;
  EXPECT_EQ(Ldtk::parseText(text, "L", "Collision", level).error,
            LevelError::MalformedLevelFile);
}

TEST(LdtkParserTest, MissingCollisionLayerIsReported) {
  ParsedLevel level;
  const std::string text = projectJson({layerFromRows("Background", {"..", "##"})});
  const LevelStatus st = Ldtk::parseText(text, "Level_0", "Collision", level);
  EXPECT_EQ(st.error, LevelError::MissingLayer);
}

TEST(LdtkParserTest, CollisionLayerOfWrongTypeIsMissing) {
  LayerSpec tiles;
  tiles.identifier = "Collision";
  tiles.type = "Tiles";
  ParsedLevel level;
  const LevelStatus st =
      Ldtk::parseText(projectJson({tiles, layerFromRows("Other", {"#"})}), "", "Collision", level);
  EXPECT_EQ(st.error, LevelError::MissingLayer);
}

TEST(LdtkParserTest, BadDimensionsAreUnsupported) {
  ParsedLevel level;

  LayerSpec zeroCell = floorLayer();
  zeroCell.gridSize = 0;
  EXPECT_EQ(Ldtk::parseText(projectJson({zeroCell}), "", "Collision", level).error,
            LevelError::UnsupportedDimensions);

  LayerSpec negativeWidth = floorLayer();
  negativeWidth.width = -4;
  EXPECT_EQ(Ldtk::parseText(projectJson({negativeWidth}), "", "Collision", level).error,
            LevelError::UnsupportedDimensions);

  LayerSpec shortCsv = floorLayer();
  shortCsv.csv.pop_back();
  EXPECT_EQ(Ldtk::parseText(projectJson({shortCsv}), "", "Collision", level).error,
            LevelError::UnsupportedDimensions);
}

TEST(LdtkParserTest, FailureLeavesOutputUntouched) {
  ParsedLevel level;
  ASSERT_TRUE(Ldtk::parseText(projectJson({floorLayer()}), "", "Collision", level).ok());
  const ParsedLevel before = level;

  LayerSpec bad = floorLayer();
  bad.csv.push_back(1);
  EXPECT_FALSE(Ldtk::parseText(projectJson({bad}), "", "Collision", level).ok());
  EXPECT_EQ(level.identifier, before.identifier);
  ASSERT_EQ(level.layers.size(), before.layers.size());
  EXPECT_EQ(level.layers[0].cells, before.layers[0].cells);
}

TEST(LdtkParserTest, MissingFileIsMalformed) {
  testlevels::TempDir dir;
  ParsedLevel level;
  EXPECT_EQ(Ldtk::parseFile(dir.path() / "absent.ldtk", "", "Collision", level).error,
            LevelError::MalformedLevelFile);
}
