// Tests for config/tool_config.h -- JSON settings and table overrides.

#include "config/tool_config.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

namespace tunescript {
namespace {

TEST(ToolConfigTest, EmptyObjectGivesDefaults) {
  ToolConfigResult result = parseToolConfig("{}");
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.config.log_level, LogLevel::Warn);
  EXPECT_FALSE(result.config.debug_parser);
  EXPECT_EQ(result.config.output_path, "output.mid");
  EXPECT_TRUE(result.config.instrument_overrides.empty());
  EXPECT_TRUE(result.config.drum_overrides.empty());
  EXPECT_TRUE(result.warnings.empty());
}

TEST(ToolConfigTest, ParsesEveryField) {
  ToolConfigResult result = parseToolConfig(R"({
    "log_level": "Debug",
    "debug_parser": true,
    "output": "songs/night.mid",
    "instruments": { "Harpsichord": 6, "kit": -1 },
    "drums": { " COWBELL ": 60 }
  })");
  ASSERT_TRUE(result.success) << result.error_message;
  const ToolConfig& config = result.config;
  EXPECT_EQ(config.log_level, LogLevel::Debug);
  EXPECT_TRUE(config.debug_parser);
  EXPECT_EQ(config.output_path, "songs/night.mid");
  EXPECT_EQ(config.instrument_overrides.at("harpsichord"), 6);
  EXPECT_EQ(config.instrument_overrides.at("kit"), kPercussionProgram);
  EXPECT_EQ(config.drum_overrides.at("cowbell"), 60);
}

TEST(ToolConfigTest, UnknownKeysAndLevelsWarn) {
  ToolConfigResult result = parseToolConfig(R"({"colour": "blue", "log_level": "loud"})");
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.config.log_level, LogLevel::Warn);
  ASSERT_EQ(result.warnings.size(), 2u);
  EXPECT_NE(result.warnings[0].find("colour"), std::string::npos);
  EXPECT_NE(result.warnings[1].find("loud"), std::string::npos);
}

TEST(ToolConfigTest, OffLevelIsNotAWarning) {
  ToolConfigResult result = parseToolConfig(R"({"log_level": "off"})");
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.config.log_level, LogLevel::Off);
  EXPECT_TRUE(result.warnings.empty());
}

TEST(ToolConfigTest, MalformedJsonFails) {
  ToolConfigResult result = parseToolConfig("{\"output\": ");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error_message.rfind("Invalid config JSON at offset", 0), 0u);
}

TEST(ToolConfigTest, RootMustBeObject) {
  ToolConfigResult result = parseToolConfig("[1, 2]");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error_message, "Config root must be a JSON object");
}

TEST(ToolConfigTest, WrongFieldTypesFail) {
  EXPECT_FALSE(parseToolConfig(R"({"debug_parser": "yes"})").success);
  EXPECT_FALSE(parseToolConfig(R"({"log_level": 3})").success);
  EXPECT_FALSE(parseToolConfig(R"({"output": ""})").success);
  EXPECT_FALSE(parseToolConfig(R"({"instruments": [6]})").success);
}

TEST(ToolConfigTest, TableEntriesAreRangeChecked) {
  ToolConfigResult result = parseToolConfig(R"({"instruments": {"tuba": 128}})");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error_message.find("instruments.tuba"), std::string::npos);

  EXPECT_FALSE(parseToolConfig(R"({"instruments": {"tuba": -2}})").success);
  EXPECT_FALSE(parseToolConfig(R"({"instruments": {"tuba": 58.5}})").success);
  EXPECT_FALSE(parseToolConfig(R"({"drums": {"gong": -1}})").success);
  EXPECT_FALSE(parseToolConfig(R"({"drums": {"": 40}})").success);
  EXPECT_TRUE(parseToolConfig(R"({"instruments": {"tuba": 58.0}})").success);
}

TEST(ToolConfigTest, BuildTablesAppliesOverrides) {
  ToolConfigResult result = parseToolConfig(
      R"({"instruments": {"piano": 6, "kazoo": 75, "bells": -1}, "drums": {"kick": 35}})");
  ASSERT_TRUE(result.success) << result.error_message;
  MusicTables tables = result.config.buildTables();

  EXPECT_EQ(tables.instrumentProgram("piano"), 6);
  EXPECT_TRUE(tables.isKnownInstrument("kazoo"));
  EXPECT_EQ(tables.instrumentProgram("KAZOO"), 75);
  EXPECT_TRUE(tables.isPercussionInstrument("bells"));
  EXPECT_EQ(tables.drumPitch("kick"), 35);
  EXPECT_EQ(tables.drumPitch("snare"), 38);

  // The shared defaults are untouched.
  EXPECT_EQ(MusicTables::defaults().instrumentProgram("piano"), 0);
}

TEST(ToolConfigTest, LoadMissingFileFails) {
  ToolConfigResult result = loadToolConfig("/tmp/tunescript_missing_config_987.json");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error_message.find("Failed to open config file"), std::string::npos);
}

TEST(ToolConfigTest, LoadFromFile) {
  std::string path = ::testing::TempDir() + "tunescript_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"output": "from_file.mid", "drums": {"snare": 40}})";
  }

  ToolConfigResult result = loadToolConfig(path);
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.config.output_path, "from_file.mid");
  EXPECT_EQ(result.config.drum_overrides.at("snare"), 40);

  {
    std::ofstream out(path);
    out << "{ bad";
  }
  result = loadToolConfig(path);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error_message.rfind(path + ": ", 0), 0u);
  std::remove(path.c_str());
}

}  // namespace
}  // namespace tunescript
