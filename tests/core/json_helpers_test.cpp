// Tests for core/json_helpers.h -- JsonWriter serialization.

#include "core/json_helpers.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <cstdlib>
#include <string>

namespace tunescript {
namespace {

// ---------------------------------------------------------------------------
// Compact output
// ---------------------------------------------------------------------------

TEST(JsonWriterTest, EmptyContainers) {
  JsonWriter object_writer;
  object_writer.beginObject();
  object_writer.endObject();
  EXPECT_EQ(object_writer.toString(), "{}");

  JsonWriter array_writer;
  array_writer.beginArray();
  array_writer.endArray();
  EXPECT_EQ(array_writer.toString(), "[]");
}

TEST(JsonWriterTest, ScalarMembers) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("title");
  writer.value("Night Drive");
  writer.key("tempo");
  writer.value(96);
  writer.key("ticks");
  writer.value(static_cast<uint32_t>(1920));
  writer.key("loop");
  writer.value(false);
  writer.key("key");
  writer.valueNull();
  writer.endObject();
  EXPECT_EQ(writer.toString(),
            R"({"title":"Night Drive","tempo":96,"ticks":1920,"loop":false,"key":null})");
}

TEST(JsonWriterTest, NestedArraysOfObjects) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("notes");
  writer.beginArray();
  writer.beginObject();
  writer.key("pitch");
  writer.value(60);
  writer.endObject();
  writer.beginObject();
  writer.key("pitch");
  writer.value(64);
  writer.endObject();
  writer.endArray();
  writer.key("chords");
  writer.beginArray();
  writer.endArray();
  writer.endObject();
  EXPECT_EQ(writer.toString(), R"({"notes":[{"pitch":60},{"pitch":64}],"chords":[]})");
}

TEST(JsonWriterTest, NonFiniteDoubleWritesNull) {
  JsonWriter writer;
  writer.beginArray();
  writer.value(std::strtod("inf", nullptr));
  writer.value(std::strtod("nan", nullptr));
  writer.endArray();
  EXPECT_EQ(writer.toString(), "[null,null]");
}

// ---------------------------------------------------------------------------
// Pretty output
// ---------------------------------------------------------------------------

TEST(JsonWriterTest, PrettyIndentsMembersAndKeepsEmptyContainersCompact) {
  JsonWriter writer(2);
  writer.beginObject();
  writer.key("name");
  writer.value("Verse");
  writer.key("tracks");
  writer.beginArray();
  writer.endArray();
  writer.key("bars");
  writer.beginArray();
  writer.value(4);
  writer.endArray();
  writer.endObject();

  EXPECT_EQ(writer.toString(),
            "{\n"
            "  \"name\": \"Verse\",\n"
            "  \"tracks\": [],\n"
            "  \"bars\": [\n"
            "    4\n"
            "  ]\n"
            "}");
}

// ---------------------------------------------------------------------------
// Number formatting
// ---------------------------------------------------------------------------

TEST(JsonWriterTest, FormatDoubleUsesShortestForm) {
  EXPECT_EQ(JsonWriter::formatDouble(1.0), "1");
  EXPECT_EQ(JsonWriter::formatDouble(0.5), "0.5");
  EXPECT_EQ(JsonWriter::formatDouble(0.7), "0.7");
  EXPECT_EQ(JsonWriter::formatDouble(0.333), "0.333");
  EXPECT_EQ(JsonWriter::formatDouble(-2.25), "-2.25");
}

TEST(JsonWriterTest, FormatDoubleRoundTripsExactly) {
  const double values[] = {0.1 + 0.2, 1.0 / 3.0, 123456.789, 5e-324, 1.7976931348623157e308};
  for (double val : values) {
    std::string text = JsonWriter::formatDouble(val);
    EXPECT_EQ(std::strtod(text.c_str(), nullptr), val) << text;
  }
}

// ---------------------------------------------------------------------------
// String escaping
// ---------------------------------------------------------------------------

TEST(JsonWriterTest, EscapesQuotesBackslashesAndControls) {
  EXPECT_EQ(JsonWriter::escapeString("say \"hi\""), "say \\\"hi\\\"");
  EXPECT_EQ(JsonWriter::escapeString("a\\b"), "a\\\\b");
  EXPECT_EQ(JsonWriter::escapeString("l1\nl2\tx"), "l1\\nl2\\tx");
  EXPECT_EQ(JsonWriter::escapeString(std::string("\x01", 1)), "\\u0001");
}

TEST(JsonWriterTest, KeysAreEscaped) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("a\"b");
  writer.value(1);
  writer.endObject();
  EXPECT_EQ(writer.toString(), R"({"a\"b":1})");
}

TEST(JsonWriterTest, Utf8PassesThrough) {
  JsonWriter writer;
  writer.beginArray();
  writer.value("Caf\xc3\xa9");
  writer.endArray();
  EXPECT_EQ(writer.toString(), "[\"Caf\xc3\xa9\"]");
}

}  // namespace
}  // namespace tunescript
