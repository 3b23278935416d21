// Tests for core/json_helpers.h -- JsonWriter serialization.

#include "core/json_helpers.h"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>

namespace stylec {
namespace {

// ---------------------------------------------------------------------------
// Simple values
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
  writer.key("name");
  writer.value("oud");
  writer.key("channel");
  writer.value(3);
  writer.key("ticks");
  writer.value(static_cast<uint32_t>(4294967295u));
  writer.key("loop");
  writer.value(true);
  writer.key("program");
  writer.valueNull();
  writer.endObject();
  EXPECT_EQ(writer.toString(),
            R"({"name":"oud","channel":3,"ticks":4294967295,"loop":true,"program":null})");
}

TEST(JsonWriterTest, DoubleValues) {
  JsonWriter writer;
  writer.beginArray();
  writer.value(0.5);
  writer.value(1.0);
  writer.value(1.5);
  writer.value(0.75);
  writer.endArray();
  EXPECT_EQ(writer.toString(), "[0.5,1,1.5,0.75]");
}

TEST(JsonWriterTest, NonFiniteDoubleBecomesNull) {
  JsonWriter writer;
  writer.beginArray();
  writer.value(std::numeric_limits<double>::infinity());
  writer.value(std::nan(""));
  writer.endArray();
  EXPECT_EQ(writer.toString(), "[null,null]");
}

// ---------------------------------------------------------------------------
// Nesting and separators
// ---------------------------------------------------------------------------

TEST(JsonWriterTest, NestedContainersGetCommas) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("tracks");
  writer.beginArray();
  for (int idx = 0; idx < 2; ++idx) {
    writer.beginObject();
    writer.key("notes");
    writer.beginArray();
    writer.value(60 + idx);
    writer.value(64 + idx);
    writer.endArray();
    writer.endObject();
  }
  writer.endArray();
  writer.key("bpm");
  writer.value(120);
  writer.endObject();
  EXPECT_EQ(writer.toString(),
            R"({"tracks":[{"notes":[60,64]},{"notes":[61,65]}],"bpm":120})");
}

TEST(JsonWriterTest, EmptyArrayInsideObject) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("notes");
  writer.beginArray();
  writer.endArray();
  writer.key("name");
  writer.value("empty");
  writer.endObject();
  EXPECT_EQ(writer.toString(), R"({"notes":[],"name":"empty"})");
}

// ---------------------------------------------------------------------------
// Escaping
// ---------------------------------------------------------------------------

TEST(JsonWriterTest, EscapesSpecialCharacters) {
  JsonWriter writer;
  writer.beginArray();
  writer.value("say \"hi\"\\");
  writer.value("a\nb\tc");
  writer.value(std::string_view("\x01", 1));
  writer.endArray();
  EXPECT_EQ(writer.toString(), R"(["say \"hi\"\\","a\nb\tc","\u0001"])");
}

TEST(JsonWriterTest, EscapesKeys) {
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
  writer.value("ney \xC3\xA7");
  writer.endArray();
  EXPECT_EQ(writer.toString(), "[\"ney \xC3\xA7\"]");
}

}  // namespace
}  // namespace stylec
