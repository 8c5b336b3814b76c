/***
 * Name: test_json_writer
 * Purpose: Pretty JSON layout, escaping and explicit nulls.
 */
#include <gtest/gtest.h>
#include "pyspect/support/json_writer.h"

using namespace pyspect;

TEST(JsonWriter, NestedLayout) {
  support::JsonWriter json;
  json.beginObject();
  json.key("a").integer(1);
  json.key("b").beginArray().str("x").boolean(true).endArray();
  json.key("c").beginArray().endArray();
  json.key("d").beginObject().endObject();
  json.endObject();
  EXPECT_EQ(json.text(),
            "{\n"
            "  \"a\": 1,\n"
            "  \"b\": [\n"
            "    \"x\",\n"
            "    true\n"
            "  ],\n"
            "  \"c\": [],\n"
            "  \"d\": {}\n"
            "}");
}

TEST(JsonWriter, OptionalsWriteNull) {
  support::JsonWriter json;
  json.beginObject();
  json.key("s").optStr(std::nullopt);
  json.key("n").optInteger(std::nullopt);
  json.key("m").optInteger(7);
  json.endObject();
  EXPECT_EQ(json.text(), "{\n  \"s\": null,\n  \"n\": null,\n  \"m\": 7\n}");
}

TEST(JsonWriter, EscapesControlButKeepsUtf8) {
  EXPECT_EQ(support::JsonEscape("q\"\\\n\x01"), "q\\\"\\\\\\n\\u0001");
  EXPECT_EQ(support::JsonEscape("\xF0\x9F\x8E\x89"), "\xF0\x9F\x8E\x89");
}
