#include <string>
#include <vector>

#include <decloc/json_format.hpp>

#include "core_builder.hpp"

#include <gtest/gtest.h>

using decloc::Error;
using decloc::ErrorKind;
using decloc::JsonFormat;
using decloc::Language;
using decloc::ResourceFormat;
using decloc::TextEntry;

TEST(JsonFormatTest, Render) {
  std::vector<TextEntry> entries = {
      {{0, makeId(0x10), Language::English, 0}, ResourceFormat::HzdLocalized, "Hello"},
      {{0, makeId(0x10), Language::French, 0}, ResourceFormat::HzdLocalized, "Bonjour\nmonde"},
      {{1, makeId(0x20), Language::English, 0}, ResourceFormat::HzdCutscene, "Run!"},
      {{1, makeId(0x20), Language::English, 1}, ResourceFormat::HzdCutscene, "Now"},
  };

  std::string expected = R"({
  "0:101112131415161718191a1b1c1d1e1f": {
    "English": "Hello",
    "French": "Bonjour\nmonde"
  },
  "1:202122232425262728292a2b2c2d2e2f": {
    "English": [
      "Run!",
      "Now"
    ]
  }
}
)";

  JsonFormat format;
  EXPECT_EQ(format.render(entries), expected);
  EXPECT_EQ(format.extension(), "json");

  Error error;
  auto edits = format.parse(expected, &error);
  ASSERT_TRUE(edits.has_value()) << error.message;
  ASSERT_EQ(edits->size(), entries.size());
  for (size_t i = 0; i < entries.size(); ++i) {
    EXPECT_EQ((*edits)[i].key, entries[i].key) << "entry " << i;
    EXPECT_EQ((*edits)[i].text, entries[i].text) << "entry " << i;
  }
}

TEST(JsonFormatTest, ParseErrors) {
  JsonFormat format;
  Error error;

  EXPECT_FALSE(format.parse("{ not json", &error).has_value());
  EXPECT_EQ(error.kind, ErrorKind::AdapterParseError);

  EXPECT_FALSE(format.parse("[]", &error).has_value());
  EXPECT_EQ(error.kind, ErrorKind::AdapterParseError);

  EXPECT_FALSE(format.parse(R"({"0:abc": {"English": "x"}})", &error).has_value());
  EXPECT_FALSE(
      format.parse(R"({"101112131415161718191a1b1c1d1e1f": {"English": "x"}})", &error).has_value());
  EXPECT_FALSE(
      format.parse(R"({"0:101112131415161718191a1b1c1d1e1f": {"Elvish": "x"}})", &error).has_value());
  EXPECT_FALSE(
      format.parse(R"({"0:101112131415161718191a1b1c1d1e1f": {"English": 5}})", &error).has_value());
  EXPECT_FALSE(
      format.parse(R"({"0:101112131415161718191a1b1c1d1e1f": {"English": [1]}})", &error).has_value());
}

TEST(JsonFormatTest, FactoryBuildsJson) {
  auto format = decloc::makeFormat(decloc::FormatKind::Json);
  ASSERT_NE(format, nullptr);
  EXPECT_EQ(format->extension(), "json");
}

TEST(JsonFormatTest, SameIdInTwoChunksStaysSeparate) {
  std::vector<TextEntry> entries = {
      {{2, makeId(0x10), Language::English, 0}, ResourceFormat::HzdLocalized, "First"},
      {{5, makeId(0x10), Language::English, 0}, ResourceFormat::HzdLocalized, "Second"},
  };

  JsonFormat format;
  Error error;
  auto edits = format.parse(format.render(entries), &error);
  ASSERT_TRUE(edits.has_value()) << error.message;
  ASSERT_EQ(edits->size(), 2u);
  EXPECT_EQ((*edits)[0].key.chunk, 2u);
  EXPECT_EQ((*edits)[0].text, "First");
  EXPECT_EQ((*edits)[1].key.chunk, 5u);
  EXPECT_EQ((*edits)[1].text, "Second");
}
