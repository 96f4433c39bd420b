#include <filesystem>
#include <vector>

#include <decloc/chunk_stream.hpp>
#include <decloc/document.hpp>
#include <decloc/format.hpp>

#include "core_builder.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;

using decloc::CoreDocument;
using decloc::Error;
using decloc::ErrorKind;
using decloc::Game;
using decloc::Language;
using decloc::TextEdit;

class CoreDocumentTest : public ::testing::Test {
protected:
  void SetUp() override {
    tempDir_ = fs::temp_directory_path() / "decloc_test_document";
    fs::create_directories(tempDir_);

    // opaque, text, opaque, cutscene, opaque
    appendChunk(hzd_, kOpaqueTag, opaquePayload(40, 3));
    appendChunk(hzd_, decloc::kHzdLocalizedTag,
                hzdLocalizedPayload(makeId(1), {{Language::English, "Hello"},
                                                {Language::French, "Bonjour"}}));
    appendChunk(hzd_, kOpaqueTag + 1, opaquePayload(7, 9));
    appendChunk(hzd_, decloc::kHzdCutsceneTag,
                hzdCutscenePayload(makeId(2), {{Language::English, {{u"Run!", 10}, {u"Now", 20}}}}));
    appendChunk(hzd_, kOpaqueTag + 2, {});
  }

  void TearDown() override { fs::remove_all(tempDir_); }

  static decloc::EntryKey key(uint32_t chunk, const decloc::ResourceId &id, Language language,
                              uint32_t line = 0) {
    return decloc::EntryKey{chunk, id, language, line};
  }

  fs::path tempDir_;
  std::vector<uint8_t> hzd_;
};

TEST_F(CoreDocumentTest, LoadFindsTextResources) {
  Error error;
  auto document = CoreDocument::load(hzd_, Game::HorizonZeroDawn, &error);
  ASSERT_TRUE(document.has_value()) << error.message;

  EXPECT_EQ(document->chunkCount(), 5);
  EXPECT_EQ(document->textResourceCount(), 2);
  EXPECT_EQ(document->resource(0), nullptr);
  ASSERT_NE(document->resource(1), nullptr);
  EXPECT_EQ(document->resource(1)->id, makeId(1));
  ASSERT_NE(document->resource(3), nullptr);
  EXPECT_TRUE(document->resource(3)->isCutscene());
  EXPECT_TRUE(document->issues().empty());
  EXPECT_FALSE(document->isModified());
}

TEST_F(CoreDocumentTest, SaveWithoutEditsIsByteIdentical) {
  auto document = CoreDocument::load(hzd_, Game::HorizonZeroDawn);
  ASSERT_TRUE(document.has_value());

  auto bytes = document->save();
  ASSERT_TRUE(bytes.has_value());
  EXPECT_EQ(*bytes, hzd_);
}

TEST_F(CoreDocumentTest, ExportOrder) {
  auto document = CoreDocument::load(hzd_, Game::HorizonZeroDawn);
  ASSERT_TRUE(document.has_value());

  auto entries = document->exportEntries();
  // 21 plain strings plus two English cutscene lines
  ASSERT_EQ(entries.size(), 23);

  EXPECT_EQ(entries[0].key, key(1, makeId(1), Language::English));
  EXPECT_EQ(entries[0].text, "Hello");
  EXPECT_EQ(entries[1].key, key(1, makeId(1), Language::French));
  EXPECT_EQ(entries[1].text, "Bonjour");
  EXPECT_EQ(entries[20].key.language, Language::SimplifiedChinese);

  EXPECT_EQ(entries[21].key, key(3, makeId(2), Language::English, 0));
  EXPECT_EQ(entries[21].format, decloc::ResourceFormat::HzdCutscene);
  EXPECT_EQ(entries[21].text, "Run!");
  EXPECT_EQ(entries[22].key, key(3, makeId(2), Language::English, 1));
  EXPECT_EQ(entries[22].text, "Now");

  std::vector<Language> french = {Language::French};
  auto filtered = document->exportEntries(french);
  ASSERT_EQ(filtered.size(), 1);
  EXPECT_EQ(filtered[0].text, "Bonjour");
}

// English "Hello", French "Bonjour" -> "Salut"
TEST_F(CoreDocumentTest, EditOneLanguage) {
  auto document = CoreDocument::load(hzd_, Game::HorizonZeroDawn);
  ASSERT_TRUE(document.has_value());

  std::vector<TextEdit> edits = {{key(1, makeId(1), Language::French), "Salut"}};
  auto report = document->applyEdits(edits);
  EXPECT_EQ(report.applied, 1);
  EXPECT_TRUE(report.warnings.empty());
  EXPECT_TRUE(document->isModified());

  Error error;
  auto bytes = document->save(&error);
  ASSERT_TRUE(bytes.has_value()) << error.message;

  std::vector<uint8_t> expected;
  appendChunk(expected, kOpaqueTag, opaquePayload(40, 3));
  appendChunk(expected, decloc::kHzdLocalizedTag,
              hzdLocalizedPayload(makeId(1), {{Language::English, "Hello"},
                                              {Language::French, "Salut"}}));
  appendChunk(expected, kOpaqueTag + 1, opaquePayload(7, 9));
  appendChunk(expected, decloc::kHzdCutsceneTag,
              hzdCutscenePayload(makeId(2), {{Language::English, {{u"Run!", 10}, {u"Now", 20}}}}));
  appendChunk(expected, kOpaqueTag + 2, {});
  EXPECT_EQ(*bytes, expected);

  auto reloaded = CoreDocument::load(*bytes, Game::HorizonZeroDawn);
  ASSERT_TRUE(reloaded.has_value());
  auto entries = reloaded->exportEntries();
  EXPECT_EQ(entries[0].text, "Hello");
  EXPECT_EQ(entries[1].text, "Salut");
}

TEST_F(CoreDocumentTest, OpaqueChunksSurviveEdits) {
  auto document = CoreDocument::load(hzd_, Game::HorizonZeroDawn);
  ASSERT_TRUE(document.has_value());

  std::vector<TextEdit> edits = {{key(3, makeId(2), Language::English, 1), "Later, much later"}};
  document->applyEdits(edits);

  auto bytes = document->save();
  ASSERT_TRUE(bytes.has_value());

  auto before = decloc::parseChunks(hzd_, decloc::ContainerLayout::decima());
  auto after = decloc::parseChunks(*bytes, decloc::ContainerLayout::decima());
  ASSERT_TRUE(before.has_value());
  ASSERT_TRUE(after.has_value());
  ASSERT_EQ(before->size(), after->size());

  for (size_t i = 0; i < before->size(); ++i) {
    EXPECT_EQ((*before)[i].tag, (*after)[i].tag) << "chunk " << i;
    if (i != 3) {
      EXPECT_EQ((*before)[i].payload, (*after)[i].payload) << "chunk " << i;
    }
  }

  auto reloaded = CoreDocument::load(*bytes, Game::HorizonZeroDawn);
  ASSERT_TRUE(reloaded.has_value());
  const auto *cutscene = reloaded->resource(3);
  ASSERT_NE(cutscene, nullptr);
  const auto &lines = cutscene->find(Language::English)->lines;
  EXPECT_EQ(lines[0].text, "Run!");
  EXPECT_EQ(lines[1].text, "Later, much later");
  EXPECT_EQ(lines[1].timing, 20);
}

TEST_F(CoreDocumentTest, UnknownTargetsAreWarnings) {
  auto document = CoreDocument::load(hzd_, Game::HorizonZeroDawn);
  ASSERT_TRUE(document.has_value());

  std::vector<TextEdit> edits = {
      {key(1, makeId(99), Language::English), "nobody"},
      {key(0, makeId(1), Language::English), "opaque chunk"},
      {key(3, makeId(1), Language::English), "id of another chunk"},
      {key(40, makeId(1), Language::English), "past the end"},
      {key(1, makeId(1), Language::English, 1), "no second line"},
      {key(3, makeId(2), Language::English, 5), "no sixth line"},
      {key(1, makeId(1), Language::Greek), "not in this game"},
      {key(1, makeId(1), Language::German), "Hallo"},
  };
  auto report = document->applyEdits(edits);

  EXPECT_EQ(report.applied, 1);
  ASSERT_EQ(report.warnings.size(), 7);
  for (const auto &warning : report.warnings) {
    EXPECT_EQ(warning.kind, ErrorKind::UnknownTarget);
    EXPECT_FALSE(warning.message.empty());
  }
  EXPECT_EQ(report.warnings[0].key.resource, makeId(99));
  EXPECT_EQ(report.warnings[2].key.chunk, 3u);
  EXPECT_EQ(document->resource(3)->find(Language::English)->lines[0].text, "Run!");
}

TEST_F(CoreDocumentTest, EditOrderDoesNotChangeOutput) {
  std::vector<TextEdit> edits = {
      {key(3, makeId(2), Language::English, 1), "Go"},
      {key(1, makeId(1), Language::Turkish), "Merhaba"},
      {key(1, makeId(1), Language::English), "Hi"},
      {key(1, makeId(1), Language::French), "Salut"},
  };

  auto forward = CoreDocument::load(hzd_, Game::HorizonZeroDawn);
  ASSERT_TRUE(forward.has_value());
  forward->applyEdits(edits);
  auto forwardBytes = forward->save();
  ASSERT_TRUE(forwardBytes.has_value());

  std::vector<TextEdit> reversed(edits.rbegin(), edits.rend());
  auto backward = CoreDocument::load(hzd_, Game::HorizonZeroDawn);
  ASSERT_TRUE(backward.has_value());
  backward->applyEdits(reversed);
  auto backwardBytes = backward->save();
  ASSERT_TRUE(backwardBytes.has_value());

  EXPECT_EQ(*forwardBytes, *backwardBytes);
}

TEST_F(CoreDocumentTest, UnchangedEditKeepsDocumentClean) {
  auto document = CoreDocument::load(hzd_, Game::HorizonZeroDawn);
  ASSERT_TRUE(document.has_value());

  std::vector<TextEdit> edits = {{key(1, makeId(1), Language::English), "Hello"}};
  auto report = document->applyEdits(edits);
  EXPECT_EQ(report.applied, 0);
  EXPECT_EQ(report.unchanged, 1);
  EXPECT_FALSE(document->isModified());
}

class SharedIdDocumentTest : public ::testing::Test {
protected:
  // Two resources with the same id, as some shipped files carry
  void SetUp() override {
    appendChunk(data_, decloc::kHzdLocalizedTag,
                hzdLocalizedPayload(makeId(1), {{Language::English, "First"}}));
    appendChunk(data_, kOpaqueTag, opaquePayload(3, 1));
    appendChunk(data_, decloc::kHzdLocalizedTag,
                hzdLocalizedPayload(makeId(1), {{Language::English, "Second"}}));
  }

  std::vector<uint8_t> data_;
};

TEST_F(SharedIdDocumentTest, ExportKeepsChunksApart) {
  auto document = CoreDocument::load(data_, Game::HorizonZeroDawn);
  ASSERT_TRUE(document.has_value());

  std::vector<Language> english = {Language::English};
  auto entries = document->exportEntries(english);
  ASSERT_EQ(entries.size(), 2);
  EXPECT_EQ(entries[0].key.chunk, 0u);
  EXPECT_EQ(entries[0].text, "First");
  EXPECT_EQ(entries[1].key.chunk, 2u);
  EXPECT_EQ(entries[1].text, "Second");
  EXPECT_EQ(entries[0].key.resource, entries[1].key.resource);
}

TEST_F(SharedIdDocumentTest, EachChunkIsEditedOnItsOwn) {
  auto document = CoreDocument::load(data_, Game::HorizonZeroDawn);
  ASSERT_TRUE(document.has_value());

  std::vector<TextEdit> edits = {{decloc::EntryKey{2, makeId(1), Language::English, 0}, "Changed"}};
  auto report = document->applyEdits(edits);
  EXPECT_EQ(report.applied, 1);
  EXPECT_TRUE(report.warnings.empty());

  auto bytes = document->save();
  ASSERT_TRUE(bytes.has_value());
  auto reloaded = CoreDocument::load(*bytes, Game::HorizonZeroDawn);
  ASSERT_TRUE(reloaded.has_value());
  EXPECT_EQ(reloaded->resource(0)->find(Language::English)->lines[0].text, "First");
  EXPECT_EQ(reloaded->resource(2)->find(Language::English)->lines[0].text, "Changed");
}

TEST_F(SharedIdDocumentTest, UneditedExportImportIsByteIdentical) {
  auto document = CoreDocument::load(data_, Game::HorizonZeroDawn);
  ASSERT_TRUE(document.has_value());

  decloc::TextFormat format;
  Error error;
  auto edits = format.parse(format.render(document->exportEntries()), &error);
  ASSERT_TRUE(edits.has_value()) << error.message;

  auto report = document->applyEdits(*edits);
  EXPECT_EQ(report.applied, 0);
  EXPECT_EQ(report.unchanged, edits->size());
  EXPECT_TRUE(report.warnings.empty());
  EXPECT_FALSE(document->isModified());

  auto bytes = document->save();
  ASSERT_TRUE(bytes.has_value());
  EXPECT_EQ(*bytes, data_);
}

TEST_F(CoreDocumentTest, UndecodableResourceStaysOpaque) {
  // Right tag and size, but invalid UTF-8 in the English slot
  std::vector<uint8_t> data;
  appendChunk(data, decloc::kHzdLocalizedTag,
              hzdLocalizedPayload(makeId(4), {{Language::English, "\xFF\xFE"}}));
  appendChunk(data, decloc::kHzdLocalizedTag,
              hzdLocalizedPayload(makeId(5), {{Language::English, "fine"}}));

  Error error;
  auto document = CoreDocument::load(data, Game::HorizonZeroDawn, &error);
  ASSERT_TRUE(document.has_value()) << error.message;

  EXPECT_EQ(document->textResourceCount(), 1);
  ASSERT_EQ(document->issues().size(), 1);
  EXPECT_EQ(document->issues()[0].chunkIndex, 0);
  EXPECT_EQ(document->issues()[0].error.kind, ErrorKind::InvalidText);

  auto bytes = document->save();
  ASSERT_TRUE(bytes.has_value());
  EXPECT_EQ(*bytes, data);
}

TEST_F(CoreDocumentTest, OtherGameResourcesAreOpaque) {
  std::vector<uint8_t> data;
  appendChunk(data, decloc::kDsLocalizedTag,
              dsLocalizedPayload(makeId(6), {{Language::English, {"Sam", "", 0}}}));

  auto document = CoreDocument::load(data, Game::HorizonZeroDawn);
  ASSERT_TRUE(document.has_value());
  EXPECT_EQ(document->textResourceCount(), 0);
  EXPECT_TRUE(document->exportEntries().empty());

  auto ds = CoreDocument::load(data, Game::DeathStranding);
  ASSERT_TRUE(ds.has_value());
  auto entries = ds->exportEntries();
  ASSERT_EQ(entries.size(), 25);
  EXPECT_EQ(entries[0].text, "Sam");
}

TEST_F(CoreDocumentTest, MalformedContainerFailsLoad) {
  hzd_.resize(hzd_.size() - 3);

  Error error;
  EXPECT_FALSE(CoreDocument::load(hzd_, Game::HorizonZeroDawn, &error).has_value());
  EXPECT_EQ(error.kind, ErrorKind::MalformedContainer);
}

TEST_F(CoreDocumentTest, OversizedEditFailsSave) {
  auto document = CoreDocument::load(hzd_, Game::HorizonZeroDawn);
  ASSERT_TRUE(document.has_value());

  std::vector<TextEdit> edits = {{key(1, makeId(1), Language::Korean), std::string(0x10000, 'k')}};
  document->applyEdits(edits);

  Error error;
  EXPECT_FALSE(document->save(&error).has_value());
  EXPECT_EQ(error.kind, ErrorKind::EntryTooLarge);
}

TEST_F(CoreDocumentTest, OpenAndWriteFiles) {
  fs::path input = tempDir_ / "in" / "menu.core";
  writeBinary(input, hzd_);

  Error error;
  auto document = CoreDocument::open(input, Game::HorizonZeroDawn, &error);
  ASSERT_TRUE(document.has_value()) << error.message;

  std::vector<TextEdit> edits = {{key(1, makeId(1), Language::French), "Salut"}};
  document->applyEdits(edits);

  fs::path output = tempDir_ / "out" / "nested" / "menu.core";
  ASSERT_TRUE(document->write(output, &error)) << error.message;

  auto reloaded = CoreDocument::open(output, Game::HorizonZeroDawn, &error);
  ASSERT_TRUE(reloaded.has_value()) << error.message;
  EXPECT_EQ(reloaded->exportEntries()[1].text, "Salut");

  // Input untouched
  EXPECT_EQ(readBinary(input), hzd_);
}

TEST_F(CoreDocumentTest, OpenEmptyAndMissingFiles) {
  fs::path empty = tempDir_ / "empty.core";
  writeBinary(empty, {});

  Error error;
  auto document = CoreDocument::open(empty, Game::HorizonZeroDawn, &error);
  ASSERT_TRUE(document.has_value()) << error.message;
  EXPECT_EQ(document->chunkCount(), 0);

  EXPECT_FALSE(CoreDocument::open(tempDir_ / "missing.core", Game::HorizonZeroDawn, &error));
  EXPECT_EQ(error.kind, ErrorKind::Io);
}

TEST_F(CoreDocumentTest, DetectGame) {
  auto detected = decloc::detectGame(hzd_);
  ASSERT_TRUE(detected.has_value());
  EXPECT_EQ(*detected, decloc::GameDetection::HorizonZeroDawn);

  std::vector<uint8_t> ds;
  appendChunk(ds, decloc::kDsLocalizedTag, dsLocalizedPayload(makeId(1), {}));
  EXPECT_EQ(decloc::detectGame(ds), decloc::GameDetection::DeathStranding);

  std::vector<uint8_t> mixed = hzd_;
  mixed.insert(mixed.end(), ds.begin(), ds.end());
  EXPECT_EQ(decloc::detectGame(mixed), decloc::GameDetection::Mixed);

  std::vector<uint8_t> none;
  appendChunk(none, kOpaqueTag, opaquePayload(4, 0));
  EXPECT_EQ(decloc::detectGame(none), decloc::GameDetection::Unknown);

  EXPECT_STREQ(decloc::gameDetectionName(decloc::GameDetection::Mixed), "Mixed");
}
