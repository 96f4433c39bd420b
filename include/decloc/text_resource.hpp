#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "language.hpp"
#include "types.hpp"

namespace decloc {

// Chunk tags of the text resources
inline constexpr ChunkTag kHzdLocalizedTag = 0xB89A596B420BB2E2ull;
inline constexpr ChunkTag kHzdCutsceneTag = 0x5A3ECD4ADA693D7Full;
inline constexpr ChunkTag kDsLocalizedTag = 0x31BE502435317445ull;

enum class ResourceFormat {
  HzdLocalized, // One UTF-8 string per language
  HzdCutscene,  // UTF-16 subtitle lines with timings per language
  DsLocalized,  // UTF-8 text + note + mode per language
};

const char *resourceFormatName(ResourceFormat format);

// 16-byte object UUID the engine binds the text to
using ResourceId = std::array<uint8_t, 16>;

// 32 lowercase hex digits, byte order as stored
std::string formatResourceId(const ResourceId &id);
std::optional<ResourceId> parseResourceId(std::string_view text);

struct TextLine {
  std::string text;    // UTF-8
  uint64_t timing = 0; // Cutscene lines only, opaque
};

// One language's value inside a resource
struct StringEntry {
  Language language = Language::English;
  std::vector<TextLine> lines; // Exactly one line unless the resource is a cutscene
  std::string note;            // DsLocalized only, kept verbatim
  uint8_t mode = 0;            // DsLocalized only, kept verbatim
};

// Decoded view of one text-resource chunk payload
struct TextResource {
  ResourceId id{};
  ResourceFormat format = ResourceFormat::HzdLocalized;
  std::map<Language, StringEntry> entries; // Ordered by language code

  // Cutscene-only opaque fields: the block that follows the id (its length
  // word is recomputed on encode) and the five bytes after the language groups
  std::vector<uint8_t> cutsceneBlock;
  std::array<uint8_t, 5> cutsceneTrailer{};

  bool isCutscene() const { return format == ResourceFormat::HzdCutscene; }

  const StringEntry *find(Language language) const;
  StringEntry *find(Language language);
};

// Game whose resources use this format
Game formatGame(ResourceFormat format);

// Classify a chunk by tag and payload signature. Returns std::nullopt for
// anything that is not a text resource of this game, including tagged chunks
// whose payload fails the signature check.
std::optional<ResourceFormat> classifyChunk(const Chunk &chunk, Game game);

inline bool isTextResource(const Chunk &chunk, Game game) {
  return classifyChunk(chunk, game).has_value();
}

// Decode a text-resource payload.
// Fails with UnsupportedResourceVersion, TruncatedPayload or InvalidText.
std::optional<TextResource> decodeTextResource(ResourceFormat format,
                                               std::span<const uint8_t> payload,
                                               Error *outError = nullptr);

// Rebuild a payload from the model: lengths recomputed from content, languages
// in canonical order. Fails with EntryTooLarge instead of truncating.
std::optional<std::vector<uint8_t>> encodeTextResource(const TextResource &resource,
                                                       Error *outError = nullptr);

// UTF-8 <-> UTF-16 helpers used by the cutscene format
std::optional<std::u16string> utf8ToUtf16(std::string_view text);
std::optional<std::string> utf16ToUtf8(std::u16string_view text);

} // namespace decloc
