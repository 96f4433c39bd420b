#include <algorithm>
#include <limits>

#include <fmt/format.h>

#include <decloc/byte_io.hpp>
#include <decloc/text_resource.hpp>

namespace decloc {

namespace {

constexpr size_t kIdSize = 16;
constexpr size_t kCutsceneTrailerSize = 5;

// Smallest payloads that can hold every language with empty strings
constexpr size_t kHzdLocalizedMinSize = kIdSize + 21 * 2;
constexpr size_t kDsLocalizedMinSize = kIdSize + 25 * (2 + 2 + 1);

bool isValidUtf8(std::string_view text) {
  size_t i = 0;
  while (i < text.size()) {
    auto c = static_cast<unsigned char>(text[i]);
    size_t extra;
    uint32_t cp;
    if (c < 0x80) {
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      extra = 1;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      cp = c & 0x07;
    } else {
      return false;
    }
    if (i + extra >= text.size()) {
      return false;
    }
    for (size_t k = 1; k <= extra; ++k) {
      auto cc = static_cast<unsigned char>(text[i + k]);
      if ((cc & 0xC0) != 0x80) {
        return false;
      }
      cp = (cp << 6) | (cc & 0x3F);
    }
    // Reject overlong forms, surrogates and out-of-range code points
    if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000) ||
        cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

std::string readUtf8(ByteCursor &cursor, const char *what) {
  uint16_t length = cursor.readU16();
  std::string text = cursor.readString(length, what);
  if (!isValidUtf8(text)) {
    throw ParseError(ErrorKind::InvalidText,
                     fmt::format("Invalid UTF-8 in {} ending at offset {}", what,
                                 cursor.position()));
  }
  return text;
}

void writeUtf8(ByteSink &sink, const std::string &text, const char *what, Language language) {
  if (text.size() > std::numeric_limits<uint16_t>::max()) {
    throw ParseError(ErrorKind::EntryTooLarge,
                     fmt::format("{} {} is {} bytes, the 16-bit length field allows at most {}",
                                 languageName(language), what, text.size(),
                                 std::numeric_limits<uint16_t>::max()));
  }
  sink.writeU16(static_cast<uint16_t>(text.size()));
  sink.writeString(text);
}

void expectEnd(const ByteCursor &cursor) {
  if (!cursor.atEnd()) {
    throw ParseError(ErrorKind::UnsupportedResourceVersion,
                     fmt::format("{} unexpected bytes after the last field at offset {}",
                                 cursor.remaining(), cursor.position()));
  }
}

TextResource decodeLocalized(ResourceFormat format, std::span<const uint8_t> payload) {
  ByteCursor cursor(payload);
  TextResource resource;
  resource.format = format;

  auto id = cursor.readBytes(kIdSize, "resource id");
  std::copy(id.begin(), id.end(), resource.id.begin());

  const bool withNotes = format == ResourceFormat::DsLocalized;
  for (Language language : gameLanguages(formatGame(format))) {
    StringEntry entry;
    entry.language = language;
    entry.lines.push_back(TextLine{readUtf8(cursor, "text"), 0});
    if (withNotes) {
      entry.note = readUtf8(cursor, "note");
      entry.mode = cursor.readU8();
    }
    resource.entries.emplace(language, std::move(entry));
  }

  expectEnd(cursor);
  return resource;
}

TextResource decodeCutscene(std::span<const uint8_t> payload) {
  ByteCursor cursor(payload);
  TextResource resource;
  resource.format = ResourceFormat::HzdCutscene;

  auto id = cursor.readBytes(kIdSize, "resource id");
  std::copy(id.begin(), id.end(), resource.id.begin());

  // The block carries four bytes beyond its declared length
  uint32_t blockLength = cursor.readU32();
  auto block = cursor.readBytes(static_cast<size_t>(blockLength) + 4, "cutscene block");
  resource.cutsceneBlock.assign(block.begin(), block.end());

  const size_t expected = languageCount(Game::HorizonZeroDawn);
  uint32_t groupCount = cursor.readU32();
  if (groupCount != expected) {
    throw ParseError(ErrorKind::UnsupportedResourceVersion,
                     fmt::format("Cutscene has {} language groups, expected {}", groupCount,
                                 expected));
  }

  for (uint32_t g = 0; g < groupCount; ++g) {
    uint32_t code = cursor.readU32();
    if (code >= expected) {
      throw ParseError(ErrorKind::UnsupportedResourceVersion,
                       fmt::format("Cutscene group {} has unknown language code {}", g, code));
    }

    auto language = static_cast<Language>(code);
    if (resource.entries.contains(language)) {
      throw ParseError(ErrorKind::UnsupportedResourceVersion,
                       fmt::format("Cutscene repeats the {} group", languageName(language)));
    }

    uint32_t lineCount = cursor.readU32();
    StringEntry entry;
    entry.language = language;
    // Each line needs at least a unit count and a timing
    entry.lines.reserve(std::min<size_t>(lineCount, cursor.remaining() / 12));

    for (uint32_t i = 0; i < lineCount; ++i) {
      uint32_t units = cursor.readU32();
      if (units > cursor.remaining() / 2) {
        throw ParseError(ErrorKind::TruncatedPayload,
                         fmt::format("{} line {} declares {} UTF-16 units but only {} bytes remain",
                                     languageName(language), i, units, cursor.remaining()));
      }

      auto raw = cursor.readBytes(static_cast<size_t>(units) * 2, "subtitle");
      std::u16string wide(units, u'\0');
      for (uint32_t u = 0; u < units; ++u) {
        wide[u] = static_cast<char16_t>(raw[u * 2] | (raw[u * 2 + 1] << 8));
      }

      auto text = utf16ToUtf8(wide);
      if (!text) {
        throw ParseError(ErrorKind::InvalidText,
                         fmt::format("{} line {} is not valid UTF-16", languageName(language), i));
      }

      TextLine line;
      line.text = std::move(*text);
      line.timing = cursor.readU64();
      entry.lines.push_back(std::move(line));
    }

    resource.entries.emplace(language, std::move(entry));
  }

  auto trailer = cursor.readBytes(kCutsceneTrailerSize, "cutscene trailer");
  std::copy(trailer.begin(), trailer.end(), resource.cutsceneTrailer.begin());

  expectEnd(cursor);
  return resource;
}

const std::string &firstLine(const StringEntry *entry) {
  static const std::string empty;
  if (!entry || entry->lines.empty()) {
    return empty;
  }
  return entry->lines.front().text;
}

std::vector<uint8_t> encodeLocalized(const TextResource &resource) {
  ByteSink sink(kDsLocalizedMinSize);
  sink.writeBytes(resource.id);

  const bool withNotes = resource.format == ResourceFormat::DsLocalized;
  for (Language language : gameLanguages(formatGame(resource.format))) {
    const StringEntry *entry = resource.find(language);
    writeUtf8(sink, firstLine(entry), "text", language);
    if (withNotes) {
      writeUtf8(sink, entry ? entry->note : std::string(), "note", language);
      sink.writeU8(entry ? entry->mode : 0);
    }
  }

  return sink.take();
}

std::vector<uint8_t> encodeCutscene(const TextResource &resource) {
  if (resource.cutsceneBlock.size() < 4) {
    throw ParseError(ErrorKind::UnsupportedResourceVersion,
                     "Cutscene block must hold at least 4 bytes");
  }
  if (resource.cutsceneBlock.size() - 4 > std::numeric_limits<uint32_t>::max()) {
    throw ParseError(ErrorKind::EntryTooLarge, "Cutscene block exceeds the 32-bit length field");
  }

  ByteSink sink;
  sink.writeBytes(resource.id);
  sink.writeU32(static_cast<uint32_t>(resource.cutsceneBlock.size() - 4));
  sink.writeBytes(resource.cutsceneBlock);

  auto languages = gameLanguages(Game::HorizonZeroDawn);
  sink.writeU32(static_cast<uint32_t>(languages.size()));

  for (Language language : languages) {
    const StringEntry *entry = resource.find(language);
    size_t lineCount = entry ? entry->lines.size() : 0;
    if (lineCount > std::numeric_limits<uint32_t>::max()) {
      throw ParseError(ErrorKind::EntryTooLarge,
                       fmt::format("{} has too many lines", languageName(language)));
    }

    sink.writeU32(static_cast<uint32_t>(language));
    sink.writeU32(static_cast<uint32_t>(lineCount));

    for (size_t i = 0; i < lineCount; ++i) {
      const TextLine &line = entry->lines[i];
      auto wide = utf8ToUtf16(line.text);
      if (!wide) {
        throw ParseError(ErrorKind::InvalidText,
                         fmt::format("{} line {} is not valid UTF-8", languageName(language), i));
      }
      if (wide->size() > std::numeric_limits<uint32_t>::max()) {
        throw ParseError(ErrorKind::EntryTooLarge,
                         fmt::format("{} line {} exceeds the 32-bit length field",
                                     languageName(language), i));
      }

      sink.writeU32(static_cast<uint32_t>(wide->size()));
      for (char16_t unit : *wide) {
        sink.writeU16(static_cast<uint16_t>(unit));
      }
      sink.writeU64(line.timing);
    }
  }

  sink.writeBytes(resource.cutsceneTrailer);
  return sink.take();
}

} // namespace

const char *resourceFormatName(ResourceFormat format) {
  switch (format) {
  case ResourceFormat::HzdLocalized:
    return "HzdLocalized";
  case ResourceFormat::HzdCutscene:
    return "HzdCutscene";
  case ResourceFormat::DsLocalized:
    return "DsLocalized";
  }
  return "Unknown";
}

Game formatGame(ResourceFormat format) {
  return format == ResourceFormat::DsLocalized ? Game::DeathStranding : Game::HorizonZeroDawn;
}

std::string formatResourceId(const ResourceId &id) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string result;
  result.reserve(id.size() * 2);
  for (uint8_t byte : id) {
    result += kDigits[byte >> 4];
    result += kDigits[byte & 0x0F];
  }
  return result;
}

std::optional<ResourceId> parseResourceId(std::string_view text) {
  if (text.size() != 32) {
    return std::nullopt;
  }

  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') {
      return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
      return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
      return c - 'A' + 10;
    }
    return -1;
  };

  ResourceId id{};
  for (size_t i = 0; i < id.size(); ++i) {
    int hi = nibble(text[i * 2]);
    int lo = nibble(text[i * 2 + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    id[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return id;
}

const StringEntry *TextResource::find(Language language) const {
  auto it = entries.find(language);
  return it == entries.end() ? nullptr : &it->second;
}

StringEntry *TextResource::find(Language language) {
  auto it = entries.find(language);
  return it == entries.end() ? nullptr : &it->second;
}

std::optional<ResourceFormat> classifyChunk(const Chunk &chunk, Game game) {
  const auto &payload = chunk.payload;

  switch (game) {
  case Game::HorizonZeroDawn:
    if (chunk.tag == kHzdLocalizedTag) {
      if (payload.size() >= kHzdLocalizedMinSize) {
        return ResourceFormat::HzdLocalized;
      }
      return std::nullopt;
    }
    if (chunk.tag == kHzdCutsceneTag) {
      // uuid, block length word, block (+4), language count, trailer
      if (payload.size() < kIdSize + 4) {
        return std::nullopt;
      }
      ByteCursor cursor(std::span<const uint8_t>(payload).subspan(kIdSize));
      uint64_t blockLength = cursor.readU32();
      uint64_t minimum = kIdSize + 4 + blockLength + 4 + 4 + kCutsceneTrailerSize;
      if (payload.size() >= minimum) {
        return ResourceFormat::HzdCutscene;
      }
    }
    return std::nullopt;

  case Game::DeathStranding:
    if (chunk.tag == kDsLocalizedTag && payload.size() >= kDsLocalizedMinSize) {
      return ResourceFormat::DsLocalized;
    }
    return std::nullopt;
  }

  return std::nullopt;
}

std::optional<TextResource> decodeTextResource(ResourceFormat format,
                                               std::span<const uint8_t> payload,
                                               Error *outError) {
  try {
    if (format == ResourceFormat::HzdCutscene) {
      return decodeCutscene(payload);
    }
    return decodeLocalized(format, payload);
  } catch (const ParseError &e) {
    setError(outError, e.kind(),
             fmt::format("{} resource: {}", resourceFormatName(format), e.what()));
    return std::nullopt;
  }
}

std::optional<std::vector<uint8_t>> encodeTextResource(const TextResource &resource,
                                                       Error *outError) {
  try {
    if (resource.isCutscene()) {
      return encodeCutscene(resource);
    }
    return encodeLocalized(resource);
  } catch (const ParseError &e) {
    setError(outError, e.kind(),
             fmt::format("Resource {}: {}", formatResourceId(resource.id), e.what()));
    return std::nullopt;
  }
}

std::optional<std::u16string> utf8ToUtf16(std::string_view text) {
  if (!isValidUtf8(text)) {
    return std::nullopt;
  }

  std::u16string result;
  result.reserve(text.size());

  size_t i = 0;
  while (i < text.size()) {
    auto c = static_cast<unsigned char>(text[i]);
    uint32_t cp;
    size_t extra;
    if (c < 0x80) {
      cp = c;
      extra = 0;
    } else if ((c & 0xE0) == 0xC0) {
      cp = c & 0x1F;
      extra = 1;
    } else if ((c & 0xF0) == 0xE0) {
      cp = c & 0x0F;
      extra = 2;
    } else {
      cp = c & 0x07;
      extra = 3;
    }
    for (size_t k = 1; k <= extra; ++k) {
      cp = (cp << 6) | (static_cast<unsigned char>(text[i + k]) & 0x3F);
    }
    i += extra + 1;

    if (cp >= 0x10000) {
      cp -= 0x10000;
      result += static_cast<char16_t>(0xD800 + (cp >> 10));
      result += static_cast<char16_t>(0xDC00 + (cp & 0x3FF));
    } else {
      result += static_cast<char16_t>(cp);
    }
  }

  return result;
}

std::optional<std::string> utf16ToUtf8(std::u16string_view text) {
  std::string result;
  result.reserve(text.size());

  for (size_t i = 0; i < text.size(); ++i) {
    uint32_t cp = text[i];

    if (cp >= 0xD800 && cp <= 0xDBFF) {
      if (i + 1 >= text.size() || text[i + 1] < 0xDC00 || text[i + 1] > 0xDFFF) {
        return std::nullopt;
      }
      cp = 0x10000 + ((cp - 0xD800) << 10) + (text[i + 1] - 0xDC00);
      ++i;
    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
      return std::nullopt;
    }

    if (cp < 0x80) {
      result += static_cast<char>(cp);
    } else if (cp < 0x800) {
      result += static_cast<char>(0xC0 | (cp >> 6));
      result += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
      result += static_cast<char>(0xE0 | (cp >> 12));
      result += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      result += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
      result += static_cast<char>(0xF0 | (cp >> 18));
      result += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
      result += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      result += static_cast<char>(0x80 | (cp & 0x3F));
    }
  }

  return result;
}

} // namespace decloc
