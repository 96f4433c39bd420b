#include <algorithm>

#include <fmt/format.h>

#include <decloc/chunk_stream.hpp>
#include <decloc/document.hpp>
#include <decloc/log.hpp>
#include <decloc/mmap.hpp>

namespace decloc {

namespace {

std::string describeKey(const EntryKey &key) {
  return fmt::format("chunk {} ({}) {}#{}", key.chunk, formatResourceId(key.resource),
                     languageName(key.language), key.line);
}

} // namespace

std::optional<CoreDocument> CoreDocument::load(std::span<const uint8_t> data, Game game,
                                               Error *outError, const ContainerLayout &layout) {
  auto chunks = parseChunks(data, layout, outError);
  if (!chunks) {
    return std::nullopt;
  }

  CoreDocument document;
  document.game_ = game;
  document.layout_ = layout;
  document.slots_.reserve(chunks->size());

  for (size_t i = 0; i < chunks->size(); ++i) {
    Slot slot;
    slot.chunk = std::move((*chunks)[i]);

    if (auto format = classifyChunk(slot.chunk, game)) {
      Error error;
      slot.text = decodeTextResource(*format, slot.chunk.payload, &error);
      if (!slot.text) {
        log::debug("Chunk {} kept opaque: {}", i, error.message);
        document.issues_.push_back(ChunkIssue{i, std::move(error)});
      }
    }

    document.slots_.push_back(std::move(slot));
  }

  return document;
}

std::optional<CoreDocument> CoreDocument::open(const std::filesystem::path &path, Game game,
                                               Error *outError) {
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    setError(outError, ErrorKind::Io,
             fmt::format("Failed to open core file: {} ({})", path.string(), ec.message()));
    return std::nullopt;
  }

  // An empty file is a container with no chunks
  if (size == 0) {
    return load({}, game, outError);
  }

  MappedFile file;
  if (!file.openRead(path, outError)) {
    return std::nullopt;
  }

  auto document = load(file.data(), game, outError);
  if (!document && outError) {
    outError->message = fmt::format("{}: {}", path.string(), outError->message);
  }
  return document;
}

size_t CoreDocument::textResourceCount() const {
  return static_cast<size_t>(
      std::count_if(slots_.begin(), slots_.end(), [](const Slot &s) { return s.text.has_value(); }));
}

const TextResource *CoreDocument::resource(size_t index) const {
  if (index >= slots_.size() || !slots_[index].text) {
    return nullptr;
  }
  return &*slots_[index].text;
}

bool CoreDocument::isModified() const {
  return std::any_of(slots_.begin(), slots_.end(), [](const Slot &s) { return s.dirty; });
}

std::vector<TextEntry> CoreDocument::exportEntries() const {
  auto all = gameLanguages(game_);
  return exportEntries(all);
}

std::vector<TextEntry> CoreDocument::exportEntries(std::span<const Language> languages) const {
  std::vector<TextEntry> result;

  for (size_t index = 0; index < slots_.size(); ++index) {
    const auto &slot = slots_[index];
    if (!slot.text) {
      continue;
    }

    // entries is keyed by language code, so iteration is canonical order
    for (const auto &[language, entry] : slot.text->entries) {
      if (std::find(languages.begin(), languages.end(), language) == languages.end()) {
        continue;
      }

      for (size_t line = 0; line < entry.lines.size(); ++line) {
        TextEntry out;
        out.key.chunk = static_cast<uint32_t>(index);
        out.key.resource = slot.text->id;
        out.key.language = language;
        out.key.line = static_cast<uint32_t>(line);
        out.format = slot.text->format;
        out.text = entry.lines[line].text;
        result.push_back(std::move(out));
      }
    }
  }

  return result;
}

TextLine *CoreDocument::findLine(const EntryKey &key) {
  if (key.chunk >= slots_.size()) {
    return nullptr;
  }
  auto &text = slots_[key.chunk].text;
  if (!text || text->id != key.resource) {
    return nullptr;
  }

  StringEntry *entry = text->find(key.language);
  if (!entry || key.line >= entry->lines.size()) {
    return nullptr;
  }
  // Plain resources only ever address line 0
  if (!text->isCutscene() && key.line != 0) {
    return nullptr;
  }
  return &entry->lines[key.line];
}

EditReport CoreDocument::applyEdits(std::span<const TextEdit> edits) {
  EditReport report;

  for (const auto &edit : edits) {
    TextLine *line = findLine(edit.key);
    if (!line) {
      report.warnings.push_back(EditWarning{ErrorKind::UnknownTarget, edit.key,
                                            fmt::format("No string at {}", describeKey(edit.key))});
      continue;
    }

    if (line->text == edit.text) {
      ++report.unchanged;
      continue;
    }

    line->text = edit.text;
    slots_[edit.key.chunk].dirty = true;
    ++report.applied;
  }

  return report;
}

std::optional<std::vector<uint8_t>> CoreDocument::save(Error *outError) const {
  std::vector<Chunk> chunks;
  chunks.reserve(slots_.size());

  for (size_t i = 0; i < slots_.size(); ++i) {
    const auto &slot = slots_[i];
    Chunk chunk = slot.chunk;

    if (slot.dirty) {
      auto payload = encodeTextResource(*slot.text, outError);
      if (!payload) {
        if (outError) {
          outError->message = fmt::format("Chunk {}: {}", i, outError->message);
        }
        return std::nullopt;
      }
      chunk.payload = std::move(*payload);
      chunk.declaredLength = static_cast<uint32_t>(chunk.payload.size());
    }

    chunks.push_back(std::move(chunk));
  }

  return serializeChunks(chunks, layout_, outError);
}

bool CoreDocument::write(const std::filesystem::path &path, Error *outError) const {
  auto bytes = save(outError);
  if (!bytes) {
    return false;
  }
  return writeFileAtomic(path, *bytes, outError);
}

const char *gameDetectionName(GameDetection detection) {
  switch (detection) {
  case GameDetection::HorizonZeroDawn:
    return "HorizonZeroDawn";
  case GameDetection::DeathStranding:
    return "DeathStranding";
  case GameDetection::Mixed:
    return "Mixed";
  case GameDetection::Unknown:
    break;
  }
  return "Unknown";
}

std::optional<GameDetection> detectGame(std::span<const uint8_t> data, Error *outError,
                                        const ContainerLayout &layout) {
  auto chunks = parseChunks(data, layout, outError);
  if (!chunks) {
    return std::nullopt;
  }

  size_t hzd = 0;
  size_t ds = 0;
  for (const auto &chunk : *chunks) {
    if (chunk.tag == kHzdLocalizedTag || chunk.tag == kHzdCutsceneTag) {
      ++hzd;
    } else if (chunk.tag == kDsLocalizedTag) {
      ++ds;
    }
  }

  if (hzd > 0 && ds > 0) {
    return GameDetection::Mixed;
  }
  if (hzd > 0) {
    return GameDetection::HorizonZeroDawn;
  }
  if (ds > 0) {
    return GameDetection::DeathStranding;
  }
  return GameDetection::Unknown;
}

} // namespace decloc
