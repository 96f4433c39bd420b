#pragma once

#include <compare>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "language.hpp"
#include "text_resource.hpp"
#include "types.hpp"

namespace decloc {

// Address of one string in a document. Resources are addressed by the chunk
// that holds them; the id must match that chunk's resource.
struct EntryKey {
  uint32_t chunk = 0; // Chunk index in the container
  ResourceId resource{};
  Language language = Language::English;
  uint32_t line = 0; // Subtitle index for cutscenes, 0 otherwise

  auto operator<=>(const EntryKey &) const = default;
};

// Exported string
struct TextEntry {
  EntryKey key;
  ResourceFormat format = ResourceFormat::HzdLocalized;
  std::string text;
};

// Requested replacement
struct TextEdit {
  EntryKey key;
  std::string text;
};

// Edit that could not be applied; the document is left untouched for it
struct EditWarning {
  ErrorKind kind = ErrorKind::UnknownTarget;
  EntryKey key;
  std::string message;
};

struct EditReport {
  size_t applied = 0;   // Edits that changed text
  size_t unchanged = 0; // Edits equal to the current text
  std::vector<EditWarning> warnings;
};

// Text-resource chunk that was kept opaque because it failed to decode
struct ChunkIssue {
  size_t chunkIndex = 0;
  Error error;
};

// One core file in memory: the ordered chunk list with its text resources
// decoded. Untouched chunks keep their parsed bytes; save() re-encodes only
// the resources an edit changed.
class CoreDocument {
public:
  CoreDocument() = default;

  // Parse a container. Fails only when the framing is malformed; text
  // resources that fail to decode are kept opaque and listed in issues().
  static std::optional<CoreDocument> load(std::span<const uint8_t> data, Game game,
                                          Error *outError = nullptr,
                                          const ContainerLayout &layout = ContainerLayout::decima());

  // Read a core file from disk and load it
  static std::optional<CoreDocument> open(const std::filesystem::path &path, Game game,
                                          Error *outError = nullptr);

  // All strings, ordered by chunk index, then language code, then line
  std::vector<TextEntry> exportEntries() const;

  // Same, restricted to the given languages
  std::vector<TextEntry> exportEntries(std::span<const Language> languages) const;

  // Replace strings. An edit changes only the chunk its key names; a chunk
  // that is not a text resource, a resource id that does not match the chunk,
  // or a missing language or line is reported as an UnknownTarget warning.
  EditReport applyEdits(std::span<const TextEdit> edits);

  // Serialize the document. Fails with EntryTooLarge (or InvalidText) when an
  // edited resource cannot be encoded.
  std::optional<std::vector<uint8_t>> save(Error *outError = nullptr) const;

  // save() followed by an atomic write to path
  bool write(const std::filesystem::path &path, Error *outError = nullptr) const;

  Game game() const { return game_; }
  const ContainerLayout &layout() const { return layout_; }

  size_t chunkCount() const { return slots_.size(); }
  size_t textResourceCount() const;

  const Chunk &chunk(size_t index) const { return slots_.at(index).chunk; }

  // Decoded text resource at chunk index, or nullptr for opaque chunks
  const TextResource *resource(size_t index) const;

  const std::vector<ChunkIssue> &issues() const { return issues_; }

  // True once an edit changed any text
  bool isModified() const;

private:
  struct Slot {
    Chunk chunk;
    std::optional<TextResource> text;
    bool dirty = false;
  };

  TextLine *findLine(const EntryKey &key);

  Game game_ = Game::HorizonZeroDawn;
  ContainerLayout layout_;
  std::vector<Slot> slots_;
  std::vector<ChunkIssue> issues_;
};

// Result of scanning a container's chunk tags
enum class GameDetection {
  HorizonZeroDawn,
  DeathStranding,
  Mixed,   // Text resources of both games
  Unknown, // No known text resource
};

const char *gameDetectionName(GameDetection detection);

// Guess which game a core file comes from by counting text-resource tags
std::optional<GameDetection> detectGame(std::span<const uint8_t> data,
                                        Error *outError = nullptr,
                                        const ContainerLayout &layout = ContainerLayout::decima());

} // namespace decloc
