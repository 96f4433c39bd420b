#pragma once

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "document.hpp"
#include "types.hpp"

namespace decloc {

enum class FormatKind {
  Json,
  Text,
  Yaml,
};

const char *formatKindName(FormatKind kind);
std::optional<FormatKind> parseFormatKind(std::string_view name);

// "<chunk>:<resource-id>", the resource part of an entry key in every format
std::string formatResourceRef(const EntryKey &key);

// Fills key.chunk and key.resource
bool parseResourceRef(std::string_view text, EntryKey &key);

// Converts exported strings to an editable file and parses an edited file
// back into edits. Adapters are stateless and safe to share between threads.
class FormatAdapter {
public:
  virtual ~FormatAdapter() = default;

  // File extension without the dot
  virtual std::string_view extension() const = 0;

  virtual std::string render(std::span<const TextEntry> entries) const = 0;

  // Fails with ErrorKind::AdapterParseError on malformed input
  virtual std::optional<std::vector<TextEdit>> parse(std::string_view input,
                                                     Error *outError = nullptr) const = 0;
};

std::unique_ptr<FormatAdapter> makeFormat(FormatKind kind);

// Plain text: a "[chunk:resource-id]" line per resource followed by
// "Language:: text" lines ("Language#n:: text" for cutscene line n)
class TextFormat final : public FormatAdapter {
public:
  std::string_view extension() const override { return "txt"; }
  std::string render(std::span<const TextEntry> entries) const override;
  std::optional<std::vector<TextEdit>> parse(std::string_view input,
                                             Error *outError = nullptr) const override;

  // Line breaks become <cf> (CR LF), <lf> and <cr> so every string fits one line
  static std::string escapeLineBreaks(std::string_view text);
  static std::string unescapeLineBreaks(std::string_view text);
};

} // namespace decloc
