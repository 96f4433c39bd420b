#pragma once

#include "format.hpp"

namespace decloc {

// JSON: {"<chunk>:<resource-id>": {"<Language>": "text" | ["line", ...]}}
// Cutscene languages map to an array indexed by line.
class JsonFormat final : public FormatAdapter {
public:
  std::string_view extension() const override { return "json"; }
  std::string render(std::span<const TextEntry> entries) const override;
  std::optional<std::vector<TextEdit>> parse(std::string_view input,
                                             Error *outError = nullptr) const override;
};

} // namespace decloc
