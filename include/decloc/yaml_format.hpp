#pragma once

#include "format.hpp"

namespace decloc {

// YAML with the same shape as JsonFormat:
//   "<chunk>:<resource-id>":
//     <Language>: "text"
//     <Language>: ["line", ...]   (cutscenes)
class YamlFormat final : public FormatAdapter {
public:
  std::string_view extension() const override { return "yaml"; }
  std::string render(std::span<const TextEntry> entries) const override;
  std::optional<std::vector<TextEdit>> parse(std::string_view input,
                                             Error *outError = nullptr) const override;
};

} // namespace decloc
