#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <decloc/json_format.hpp>

namespace decloc {

using ordered_json = nlohmann::ordered_json;

std::string JsonFormat::render(std::span<const TextEntry> entries) const {
  ordered_json root = ordered_json::object();

  for (const auto &entry : entries) {
    auto &resource = root[formatResourceRef(entry.key)];
    const char *language = languageName(entry.key.language);

    if (entry.format == ResourceFormat::HzdCutscene) {
      auto &lines = resource[language];
      if (lines.is_null()) {
        lines = ordered_json::array();
      }
      lines.push_back(entry.text);
    } else {
      resource[language] = entry.text;
    }
  }

  return root.dump(2) + "\n";
}

std::optional<std::vector<TextEdit>> JsonFormat::parse(std::string_view input,
                                                       Error *outError) const {
  ordered_json root;
  try {
    root = ordered_json::parse(input.begin(), input.end());
  } catch (const ordered_json::parse_error &e) {
    setError(outError, ErrorKind::AdapterParseError, fmt::format("Invalid JSON: {}", e.what()));
    return std::nullopt;
  }

  if (!root.is_object()) {
    setError(outError, ErrorKind::AdapterParseError, "Top-level JSON value must be an object");
    return std::nullopt;
  }

  std::vector<TextEdit> edits;

  for (const auto &[idText, languages] : root.items()) {
    EntryKey resource;
    if (!parseResourceRef(idText, resource)) {
      setError(outError, ErrorKind::AdapterParseError,
               fmt::format("Invalid resource '{}', expected chunk:resource-id", idText));
      return std::nullopt;
    }
    if (!languages.is_object()) {
      setError(outError, ErrorKind::AdapterParseError,
               fmt::format("Resource '{}' must map languages to text", idText));
      return std::nullopt;
    }

    for (const auto &[name, value] : languages.items()) {
      auto language = parseLanguage(name);
      if (!language) {
        setError(outError, ErrorKind::AdapterParseError,
                 fmt::format("Resource '{}': unknown language '{}'", idText, name));
        return std::nullopt;
      }

      if (value.is_string()) {
        edits.push_back(
            TextEdit{EntryKey{resource.chunk, resource.resource, *language, 0},
                     value.get<std::string>()});
        continue;
      }

      if (!value.is_array()) {
        setError(outError, ErrorKind::AdapterParseError,
                 fmt::format("Resource '{}', {}: expected a string or an array of strings",
                             idText, name));
        return std::nullopt;
      }

      uint32_t line = 0;
      for (const auto &item : value) {
        if (!item.is_string()) {
          setError(outError, ErrorKind::AdapterParseError,
                   fmt::format("Resource '{}', {}#{}: expected a string", idText, name, line));
          return std::nullopt;
        }
        edits.push_back(TextEdit{EntryKey{resource.chunk, resource.resource, *language, line},
                                 item.get<std::string>()});
        ++line;
      }
    }
  }

  return edits;
}

} // namespace decloc
