#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <decloc/yaml_format.hpp>

namespace decloc {

std::string YamlFormat::render(std::span<const TextEntry> entries) const {
  if (entries.empty()) {
    return "{}\n";
  }

  YAML::Emitter out;
  out << YAML::BeginMap;

  size_t i = 0;
  while (i < entries.size()) {
    const auto &first = entries[i].key;
    out << YAML::Key << YAML::DoubleQuoted << formatResourceRef(first);
    out << YAML::Value << YAML::BeginMap;

    // One resource: consecutive entries with the same chunk and id
    while (i < entries.size() && entries[i].key.chunk == first.chunk &&
           entries[i].key.resource == first.resource) {
      const auto &entry = entries[i];
      out << YAML::Key << languageName(entry.key.language) << YAML::Value;

      if (entry.format != ResourceFormat::HzdCutscene) {
        out << YAML::DoubleQuoted << entry.text;
        ++i;
        continue;
      }

      out << YAML::BeginSeq;
      Language language = entry.key.language;
      while (i < entries.size() && entries[i].key.chunk == first.chunk &&
             entries[i].key.resource == first.resource && entries[i].key.language == language) {
        out << YAML::DoubleQuoted << entries[i].text;
        ++i;
      }
      out << YAML::EndSeq;
    }

    out << YAML::EndMap;
  }

  out << YAML::EndMap;
  return std::string(out.c_str()) + "\n";
}

std::optional<std::vector<TextEdit>> YamlFormat::parse(std::string_view input,
                                                       Error *outError) const {
  YAML::Node root;
  try {
    root = YAML::Load(std::string(input));
  } catch (const YAML::Exception &e) {
    setError(outError, ErrorKind::AdapterParseError, fmt::format("Invalid YAML: {}", e.what()));
    return std::nullopt;
  }

  std::vector<TextEdit> edits;
  if (root.IsNull()) {
    return edits;
  }
  if (!root.IsMap()) {
    setError(outError, ErrorKind::AdapterParseError, "Top-level YAML value must be a mapping");
    return std::nullopt;
  }

  for (const auto &resourceItem : root) {
    EntryKey resource;
    std::string ref = resourceItem.first.Scalar();
    if (!resourceItem.first.IsScalar() || !parseResourceRef(ref, resource)) {
      setError(outError, ErrorKind::AdapterParseError,
               fmt::format("Invalid resource '{}', expected chunk:resource-id", ref));
      return std::nullopt;
    }

    const YAML::Node &languages = resourceItem.second;
    if (!languages.IsMap()) {
      setError(outError, ErrorKind::AdapterParseError,
               fmt::format("Resource '{}' must map languages to text", ref));
      return std::nullopt;
    }

    for (const auto &languageItem : languages) {
      std::string name = languageItem.first.Scalar();
      auto language = parseLanguage(name);
      if (!languageItem.first.IsScalar() || !language) {
        setError(outError, ErrorKind::AdapterParseError,
                 fmt::format("Resource '{}': unknown language '{}'", ref, name));
        return std::nullopt;
      }

      const YAML::Node &value = languageItem.second;
      if (value.IsScalar()) {
        edits.push_back(
            TextEdit{EntryKey{resource.chunk, resource.resource, *language, 0}, value.Scalar()});
        continue;
      }

      if (!value.IsSequence()) {
        setError(outError, ErrorKind::AdapterParseError,
                 fmt::format("Resource '{}', {}: expected a string or a list of strings", ref,
                             name));
        return std::nullopt;
      }

      uint32_t line = 0;
      for (const auto &item : value) {
        if (!item.IsScalar()) {
          setError(outError, ErrorKind::AdapterParseError,
                   fmt::format("Resource '{}', {}#{}: expected a string", ref, name, line));
          return std::nullopt;
        }
        edits.push_back(
            TextEdit{EntryKey{resource.chunk, resource.resource, *language, line}, item.Scalar()});
        ++line;
      }
    }
  }

  return edits;
}

} // namespace decloc
