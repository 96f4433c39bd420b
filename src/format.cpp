#include <algorithm>
#include <cctype>
#include <charconv>

#include <fmt/format.h>

#include <decloc/format.hpp>
#include <decloc/json_format.hpp>
#include <decloc/yaml_format.hpp>

namespace decloc {

namespace {

std::string_view trimRight(std::string_view text) {
  while (!text.empty() && (text.back() == '\r' || text.back() == ' ' || text.back() == '\t')) {
    text.remove_suffix(1);
  }
  return text;
}

std::string_view trim(std::string_view text) {
  text = trimRight(text);
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.remove_prefix(1);
  }
  return text;
}

void parseFailed(Error *outError, size_t lineNumber, std::string_view message) {
  setError(outError, ErrorKind::AdapterParseError,
           fmt::format("line {}: {}", lineNumber, message));
}

// "English" or "English#3"
bool parseEntryName(std::string_view name, Language &language, uint32_t &line) {
  line = 0;
  auto hash = name.find('#');
  if (hash != std::string_view::npos) {
    auto digits = name.substr(hash + 1);
    auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), line);
    if (ec != std::errc() || end != digits.data() + digits.size() || digits.empty()) {
      return false;
    }
    name = name.substr(0, hash);
  }

  auto parsed = parseLanguage(name);
  if (!parsed) {
    return false;
  }
  language = *parsed;
  return true;
}

} // namespace

const char *formatKindName(FormatKind kind) {
  switch (kind) {
  case FormatKind::Json:
    return "json";
  case FormatKind::Text:
    return "txt";
  case FormatKind::Yaml:
    return "yaml";
  }
  return "unknown";
}

std::optional<FormatKind> parseFormatKind(std::string_view name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "json") {
    return FormatKind::Json;
  }
  if (lower == "txt" || lower == "text") {
    return FormatKind::Text;
  }
  if (lower == "yaml" || lower == "yml") {
    return FormatKind::Yaml;
  }
  return std::nullopt;
}

std::string formatResourceRef(const EntryKey &key) {
  return fmt::format("{}:{}", key.chunk, formatResourceId(key.resource));
}

bool parseResourceRef(std::string_view text, EntryKey &key) {
  auto colon = text.find(':');
  if (colon == std::string_view::npos || colon == 0) {
    return false;
  }

  uint32_t chunk = 0;
  auto [end, ec] = std::from_chars(text.data(), text.data() + colon, chunk);
  if (ec != std::errc() || end != text.data() + colon) {
    return false;
  }

  auto id = parseResourceId(text.substr(colon + 1));
  if (!id) {
    return false;
  }

  key.chunk = chunk;
  key.resource = *id;
  return true;
}

std::unique_ptr<FormatAdapter> makeFormat(FormatKind kind) {
  switch (kind) {
  case FormatKind::Text:
    return std::make_unique<TextFormat>();
  case FormatKind::Json:
    return std::make_unique<JsonFormat>();
  case FormatKind::Yaml:
    return std::make_unique<YamlFormat>();
  }
  return nullptr;
}

std::string TextFormat::escapeLineBreaks(std::string_view text) {
  std::string result;
  result.reserve(text.size());

  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '\r') {
      if (i + 1 < text.size() && text[i + 1] == '\n') {
        result += "<cf>";
        ++i;
      } else {
        result += "<cr>";
      }
    } else if (c == '\n') {
      result += "<lf>";
    } else {
      result += c;
    }
  }

  return result;
}

std::string TextFormat::unescapeLineBreaks(std::string_view text) {
  std::string result;
  result.reserve(text.size());

  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '<' && i + 3 < text.size() && text[i + 3] == '>') {
      auto code = text.substr(i + 1, 2);
      if (code == "cf") {
        result += "\r\n";
        i += 3;
        continue;
      }
      if (code == "lf") {
        result += '\n';
        i += 3;
        continue;
      }
      if (code == "cr") {
        result += '\r';
        i += 3;
        continue;
      }
    }
    result += text[i];
  }

  return result;
}

std::string TextFormat::render(std::span<const TextEntry> entries) const {
  std::string out;
  const EntryKey *current = nullptr;

  for (const auto &entry : entries) {
    if (!current || current->chunk != entry.key.chunk || current->resource != entry.key.resource) {
      if (current) {
        out += '\n';
      }
      out += fmt::format("[{}]\n", formatResourceRef(entry.key));
      current = &entry.key;
    }

    if (entry.format == ResourceFormat::HzdCutscene) {
      out += fmt::format("{}#{}:: ", languageName(entry.key.language), entry.key.line);
    } else {
      out += fmt::format("{}:: ", languageName(entry.key.language));
    }
    out += escapeLineBreaks(entry.text);
    out += '\n';
  }

  return out;
}

std::optional<std::vector<TextEdit>> TextFormat::parse(std::string_view input,
                                                       Error *outError) const {
  std::vector<TextEdit> edits;
  std::optional<EntryKey> resource;

  size_t lineNumber = 0;
  size_t pos = 0;
  while (pos <= input.size()) {
    size_t end = input.find('\n', pos);
    if (end == std::string_view::npos) {
      end = input.size();
    }
    std::string_view line = input.substr(pos, end - pos);
    pos = end + 1;
    ++lineNumber;

    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    if (trim(line).empty()) {
      continue;
    }

    if (line.front() == '[') {
      auto header = trimRight(line);
      if (header.back() != ']') {
        parseFailed(outError, lineNumber, "unterminated resource header");
        return std::nullopt;
      }
      auto ref = header.substr(1, header.size() - 2);
      EntryKey key;
      if (!parseResourceRef(ref, key)) {
        parseFailed(outError, lineNumber,
                    fmt::format("invalid resource '{}', expected chunk:resource-id", ref));
        return std::nullopt;
      }
      resource = key;
      continue;
    }

    auto separator = line.find("::");
    if (separator == std::string_view::npos) {
      parseFailed(outError, lineNumber, "expected 'Language:: text'");
      return std::nullopt;
    }
    if (!resource) {
      parseFailed(outError, lineNumber, "entry before the first [chunk:resource-id] header");
      return std::nullopt;
    }

    TextEdit edit;
    edit.key = *resource;
    auto name = trim(line.substr(0, separator));
    if (!parseEntryName(name, edit.key.language, edit.key.line)) {
      parseFailed(outError, lineNumber, fmt::format("unknown language '{}'", name));
      return std::nullopt;
    }

    auto value = line.substr(separator + 2);
    if (!value.empty() && value.front() == ' ') {
      value.remove_prefix(1);
    }
    edit.text = unescapeLineBreaks(value);
    edits.push_back(std::move(edit));
  }

  return edits;
}

} // namespace decloc
