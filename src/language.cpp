#include <algorithm>
#include <array>
#include <cctype>

#include <decloc/language.hpp>

namespace decloc {

namespace {

constexpr std::array<const char *, kMaxLanguages> kLanguageNames = {
    "English", "French", "Spanish", "German", "Italian", "Dutch", "Portuguese",
    "TraditionalChinese", "Korean", "Russian", "Polish", "Danish", "Finnish", "Norwegian",
    "Swedish", "Japanese", "LatinAmericanSpanish", "BrazilianPortuguese", "Turkish", "Arabic",
    "SimplifiedChinese", "EnglishUK", "Greek", "Czech", "Hungarian",
};

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
  return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
    return std::tolower(static_cast<unsigned char>(x)) ==
           std::tolower(static_cast<unsigned char>(y));
  });
}

} // namespace

const char *gameName(Game game) {
  switch (game) {
  case Game::HorizonZeroDawn:
    return "HorizonZeroDawn";
  case Game::DeathStranding:
    return "DeathStranding";
  }
  return "Unknown";
}

std::optional<Game> parseGame(std::string_view name) {
  if (equalsIgnoreCase(name, "hzd") || equalsIgnoreCase(name, "HorizonZeroDawn")) {
    return Game::HorizonZeroDawn;
  }
  if (equalsIgnoreCase(name, "ds") || equalsIgnoreCase(name, "DeathStranding")) {
    return Game::DeathStranding;
  }
  return std::nullopt;
}

const char *errorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::MalformedContainer:
    return "MalformedContainer";
  case ErrorKind::UnsupportedResourceVersion:
    return "UnsupportedResourceVersion";
  case ErrorKind::TruncatedPayload:
    return "TruncatedPayload";
  case ErrorKind::EntryTooLarge:
    return "EntryTooLarge";
  case ErrorKind::InvalidText:
    return "InvalidText";
  case ErrorKind::UnknownTarget:
    return "UnknownTarget";
  case ErrorKind::AdapterParseError:
    return "AdapterParseError";
  case ErrorKind::Io:
    return "Io";
  case ErrorKind::Cancelled:
    return "Cancelled";
  case ErrorKind::UnknownGame:
    return "UnknownGame";
  }
  return "Unknown";
}

const char *languageName(Language language) {
  auto index = static_cast<size_t>(language);
  return index < kLanguageNames.size() ? kLanguageNames[index] : "Unknown";
}

std::optional<Language> parseLanguage(std::string_view name) {
  for (size_t i = 0; i < kLanguageNames.size(); ++i) {
    if (equalsIgnoreCase(name, kLanguageNames[i])) {
      return static_cast<Language>(i);
    }
  }
  return std::nullopt;
}

size_t languageCount(Game game) {
  return game == Game::DeathStranding ? 25 : 21;
}

std::vector<Language> gameLanguages(Game game) {
  std::vector<Language> result;
  size_t count = languageCount(game);
  result.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    result.push_back(static_cast<Language>(i));
  }
  return result;
}

} // namespace decloc
