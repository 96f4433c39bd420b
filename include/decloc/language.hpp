#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace decloc {

// Language codes as stored in the text resources. Numeric order is the
// canonical order every encoder and exporter uses.
enum class Language : uint8_t {
  English = 0,
  French = 1,
  Spanish = 2,
  German = 3,
  Italian = 4,
  Dutch = 5,
  Portuguese = 6,
  TraditionalChinese = 7,
  Korean = 8,
  Russian = 9,
  Polish = 10,
  Danish = 11,
  Finnish = 12,
  Norwegian = 13,
  Swedish = 14,
  Japanese = 15,
  LatinAmericanSpanish = 16,
  BrazilianPortuguese = 17,
  Turkish = 18,
  Arabic = 19,
  SimplifiedChinese = 20,
  // Death Stranding only
  EnglishUK = 21,
  Greek = 22,
  Czech = 23,
  Hungarian = 24,
};

inline constexpr size_t kMaxLanguages = 25;

const char *languageName(Language language);

// Case-insensitive lookup by name
std::optional<Language> parseLanguage(std::string_view name);

// Number of language slots the game's resources carry (21 for HZD, 25 for DS)
size_t languageCount(Game game);

// All languages of a game in canonical order
std::vector<Language> gameLanguages(Game game);

inline bool isLanguageSupported(Game game, Language language) {
  return static_cast<size_t>(language) < languageCount(game);
}

} // namespace decloc
