#include <iostream>

#include <decloc/decloc.hpp>

// Prints the language names the editable files and --lang accept
int main(int argc, char *argv[]) {
  std::vector<decloc::Game> games = {decloc::Game::HorizonZeroDawn, decloc::Game::DeathStranding};

  if (argc >= 2) {
    auto game = decloc::parseGame(argv[1]);
    if (!game) {
      std::cerr << "Unknown game: " << argv[1] << "\n"
                << "Usage: " << argv[0] << " [hzd|ds]\n";
      return 1;
    }
    games = {*game};
  }

  for (auto game : games) {
    auto languages = decloc::gameLanguages(game);
    std::cout << decloc::gameName(game) << " (" << languages.size() << " languages)\n";
    for (auto language : languages) {
      std::cout << "  " << static_cast<int>(language) << "\t" << decloc::languageName(language)
                << "\n";
    }
  }

  return 0;
}
