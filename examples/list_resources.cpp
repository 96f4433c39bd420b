#include <iostream>

#include <decloc/decloc.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <file.core> [hzd|ds]\n";
    return 1;
  }

  auto game = decloc::Game::HorizonZeroDawn;
  if (argc >= 3) {
    auto parsed = decloc::parseGame(argv[2]);
    if (!parsed) {
      std::cerr << "Unknown game: " << argv[2] << "\n";
      return 1;
    }
    game = *parsed;
  }

  decloc::Error error;
  auto document = decloc::CoreDocument::open(argv[1], game, &error);

  if (!document) {
    std::cerr << "Error: " << error.message << "\n";
    return 1;
  }

  std::cout << "Core file: " << argv[1] << "\n";
  std::cout << "Chunks: " << document->chunkCount() << "\n";
  std::cout << "Text resources: " << document->textResourceCount() << "\n\n";

  for (size_t i = 0; i < document->chunkCount(); ++i) {
    const auto *resource = document->resource(i);
    if (!resource) {
      continue;
    }

    std::cout << "  [" << i << "] " << decloc::formatResourceId(resource->id) << " ("
              << decloc::resourceFormatName(resource->format) << ")\n";

    const auto *english = resource->find(decloc::Language::English);
    if (english) {
      for (const auto &line : english->lines) {
        std::cout << "      " << decloc::TextFormat::escapeLineBreaks(line.text) << "\n";
      }
    }
  }

  for (const auto &issue : document->issues()) {
    std::cerr << "Chunk " << issue.chunkIndex << " not decoded: " << issue.error.message << "\n";
  }

  return document->issues().empty() ? 0 : 2;
}
