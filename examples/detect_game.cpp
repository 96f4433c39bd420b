#include <iostream>

#include <decloc/decloc.hpp>
#include <decloc/mmap.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <file.core>...\n";
    return 1;
  }

  int failures = 0;
  for (int i = 1; i < argc; ++i) {
    decloc::Error error;
    auto bytes = decloc::readFile(argv[i], &error);
    std::optional<decloc::GameDetection> detected;
    if (bytes) {
      detected = decloc::detectGame(*bytes, &error);
    }

    if (!detected) {
      std::cerr << argv[i] << ": " << error.message << "\n";
      ++failures;
      continue;
    }

    std::cout << argv[i] << ": " << decloc::gameDetectionName(*detected) << "\n";
  }

  return failures == 0 ? 0 : 1;
}
