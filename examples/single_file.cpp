#include <iostream>
#include <string_view>

#include "batch_cli.hpp"

namespace {

int usage(const char *program) {
  std::cerr << "Usage: " << program << " export <file.core> <edits_file> [options]\n"
            << "       " << program << " import <file.core> <edits_file> <output.core> [options]\n"
            << batchFlagsUsage() << "  --skip-unchanged     Do not write the output without edits\n";
  return 1;
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc < 4) {
    return usage(argv[0]);
  }

  std::string_view command = argv[1];
  decloc::BatchOptions options;
  int first = 4;
  if (command == "export") {
    options.operation = decloc::Operation::Export;
  } else if (command == "import" && argc >= 5) {
    options.operation = decloc::Operation::Import;
    first = 5;
  } else {
    return usage(argv[0]);
  }

  if (!parseBatchFlags(argc, argv, first, options)) {
    return 1;
  }

  decloc::BatchCoordinator batch(options);
  auto outcome = options.operation == decloc::Operation::Export
                     ? batch.exportSingle(argv[2], argv[3])
                     : batch.importSingle(argv[2], argv[3], argv[4]);

  if (outcome.status == decloc::FileStatus::Failed) {
    std::cerr << "Error: " << outcome.error->message << "\n";
    return 2;
  }

  if (options.operation == decloc::Operation::Export) {
    decloc::log::good("Exported {} strings to {}", outcome.strings, argv[3]);
  } else if (outcome.status == decloc::FileStatus::Unchanged) {
    decloc::log::info("No text changed, {} not written", argv[4]);
  } else {
    decloc::log::good("Applied {} edits, wrote {}", outcome.strings, argv[4]);
  }
  return 0;
}
