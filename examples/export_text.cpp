#include <iostream>

#include "batch_cli.hpp"

int main(int argc, char *argv[]) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <core_dir> <edits_dir> [options]\n"
              << batchFlagsUsage();
    return 1;
  }

  decloc::BatchOptions options;
  options.operation = decloc::Operation::Export;
  options.inputRoot = argv[1];
  options.editsRoot = argv[2];

  if (!parseBatchFlags(argc, argv, 3, options)) {
    return 1;
  }

  return runBatch(options);
}
