#include <iostream>

#include "batch_cli.hpp"

int main(int argc, char *argv[]) {
  if (argc < 4) {
    std::cerr << "Usage: " << argv[0] << " <core_dir> <edits_dir> <output_dir> [options]\n"
              << batchFlagsUsage() << "  --skip-unchanged     Do not write files without edits\n";
    return 1;
  }

  decloc::BatchOptions options;
  options.operation = decloc::Operation::Import;
  options.inputRoot = argv[1];
  options.editsRoot = argv[2];
  options.outputRoot = argv[3];

  if (!parseBatchFlags(argc, argv, 4, options)) {
    return 1;
  }

  return runBatch(options);
}
