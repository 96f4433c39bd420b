#pragma once

// Decima Localization Library
// A C++20 library for extracting and re-embedding the localized text stored
// in Decima engine core files (Horizon Zero Dawn, Death Stranding).

#include "batch.hpp"
#include "chunk_stream.hpp"
#include "document.hpp"
#include "format.hpp"
#include "json_format.hpp"
#include "language.hpp"
#include "log.hpp"
#include "text_resource.hpp"
#include "types.hpp"
#include "yaml_format.hpp"

// The library provides three levels of abstraction:
//
// 1. Low-level: parseChunks / serializeChunks and the text resource codec
//    - Byte-exact access to the chunk list of a container
//    - decodeTextResource / encodeTextResource for a single payload
//
// 2. Document: CoreDocument
//    - Load a core file, export its strings, apply edits, save it back
//    - Everything that is not edited is written back byte for byte
//
// 3. Batch: BatchCoordinator
//    - Export or import whole directory trees on several threads
//
// Example usage:
//
//   // Translating one string
//   decloc::Error error;
//   auto document = decloc::CoreDocument::open("menu.core", decloc::Game::HorizonZeroDawn, &error);
//   if (document) {
//     for (const auto& entry : document->exportEntries()) {
//       std::cout << decloc::languageName(entry.key.language) << ": " << entry.text << std::endl;
//     }
//     auto key = document->exportEntries().front().key;
//     key.language = decloc::Language::French;
//     std::vector<decloc::TextEdit> edits{{key, "Salut"}};
//     document->applyEdits(edits);
//     document->write("out/menu.core", &error);
//   }
//
//   // Exporting a directory tree to plain text
//   decloc::BatchOptions options;
//   options.inputRoot = "extracted";
//   options.editsRoot = "text";
//   options.game = std::nullopt; // detect per file
//   decloc::BatchCoordinator batch(options);
//   auto files = decloc::collectCoreFiles(options.inputRoot);
//   auto report = batch.run(*files);

namespace decloc {}
