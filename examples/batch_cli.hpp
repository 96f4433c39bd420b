#pragma once

#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <decloc/decloc.hpp>

// Option parsing and reporting shared by the export, import and single-file tools

inline bool parseLanguageList(std::string_view list, std::vector<decloc::Language> &out) {
  while (!list.empty()) {
    auto comma = list.find(',');
    auto name = list.substr(0, comma);
    auto language = decloc::parseLanguage(name);
    if (!language) {
      std::cerr << "Unknown language: " << name << "\n";
      return false;
    }
    out.push_back(*language);
    list = comma == std::string_view::npos ? std::string_view() : list.substr(comma + 1);
  }
  return true;
}

// "auto" clears the game so each file is detected on its own
inline bool parseGameFlag(std::string_view value, std::optional<decloc::Game> &game) {
  if (value == "auto") {
    game = std::nullopt;
    return true;
  }
  auto parsed = decloc::parseGame(value);
  if (!parsed) {
    std::cerr << "Unknown game: " << value << "\n";
    return false;
  }
  game = *parsed;
  return true;
}

// Parses the flags after the positional arguments starting at argv[first]
inline bool parseBatchFlags(int argc, char *argv[], int first, decloc::BatchOptions &options) {
  for (int i = first; i < argc; ++i) {
    std::string_view arg = argv[i];
    bool hasValue = i + 1 < argc;

    if (arg == "--game" && hasValue) {
      if (!parseGameFlag(argv[++i], options.game)) {
        return false;
      }
    } else if (arg == "--format" && hasValue) {
      auto format = decloc::parseFormatKind(argv[++i]);
      if (!format) {
        std::cerr << "Unknown format: " << argv[i] << "\n";
        return false;
      }
      options.format = *format;
    } else if (arg == "--workers" && hasValue) {
      std::string_view value = argv[++i];
      auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), options.workers);
      if (ec != std::errc() || end != value.data() + value.size()) {
        std::cerr << "Invalid worker count: " << value << "\n";
        return false;
      }
    } else if (arg == "--lang" && hasValue) {
      if (!parseLanguageList(argv[++i], options.languages)) {
        return false;
      }
    } else if (arg == "--skip-unchanged") {
      options.skipUnchanged = true;
    } else if (arg == "--verbose") {
      decloc::log::setLevel(decloc::log::Level::Debug);
    } else if (arg == "--quiet") {
      decloc::log::setLevel(decloc::log::Level::Warn);
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      return false;
    }
  }
  return true;
}

inline const char *batchFlagsUsage() {
  return "  --game hzd|ds|auto   Game the files come from (default hzd)\n"
         "  --format txt|json|yaml  Editable file format (default txt)\n"
         "  --workers N          Worker threads, 0 for one per core (default 1)\n"
         "  --lang L1,L2         Only these languages\n"
         "  --verbose / --quiet  Log level\n";
}

// Runs the batch over every core file under inputRoot and prints a summary
inline int runBatch(const decloc::BatchOptions &options) {
  decloc::Error error;
  auto files = decloc::collectCoreFiles(options.inputRoot, &error);
  if (!files) {
    std::cerr << "Error: " << error.message << "\n";
    return 1;
  }

  decloc::BatchCoordinator batch(options);
  batch.setProgressCallback([&options](const decloc::FileOutcome &, size_t done, size_t total) {
    decloc::log::progress(decloc::operationName(options.operation), done, total);
  });

  auto report = batch.run(*files);

  decloc::log::good("{} files succeeded, {} failed", report.succeeded(), report.failed());
  for (const auto &outcome : report.outcomes) {
    if (outcome.status == decloc::FileStatus::Failed) {
      std::cerr << "  " << outcome.file.string() << ": " << outcome.error->message << "\n";
    }
  }

  return report.ok() ? 0 : 2;
}
