#include <algorithm>
#include <atomic>
#include <functional>
#include <mutex>
#include <thread>

#include <fmt/format.h>

#include <decloc/batch.hpp>
#include <decloc/log.hpp>
#include <decloc/mmap.hpp>

namespace decloc {

namespace fs = std::filesystem;

namespace {

void fail(FileOutcome &outcome, Error error) {
  outcome.status = FileStatus::Failed;
  outcome.error = std::move(error);
}

// Text extraction is fatal: a resource that failed to decode fails the file
bool checkIssues(const CoreDocument &document, Error *outError) {
  const auto &issues = document.issues();
  if (issues.empty()) {
    return true;
  }

  const auto &first = issues.front();
  std::string message = fmt::format("chunk {}: {}", first.chunkIndex, first.error.message);
  if (issues.size() > 1) {
    message += fmt::format(" (and {} more)", issues.size() - 1);
  }
  setError(outError, first.error.kind, std::move(message));
  return false;
}

std::optional<Game> detectFileGame(std::span<const uint8_t> data, Error *outError) {
  auto detected = detectGame(data, outError);
  if (!detected) {
    return std::nullopt;
  }

  switch (*detected) {
  case GameDetection::HorizonZeroDawn:
    return Game::HorizonZeroDawn;
  case GameDetection::DeathStranding:
    return Game::DeathStranding;
  case GameDetection::Mixed:
    setError(outError, ErrorKind::UnknownGame,
             "File holds text resources of both games, pass the game explicitly");
    return std::nullopt;
  case GameDetection::Unknown:
    break;
  }
  setError(outError, ErrorKind::UnknownGame,
           "No text resource to detect the game from, pass the game explicitly");
  return std::nullopt;
}

} // namespace

const char *operationName(Operation operation) {
  switch (operation) {
  case Operation::Export:
    return "export";
  case Operation::Import:
    return "import";
  }
  return "unknown";
}

const char *fileStatusName(FileStatus status) {
  switch (status) {
  case FileStatus::Succeeded:
    return "succeeded";
  case FileStatus::Unchanged:
    return "unchanged";
  case FileStatus::Failed:
    return "failed";
  case FileStatus::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

size_t BatchReport::count(FileStatus status) const {
  return static_cast<size_t>(std::count_if(outcomes.begin(), outcomes.end(),
                                           [status](const FileOutcome &o) {
                                             return o.status == status;
                                           }));
}

BatchCoordinator::BatchCoordinator(BatchOptions options)
    : options_(std::move(options)), format_(makeFormat(options_.format)) {}

fs::path BatchCoordinator::inputPath(const fs::path &file) const {
  if (file.is_absolute() || options_.inputRoot.empty()) {
    return file;
  }
  return options_.inputRoot / file;
}

std::optional<fs::path> BatchCoordinator::relativePath(const fs::path &file) const {
  fs::path relative;
  if (file.is_absolute()) {
    std::error_code ec;
    auto root = fs::absolute(options_.inputRoot, ec);
    if (ec) {
      return std::nullopt;
    }
    relative = file.lexically_normal().lexically_relative(root.lexically_normal());
  } else {
    relative = file.lexically_normal();
  }

  if (relative.empty() || relative == "." || *relative.begin() == "..") {
    return std::nullopt;
  }
  return relative;
}

std::optional<fs::path> BatchCoordinator::editsPathFor(const fs::path &file) const {
  auto relative = relativePath(file);
  if (!relative) {
    return std::nullopt;
  }
  auto path = options_.editsRoot / *relative;
  path += ".";
  path += format_->extension();
  return path;
}

std::optional<fs::path> BatchCoordinator::outputPathFor(const fs::path &file) const {
  auto relative = relativePath(file);
  if (!relative) {
    return std::nullopt;
  }
  return options_.outputRoot / *relative;
}

std::optional<CoreDocument> BatchCoordinator::openDocument(const fs::path &source,
                                                           Error *outError) const {
  std::optional<CoreDocument> document;
  if (options_.game) {
    document = CoreDocument::open(source, *options_.game, outError);
  } else {
    auto bytes = readFile(source, outError);
    if (!bytes) {
      return std::nullopt;
    }
    auto game = detectFileGame(*bytes, outError);
    if (!game) {
      return std::nullopt;
    }
    log::debug("{} detected as {}", source.string(), gameName(*game));
    document = CoreDocument::load(*bytes, *game, outError);
  }

  if (!document) {
    return std::nullopt;
  }
  if (!checkIssues(*document, outError)) {
    return std::nullopt;
  }
  return document;
}

bool BatchCoordinator::exportFile(const fs::path &source, const fs::path &dest,
                                  FileOutcome &outcome) const {
  Error error;
  auto document = openDocument(source, &error);
  if (!document) {
    fail(outcome, std::move(error));
    return false;
  }

  auto entries = options_.languages.empty() ? document->exportEntries()
                                            : document->exportEntries(options_.languages);
  auto text = format_->render(entries);

  auto bytes = std::span<const uint8_t>(reinterpret_cast<const uint8_t *>(text.data()), text.size());
  if (!writeFileAtomic(dest, bytes, &error)) {
    fail(outcome, std::move(error));
    return false;
  }

  log::debug("Exported {} strings from {} to {}", entries.size(), source.string(), dest.string());
  outcome.strings = entries.size();
  outcome.status = FileStatus::Succeeded;
  return true;
}

bool BatchCoordinator::importFile(const fs::path &source, const fs::path &editsPath,
                                  const fs::path &dest, FileOutcome &outcome) const {
  Error error;
  auto document = openDocument(source, &error);
  if (!document) {
    fail(outcome, std::move(error));
    return false;
  }

  auto bytes = readFile(editsPath, &error);
  if (!bytes) {
    fail(outcome, std::move(error));
    return false;
  }

  auto text = std::string_view(reinterpret_cast<const char *>(bytes->data()), bytes->size());
  auto edits = format_->parse(text, &error);
  if (!edits) {
    error.message = fmt::format("{}: {}", editsPath.string(), error.message);
    fail(outcome, std::move(error));
    return false;
  }

  if (!options_.languages.empty()) {
    std::erase_if(*edits, [this](const TextEdit &edit) {
      return std::find(options_.languages.begin(), options_.languages.end(),
                       edit.key.language) == options_.languages.end();
    });
  }

  auto report = document->applyEdits(*edits);
  for (const auto &warning : report.warnings) {
    log::warn("{}: {}", source.string(), warning.message);
  }
  outcome.warnings = std::move(report.warnings);
  outcome.strings = report.applied;

  if (options_.skipUnchanged && !document->isModified()) {
    log::debug("No text changed in {}, skipped", source.string());
    outcome.status = FileStatus::Unchanged;
    return true;
  }

  if (!document->write(dest, &error)) {
    fail(outcome, std::move(error));
    return false;
  }

  log::debug("Applied {} edits to {}", report.applied, dest.string());
  outcome.status = FileStatus::Succeeded;
  return true;
}

FileOutcome BatchCoordinator::guarded(const fs::path &file,
                                      const std::function<void(FileOutcome &)> &body) const {
  FileOutcome outcome;
  outcome.file = file;

  try {
    body(outcome);
  } catch (const std::exception &e) {
    fail(outcome, Error{ErrorKind::Io, fmt::format("{}: {}", file.string(), e.what())});
  }

  if (outcome.status == FileStatus::Failed) {
    log::warn("{} failed: {} ({})", file.string(), outcome.error->message,
              errorKindName(outcome.error->kind));
  }
  return outcome;
}

FileOutcome BatchCoordinator::processFile(const fs::path &file) const {
  return guarded(file, [&](FileOutcome &outcome) {
    auto editsPath = editsPathFor(file);
    auto outputPath = outputPathFor(file);
    if (!editsPath || !outputPath) {
      fail(outcome, Error{ErrorKind::Io, fmt::format("{} is not under the input root {}",
                                                     file.string(),
                                                     options_.inputRoot.string())});
      return;
    }

    if (options_.operation == Operation::Export) {
      exportFile(inputPath(file), *editsPath, outcome);
    } else {
      importFile(inputPath(file), *editsPath, *outputPath, outcome);
    }
  });
}

FileOutcome BatchCoordinator::exportSingle(const fs::path &core, const fs::path &edits) const {
  return guarded(core, [&](FileOutcome &outcome) { exportFile(core, edits, outcome); });
}

FileOutcome BatchCoordinator::importSingle(const fs::path &core, const fs::path &edits,
                                           const fs::path &output) const {
  return guarded(core, [&](FileOutcome &outcome) { importFile(core, edits, output, outcome); });
}

BatchReport BatchCoordinator::run(std::span<const fs::path> files, std::stop_token stop) {
  BatchReport report;
  report.outcomes.resize(files.size());
  for (size_t i = 0; i < files.size(); ++i) {
    report.outcomes[i].file = files[i];
  }

  if (files.empty()) {
    return report;
  }

  size_t workerCount = options_.workers;
  if (workerCount == 0) {
    workerCount = std::max(1u, std::thread::hardware_concurrency());
  }
  workerCount = std::min(workerCount, files.size());

  std::atomic<size_t> next{0};
  std::mutex reportMutex;
  std::mutex callbackMutex;
  size_t done = 0;

  auto work = [&]() {
    while (!stop.stop_requested()) {
      size_t index = next.fetch_add(1);
      if (index >= files.size()) {
        break;
      }

      FileOutcome outcome = processFile(files[index]);
      size_t finished = 0;
      {
        std::lock_guard<std::mutex> lock(reportMutex);
        report.outcomes[index] = outcome;
        finished = ++done;
      }

      if (progress_) {
        std::lock_guard<std::mutex> lock(callbackMutex);
        try {
          progress_(outcome, finished, files.size());
        } catch (const std::exception &e) {
          log::warn("Progress callback failed for {}: {}", outcome.file.string(), e.what());
        }
      }
    }
  };

  if (workerCount == 1) {
    work();
  } else {
    std::vector<std::jthread> workers;
    workers.reserve(workerCount);
    for (size_t i = 0; i < workerCount; ++i) {
      workers.emplace_back(work);
    }
  }

  for (auto &outcome : report.outcomes) {
    if (outcome.status == FileStatus::Cancelled) {
      outcome.error = Error{ErrorKind::Cancelled, "Batch cancelled before this file started"};
    }
  }

  log::debug("{} finished: {} succeeded, {} failed, {} cancelled", operationName(options_.operation),
             report.succeeded(), report.failed(), report.cancelled());
  return report;
}

std::optional<std::vector<fs::path>> collectCoreFiles(const fs::path &root, Error *outError) {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    setError(outError, ErrorKind::Io, fmt::format("Not a directory: {}", root.string()));
    return std::nullopt;
  }

  std::vector<fs::path> files;
  fs::recursive_directory_iterator it(root, ec);
  fs::recursive_directory_iterator end;
  for (; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file(ec) && it->path().extension() == ".core") {
      files.push_back(it->path().lexically_relative(root));
    }
  }

  if (ec) {
    setError(outError, ErrorKind::Io,
             fmt::format("Failed to scan {}: {}", root.string(), ec.message()));
    return std::nullopt;
  }

  std::sort(files.begin(), files.end());
  return files;
}

} // namespace decloc
