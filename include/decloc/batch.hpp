#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <vector>

#include "document.hpp"
#include "format.hpp"
#include "language.hpp"
#include "types.hpp"

namespace decloc {

enum class Operation {
  Export, // core file -> editable file
  Import, // core file + editable file -> rewritten core file
};

const char *operationName(Operation operation);

struct BatchOptions {
  Operation operation = Operation::Export;

  // Empty detects the game of each file from its text-resource tags. Files
  // with resources of both games, or none, fail with UnknownGame.
  std::optional<Game> game = Game::HorizonZeroDawn;

  FormatKind format = FormatKind::Text;

  // Relative file paths are resolved against inputRoot. Exports go to
  // editsRoot/<relative>.<ext>; imports read the same path and write the
  // rebuilt file to outputRoot/<relative>. An absolute path must lie under
  // inputRoot, and no path may climb out of it.
  std::filesystem::path inputRoot;
  std::filesystem::path editsRoot;
  std::filesystem::path outputRoot;

  std::vector<Language> languages; // Empty means every language of the game
  unsigned workers = 1;            // 0 uses the hardware concurrency
  bool skipUnchanged = false;      // Import writes nothing when no text changed
};

enum class FileStatus {
  Succeeded,
  Unchanged, // Import with skipUnchanged that changed no text
  Failed,
  Cancelled, // Never started
};

const char *fileStatusName(FileStatus status);

struct FileOutcome {
  std::filesystem::path file;
  FileStatus status = FileStatus::Cancelled;
  std::optional<Error> error;
  std::vector<EditWarning> warnings;
  size_t strings = 0; // Exported strings or applied edits
};

struct BatchReport {
  std::vector<FileOutcome> outcomes; // Same order as the input files

  size_t count(FileStatus status) const;
  size_t succeeded() const { return count(FileStatus::Succeeded) + count(FileStatus::Unchanged); }
  size_t failed() const { return count(FileStatus::Failed); }
  size_t cancelled() const { return count(FileStatus::Cancelled); }
  bool ok() const { return failed() == 0 && cancelled() == 0; }
};

// Runs export or import over many core files. Each file is independent: a
// failure is recorded in its outcome and the batch moves on.
class BatchCoordinator {
public:
  // Called once per finished file with the number of files finished so far.
  // Calls never overlap but may arrive out of done order when several workers
  // run. An exception thrown by the callback is logged and ignored.
  using ProgressCallback =
      std::function<void(const FileOutcome &outcome, size_t done, size_t total)>;

  explicit BatchCoordinator(BatchOptions options);

  void setProgressCallback(ProgressCallback callback) { progress_ = std::move(callback); }

  const BatchOptions &options() const { return options_; }

  // Process files on the configured number of workers. Cancellation is
  // checked between files; files not yet started are reported as Cancelled.
  BatchReport run(std::span<const std::filesystem::path> files, std::stop_token stop = {});

  // Process one file on the calling thread
  FileOutcome processFile(const std::filesystem::path &file) const;

  // Export one core file to an explicit path, ignoring the roots
  FileOutcome exportSingle(const std::filesystem::path &core,
                           const std::filesystem::path &edits) const;

  // Import one editable file into a core file and write the result to output
  FileOutcome importSingle(const std::filesystem::path &core, const std::filesystem::path &edits,
                           const std::filesystem::path &output) const;

  // Path of the editable file for a core file, nullopt if the file is outside inputRoot
  std::optional<std::filesystem::path> editsPathFor(const std::filesystem::path &file) const;

  // Path the rebuilt core file is written to, nullopt if the file is outside inputRoot
  std::optional<std::filesystem::path> outputPathFor(const std::filesystem::path &file) const;

private:
  std::optional<std::filesystem::path> relativePath(const std::filesystem::path &file) const;
  std::filesystem::path inputPath(const std::filesystem::path &file) const;

  std::optional<CoreDocument> openDocument(const std::filesystem::path &source,
                                           Error *outError) const;
  bool exportFile(const std::filesystem::path &source, const std::filesystem::path &dest,
                  FileOutcome &outcome) const;
  bool importFile(const std::filesystem::path &source, const std::filesystem::path &editsPath,
                  const std::filesystem::path &dest, FileOutcome &outcome) const;
  FileOutcome guarded(const std::filesystem::path &file,
                      const std::function<void(FileOutcome &)> &body) const;

  BatchOptions options_;
  std::unique_ptr<FormatAdapter> format_;
  ProgressCallback progress_;
};

// Every *.core file under root, recursively, as sorted paths relative to root
std::optional<std::vector<std::filesystem::path>> collectCoreFiles(const std::filesystem::path &root,
                                                                   Error *outError = nullptr);

} // namespace decloc
