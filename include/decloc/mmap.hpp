#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <vector>

#include "types.hpp"

namespace decloc {

// RAII wrapper for memory-mapped files
// Supports both read-only and read-write modes
class MappedFile {
public:
  MappedFile();
  ~MappedFile();

  // Delete copy, enable move
  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;
  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  // Map an existing, non-empty file for reading
  bool openRead(const std::filesystem::path &path, Error *outError = nullptr);

  // Create (or truncate) a file of the given size and map it for writing
  bool openWrite(const std::filesystem::path &path, size_t size, Error *outError = nullptr);

  std::span<const uint8_t> data() const {
    return std::span<const uint8_t>(static_cast<const uint8_t *>(data_), size_);
  }

  std::span<uint8_t> data() { return std::span<uint8_t>(static_cast<uint8_t *>(data_), size_); }

  // Flush changes to disk (write mode only)
  bool flush(Error *outError = nullptr);

  void close();

  bool isOpen() const { return data_ != nullptr; }

  size_t size() const { return size_; }

private:
  void cleanup() noexcept;

#ifdef _WIN32
  void *fileHandle_ = nullptr;    // HANDLE on Windows
  void *mappingHandle_ = nullptr; // HANDLE on Windows
#else
  int fd_ = -1;
#endif
  void *data_ = nullptr;
  size_t size_ = 0;
  bool writable_ = false;
};

// Read a whole file. An empty file yields an empty buffer.
std::optional<std::vector<uint8_t>> readFile(const std::filesystem::path &path,
                                             Error *outError = nullptr);

// Write bytes to a temporary file next to destPath, flush it and rename it
// over destPath. On failure the temporary file is removed and destPath is
// left as it was. Parent directories are created as needed.
bool writeFileAtomic(const std::filesystem::path &destPath, std::span<const uint8_t> data,
                     Error *outError = nullptr);

} // namespace decloc
