#include <atomic>
#include <cstring>
#include <fstream>
#include <functional>
#include <thread>
#include <utility>

#include <fmt/format.h>

#include <decloc/mmap.hpp>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace decloc {

namespace {

#ifdef _WIN32
unsigned long lastSystemError() {
  return GetLastError();
}
#else
int lastSystemError() {
  return errno;
}
#endif

void ioError(Error *outError, std::string_view what, const std::filesystem::path &path) {
  setError(outError, ErrorKind::Io,
           fmt::format("{}: {} (error: {})", what, path.string(), lastSystemError()));
}

} // namespace

MappedFile::MappedFile() = default;

MappedFile::~MappedFile() {
  close();
}

MappedFile::MappedFile(MappedFile &&other) noexcept
    :
#ifdef _WIN32
      fileHandle_(other.fileHandle_), mappingHandle_(other.mappingHandle_),
#else
      fd_(other.fd_),
#endif
      data_(other.data_), size_(other.size_), writable_(other.writable_) {
#ifdef _WIN32
  other.fileHandle_ = nullptr;
  other.mappingHandle_ = nullptr;
#else
  other.fd_ = -1;
#endif
  other.data_ = nullptr;
  other.size_ = 0;
  other.writable_ = false;
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    close();

#ifdef _WIN32
    fileHandle_ = std::exchange(other.fileHandle_, nullptr);
    mappingHandle_ = std::exchange(other.mappingHandle_, nullptr);
#else
    fd_ = std::exchange(other.fd_, -1);
#endif
    data_ = std::exchange(other.data_, nullptr);
    size_ = std::exchange(other.size_, 0);
    writable_ = std::exchange(other.writable_, false);
  }
  return *this;
}

bool MappedFile::openRead(const std::filesystem::path &path, Error *outError) {
  close();

#ifdef _WIN32
  fileHandle_ = CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING,
                            FILE_ATTRIBUTE_NORMAL, nullptr);
  if (fileHandle_ == INVALID_HANDLE_VALUE) {
    fileHandle_ = nullptr;
    ioError(outError, "Failed to open file for reading", path);
    return false;
  }

  LARGE_INTEGER fileSize;
  if (!GetFileSizeEx(static_cast<HANDLE>(fileHandle_), &fileSize)) {
    ioError(outError, "Failed to get file size", path);
    close();
    return false;
  }
  size_ = static_cast<size_t>(fileSize.QuadPart);
#else
  fd_ = ::open(path.string().c_str(), O_RDONLY);
  if (fd_ < 0) {
    ioError(outError, "Failed to open file for reading", path);
    return false;
  }

  struct stat st;
  if (fstat(fd_, &st) < 0) {
    ioError(outError, "Failed to get file size", path);
    close();
    return false;
  }
  size_ = static_cast<size_t>(st.st_size);
#endif

  // Zero-length mappings are not allowed on either platform
  if (size_ == 0) {
    setError(outError, ErrorKind::Io, fmt::format("File is empty: {}", path.string()));
    close();
    return false;
  }

#ifdef _WIN32
  mappingHandle_ =
      CreateFileMappingW(static_cast<HANDLE>(fileHandle_), nullptr, PAGE_READONLY, 0, 0, nullptr);
  if (!mappingHandle_) {
    ioError(outError, "Failed to create file mapping", path);
    close();
    return false;
  }

  data_ = MapViewOfFile(static_cast<HANDLE>(mappingHandle_), FILE_MAP_READ, 0, 0, 0);
  if (!data_) {
    ioError(outError, "Failed to map view of file", path);
    close();
    return false;
  }
#else
  data_ = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
  if (data_ == MAP_FAILED) {
    data_ = nullptr;
    ioError(outError, "Failed to map file", path);
    close();
    return false;
  }
#endif

  writable_ = false;
  return true;
}

bool MappedFile::openWrite(const std::filesystem::path &path, size_t size, Error *outError) {
  close();

  if (size == 0) {
    setError(outError, ErrorKind::Io, "Cannot create file mapping with zero size");
    return false;
  }

  size_ = size;

#ifdef _WIN32
  fileHandle_ = CreateFileW(path.c_str(), GENERIC_READ | GENERIC_WRITE, 0, nullptr, CREATE_ALWAYS,
                            FILE_ATTRIBUTE_NORMAL, nullptr);
  if (fileHandle_ == INVALID_HANDLE_VALUE) {
    fileHandle_ = nullptr;
    ioError(outError, "Failed to create file for writing", path);
    return false;
  }

  LARGE_INTEGER fileSize;
  fileSize.QuadPart = static_cast<LONGLONG>(size);
  if (!SetFilePointerEx(static_cast<HANDLE>(fileHandle_), fileSize, nullptr, FILE_BEGIN) ||
      !SetEndOfFile(static_cast<HANDLE>(fileHandle_))) {
    ioError(outError, "Failed to set file size", path);
    close();
    return false;
  }

  mappingHandle_ =
      CreateFileMappingW(static_cast<HANDLE>(fileHandle_), nullptr, PAGE_READWRITE, 0, 0, nullptr);
  if (!mappingHandle_) {
    ioError(outError, "Failed to create file mapping", path);
    close();
    return false;
  }

  data_ = MapViewOfFile(static_cast<HANDLE>(mappingHandle_), FILE_MAP_WRITE, 0, 0, 0);
  if (!data_) {
    ioError(outError, "Failed to map view of file", path);
    close();
    return false;
  }
#else
  fd_ = ::open(path.string().c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
  if (fd_ < 0) {
    ioError(outError, "Failed to create file for writing", path);
    return false;
  }

  if (ftruncate(fd_, static_cast<off_t>(size)) < 0) {
    ioError(outError, "Failed to set file size", path);
    close();
    return false;
  }

  data_ = mmap(nullptr, size_, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, 0);
  if (data_ == MAP_FAILED) {
    data_ = nullptr;
    ioError(outError, "Failed to map file", path);
    close();
    return false;
  }
#endif

  writable_ = true;
  return true;
}

bool MappedFile::flush(Error *outError) {
  if (!data_ || !writable_) {
    setError(outError, ErrorKind::Io, "Cannot flush: file not open or not writable");
    return false;
  }

#ifdef _WIN32
  if (!FlushViewOfFile(data_, 0) || !FlushFileBuffers(static_cast<HANDLE>(fileHandle_))) {
    setError(outError, ErrorKind::Io,
             fmt::format("Failed to flush mapped file (error: {})", lastSystemError()));
    return false;
  }
#else
  if (msync(data_, size_, MS_SYNC) < 0) {
    setError(outError, ErrorKind::Io,
             fmt::format("Failed to sync mapped file (errno: {})", lastSystemError()));
    return false;
  }
#endif

  return true;
}

void MappedFile::close() {
  cleanup();
}

void MappedFile::cleanup() noexcept {
  if (data_) {
#ifdef _WIN32
    UnmapViewOfFile(data_);
#else
    munmap(data_, size_);
#endif
    data_ = nullptr;
  }

#ifdef _WIN32
  if (mappingHandle_) {
    CloseHandle(static_cast<HANDLE>(mappingHandle_));
    mappingHandle_ = nullptr;
  }
  if (fileHandle_) {
    CloseHandle(static_cast<HANDLE>(fileHandle_));
    fileHandle_ = nullptr;
  }
#else
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
#endif

  size_ = 0;
  writable_ = false;
}

std::optional<std::vector<uint8_t>> readFile(const std::filesystem::path &path, Error *outError) {
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    setError(outError, ErrorKind::Io,
             fmt::format("Failed to get file size: {} ({})", path.string(), ec.message()));
    return std::nullopt;
  }

  if (size == 0) {
    return std::vector<uint8_t>{};
  }

  MappedFile file;
  if (!file.openRead(path, outError)) {
    return std::nullopt;
  }

  auto view = file.data();
  return std::vector<uint8_t>(view.begin(), view.end());
}

bool writeFileAtomic(const std::filesystem::path &destPath, std::span<const uint8_t> data,
                     Error *outError) {
  namespace fs = std::filesystem;
  static std::atomic<uint64_t> counter{0};

  std::error_code ec;
  if (destPath.has_parent_path()) {
    fs::create_directories(destPath.parent_path(), ec);
    if (ec) {
      setError(outError, ErrorKind::Io,
               fmt::format("Failed to create directory: {} ({})", destPath.parent_path().string(),
                           ec.message()));
      return false;
    }
  }

  // Unique per thread and call so concurrent writers never share a temp file
  auto threadTag = std::hash<std::thread::id>{}(std::this_thread::get_id());
  fs::path tempPath = destPath;
  tempPath += fmt::format(".tmp-{:x}-{}", threadTag, counter.fetch_add(1));

  auto discard = [&tempPath] {
    std::error_code ignored;
    fs::remove(tempPath, ignored);
  };

  if (data.empty()) {
    std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
    if (!out) {
      setError(outError, ErrorKind::Io,
               fmt::format("Failed to create output file: {}", tempPath.string()));
      discard();
      return false;
    }
  } else {
    MappedFile out;
    if (!out.openWrite(tempPath, data.size(), outError)) {
      discard();
      return false;
    }
    std::memcpy(out.data().data(), data.data(), data.size());
    if (!out.flush(outError)) {
      out.close();
      discard();
      return false;
    }
  }

  fs::rename(tempPath, destPath, ec);
  if (ec) {
    setError(outError, ErrorKind::Io,
             fmt::format("Failed to move {} into place: {}", destPath.string(), ec.message()));
    discard();
    return false;
  }

  return true;
}

} // namespace decloc
