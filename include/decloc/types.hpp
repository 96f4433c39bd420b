#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace decloc {

// Games whose core files carry text resources this library understands
enum class Game {
  HorizonZeroDawn,
  DeathStranding,
};

const char *gameName(Game game);

// Accepts "hzd", "ds" and the full names, case-insensitive
std::optional<Game> parseGame(std::string_view name);

using ChunkTag = uint64_t;

// One typed, length-delimited unit of a container
struct Chunk {
  ChunkTag tag = 0;
  std::vector<uint8_t> payload;
  uint32_t declaredLength = 0;  // Length field as read, recomputed on serialize
  std::vector<uint8_t> padding; // Alignment bytes that followed the payload

  static constexpr size_t headerSize = 12; // tag (8) + length (4)
};

// Layout description of a container family
struct ContainerLayout {
  std::vector<uint8_t> header; // Fixed magic + version prefix, may be empty
  size_t alignment = 1;        // Every chunk is padded to this boundary

  // Decima core files: no file header, chunks back to back until EOF
  static ContainerLayout decima() { return {}; }
};

enum class ErrorKind {
  MalformedContainer,
  UnsupportedResourceVersion,
  TruncatedPayload,
  EntryTooLarge,
  InvalidText,
  UnknownTarget,
  AdapterParseError,
  Io,
  Cancelled,
  UnknownGame,
};

const char *errorKindName(ErrorKind kind);

struct Error {
  ErrorKind kind = ErrorKind::Io;
  std::string message;
};

// Stores an error if the caller asked for one
inline void setError(Error *outError, ErrorKind kind, std::string message) {
  if (outError) {
    *outError = Error{kind, std::move(message)};
  }
}

// Exception for binary decoding errors, converted to Error at API boundaries
class ParseError : public std::runtime_error {
public:
  ParseError(ErrorKind kind, const std::string &msg) : std::runtime_error(msg), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

} // namespace decloc
