#pragma once

#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <vector>

#include "endian.hpp"
#include "types.hpp"

namespace decloc {

// Bounds-checked little-endian reader over a byte span.
// Every read past the end throws ParseError(TruncatedPayload).
class ByteCursor {
public:
  explicit ByteCursor(std::span<const uint8_t> data) : data_(data) {}

  uint8_t readU8() {
    require(1, "u8");
    return data_[pos_++];
  }

  uint16_t readU16() {
    uint16_t value;
    copyOut(&value, sizeof(value), "u16");
    return le_to_host16(value);
  }

  uint32_t readU32() {
    uint32_t value;
    copyOut(&value, sizeof(value), "u32");
    return le_to_host32(value);
  }

  uint64_t readU64() {
    uint64_t value;
    copyOut(&value, sizeof(value), "u64");
    return le_to_host64(value);
  }

  // Returns a view of the next count bytes and advances past them
  std::span<const uint8_t> readBytes(size_t count, const char *what = "bytes") {
    require(count, what);
    auto view = data_.subspan(pos_, count);
    pos_ += count;
    return view;
  }

  std::string readString(size_t count, const char *what = "string") {
    auto view = readBytes(count, what);
    return std::string(reinterpret_cast<const char *>(view.data()), view.size());
  }

  size_t position() const { return pos_; }
  size_t remaining() const { return data_.size() - pos_; }
  bool atEnd() const { return pos_ == data_.size(); }

private:
  void require(size_t count, const char *what) const;

  void copyOut(void *dest, size_t count, const char *what) {
    require(count, what);
    std::memcpy(dest, data_.data() + pos_, count);
    pos_ += count;
  }

  std::span<const uint8_t> data_;
  size_t pos_ = 0;
};

// Little-endian writer appending to an owned buffer
class ByteSink {
public:
  ByteSink() = default;
  explicit ByteSink(size_t reserve) { buffer_.reserve(reserve); }

  void writeU8(uint8_t value) { buffer_.push_back(value); }

  void writeU16(uint16_t value) {
    value = host_to_le16(value);
    append(&value, sizeof(value));
  }

  void writeU32(uint32_t value) {
    value = host_to_le32(value);
    append(&value, sizeof(value));
  }

  void writeU64(uint64_t value) {
    value = host_to_le64(value);
    append(&value, sizeof(value));
  }

  void writeBytes(std::span<const uint8_t> bytes) {
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
  }

  void writeString(const std::string &text) { append(text.data(), text.size()); }

  void writeZeros(size_t count) { buffer_.insert(buffer_.end(), count, 0); }

  size_t size() const { return buffer_.size(); }

  std::vector<uint8_t> take() { return std::move(buffer_); }

private:
  void append(const void *src, size_t count) {
    const auto *bytes = static_cast<const uint8_t *>(src);
    buffer_.insert(buffer_.end(), bytes, bytes + count);
  }

  std::vector<uint8_t> buffer_;
};

} // namespace decloc
