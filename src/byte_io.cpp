#include <fmt/format.h>

#include <decloc/byte_io.hpp>

namespace decloc {

void ByteCursor::require(size_t count, const char *what) const {
  if (count > data_.size() - pos_) {
    throw ParseError(ErrorKind::TruncatedPayload,
                     fmt::format("Reading {} ({} bytes) at offset {} runs past the payload end ({})",
                                 what, count, pos_, data_.size()));
  }
}

} // namespace decloc
