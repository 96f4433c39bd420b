#include <cstring>
#include <limits>

#include <fmt/format.h>

#include <decloc/chunk_stream.hpp>
#include <decloc/endian.hpp>

namespace decloc {

size_t paddingFor(size_t offset, size_t alignment) {
  if (alignment <= 1) {
    return 0;
  }
  size_t rem = offset % alignment;
  return rem == 0 ? 0 : alignment - rem;
}

std::optional<std::vector<Chunk>> parseChunks(std::span<const uint8_t> data,
                                              const ContainerLayout &layout,
                                              Error *outError) {
  const size_t headerSize = layout.header.size();

  if (data.size() < headerSize) {
    setError(outError, ErrorKind::MalformedContainer,
             fmt::format("File too small for container header (size: {}, header: {})",
                         data.size(), headerSize));
    return std::nullopt;
  }

  if (headerSize > 0 && std::memcmp(data.data(), layout.header.data(), headerSize) != 0) {
    setError(outError, ErrorKind::MalformedContainer, "Container header magic/version mismatch");
    return std::nullopt;
  }

  std::vector<Chunk> chunks;
  size_t pos = headerSize;

  while (pos < data.size()) {
    size_t index = chunks.size();

    if (data.size() - pos < Chunk::headerSize) {
      setError(outError, ErrorKind::MalformedContainer,
               fmt::format("{} trailing bytes at offset {} do not form a chunk", data.size() - pos,
                           pos));
      return std::nullopt;
    }

    uint64_t tag;
    uint32_t length;
    std::memcpy(&tag, data.data() + pos, 8);
    std::memcpy(&length, data.data() + pos + 8, 4);
    tag = le_to_host64(tag);
    length = le_to_host32(length);
    pos += Chunk::headerSize;

    if (length > data.size() - pos) {
      setError(outError, ErrorKind::MalformedContainer,
               fmt::format("Chunk {} (tag {:#018x}) declares {} bytes but only {} remain", index,
                           tag, length, data.size() - pos));
      return std::nullopt;
    }

    Chunk chunk;
    chunk.tag = tag;
    chunk.declaredLength = length;
    chunk.payload.assign(data.begin() + pos, data.begin() + pos + length);
    pos += length;

    size_t pad = paddingFor(pos, layout.alignment);
    if (pad > data.size() - pos) {
      setError(outError, ErrorKind::MalformedContainer,
               fmt::format("Chunk {} alignment padding runs past end of file", index));
      return std::nullopt;
    }
    chunk.padding.assign(data.begin() + pos, data.begin() + pos + pad);
    pos += pad;

    chunks.push_back(std::move(chunk));
  }

  return chunks;
}

size_t serializedSize(std::span<const Chunk> chunks, const ContainerLayout &layout) {
  size_t pos = layout.header.size();
  for (const auto &chunk : chunks) {
    pos += Chunk::headerSize + chunk.payload.size();
    pos += paddingFor(pos, layout.alignment);
  }
  return pos;
}

std::optional<std::vector<uint8_t>> serializeChunks(std::span<const Chunk> chunks,
                                                    const ContainerLayout &layout,
                                                    Error *outError) {
  // Step 1: validate lengths and size the buffer up front
  for (size_t i = 0; i < chunks.size(); ++i) {
    if (chunks[i].payload.size() > std::numeric_limits<uint32_t>::max()) {
      setError(outError, ErrorKind::EntryTooLarge,
               fmt::format("Chunk {} payload of {} bytes exceeds the 32-bit length field", i,
                           chunks[i].payload.size()));
      return std::nullopt;
    }
  }

  std::vector<uint8_t> output(serializedSize(chunks, layout));

  // Step 2: header
  size_t pos = 0;
  if (!layout.header.empty()) {
    std::memcpy(output.data(), layout.header.data(), layout.header.size());
    pos += layout.header.size();
  }

  // Step 3: chunks, lengths recomputed from the payloads
  for (const auto &chunk : chunks) {
    uint64_t tagLE = host_to_le64(chunk.tag);
    uint32_t lengthLE = host_to_le32(static_cast<uint32_t>(chunk.payload.size()));
    std::memcpy(output.data() + pos, &tagLE, 8);
    std::memcpy(output.data() + pos + 8, &lengthLE, 4);
    pos += Chunk::headerSize;

    if (!chunk.payload.empty()) {
      std::memcpy(output.data() + pos, chunk.payload.data(), chunk.payload.size());
      pos += chunk.payload.size();
    }

    // Original padding bytes survive as long as the pad length is unchanged,
    // otherwise the new pad is zero-filled (the buffer is already zeroed)
    size_t pad = paddingFor(pos, layout.alignment);
    if (pad > 0 && chunk.padding.size() == pad) {
      std::memcpy(output.data() + pos, chunk.padding.data(), pad);
    }
    pos += pad;
  }

  return output;
}

} // namespace decloc
