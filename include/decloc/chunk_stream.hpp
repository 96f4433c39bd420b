#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "types.hpp"

namespace decloc {

// Split a container into its ordered chunk list.
// Every byte must be consumed exactly once: a missing header, a length that
// runs past the buffer or trailing bytes that do not form a chunk fail with
// ErrorKind::MalformedContainer.
std::optional<std::vector<Chunk>> parseChunks(std::span<const uint8_t> data,
                                              const ContainerLayout &layout,
                                              Error *outError = nullptr);

// Reassemble a container from chunks. Declared lengths are recomputed from the
// payloads; padding is regenerated for the layout's alignment. Identical chunk
// sequences always produce identical bytes.
std::optional<std::vector<uint8_t>> serializeChunks(std::span<const Chunk> chunks,
                                                    const ContainerLayout &layout,
                                                    Error *outError = nullptr);

// Number of bytes serializeChunks() produces for these chunks
size_t serializedSize(std::span<const Chunk> chunks, const ContainerLayout &layout);

// Padding needed after a chunk ending at offset
size_t paddingFor(size_t offset, size_t alignment);

} // namespace decloc
