#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "container/chunk_reader.hpp"

namespace pngalpha {

// Concatenate every IDAT payload in file order.
std::vector<uint8_t> concat_idat(const ChunkList& list);

// Concatenate IDAT payloads and inflate them.
// Inflation is capped at expected_size + 1 bytes so an oversized stream still
// shows up as a size mismatch without being decoded in full.
std::vector<uint8_t> reassemble_stream(const ChunkList& list, size_t expected_size);

} // namespace pngalpha
