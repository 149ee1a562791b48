#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pngalpha {

struct Chunk {
    size_t offset = 0;          // position of the length field in the file
    std::string type;           // 4-byte ASCII tag, e.g. "IDAT"
    std::vector<uint8_t> data;  // payload; CRC is not kept
};

struct ChunkList {
    std::vector<Chunk> chunks;                // file order, IEND included
    std::optional<size_t> terminal_offset;    // offset of IEND if one was seen
};

// Check the 8-byte PNG signature.
bool has_png_signature(const std::vector<uint8_t>& bytes);

// Walk the chunk sequence up to and including IEND.
// Throws FormatIdentityError on a bad signature and TruncationError when a
// chunk runs past the end of the buffer. Bytes after IEND are never read.
ChunkList read_chunks(const std::vector<uint8_t>& bytes);

// Last chunk of the given type, or nullptr.
const Chunk* find_last_chunk(const ChunkList& list, const char* type);

} // namespace pngalpha
