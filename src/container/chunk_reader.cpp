#include "container/chunk_reader.hpp"

#include "container/byte_reader.hpp"
#include "format/errors.hpp"
#include "format/png_format.hpp"

#include <algorithm>
#include <utility>

namespace pngalpha {

bool has_png_signature(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < kPngSignature.size()) return false;
    return std::equal(kPngSignature.begin(), kPngSignature.end(), bytes.begin());
}

ChunkList read_chunks(const std::vector<uint8_t>& bytes) {
    if (!has_png_signature(bytes)) {
        throw FormatIdentityError("not a PNG file (signature mismatch)");
    }

    ByteReader r(bytes.data(), bytes.size());
    r.skip(kPngSignature.size());

    ChunkList out;
    while (!r.eof()) {
        const size_t chunk_start = r.position();
        if (r.remaining() < kChunkHeaderBytes) {
            throw TruncationError("truncated chunk header at offset " + std::to_string(chunk_start));
        }
        const uint32_t length = r.read_u32_be();
        std::string type = r.read_tag();

        // length + crc compared against what is left, so a huge length cannot wrap
        if (static_cast<uint64_t>(length) + kChunkCrcBytes > r.remaining()) {
            throw TruncationError("truncated chunk '" + type + "' at offset " + std::to_string(chunk_start) +
                                  " (declares " + std::to_string(length) + " bytes, " +
                                  std::to_string(r.remaining()) + " remain)");
        }

        Chunk c;
        c.offset = chunk_start;
        c.type = std::move(type);
        c.data.assign(r.current(), r.current() + length);
        r.skip(length);
        r.skip(kChunkCrcBytes); // CRC is not verified

        const bool terminal = (c.type == kChunkIEND);
        out.chunks.push_back(std::move(c));
        if (terminal) {
            out.terminal_offset = chunk_start;
            break;
        }
    }
    return out;
}

const Chunk* find_last_chunk(const ChunkList& list, const char* type) {
    for (auto it = list.chunks.rbegin(); it != list.chunks.rend(); ++it) {
        if (it->type == type) return &*it;
    }
    return nullptr;
}

} // namespace pngalpha
