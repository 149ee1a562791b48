#include "stream/reassembler.hpp"

#include "format/png_format.hpp"
#include "stream/inflate.hpp"

#include <limits>

namespace pngalpha {

std::vector<uint8_t> concat_idat(const ChunkList& list) {
    size_t total = 0;
    for (const auto& c : list.chunks) {
        if (c.type == kChunkIDAT) total += c.data.size();
    }
    std::vector<uint8_t> out;
    out.reserve(total);
    for (const auto& c : list.chunks) {
        if (c.type == kChunkIDAT) out.insert(out.end(), c.data.begin(), c.data.end());
    }
    return out;
}

std::vector<uint8_t> reassemble_stream(const ChunkList& list, size_t expected_size) {
    const std::vector<uint8_t> compressed = concat_idat(list);
    const size_t cap = (expected_size == std::numeric_limits<size_t>::max()) ? expected_size : expected_size + 1;
    return inflate_zlib(compressed, cap);
}

} // namespace pngalpha
