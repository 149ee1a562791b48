#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace pngalpha {

// Inflate a zlib-wrapped DEFLATE stream.
// Output stops growing once max_output bytes have been produced; whatever the
// stream holds beyond that is not decoded.
// Throws DecompressionError on malformed, truncated or empty input.
std::vector<uint8_t> inflate_zlib(const uint8_t* data,
                                  size_t size,
                                  size_t max_output = std::numeric_limits<size_t>::max());

inline std::vector<uint8_t> inflate_zlib(const std::vector<uint8_t>& in,
                                         size_t max_output = std::numeric_limits<size_t>::max()) {
    return inflate_zlib(in.data(), in.size(), max_output);
}

} // namespace pngalpha
