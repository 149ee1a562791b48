#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "alpha/transparency.hpp"
#include "format/png_format.hpp"

namespace pngalpha {

struct DecodedPng {
    PngHeader header;
    std::vector<uint8_t> raster;                       // height * width * bpp
    std::optional<std::vector<uint8_t>> transparency;  // tRNS payload, if present
    size_t chunk_count = 0;
    std::optional<size_t> terminal_offset;             // IEND offset
};

// Decode PNG bytes to an unfiltered 8-bit raster. Throws PngError subclasses.
DecodedPng decode_png(const std::vector<uint8_t>& bytes);

// Does the image contain at least one non-opaque pixel?
// Color types without alpha return false once IHDR is validated; their image
// data is not inflated.
bool png_has_transparency(const std::vector<uint8_t>& bytes,
                          PalettePolicy policy = PalettePolicy::AnyTableEntry);

} // namespace pngalpha
