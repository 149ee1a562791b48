#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "format/png_format.hpp"

namespace pngalpha {

// How indexed images are judged.
enum class PalettePolicy {
    AnyTableEntry,  // any tRNS entry < 255, regardless of which indices pixels use
    PixelIndices,   // some pixel's index maps to a tRNS entry < 255
};

// True if the color type can express non-opaque pixels at all.
bool can_carry_transparency(ColorType ct);

// Answer "is any pixel not fully opaque?" for a reconstructed raster.
// raster layout must match header (8-bit, bytes_per_pixel(header.color_type)).
bool evaluate_transparency(const PngHeader& header,
                           const std::vector<uint8_t>& raster,
                           const std::optional<std::vector<uint8_t>>& trns,
                           PalettePolicy policy = PalettePolicy::AnyTableEntry);

} // namespace pngalpha
