#include "alpha/transparency.hpp"

#include <algorithm>

namespace pngalpha {

namespace {

constexpr uint8_t kOpaque = 255;

static bool any_alpha_below_opaque(const std::vector<uint8_t>& raster) {
    // RGBA: alpha is every 4th byte starting at offset 3
    for (size_t i = 3; i < raster.size(); i += 4) {
        if (raster[i] < kOpaque) return true;
    }
    return false;
}

static bool any_table_entry_below_opaque(const std::vector<uint8_t>& trns) {
    return std::any_of(trns.begin(), trns.end(), [](uint8_t a) { return a < kOpaque; });
}

static bool any_pixel_index_translucent(const std::vector<uint8_t>& raster,
                                        const std::vector<uint8_t>& trns) {
    // Indices past the end of the table are opaque.
    for (uint8_t idx : raster) {
        if (idx < trns.size() && trns[idx] < kOpaque) return true;
    }
    return false;
}

} // namespace

bool can_carry_transparency(ColorType ct) {
    switch (ct) {
    case ColorType::TruecolorAlpha:
    case ColorType::Indexed:
        return true;
    case ColorType::Grayscale:
    case ColorType::Truecolor:
    case ColorType::GrayscaleAlpha:
        return false;
    }
    return false;
}

bool evaluate_transparency(const PngHeader& header,
                           const std::vector<uint8_t>& raster,
                           const std::optional<std::vector<uint8_t>>& trns,
                           PalettePolicy policy) {
    switch (header.color_type) {
    case ColorType::TruecolorAlpha:
        return any_alpha_below_opaque(raster);
    case ColorType::Indexed:
        if (!trns) return false; // no tRNS: palette is fully opaque
        if (policy == PalettePolicy::PixelIndices) return any_pixel_index_translucent(raster, *trns);
        return any_table_entry_below_opaque(*trns);
    case ColorType::Grayscale:
    case ColorType::Truecolor:
    case ColorType::GrayscaleAlpha:
        return false;
    }
    return false;
}

} // namespace pngalpha
