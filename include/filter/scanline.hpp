#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace pngalpha {

enum class FilterType : uint8_t {
    None    = 0,
    Sub     = 1,
    Up      = 2,
    Average = 3,
    Paeth   = 4,
};

// Map the leading byte of a filtered row. Throws UnsupportedFeatureError for values > 4.
FilterType filter_type_from_byte(uint8_t v);

// Paeth predictor: a = left, b = up, c = up-left. Ties go to a, then b.
uint8_t paeth_predictor(uint8_t a, uint8_t b, uint8_t c);

// Undo one filter in place, left to right.
// prev == nullptr means the row above is all zero (first row).
// Left / up-left references with x < bpp read as 0.
void unfilter_row(FilterType type,
                  uint8_t* row,
                  const uint8_t* prev,
                  size_t row_length,
                  size_t bpp);

struct ScanlineLayout {
    uint32_t width = 0;
    uint32_t height = 0;
    size_t bpp = 0;         // bytes per pixel
    size_t row_length = 0;  // width * bpp
    size_t filtered_size = 0; // height * (1 + row_length)
    size_t raster_size = 0;   // height * row_length
};

// Throws StructuralError if the sizes do not fit in size_t.
ScanlineLayout make_layout(uint32_t width, uint32_t height, size_t bpp);

// Position in the filtered stream. One instance per reconstruction pass.
struct ScanlineCursor {
    uint32_t row = 0;     // next row to reconstruct
    size_t offset = 0;    // byte offset of that row's filter byte

    bool done(const ScanlineLayout& layout) const { return row >= layout.height; }
};

// Reconstruct the row at cursor.row into raster (sized layout.raster_size) and
// advance the cursor. Rows must be consumed top to bottom.
// Throws TruncationError if the row runs past the end of filtered.
void reconstruct_next_row(const std::vector<uint8_t>& filtered,
                          const ScanlineLayout& layout,
                          ScanlineCursor& cursor,
                          std::vector<uint8_t>& raster);

// Full pass. Throws StructuralError unless filtered.size() == layout.filtered_size.
std::vector<uint8_t> reconstruct_scanlines(const std::vector<uint8_t>& filtered,
                                           const ScanlineLayout& layout);

} // namespace pngalpha
