#include "filter/scanline.hpp"

#include "format/errors.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string>

namespace pngalpha {

FilterType filter_type_from_byte(uint8_t v) {
    switch (v) {
    case 0: return FilterType::None;
    case 1: return FilterType::Sub;
    case 2: return FilterType::Up;
    case 3: return FilterType::Average;
    case 4: return FilterType::Paeth;
    default:
        throw UnsupportedFeatureError("unknown PNG filter type: " + std::to_string(v));
    }
}

uint8_t paeth_predictor(uint8_t a, uint8_t b, uint8_t c) {
    const int p = static_cast<int>(a) + static_cast<int>(b) - static_cast<int>(c);
    const int pa = std::abs(p - static_cast<int>(a));
    const int pb = std::abs(p - static_cast<int>(b));
    const int pc = std::abs(p - static_cast<int>(c));
    if (pa <= pb && pa <= pc) return a;
    if (pb <= pc) return b;
    return c;
}

void unfilter_row(FilterType type,
                  uint8_t* row,
                  const uint8_t* prev,
                  size_t row_length,
                  size_t bpp) {
    // Sub/Average/Paeth read row[x - bpp], which is already reconstructed
    switch (type) {
    case FilterType::None:
        break;
    case FilterType::Sub:
        for (size_t x = bpp; x < row_length; ++x) {
            row[x] = static_cast<uint8_t>(row[x] + row[x - bpp]);
        }
        break;
    case FilterType::Up:
        if (!prev) break;
        for (size_t x = 0; x < row_length; ++x) {
            row[x] = static_cast<uint8_t>(row[x] + prev[x]);
        }
        break;
    case FilterType::Average:
        for (size_t x = 0; x < row_length; ++x) {
            const unsigned left = (x >= bpp) ? row[x - bpp] : 0u;
            const unsigned up = prev ? prev[x] : 0u;
            row[x] = static_cast<uint8_t>(row[x] + ((left + up) >> 1));
        }
        break;
    case FilterType::Paeth:
        for (size_t x = 0; x < row_length; ++x) {
            const uint8_t left = (x >= bpp) ? row[x - bpp] : 0;
            const uint8_t up = prev ? prev[x] : 0;
            const uint8_t up_left = (prev && x >= bpp) ? prev[x - bpp] : 0;
            row[x] = static_cast<uint8_t>(row[x] + paeth_predictor(left, up, up_left));
        }
        break;
    }
}

ScanlineLayout make_layout(uint32_t width, uint32_t height, size_t bpp) {
    if (width == 0 || height == 0 || bpp == 0) {
        throw StructuralError("make_layout: empty image geometry");
    }
    constexpr size_t kMax = std::numeric_limits<size_t>::max();
    if (static_cast<size_t>(width) > kMax / bpp) {
        throw StructuralError("image row too large (width " + std::to_string(width) + ")");
    }
    ScanlineLayout l;
    l.width = width;
    l.height = height;
    l.bpp = bpp;
    l.row_length = static_cast<size_t>(width) * bpp;
    if (l.row_length == kMax || static_cast<size_t>(height) > kMax / (l.row_length + 1)) {
        throw StructuralError("image too large (" + std::to_string(width) + "x" + std::to_string(height) + ")");
    }
    l.filtered_size = static_cast<size_t>(height) * (l.row_length + 1);
    l.raster_size = static_cast<size_t>(height) * l.row_length;
    return l;
}

void reconstruct_next_row(const std::vector<uint8_t>& filtered,
                          const ScanlineLayout& layout,
                          ScanlineCursor& cursor,
                          std::vector<uint8_t>& raster) {
    if (cursor.done(layout)) {
        throw StructuralError("reconstruct_next_row: all rows already reconstructed");
    }
    if (raster.size() != layout.raster_size) {
        throw StructuralError("reconstruct_next_row: raster buffer size mismatch");
    }
    if (cursor.offset > filtered.size() || filtered.size() - cursor.offset < layout.row_length + 1) {
        throw TruncationError("scanline " + std::to_string(cursor.row) + " truncated at offset " +
                              std::to_string(cursor.offset));
    }

    const size_t y = cursor.row;
    const FilterType type = filter_type_from_byte(filtered[cursor.offset]);
    uint8_t* row = raster.data() + y * layout.row_length;
    const uint8_t* prev = (y > 0) ? row - layout.row_length : nullptr;

    std::copy(filtered.begin() + static_cast<std::ptrdiff_t>(cursor.offset + 1),
              filtered.begin() + static_cast<std::ptrdiff_t>(cursor.offset + 1 + layout.row_length),
              row);
    unfilter_row(type, row, prev, layout.row_length, layout.bpp);

    cursor.offset += layout.row_length + 1;
    ++cursor.row;
}

std::vector<uint8_t> reconstruct_scanlines(const std::vector<uint8_t>& filtered,
                                           const ScanlineLayout& layout) {
    if (filtered.size() != layout.filtered_size) {
        throw StructuralError("decompressed size mismatch: expected " + std::to_string(layout.filtered_size) +
                              " bytes, got " + std::to_string(filtered.size()));
    }
    std::vector<uint8_t> raster(layout.raster_size);
    ScanlineCursor cursor;
    while (!cursor.done(layout)) {
        reconstruct_next_row(filtered, layout, cursor, raster);
    }
#ifndef NDEBUG
    std::fprintf(stderr, "reconstructed %u rows x %zu bytes\n", layout.height, layout.row_length);
#endif
    return raster;
}

#ifndef NDEBUG
namespace {
// Self-test: predictor tie-breaks.
struct PaethSelfTest {
    PaethSelfTest() {
        if (paeth_predictor(5, 5, 5) != 5 ||
            paeth_predictor(10, 5, 0) != 10 ||
            paeth_predictor(13, 4, 10) != 4 ||
            paeth_predictor(3, 7, 5) != 5) {
            throw std::runtime_error("paeth self-test: unexpected prediction");
        }
    }
};
static PaethSelfTest _paeth_self_test{};
} // namespace
#endif

} // namespace pngalpha
