#include <gtest/gtest.h>

#include "filter/scanline.hpp"
#include "format/errors.hpp"
#include "support/png_builder.hpp"

#include <algorithm>
#include <vector>

using namespace pngalpha;
using pngalpha::test::filter_scanlines;
using pngalpha::test::pattern_bytes;

TEST(PaethTest, AllEqualPicksA) {
    EXPECT_EQ(paeth_predictor(5, 5, 5), 5);
}

TEST(PaethTest, NearestNeighborWins) {
    // p = 15: pa = 5, pb = 10, pc = 15
    EXPECT_EQ(paeth_predictor(10, 5, 0), 10);
    // p = 5: pa = 2, pb = 2, pc = 0
    EXPECT_EQ(paeth_predictor(3, 7, 5), 5);
}

TEST(PaethTest, TieBreaksFavorAThenB) {
    // p = 7: pa = 3, pb = 6, pc = 3 -> a over c
    EXPECT_EQ(paeth_predictor(4, 13, 10), 4);
    // p = 7: pa = 6, pb = 3, pc = 3 -> b over c
    EXPECT_EQ(paeth_predictor(13, 4, 10), 4);
    // p = 7: pa = 4, pb = 4, pc = 8 -> a over b
    EXPECT_EQ(paeth_predictor(7, 7, 3), 7);
    EXPECT_EQ(paeth_predictor(0, 0, 0), 0);
    // p = 0: pa = 255, pb = 0, pc = 255
    EXPECT_EQ(paeth_predictor(255, 0, 255), 0);
}

TEST(FilterTypeTest, MapsKnownBytes) {
    EXPECT_EQ(filter_type_from_byte(0), FilterType::None);
    EXPECT_EQ(filter_type_from_byte(1), FilterType::Sub);
    EXPECT_EQ(filter_type_from_byte(2), FilterType::Up);
    EXPECT_EQ(filter_type_from_byte(3), FilterType::Average);
    EXPECT_EQ(filter_type_from_byte(4), FilterType::Paeth);
}

TEST(FilterTypeTest, RejectsUnknownBytes) {
    EXPECT_THROW(filter_type_from_byte(5), UnsupportedFeatureError);
    EXPECT_THROW(filter_type_from_byte(255), UnsupportedFeatureError);
}

TEST(UnfilterRowTest, SubTreatsFirstPixelLeftAsZero) {
    std::vector<uint8_t> row = {1, 2, 3, 4, 5, 6, 7, 8};
    unfilter_row(FilterType::Sub, row.data(), nullptr, row.size(), 4);
    EXPECT_EQ(row, (std::vector<uint8_t>{1, 2, 3, 4, 6, 8, 10, 12}));
}

TEST(UnfilterRowTest, SubWrapsModulo256) {
    std::vector<uint8_t> row = {200, 100};
    unfilter_row(FilterType::Sub, row.data(), nullptr, row.size(), 1);
    EXPECT_EQ(row, (std::vector<uint8_t>{200, 44}));
}

TEST(UnfilterRowTest, FirstRowUpIsUnchanged) {
    std::vector<uint8_t> row = {10, 20, 30};
    unfilter_row(FilterType::Up, row.data(), nullptr, row.size(), 1);
    EXPECT_EQ(row, (std::vector<uint8_t>{10, 20, 30}));
}

TEST(UnfilterRowTest, FirstRowAverageUsesHalfOfLeft) {
    std::vector<uint8_t> row = {10, 20, 30};
    unfilter_row(FilterType::Average, row.data(), nullptr, row.size(), 1);
    // 10; 20 + 10/2 = 25; 30 + 25/2 = 42
    EXPECT_EQ(row, (std::vector<uint8_t>{10, 25, 42}));
}

TEST(UnfilterRowTest, FirstRowPaethDegradesToSub) {
    std::vector<uint8_t> row = {10, 20, 30};
    unfilter_row(FilterType::Paeth, row.data(), nullptr, row.size(), 1);
    EXPECT_EQ(row, (std::vector<uint8_t>{10, 30, 60}));
}

TEST(UnfilterRowTest, UpAddsPreviousRow) {
    const std::vector<uint8_t> prev = {250, 1, 2};
    std::vector<uint8_t> row = {10, 20, 30};
    unfilter_row(FilterType::Up, row.data(), prev.data(), row.size(), 1);
    EXPECT_EQ(row, (std::vector<uint8_t>{4, 21, 32}));
}

TEST(UnfilterRowTest, AverageFloorsSumOfLeftAndUp) {
    const std::vector<uint8_t> prev = {3, 255};
    std::vector<uint8_t> row = {0, 0};
    unfilter_row(FilterType::Average, row.data(), prev.data(), row.size(), 1);
    // x0: (0 + 3) / 2 = 1; x1: (1 + 255) / 2 = 128
    EXPECT_EQ(row, (std::vector<uint8_t>{1, 128}));
}

TEST(UnfilterRowTest, PaethUsesUpLeftOnlyPastFirstPixel) {
    const std::vector<uint8_t> prev = {10, 20};
    std::vector<uint8_t> row = {0, 0};
    unfilter_row(FilterType::Paeth, row.data(), prev.data(), row.size(), 1);
    // x0: paeth(0, 10, 0) = 10; x1: paeth(10, 20, 10) = 20
    EXPECT_EQ(row, (std::vector<uint8_t>{10, 20}));
}

TEST(LayoutTest, ComputesRowAndStreamSizes) {
    const ScanlineLayout l = make_layout(3, 2, 4);
    EXPECT_EQ(l.row_length, 12u);
    EXPECT_EQ(l.filtered_size, 26u);
    EXPECT_EQ(l.raster_size, 24u);
}

TEST(LayoutTest, RejectsEmptyGeometry) {
    EXPECT_THROW(make_layout(0, 1, 4), StructuralError);
    EXPECT_THROW(make_layout(1, 0, 4), StructuralError);
}

TEST(LayoutTest, RejectsOverflowingGeometry) {
    if (sizeof(size_t) == 8) {
        EXPECT_THROW(make_layout(0xFFFFFFFFu, 0xFFFFFFFFu, 4), StructuralError);
    } else {
        EXPECT_THROW(make_layout(0xFFFFFFFFu, 2, 4), StructuralError);
    }
}

TEST(ReconstructTest, NoneFilterIsIdentity) {
    const uint32_t w = 4, h = 3;
    const size_t bpp = 4;
    const auto raster = pattern_bytes(w * h * bpp, 1);
    const auto filtered = filter_scanlines(raster, w, h, bpp, {FilterType::None});

    const auto out = reconstruct_scanlines(filtered, make_layout(w, h, bpp));
    EXPECT_EQ(out, raster);
    for (uint32_t y = 0; y < h; ++y) {
        const size_t row_len = w * bpp;
        EXPECT_EQ(filtered[y * (row_len + 1)], 0);
        EXPECT_TRUE(std::equal(out.begin() + y * row_len, out.begin() + (y + 1) * row_len,
                               filtered.begin() + y * (row_len + 1) + 1));
    }
}

class SingleFilterRoundTrip : public ::testing::TestWithParam<FilterType> {};

TEST_P(SingleFilterRoundTrip, ReproducesRaster) {
    for (size_t bpp : {1u, 2u, 3u, 4u}) {
        const uint32_t w = 7, h = 5;
        const auto raster = pattern_bytes(w * h * bpp, static_cast<uint32_t>(bpp) * 31u);
        const auto filtered = filter_scanlines(raster, w, h, bpp, {GetParam()});
        EXPECT_EQ(reconstruct_scanlines(filtered, make_layout(w, h, bpp)), raster) << "bpp=" << bpp;
    }
}

INSTANTIATE_TEST_SUITE_P(AllFilters,
                         SingleFilterRoundTrip,
                         ::testing::Values(FilterType::None,
                                           FilterType::Sub,
                                           FilterType::Up,
                                           FilterType::Average,
                                           FilterType::Paeth));

TEST(ReconstructTest, MixedFiltersAcrossRows) {
    const uint32_t w = 9, h = 10;
    const size_t bpp = 4;
    const auto raster = pattern_bytes(w * h * bpp, 99);
    const std::vector<FilterType> order = {FilterType::Paeth, FilterType::Sub, FilterType::Average,
                                           FilterType::None, FilterType::Up, FilterType::Paeth,
                                           FilterType::Average};
    const auto filtered = filter_scanlines(raster, w, h, bpp, order);
    EXPECT_EQ(reconstruct_scanlines(filtered, make_layout(w, h, bpp)), raster);
}

TEST(ReconstructTest, OneByteShortIsStructural) {
    const auto layout = make_layout(2, 2, 4);
    std::vector<uint8_t> filtered(layout.filtered_size - 1, 0);
    try {
        reconstruct_scanlines(filtered, layout);
        FAIL() << "expected StructuralError";
    } catch (const PngError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Structural);
    }
}

TEST(ReconstructTest, OneByteLongIsStructural) {
    const auto layout = make_layout(2, 2, 4);
    std::vector<uint8_t> filtered(layout.filtered_size + 1, 0);
    EXPECT_THROW(reconstruct_scanlines(filtered, layout), StructuralError);
}

TEST(ReconstructTest, UnknownFilterOnLaterRowHalts) {
    const auto layout = make_layout(2, 3, 1);
    std::vector<uint8_t> filtered(layout.filtered_size, 0);
    filtered[3] = 5; // row 1 filter byte
    EXPECT_THROW(reconstruct_scanlines(filtered, layout), UnsupportedFeatureError);
}

TEST(CursorTest, AdvancesOneRowAtATime) {
    const uint32_t w = 3, h = 2;
    const size_t bpp = 1;
    const std::vector<uint8_t> raster = {1, 2, 3, 4, 5, 6};
    const auto filtered = filter_scanlines(raster, w, h, bpp, {FilterType::Sub, FilterType::Up});
    const auto layout = make_layout(w, h, bpp);

    std::vector<uint8_t> out(layout.raster_size);
    ScanlineCursor cursor;
    reconstruct_next_row(filtered, layout, cursor, out);
    EXPECT_EQ(cursor.row, 1u);
    EXPECT_EQ(cursor.offset, 4u);
    EXPECT_FALSE(cursor.done(layout));

    reconstruct_next_row(filtered, layout, cursor, out);
    EXPECT_EQ(cursor.row, 2u);
    EXPECT_EQ(cursor.offset, 8u);
    EXPECT_TRUE(cursor.done(layout));
    EXPECT_EQ(out, raster);

    EXPECT_THROW(reconstruct_next_row(filtered, layout, cursor, out), StructuralError);
}

TEST(CursorTest, RowPastEndOfStreamIsTruncation) {
    const auto layout = make_layout(4, 2, 1);
    const std::vector<uint8_t> filtered(7, 0); // second row missing
    std::vector<uint8_t> out(layout.raster_size);
    ScanlineCursor cursor;
    reconstruct_next_row(filtered, layout, cursor, out);
    EXPECT_THROW(reconstruct_next_row(filtered, layout, cursor, out), TruncationError);
}

TEST(CursorTest, IndependentCursorsDoNotInterfere) {
    const auto raster = pattern_bytes(5 * 4 * 3, 17);
    const auto filtered = filter_scanlines(raster, 5, 4, 3, {FilterType::Paeth});
    const auto layout = make_layout(5, 4, 3);

    std::vector<uint8_t> a(layout.raster_size), b(layout.raster_size);
    ScanlineCursor ca, cb;
    while (!ca.done(layout)) {
        reconstruct_next_row(filtered, layout, ca, a);
        if (!cb.done(layout)) reconstruct_next_row(filtered, layout, cb, b);
    }
    EXPECT_EQ(a, raster);
    EXPECT_EQ(b, raster);
}
