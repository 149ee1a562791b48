#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace pngalpha {

// PNG file layout:
// [Signature 8 bytes][Chunk][Chunk]...[IEND]
//
// Chunk wire form (all integers big-endian):
// [length u32][type 4 ASCII][data length bytes][crc u32]
inline constexpr std::array<uint8_t, 8> kPngSignature = {
    0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};

inline constexpr size_t kChunkHeaderBytes = 8;  // length + type
inline constexpr size_t kChunkCrcBytes = 4;
inline constexpr size_t kIhdrBytes = 13;        // fixed IHDR payload size

inline constexpr char kChunkIHDR[] = "IHDR";
inline constexpr char kChunkTRNS[] = "tRNS";
inline constexpr char kChunkIDAT[] = "IDAT";
inline constexpr char kChunkIEND[] = "IEND";

// Only 8-bit samples are decoded.
inline constexpr uint8_t kSupportedBitDepth = 8;

enum class ColorType : uint8_t {
    Grayscale      = 0,
    Truecolor      = 2,
    Indexed        = 3,
    GrayscaleAlpha = 4,
    TruecolorAlpha = 6,
};

// IMPORTANT:
// Not a wire layout. IHDR is big-endian and 13 bytes packed, so this struct
// must never be memcpy'd from the payload; parse_ihdr_payload reads it field
// by field. Compression, filter and interlace method are not kept.
struct PngHeader {
    uint32_t  width = 0;
    uint32_t  height = 0;
    uint8_t   bit_depth = 0;
    ColorType color_type = ColorType::Grayscale;
};

// Bytes per pixel at 8-bit depth.
inline size_t bytes_per_pixel(ColorType ct) {
    switch (ct) {
    case ColorType::Grayscale:      return 1;
    case ColorType::Truecolor:      return 3;
    case ColorType::Indexed:        return 1;
    case ColorType::GrayscaleAlpha: return 2;
    case ColorType::TruecolorAlpha: return 4;
    }
    return 0;
}

const char* color_type_name(ColorType ct);

} // namespace pngalpha
