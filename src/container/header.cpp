#include "container/header.hpp"

#include "container/byte_reader.hpp"
#include "format/errors.hpp"

#include <string>

namespace pngalpha {

namespace {

static ColorType color_type_from_byte(uint8_t v) {
    switch (v) {
    case 0: return ColorType::Grayscale;
    case 2: return ColorType::Truecolor;
    case 3: return ColorType::Indexed;
    case 4: return ColorType::GrayscaleAlpha;
    case 6: return ColorType::TruecolorAlpha;
    default:
        throw UnsupportedFeatureError("unsupported color type: " + std::to_string(v));
    }
}

} // namespace

PngHeader parse_ihdr_payload(const std::vector<uint8_t>& payload) {
    if (payload.size() != kIhdrBytes) {
        throw StructuralError("missing IHDR header (IHDR is " + std::to_string(payload.size()) +
                              " bytes, expected " + std::to_string(kIhdrBytes) + ")");
    }

    ByteReader r(payload.data(), payload.size());
    PngHeader hdr{};
    hdr.width = r.read_u32_be();
    hdr.height = r.read_u32_be();
    hdr.bit_depth = r.read_u8();
    const uint8_t color_byte = r.read_u8();
    // compression, filter method, interlace: ignored

    if (hdr.width == 0 || hdr.height == 0) {
        throw StructuralError("invalid image size " + std::to_string(hdr.width) + "x" + std::to_string(hdr.height));
    }
    if (hdr.bit_depth != kSupportedBitDepth) {
        throw UnsupportedFeatureError("unsupported bit depth: " + std::to_string(hdr.bit_depth));
    }
    hdr.color_type = color_type_from_byte(color_byte);
    return hdr;
}

PngHeader parse_header(const ChunkList& list) {
    if (list.chunks.empty() || list.chunks.front().type != kChunkIHDR) {
        throw StructuralError("missing IHDR header");
    }
    return parse_ihdr_payload(list.chunks.front().data);
}

} // namespace pngalpha
