#include "codec/decoder.hpp"

#include "container/chunk_reader.hpp"
#include "container/header.hpp"
#include "filter/scanline.hpp"
#include "stream/reassembler.hpp"

#include <cstdio>

namespace pngalpha {

namespace {

static std::optional<std::vector<uint8_t>> transparency_table(const ChunkList& list) {
    const Chunk* trns = find_last_chunk(list, kChunkTRNS);
    if (!trns) return std::nullopt;
    return trns->data;
}

} // namespace

DecodedPng decode_png(const std::vector<uint8_t>& bytes) {
    const ChunkList chunks = read_chunks(bytes);
    const PngHeader hdr = parse_header(chunks);
#ifndef NDEBUG
    std::fprintf(stderr, "IHDR %ux%u depth=%u color=%s chunks=%zu\n",
                 hdr.width, hdr.height, static_cast<unsigned>(hdr.bit_depth),
                 color_type_name(hdr.color_type), chunks.chunks.size());
#endif

    const ScanlineLayout layout = make_layout(hdr.width, hdr.height, bytes_per_pixel(hdr.color_type));
    const std::vector<uint8_t> filtered = reassemble_stream(chunks, layout.filtered_size);

    DecodedPng out;
    out.header = hdr;
    out.raster = reconstruct_scanlines(filtered, layout);
    out.transparency = transparency_table(chunks);
    out.chunk_count = chunks.chunks.size();
    out.terminal_offset = chunks.terminal_offset;
    return out;
}

bool png_has_transparency(const std::vector<uint8_t>& bytes, PalettePolicy policy) {
    const ChunkList chunks = read_chunks(bytes);
    const PngHeader hdr = parse_header(chunks);
    if (!can_carry_transparency(hdr.color_type)) {
        return false;
    }

    const ScanlineLayout layout = make_layout(hdr.width, hdr.height, bytes_per_pixel(hdr.color_type));
    const std::vector<uint8_t> filtered = reassemble_stream(chunks, layout.filtered_size);
    const std::vector<uint8_t> raster = reconstruct_scanlines(filtered, layout);
    return evaluate_transparency(hdr, raster, transparency_table(chunks), policy);
}

} // namespace pngalpha
