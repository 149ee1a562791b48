#pragma once

#include "container/chunk_reader.hpp"
#include "format/png_format.hpp"

namespace pngalpha {

// Decode IHDR from chunk 0.
// StructuralError: chunk 0 missing / not IHDR / wrong size, or zero width/height.
// UnsupportedFeatureError: bit depth other than 8, unknown color type.
PngHeader parse_header(const ChunkList& list);

// Same checks on a bare IHDR payload.
PngHeader parse_ihdr_payload(const std::vector<uint8_t>& payload);

} // namespace pngalpha
