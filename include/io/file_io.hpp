#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace pngalpha {

// Read a whole file into memory. Throws std::runtime_error on I/O failure.
std::vector<uint8_t> read_all(const std::string& path);

// Asset list: one path per line; blank lines and '#' comments are skipped,
// surrounding whitespace is trimmed.
std::vector<std::string> load_manifest(const std::string& path);

} // namespace pngalpha
