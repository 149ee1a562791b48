#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "alpha/transparency.hpp"
#include "check/asset_check.hpp"

namespace pngalpha {

class CliParser;

// Bad command line. The tool prints usage and exits 1.
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& msg) : std::runtime_error(msg) {}
};

struct CheckConfig {
    CheckOptions options;
    std::vector<std::string> assets;
    bool verbose = false;
};

// "table" or "pixels". Throws UsageError otherwise.
PalettePolicy parse_palette_mode(const std::string& mode);

// Asset list precedence: positional paths, then --manifest, then the default
// icon set. An explicit manifest that lists nothing is a UsageError; an
// unreadable one throws std::runtime_error from load_manifest.
std::vector<std::string> resolve_asset_list(const CliParser& cli);

CheckConfig resolve_config(const CliParser& cli);

} // namespace pngalpha
