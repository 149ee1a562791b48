#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "alpha/transparency.hpp"
#include "format/errors.hpp"

namespace pngalpha {

enum class AssetStatus {
    Transparent,  // decoded, has at least one non-opaque pixel
    Opaque,       // decoded, fully opaque
    Missing,      // file does not exist
    Failed,       // read or decode error
};

struct AssetReport {
    std::string path;
    AssetStatus status = AssetStatus::Failed;
    std::optional<ErrorKind> error_kind;  // set for decode errors only
    std::string message;                  // error text for Failed

    bool passed() const { return status == AssetStatus::Transparent; }
};

struct CheckOptions {
    std::string root;  // base for relative paths; empty = current directory
    PalettePolicy palette_policy = PalettePolicy::AnyTableEntry;
};

// The icon set the check guards by default.
const std::vector<std::string>& default_asset_paths();

// Check one asset. Never throws for per-asset problems.
AssetReport check_asset(const std::string& path, const CheckOptions& opt);

// Check every asset independently; one failure does not stop the others.
std::vector<AssetReport> check_assets(const std::vector<std::string>& paths, const CheckOptions& opt);

// Print the summary. Returns true iff every asset passed.
bool print_report(std::ostream& os, const std::vector<AssetReport>& reports);

// One-line description of a single report, used by --verbose.
std::string describe(const AssetReport& report);

} // namespace pngalpha
