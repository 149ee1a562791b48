#include "check/asset_check.hpp"

#include "codec/decoder.hpp"
#include "io/file_io.hpp"

#include <filesystem>
#include <ostream>
#include <system_error>

namespace fs = std::filesystem;

namespace pngalpha {

namespace {

static fs::path resolve(const std::string& path, const std::string& root) {
    fs::path p(path);
    if (root.empty() || p.is_absolute()) return p;
    return fs::path(root) / p;
}

} // namespace

const std::vector<std::string>& default_asset_paths() {
    static const std::vector<std::string> kPaths = {
        "src-tauri/icons/32x32.png",
        "src-tauri/icons/128x128.png",
        "src-tauri/icons/128x128@2x.png",
        "src-tauri/icons/logo.png",
    };
    return kPaths;
}

AssetReport check_asset(const std::string& path, const CheckOptions& opt) {
    AssetReport rep;
    rep.path = path;

    const fs::path full = resolve(path, opt.root);
    std::error_code ec;
    if (!fs::exists(full, ec)) {
        rep.status = AssetStatus::Missing;
        if (ec) rep.message = ec.message();
        return rep;
    }

    try {
        const std::vector<uint8_t> bytes = read_all(full.string());
        rep.status = png_has_transparency(bytes, opt.palette_policy) ? AssetStatus::Transparent
                                                                      : AssetStatus::Opaque;
    } catch (const PngError& e) {
        rep.status = AssetStatus::Failed;
        rep.error_kind = e.kind();
        rep.message = e.what();
    } catch (const std::exception& e) {
        rep.status = AssetStatus::Failed;
        rep.message = e.what();
    }
    return rep;
}

std::vector<AssetReport> check_assets(const std::vector<std::string>& paths, const CheckOptions& opt) {
    std::vector<AssetReport> out;
    out.reserve(paths.size());
    for (const auto& p : paths) {
        out.push_back(check_asset(p, opt));
    }
    return out;
}

std::string describe(const AssetReport& report) {
    switch (report.status) {
    case AssetStatus::Transparent:
        return report.path + ": transparent";
    case AssetStatus::Opaque:
        return report.path + ": opaque";
    case AssetStatus::Missing:
        return report.path + ": missing";
    case AssetStatus::Failed:
        if (report.error_kind) {
            return report.path + ": error (" + error_kind_name(*report.error_kind) + ") " + report.message;
        }
        return report.path + ": error " + report.message;
    }
    return report.path;
}

bool print_report(std::ostream& os, const std::vector<AssetReport>& reports) {
    std::vector<std::string> failures;
    for (const auto& r : reports) {
        switch (r.status) {
        case AssetStatus::Transparent:
            break;
        case AssetStatus::Opaque:
            failures.push_back("No transparent pixels found in " + r.path);
            break;
        case AssetStatus::Missing:
            failures.push_back("Missing asset file: " + r.path);
            break;
        case AssetStatus::Failed:
            failures.push_back("Failed to validate " + r.path + ": " + r.message);
            break;
        }
    }

    if (!failures.empty()) {
        os << "Transparency check failed:\n";
        for (const auto& f : failures) os << "- " << f << "\n";
        return false;
    }
    os << "Transparency check passed for " << reports.size() << " required PNGs.\n";
    return true;
}

} // namespace pngalpha
