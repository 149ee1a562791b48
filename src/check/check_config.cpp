#include "check/check_config.hpp"

#include "cli/cli_parser.hpp"
#include "io/file_io.hpp"

namespace pngalpha {

namespace {

static void require_value(const CliParser& cli, const std::string& key) {
    if (cli.missing_value(key)) throw UsageError("--" + key + " requires a value");
}

} // namespace

PalettePolicy parse_palette_mode(const std::string& mode) {
    if (mode == "table") return PalettePolicy::AnyTableEntry;
    if (mode == "pixels") return PalettePolicy::PixelIndices;
    throw UsageError("Invalid --palette-mode: " + mode);
}

std::vector<std::string> resolve_asset_list(const CliParser& cli) {
    if (!cli.positional().empty()) return cli.positional();
    if (!cli.has("manifest")) return default_asset_paths();

    require_value(cli, "manifest");
    const std::string manifest = cli.get("manifest");
    std::vector<std::string> assets = load_manifest(manifest);
    if (assets.empty()) throw UsageError("No assets to check in " + manifest);
    return assets;
}

CheckConfig resolve_config(const CliParser& cli) {
    require_value(cli, "root");
    require_value(cli, "palette-mode");

    CheckConfig cfg;
    cfg.options.root = cli.get("root");
    cfg.options.palette_policy = parse_palette_mode(cli.get("palette-mode", "table"));
    cfg.assets = resolve_asset_list(cli);
    cfg.verbose = cli.has("verbose");
    return cfg;
}

} // namespace pngalpha
