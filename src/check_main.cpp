#include "check/asset_check.hpp"
#include "check/check_config.hpp"
#include "cli/cli_parser.hpp"

#include <iostream>

static const char* kUsage =
    "Usage: pngalpha_check [--root <dir>] [--manifest <file>] [--palette-mode table|pixels]\n"
    "                      [--verbose] [asset.png ...]\n";

int main(int argc, char** argv) {
    try {
        pngalpha::CliParser cli({"verbose", "help"});
        cli.parse(argc, argv);
        if (cli.has("help")) {
            std::cout << kUsage;
            return 0;
        }

        const pngalpha::CheckConfig cfg = pngalpha::resolve_config(cli);
        const auto reports = pngalpha::check_assets(cfg.assets, cfg.options);
        if (cfg.verbose) {
            for (const auto& r : reports) std::cout << pngalpha::describe(r) << "\n";
        }
        return pngalpha::print_report(std::cout, reports) ? 0 : 1;
    } catch (const pngalpha::UsageError& e) {
        std::cerr << e.what() << "\n" << kUsage;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
