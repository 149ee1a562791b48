#include "cli/cli_parser.hpp"

namespace pngalpha {

void CliParser::parse(int argc, char** argv) {
    kv_.clear();
    positional_.clear();
    missing_.clear();
    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i] ? argv[i] : "";
        if (options_done || a.rfind("--", 0) != 0) {
            positional_.push_back(a);
            continue;
        }
        if (a == "--") {
            options_done = true;
            continue;
        }

        std::string key = a.substr(2);
        const auto eq = key.find('=');
        if (eq != std::string::npos) {
            kv_[key.substr(0, eq)] = key.substr(eq + 1);
            missing_.erase(key.substr(0, eq));
            continue;
        }
        std::string val = "true";
        bool got_value = flags_.count(key) != 0;
        if (!got_value && i + 1 < argc) {
            std::string next = argv[i + 1] ? argv[i + 1] : "";
            if (next.rfind("--", 0) != 0) {
                val = next;
                got_value = true;
                ++i;
            }
        }
        kv_[key] = val;
        if (got_value) {
            missing_.erase(key);
        } else {
            missing_.insert(key);
        }
    }
}

bool CliParser::has(const std::string& key) const {
    return kv_.find(key) != kv_.end();
}

std::string CliParser::get(const std::string& key, const std::string& def) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return def;
    return it->second;
}

} // namespace pngalpha
