#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace pngalpha {

// Small CLI parser:
//   --key value
//   --key=value
//   --flag        (listed in `flags`, never consumes a value; stored as "true")
//   anything else is positional
// A non-flag key with no value following it is stored as "true" and
// reported by missing_value().
class CliParser {
public:
    explicit CliParser(std::unordered_set<std::string> flags = {}) : flags_(std::move(flags)) {}

    void parse(int argc, char** argv);
    bool has(const std::string& key) const;
    bool missing_value(const std::string& key) const { return missing_.count(key) != 0; }
    std::string get(const std::string& key, const std::string& def = "") const;
    const std::vector<std::string>& positional() const { return positional_; }
private:
    std::unordered_set<std::string> flags_;
    std::unordered_map<std::string, std::string> kv_;
    std::vector<std::string> positional_;
    std::unordered_set<std::string> missing_;
};

} // namespace pngalpha
