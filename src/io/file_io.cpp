#include "io/file_io.hpp"

#include <cctype>
#include <fstream>
#include <stdexcept>

namespace pngalpha {

namespace {

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

} // namespace

std::vector<uint8_t> read_all(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.good()) throw std::runtime_error("Cannot open file: " + path);
    ifs.seekg(0, std::ios::end);
    const std::streamsize n = ifs.tellg();
    if (n < 0) throw std::runtime_error("Cannot determine size of file: " + path);
    ifs.seekg(0, std::ios::beg);
    std::vector<uint8_t> buf(static_cast<size_t>(n));
    ifs.read(reinterpret_cast<char*>(buf.data()), n);
    if (ifs.gcount() != n) throw std::runtime_error("Short read: " + path);
    return buf;
}

std::vector<std::string> load_manifest(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.good()) throw std::runtime_error("Cannot open manifest: " + path);

    std::vector<std::string> out;
    std::string line;
    while (std::getline(ifs, line)) {
        const std::string entry = trim(line);
        if (entry.empty() || entry[0] == '#') continue;
        out.push_back(entry);
    }
    return out;
}

} // namespace pngalpha
