#include "stream/inflate.hpp"

#include "format/errors.hpp"

#include <zlib.h>

#include <algorithm>
#include <string>

namespace pngalpha {

namespace {

constexpr size_t kInflateChunk = 16384;

static std::string zlib_message(const char* where, int rc, const z_stream& zs) {
    std::string msg = std::string(where) + ": ";
    if (zs.msg) return msg + zs.msg;
    switch (rc) {
    case Z_NEED_DICT:     return msg + "preset dictionary required";
    case Z_DATA_ERROR:    return msg + "invalid compressed data";
    case Z_STREAM_ERROR:  return msg + "stream error";
    case Z_MEM_ERROR:     return msg + "out of memory";
    case Z_BUF_ERROR:     return msg + "buffer error";
    case Z_VERSION_ERROR: return msg + "zlib version mismatch";
    default:              return msg + "error " + std::to_string(rc);
    }
}

// Ends the inflate stream on every exit path.
class InflateGuard {
public:
    explicit InflateGuard(z_stream& zs) : zs_(zs) {}
    ~InflateGuard() { inflateEnd(&zs_); }
    InflateGuard(const InflateGuard&) = delete;
    InflateGuard& operator=(const InflateGuard&) = delete;
private:
    z_stream& zs_;
};

} // namespace

std::vector<uint8_t> inflate_zlib(const uint8_t* data, size_t size, size_t max_output) {
    if (size == 0) throw DecompressionError("inflate: compressed stream is empty");

    z_stream zs{};
    int rc = inflateInit(&zs);
    if (rc != Z_OK) throw DecompressionError(zlib_message("inflateInit", rc, zs));
    InflateGuard guard(zs);

    std::vector<uint8_t> out;
    uint8_t buf[kInflateChunk];
    size_t fed = 0;

    while (out.size() < max_output) {
        if (zs.avail_in == 0 && fed < size) {
            const size_t n = std::min<size_t>(size - fed, std::numeric_limits<uInt>::max());
            zs.next_in = const_cast<Bytef*>(data + fed);
            zs.avail_in = static_cast<uInt>(n);
            fed += n;
        }
        zs.next_out = buf;
        zs.avail_out = static_cast<uInt>(sizeof(buf));

        rc = inflate(&zs, Z_NO_FLUSH);
        const size_t produced = sizeof(buf) - zs.avail_out;
        const size_t take = std::min(produced, max_output - out.size());
        out.insert(out.end(), buf, buf + take);

        if (rc == Z_STREAM_END) break;
        if (rc == Z_BUF_ERROR) {
            // no progress possible: input exhausted before the end of the stream
            if (zs.avail_in == 0 && fed >= size) {
                throw DecompressionError("inflate: compressed stream ended prematurely");
            }
            continue;
        }
        if (rc != Z_OK) throw DecompressionError(zlib_message("inflate", rc, zs));
    }
    return out;
}

} // namespace pngalpha
