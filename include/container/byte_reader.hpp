#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "format/errors.hpp"

namespace pngalpha {

// Big-endian cursor over a borrowed byte range. The range must outlive the reader.
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : buf_(data), size_(size) {}

    uint8_t read_u8() {
        need(1);
        return buf_[pos_++];
    }
    uint16_t read_u16_be() {
        uint16_t hi = read_u8();
        uint16_t lo = read_u8();
        return static_cast<uint16_t>((hi << 8) | lo);
    }
    uint32_t read_u32_be() {
        uint32_t hi = read_u16_be();
        uint32_t lo = read_u16_be();
        return (hi << 16) | lo;
    }
    // 4-byte ASCII chunk tag.
    std::string read_tag() {
        need(4);
        std::string tag(reinterpret_cast<const char*>(buf_ + pos_), 4);
        pos_ += 4;
        return tag;
    }
    void skip(size_t n) {
        need(n);
        pos_ += n;
    }
    const uint8_t* current() const { return buf_ + pos_; }
    size_t position() const { return pos_; }
    bool eof() const { return pos_ >= size_; }
    size_t remaining() const { return size_ - pos_; }
private:
    void need(size_t n) const {
        if (n > remaining()) throw TruncationError("premature end of data at offset " + std::to_string(pos_));
    }
    const uint8_t* buf_;
    size_t size_;
    size_t pos_ = 0;
};

} // namespace pngalpha
