#pragma once

#include <stdexcept>
#include <string>

namespace pngalpha {

enum class ErrorKind {
    FormatIdentity,      // signature mismatch: not a PNG at all
    Truncation,          // a chunk or row claims more bytes than available
    Structural,          // missing IHDR, decompressed size mismatch
    UnsupportedFeature,  // bit depth, color type, filter type
    Decompression,       // reported by zlib
};

const char* error_kind_name(ErrorKind kind);

// Base of every decode failure. All of them are terminal for the asset.
class PngError : public std::runtime_error {
public:
    PngError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}
    ErrorKind kind() const noexcept { return kind_; }
private:
    ErrorKind kind_;
};

class FormatIdentityError : public PngError {
public:
    explicit FormatIdentityError(const std::string& msg)
        : PngError(ErrorKind::FormatIdentity, msg) {}
};

class TruncationError : public PngError {
public:
    explicit TruncationError(const std::string& msg)
        : PngError(ErrorKind::Truncation, msg) {}
};

class StructuralError : public PngError {
public:
    explicit StructuralError(const std::string& msg)
        : PngError(ErrorKind::Structural, msg) {}
};

class UnsupportedFeatureError : public PngError {
public:
    explicit UnsupportedFeatureError(const std::string& msg)
        : PngError(ErrorKind::UnsupportedFeature, msg) {}
};

class DecompressionError : public PngError {
public:
    explicit DecompressionError(const std::string& msg)
        : PngError(ErrorKind::Decompression, msg) {}
};

} // namespace pngalpha
