#include "format/errors.hpp"

namespace pngalpha {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::FormatIdentity:     return "format-identity";
    case ErrorKind::Truncation:         return "truncation";
    case ErrorKind::Structural:         return "structural";
    case ErrorKind::UnsupportedFeature: return "unsupported-feature";
    case ErrorKind::Decompression:      return "decompression";
    }
    return "unknown";
}

} // namespace pngalpha
