#include "format/png_format.hpp"

namespace pngalpha {

const char* color_type_name(ColorType ct) {
    switch (ct) {
    case ColorType::Grayscale:      return "grayscale";
    case ColorType::Truecolor:      return "truecolor";
    case ColorType::Indexed:        return "indexed";
    case ColorType::GrayscaleAlpha: return "grayscale+alpha";
    case ColorType::TruecolorAlpha: return "truecolor+alpha";
    }
    return "unknown";
}

} // namespace pngalpha
