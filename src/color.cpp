#include "color.hpp"

namespace picoled {

namespace {
    // round(c / 255 * max) in integer arithmetic
    inline uint32_t scale_channel(uint32_t c, uint32_t max) {
        uint32_t v = (c * max * 2 + 255) / 510;
        return v > max ? max : v;
    }
}

uint16_t encode_color(uint32_t rgb24) {
    uint32_t red   = (rgb24 >> 16) & 0xFF;
    uint32_t green = (rgb24 >> 8) & 0xFF;
    uint32_t blue  = rgb24 & 0xFF;

    uint32_t r5 = scale_channel(red, 0x1F);
    uint32_t g6 = scale_channel(green, 0x3F);
    uint32_t b5 = scale_channel(blue, 0x1F);

    return static_cast<uint16_t>((((r5 << 6) | g6) << 5) | b5);
}

} // namespace picoled
