#pragma once

#include <cstdint>

namespace picoled {

// 24-bit 0xRRGGBB -> RGB565. Each channel is rescaled with rounding, so
// 0x000000 -> 0x0000 and 0xFFFFFF -> 0xFFFF.
uint16_t encode_color(uint32_t rgb24);

// Truncating conversion from 8-bit channels (drops the low bits).
constexpr uint16_t color565(uint8_t r, uint8_t g, uint8_t b) {
    return static_cast<uint16_t>(((r >> 3) << 11) | ((g >> 2) << 5) | (b >> 3));
}

} // namespace picoled
