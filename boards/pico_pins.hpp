#pragma once

#include <cstdint>

namespace picoled::pins {

// SPI0 to the panel (write-only, no MISO)
constexpr uint8_t spi0_sck  = 18;
constexpr uint8_t spi0_mosi = 19;

// Panel control
constexpr uint8_t oled_cs  = 17;
constexpr uint8_t oled_dc  = 16;
constexpr uint8_t oled_res = 15;

// Push button to ground (internal pull-up)
constexpr uint8_t button = 14;

} // namespace picoled::pins
