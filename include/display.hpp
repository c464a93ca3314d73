#pragma once

#include <cstdint>
#include "status.hpp"

namespace picoled {

// Signed origin so shapes may hang off the top/left edge and get clipped
struct Rect {
    int16_t x{0}, y{0};
    uint16_t w{0}, h{0};
};

// Abstract display interface (RGB565 assumed)
class Display {
public:
    virtual ~Display() = default;
    virtual Status init() = 0;
    virtual Status fill(uint16_t color) = 0;
    virtual Status blit(uint16_t const* pixels, const Rect& area) = 0;
    virtual uint16_t width() const = 0;
    virtual uint16_t height() const = 0;
};

} // namespace picoled
