#pragma once

#include <cstdint>

namespace picoled {

// One character as vertical 8-bit column masks, bit 0 at the top.
struct Glyph {
    const uint8_t* columns{nullptr};
    uint8_t count{0};
};

// Font lookup. Characters the font lacks return an empty glyph.
class GlyphSource {
public:
    virtual ~GlyphSource() = default;
    virtual Glyph glyph(char c) const = 0;
};

} // namespace picoled
