// Glyph drawing into a Framebuffer
#pragma once
#include <cstdint>
#include "framebuffer.hpp"
#include "glyph_source.hpp"

namespace picoled {

struct TextStyle {
    uint16_t color = 0xFFFF;     // RGB565 for set bits
    uint16_t background = 0x0000; // RGB565 for clear bits (glyph cells are opaque)
    uint8_t size = 1;            // each font pixel becomes size x size
    uint8_t space = 0;           // blank columns after each character
};

// Draws text with its top-left corner at (x, y). Every glyph column is
// 8 font pixels tall. Returns the x just past the last character.
int draw_text(Framebuffer &fb, const GlyphSource &font, int x, int y, const char *text,
              const TextStyle &style = TextStyle{});

// Width in pixels that draw_text would advance for this text
int text_width(const GlyphSource &font, const char *text, const TextStyle &style = TextStyle{});

} // namespace picoled
