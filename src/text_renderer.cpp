// Glyph drawing implementation
#include "text_renderer.hpp"

namespace picoled {

int draw_text(Framebuffer &fb, const GlyphSource &font, int x, int y, const char *text,
              const TextStyle &style) {
    if (!text) return x;
    const int size = style.size ? style.size : 1;
    for (const char *c = text; *c; ++c) {
        Glyph g = font.glyph(*c);
        for (uint8_t col = 0; col < g.count; ++col) {
            uint8_t mask = g.columns[col];
            int py = y;
            for (int row = 0; row < 8; ++row) {
                uint16_t color = (mask & 1) ? style.color : style.background;
                // Clipping is left to set_pixel
                for (int sy = 0; sy < size; ++sy) {
                    for (int sx = 0; sx < size; ++sx) fb.set_pixel(x + sx, py + sy, color);
                }
                py += size;
                mask >>= 1;
            }
            x += size;
        }
        x += style.space;
    }
    return x;
}

int text_width(const GlyphSource &font, const char *text, const TextStyle &style) {
    if (!text) return 0;
    const int size = style.size ? style.size : 1;
    int w = 0;
    for (const char *c = text; *c; ++c) {
        w += font.glyph(*c).count * size + style.space;
    }
    return w;
}

} // namespace picoled
