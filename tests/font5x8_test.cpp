#include <gtest/gtest.h>

#include <string>
#include <vector>
#include "font5x8.hpp"
#include "text_renderer.hpp"

namespace picoled {
namespace {

TEST(Font5x8Test, CoversDigitsLettersAndPunctuation) {
    Font5x8 font;
    for (char c : std::string("0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ -.:")) {
        Glyph g = font.glyph(c);
        EXPECT_EQ(g.count, Font5x8::kColumns) << c;
        EXPECT_NE(g.columns, nullptr) << c;
    }
}

TEST(Font5x8Test, LowercaseSharesUppercaseGlyph) {
    Font5x8 font;
    EXPECT_EQ(font.glyph('q').columns, font.glyph('Q').columns);
    EXPECT_EQ(font.glyph('a').columns, font.glyph('A').columns);
}

TEST(Font5x8Test, UnknownCharacterIsEmpty) {
    Font5x8 font;
    EXPECT_EQ(font.glyph('#').count, 0);
    EXPECT_EQ(font.glyph('\n').count, 0);
}

TEST(Font5x8Test, RendersDigitOne) {
    Framebuffer fb(5, 8);
    Font5x8 font;
    EXPECT_EQ(draw_text(fb, font, 0, 0, "1"), 5);
    auto d = fb.dump();
    std::vector<std::string> got(d.begin(), d.end());
    EXPECT_EQ(got, (std::vector<std::string>{
                       "..X..",
                       ".XX..",
                       "..X..",
                       "..X..",
                       "..X..",
                       "..X..",
                       ".XXX.",
                       ".....",
                   }));
}

TEST(Font5x8Test, WidthOfSpacedWord) {
    Font5x8 font;
    TextStyle style;
    style.space = 1;
    EXPECT_EQ(text_width(font, "PICOLED", style), 7 * 6);
}

} // namespace
} // namespace picoled
