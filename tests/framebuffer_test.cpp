#include <gtest/gtest.h>

#include <climits>
#include <cstdio>
#include <string>
#include <vector>
#include "color.hpp"
#include "framebuffer.hpp"

namespace picoled {
namespace {

TEST(FramebufferTest, StartsBlack) {
    Framebuffer fb(16, 8);
    EXPECT_EQ(fb.width(), 16);
    EXPECT_EQ(fb.height(), 8);
    for (int y = 0; y < 8; ++y)
        for (int x = 0; x < 16; ++x) EXPECT_EQ(fb.get_pixel(x, y), 0);
}

TEST(FramebufferTest, SetThenGetRoundTrips) {
    Framebuffer fb(10, 6);
    uint16_t c = 1;
    for (int y = 0; y < 6; ++y) {
        for (int x = 0; x < 10; ++x) {
            fb.set_pixel(x, y, c);
            EXPECT_EQ(fb.get_pixel(x, y), c);
            c = static_cast<uint16_t>(c * 31 + 7);
        }
    }
}

TEST(FramebufferTest, OutOfRangeWritesAreDropped) {
    Framebuffer fb(4, 3);
    fb.fill_rect(0, 0, 4, 3, 0x1234);
    const std::vector<uint16_t> before(fb.data(), fb.data() + 12);

    fb.set_pixel(-1, 0, 0xFFFF);
    fb.set_pixel(0, -1, 0xFFFF);
    fb.set_pixel(4, 0, 0xFFFF);
    fb.set_pixel(0, 3, 0xFFFF);
    fb.set_pixel(1000, 1000, 0xFFFF);

    EXPECT_EQ(std::vector<uint16_t>(fb.data(), fb.data() + 12), before);
}

TEST(FramebufferTest, OutOfRangeReadsReturnZero) {
    Framebuffer fb(4, 3);
    fb.fill_rect(0, 0, 4, 3, 0xFFFF);
    EXPECT_EQ(fb.get_pixel(-1, 0), 0);
    EXPECT_EQ(fb.get_pixel(0, -1), 0);
    EXPECT_EQ(fb.get_pixel(4, 0), 0);
    EXPECT_EQ(fb.get_pixel(0, 3), 0);
}

TEST(FramebufferTest, ClearThenDumpIsAllDots) {
    Framebuffer fb(5, 3);
    fb.fill_rect(1, 1, 2, 2, 0xAAAA);
    fb.clear();
    size_t rows = 0;
    for (const std::string& line : fb.dump()) {
        EXPECT_EQ(line, ".....");
        ++rows;
    }
    EXPECT_EQ(rows, 3u);
}

TEST(FramebufferTest, DumpMarksLitPixelsAndIsRestartable) {
    Framebuffer fb(4, 2);
    fb.set_pixel(0, 0, 1);
    fb.set_pixel(3, 1, 0x8000);
    auto lines = fb.dump();
    std::vector<std::string> first(lines.begin(), lines.end());
    std::vector<std::string> second(lines.begin(), lines.end());
    EXPECT_EQ(first, (std::vector<std::string>{"X...", "...X"}));
    EXPECT_EQ(first, second);
    EXPECT_EQ(lines.size(), 2u);
}

TEST(FramebufferTest, DumpToStreamWritesOneLinePerRow) {
    Framebuffer fb(3, 2);
    fb.set_pixel(1, 1, 0x0001);
    std::FILE* f = std::tmpfile();
    ASSERT_NE(f, nullptr);
    fb.dump(f);
    std::rewind(f);
    char buf[32] = {};
    size_t n = std::fread(buf, 1, sizeof(buf) - 1, f);
    std::fclose(f);
    EXPECT_EQ(std::string(buf, n), "...\n.X.\n");
}

TEST(FramebufferTest, FillRectCoversInteriorOnly) {
    Framebuffer fb(12, 10);
    fb.fill_rect(2, 3, 4, 5, 0x07E0);
    for (int y = 0; y < 10; ++y) {
        for (int x = 0; x < 12; ++x) {
            bool inside = x >= 2 && x < 6 && y >= 3 && y < 8;
            EXPECT_EQ(fb.get_pixel(x, y), inside ? 0x07E0 : 0) << x << "," << y;
        }
    }
}

TEST(FramebufferTest, FillRectClipsAtEveryEdge) {
    Framebuffer fb(8, 8);
    fb.fill_rect(6, 6, 10, 10, 1);
    EXPECT_EQ(fb.get_pixel(7, 7), 1);
    EXPECT_EQ(fb.get_pixel(6, 6), 1);
    EXPECT_EQ(fb.get_pixel(5, 5), 0);

    fb.clear();
    fb.fill_rect(-3, -2, 5, 4, 2);
    EXPECT_EQ(fb.get_pixel(0, 0), 2);
    EXPECT_EQ(fb.get_pixel(1, 1), 2);
    EXPECT_EQ(fb.get_pixel(2, 0), 0);
    EXPECT_EQ(fb.get_pixel(0, 2), 0);

    fb.clear();
    fb.fill_rect(8, 0, 3, 3, 3);
    fb.fill_rect(0, 0, 0, 3, 3);
    for (const std::string& line : fb.dump()) EXPECT_EQ(line, "........");
}

TEST(FramebufferTest, FullScreenRedFill) {
    Framebuffer fb(128, 128);
    fb.fill_rect(0, 0, 128, 128, encode_color(0xFF0000));
    for (int y = 0; y < 128; ++y)
        for (int x = 0; x < 128; ++x) ASSERT_EQ(fb.get_pixel(x, y), 0xF800);
}

TEST(FramebufferTest, ClearBlockZeroesAndClips) {
    Framebuffer fb(6, 6);
    fb.fill_rect(0, 0, 6, 6, 9);
    fb.clear_block(4, 4, 5, 5);
    fb.clear_block(-2, 0, 3, 1);
    EXPECT_EQ(fb.get_pixel(4, 4), 0);
    EXPECT_EQ(fb.get_pixel(5, 5), 0);
    EXPECT_EQ(fb.get_pixel(3, 3), 9);
    EXPECT_EQ(fb.get_pixel(0, 0), 0);
    EXPECT_EQ(fb.get_pixel(1, 0), 9);
}

TEST(FramebufferTest, HugeExtentsClipWithoutOverflow) {
    Framebuffer fb(8, 2);
    fb.fill_rect(1, 0, INT_MAX, 1, 7);
    EXPECT_EQ(fb.get_pixel(0, 0), 0);
    EXPECT_EQ(fb.get_pixel(1, 0), 7);
    EXPECT_EQ(fb.get_pixel(7, 0), 7);
    EXPECT_EQ(fb.get_pixel(7, 1), 0);

    fb.fill_rect(INT_MAX, INT_MAX, INT_MAX, INT_MAX, 9);
    fb.fill_rect(0, 1, 8, INT_MAX, 5);
    EXPECT_EQ(fb.get_pixel(3, 1), 5);

    fb.clear_block(2, 0, INT_MAX, INT_MAX);
    EXPECT_EQ(fb.get_pixel(1, 0), 7);
    EXPECT_EQ(fb.get_pixel(1, 1), 5);
    EXPECT_EQ(fb.get_pixel(2, 0), 0);
    EXPECT_EQ(fb.get_pixel(7, 1), 0);
}

} // namespace
} // namespace picoled
