#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <vector>
#include "bus_transport.hpp"
#include "command_channel.hpp"
#include "delay.hpp"
#include "display.hpp"
#include "framebuffer.hpp"
#include "gpio_line.hpp"

namespace picoled {

struct Ssd1351Config {
    uint16_t width = 128;
    uint16_t height = 128;
    size_t max_transfer_bytes = CommandChannel::kDefaultMaxTransfer;
    // Upper bound on a single pixel payload handed to the channel
    size_t flush_chunk_bytes = 1024;
};

enum class DeviceState : uint8_t { Uninitialized, Off, Normal, Inverted };

class Ssd1351Display : public Display {
public:
    Ssd1351Display(BusTransport& bus, OutputLine& dc, OutputLine& reset, Delay& delay,
                   const Ssd1351Config& config = Ssd1351Config{});

    Status init() override { return begin(); }
    Status fill(uint16_t color) override;
    Status blit(uint16_t const* pixels, const Rect& area) override;
    uint16_t width() const override { return cfg_.width; }
    uint16_t height() const override { return cfg_.height; }

    // Largest panel the controller addresses (its RAM is 128x128)
    static constexpr uint16_t kMaxDimension = 128;

    // Reset and run the power-up command list. Must precede everything else.
    // A width or height outside 1..kMaxDimension fails with InvalidArgument.
    Status begin();
    DeviceState state() const { return state_; }

    // Inclusive column/row range, then arm RAM writes. The far corner is
    // clamped to the panel; a window starting off the panel sends nothing.
    Status set_window(uint16_t x0, uint16_t y0, uint16_t x1, uint16_t y1);

    Status flush(const Framebuffer& fb);
    Status flush(const Framebuffer& fb, const Rect& area);

    Status fill_screen(uint32_t rgb24);
    Status fill_rect(const Rect& area, uint16_t color);
    Status draw_pixel(int x, int y, uint16_t color);
    // Row-major w*h words placed with their top-left corner at (x, y)
    Status draw_bitmap(int x, int y, const uint16_t* pixels, uint16_t w, uint16_t h);

    Status invert();
    Status normal();
    Status display_off();
    Status display_on();
    // Master contrast, 0..15
    Status set_contrast(uint8_t level);

    Framebuffer& framebuffer() { return fb_; }
    const Framebuffer& framebuffer() const { return fb_; }
    void clear_display() { fb_.clear(); }
    Status display() { return flush(fb_); }

    // SSD1351 command set (subset)
    static constexpr uint8_t CMD_SETCOLUMN      = 0x15;
    static constexpr uint8_t CMD_SETROW         = 0x75;
    static constexpr uint8_t CMD_WRITERAM       = 0x5C;
    static constexpr uint8_t CMD_SETREMAP       = 0xA0;
    static constexpr uint8_t CMD_STARTLINE      = 0xA1;
    static constexpr uint8_t CMD_DISPLAYOFFSET  = 0xA2;
    static constexpr uint8_t CMD_NORMALDISPLAY  = 0xA6;
    static constexpr uint8_t CMD_INVERTDISPLAY  = 0xA7;
    static constexpr uint8_t CMD_FUNCTIONSELECT = 0xAB;
    static constexpr uint8_t CMD_DISPLAYOFF     = 0xAE;
    static constexpr uint8_t CMD_DISPLAYON      = 0xAF;
    static constexpr uint8_t CMD_PRECHARGE      = 0xB1;
    static constexpr uint8_t CMD_CLOCKDIV       = 0xB3;
    static constexpr uint8_t CMD_SETVSL         = 0xB4;
    static constexpr uint8_t CMD_SETGPIO        = 0xB5;
    static constexpr uint8_t CMD_PRECHARGE2     = 0xB6;
    static constexpr uint8_t CMD_VCOMH          = 0xBE;
    static constexpr uint8_t CMD_CONTRASTABC    = 0xC1;
    static constexpr uint8_t CMD_CONTRASTMASTER = 0xC7;
    static constexpr uint8_t CMD_MUXRATIO       = 0xCA;
    static constexpr uint8_t CMD_COMMANDLOCK    = 0xFD;

private:
    // Inclusive device-space rectangle after clipping
    struct Clip {
        int x0, y0, x1, y1;
        int w() const { return x1 - x0 + 1; }
        int h() const { return y1 - y0 + 1; }
    };
    // Pixels to stream: rows of a bitmap (base != nullptr) or one solid color
    struct PixelSource {
        const uint16_t* base;
        size_t stride;
        uint16_t solid;
    };

    static bool valid_config(const Ssd1351Config& cfg);
    bool clip(int x, int y, int w, int h, Clip& out) const;
    Status write_pixels(const Clip& c, const PixelSource& src);
    Status cmd(uint8_t opcode);
    Status cmd(uint8_t opcode, std::initializer_list<uint8_t> args);
    Status cmd_inline(std::initializer_list<uint8_t> bytes);
    void hw_reset();
    Status init_failed(const char* step, Status st);

    CommandChannel channel_;
    OutputLine& reset_;
    Delay& delay_;
    Ssd1351Config cfg_;
    Framebuffer fb_;
    std::vector<uint8_t> staging_;
    DeviceState state_ = DeviceState::Uninitialized;
    DeviceState lit_state_ = DeviceState::Normal; // mode restored by display_on()
};

} // namespace picoled
