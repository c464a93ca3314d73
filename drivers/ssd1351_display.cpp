#include "ssd1351_display.hpp"

#include <algorithm>
#include "color.hpp"
#include "log.hpp"

namespace picoled {

Ssd1351Display::Ssd1351Display(BusTransport& bus, OutputLine& dc, OutputLine& reset, Delay& delay,
                               const Ssd1351Config& config)
    : channel_(bus, dc, config.max_transfer_bytes),
      reset_(reset),
      delay_(delay),
      cfg_(config),
      fb_(config.width, config.height) {
    // Even size so a pixel never straddles two payloads
    size_t chunk = cfg_.flush_chunk_bytes & ~static_cast<size_t>(1);
    if (chunk < 2) chunk = 2;
    staging_.resize(chunk);
}

Status Ssd1351Display::begin() {
    if (!valid_config(cfg_)) {
        PICOLED_LOG_ERROR("ssd1351 size %ux%u outside 1..%u", static_cast<unsigned>(cfg_.width),
                          static_cast<unsigned>(cfg_.height), static_cast<unsigned>(kMaxDimension));
        return Status::InvalidArgument;
    }
    // The panel forgets everything on reset
    state_ = DeviceState::Uninitialized;
    lit_state_ = DeviceState::Normal;

    reset_.set_direction_output();
    reset_.write(Level::High);
    channel_.init();

    delay_.sleep_ms(1); // power stabilisation
    hw_reset();

    const uint8_t last_col = static_cast<uint8_t>(cfg_.width - 1);
    const uint8_t last_row = static_cast<uint8_t>(cfg_.height - 1);
    Status st;

    // Unlock the MCU interface, then make A2,B1,B3,BB,BE,C1 accessible
    if (!ok(st = cmd(CMD_COMMANDLOCK, {0x12}))) return init_failed("unlock", st);
    if (!ok(st = cmd(CMD_COMMANDLOCK, {0xB1}))) return init_failed("unlock restricted", st);
    if (!ok(st = cmd(CMD_DISPLAYOFF))) return init_failed("display off", st);
    state_ = DeviceState::Off;

    // 7:4 = oscillator frequency, 3:0 = clock divide ratio
    if (!ok(st = cmd_inline({CMD_CLOCKDIV, 0xF1}))) return init_failed("clock div", st);
    if (!ok(st = cmd(CMD_MUXRATIO, {last_row}))) return init_failed("mux ratio", st);
    if (!ok(st = cmd(CMD_SETREMAP, {0x74}))) return init_failed("remap", st);
    if (!ok(st = cmd(CMD_SETCOLUMN, {0x00, last_col}))) return init_failed("column range", st);
    if (!ok(st = cmd(CMD_SETROW, {0x00, last_row}))) return init_failed("row range", st);
    if (!ok(st = cmd(CMD_STARTLINE, {0x00}))) return init_failed("start line", st);
    if (!ok(st = cmd(CMD_DISPLAYOFFSET, {0x00}))) return init_failed("display offset", st);
    if (!ok(st = cmd(CMD_SETGPIO, {0x00}))) return init_failed("gpio", st);
    // Internal VDD regulator
    if (!ok(st = cmd(CMD_FUNCTIONSELECT, {0x01}))) return init_failed("function select", st);
    if (!ok(st = cmd_inline({CMD_PRECHARGE, 0x32}))) return init_failed("precharge", st);
    if (!ok(st = cmd_inline({CMD_VCOMH, 0x05}))) return init_failed("vcomh", st);
    if (!ok(st = cmd(CMD_NORMALDISPLAY))) return init_failed("normal display", st);
    if (!ok(st = cmd(CMD_CONTRASTABC, {0xC8, 0x80, 0xC8}))) return init_failed("contrast abc", st);
    if (!ok(st = cmd(CMD_CONTRASTMASTER, {0x0F}))) return init_failed("contrast master", st);
    if (!ok(st = cmd(CMD_SETVSL, {0xA0, 0xB5, 0x55}))) return init_failed("vsl", st);
    if (!ok(st = cmd(CMD_PRECHARGE2, {0x01}))) return init_failed("precharge2", st);
    if (!ok(st = cmd(CMD_DISPLAYON))) return init_failed("display on", st);
    state_ = DeviceState::Normal;
    lit_state_ = DeviceState::Normal;

    PICOLED_LOG_INFO("ssd1351 %ux%u ready", static_cast<unsigned>(cfg_.width), static_cast<unsigned>(cfg_.height));
    return Status::Ok;
}

Status Ssd1351Display::init_failed(const char* step, Status st) {
    PICOLED_LOG_ERROR("ssd1351 init step '%s' failed: %s", step, to_string(st));
    return st;
}

void Ssd1351Display::hw_reset() {
    reset_.write(Level::Low);
    delay_.sleep_ms(10);
    reset_.write(Level::High);
}

Status Ssd1351Display::set_window(uint16_t x0, uint16_t y0, uint16_t x1, uint16_t y1) {
    if (state_ == DeviceState::Uninitialized) return Status::NotReady;
    if (x0 > x1 || y0 > y1) return Status::InvalidArgument;
    // Entirely off the panel: nothing to address
    if (x0 >= cfg_.width || y0 >= cfg_.height) return Status::Ok;
    if (x1 >= cfg_.width) x1 = cfg_.width - 1;
    if (y1 >= cfg_.height) y1 = cfg_.height - 1;
    Status st = cmd(CMD_SETCOLUMN, {static_cast<uint8_t>(x0), static_cast<uint8_t>(x1)});
    if (!ok(st)) return st;
    st = cmd(CMD_SETROW, {static_cast<uint8_t>(y0), static_cast<uint8_t>(y1)});
    if (!ok(st)) return st;
    return cmd(CMD_WRITERAM);
}

bool Ssd1351Display::valid_config(const Ssd1351Config& cfg) {
    return cfg.width >= 1 && cfg.width <= kMaxDimension &&
           cfg.height >= 1 && cfg.height <= kMaxDimension;
}

bool Ssd1351Display::clip(int x, int y, int w, int h, Clip& out) const {
    if (w <= 0 || h <= 0) return false;
    // Far edge in 64 bits so x + w cannot overflow
    int64_t x_end = std::min<int64_t>(static_cast<int64_t>(x) + w, cfg_.width);
    int64_t y_end = std::min<int64_t>(static_cast<int64_t>(y) + h, cfg_.height);
    out.x0 = std::max(x, 0);
    out.y0 = std::max(y, 0);
    out.x1 = static_cast<int>(x_end) - 1;
    out.y1 = static_cast<int>(y_end) - 1;
    return out.x0 <= out.x1 && out.y0 <= out.y1;
}

Status Ssd1351Display::write_pixels(const Clip& c, const PixelSource& src) {
    Status st = set_window(static_cast<uint16_t>(c.x0), static_cast<uint16_t>(c.y0),
                           static_cast<uint16_t>(c.x1), static_cast<uint16_t>(c.y1));
    if (!ok(st)) return st;

    // Convert into the staging buffer, high byte first, and hand it over
    // whenever it fills up
    const int cols = c.w();
    const int rows = c.h();
    size_t used = 0;
    for (int y = 0; y < rows; ++y) {
        const uint16_t* line = src.base ? src.base + static_cast<size_t>(y) * src.stride : nullptr;
        for (int x = 0; x < cols; ++x) {
            uint16_t px = line ? line[x] : src.solid;
            staging_[used++] = static_cast<uint8_t>(px >> 8);
            staging_[used++] = static_cast<uint8_t>(px & 0xFF);
            if (used == staging_.size()) {
                st = channel_.send_data(staging_.data(), used);
                if (!ok(st)) return st;
                used = 0;
            }
        }
    }
    if (used) return channel_.send_data(staging_.data(), used);
    return Status::Ok;
}

Status Ssd1351Display::flush(const Framebuffer& fb) {
    return flush(fb, Rect{0, 0, fb.width(), fb.height()});
}

Status Ssd1351Display::flush(const Framebuffer& fb, const Rect& area) {
    if (state_ == DeviceState::Uninitialized) return Status::NotReady;
    // Clip to the buffer first, then to the panel
    int x0 = std::max<int>(area.x, 0);
    int y0 = std::max<int>(area.y, 0);
    int x1 = std::min<int>(area.x + area.w, fb.width());
    int y1 = std::min<int>(area.y + area.h, fb.height());
    Clip c;
    if (!clip(x0, y0, x1 - x0, y1 - y0, c)) return Status::Ok;
    PixelSource src{fb.row(static_cast<uint16_t>(c.y0)) + c.x0, fb.width(), 0};
    return write_pixels(c, src);
}

Status Ssd1351Display::fill_screen(uint32_t rgb24) {
    return fill_rect(Rect{0, 0, cfg_.width, cfg_.height}, encode_color(rgb24));
}

Status Ssd1351Display::fill_rect(const Rect& area, uint16_t color) {
    if (state_ == DeviceState::Uninitialized) return Status::NotReady;
    Clip c;
    if (!clip(area.x, area.y, area.w, area.h, c)) return Status::Ok;
    return write_pixels(c, PixelSource{nullptr, 0, color});
}

Status Ssd1351Display::fill(uint16_t color) {
    return fill_rect(Rect{0, 0, cfg_.width, cfg_.height}, color);
}

Status Ssd1351Display::draw_pixel(int x, int y, uint16_t color) {
    if (state_ == DeviceState::Uninitialized) return Status::NotReady;
    Clip c;
    if (!clip(x, y, 1, 1, c)) return Status::Ok;
    return write_pixels(c, PixelSource{nullptr, 0, color});
}

Status Ssd1351Display::draw_bitmap(int x, int y, const uint16_t* pixels, uint16_t w, uint16_t h) {
    if (state_ == DeviceState::Uninitialized) return Status::NotReady;
    if (!pixels) return Status::InvalidArgument;
    Clip c;
    if (!clip(x, y, w, h, c)) return Status::Ok;
    const uint16_t* base = pixels + static_cast<size_t>(c.y0 - y) * w + (c.x0 - x);
    return write_pixels(c, PixelSource{base, w, 0});
}

Status Ssd1351Display::blit(uint16_t const* pixels, const Rect& area) {
    return draw_bitmap(area.x, area.y, pixels, area.w, area.h);
}

Status Ssd1351Display::invert() {
    if (state_ == DeviceState::Uninitialized) return Status::NotReady;
    Status st = cmd(CMD_INVERTDISPLAY);
    if (!ok(st)) return st;
    lit_state_ = DeviceState::Inverted;
    if (state_ != DeviceState::Off) state_ = lit_state_;
    return st;
}

Status Ssd1351Display::normal() {
    if (state_ == DeviceState::Uninitialized) return Status::NotReady;
    Status st = cmd(CMD_NORMALDISPLAY);
    if (!ok(st)) return st;
    lit_state_ = DeviceState::Normal;
    if (state_ != DeviceState::Off) state_ = lit_state_;
    return st;
}

Status Ssd1351Display::display_off() {
    if (state_ == DeviceState::Uninitialized) return Status::NotReady;
    Status st = cmd(CMD_DISPLAYOFF);
    if (ok(st)) state_ = DeviceState::Off;
    return st;
}

// The panel keeps its normal/inverse mode while off
Status Ssd1351Display::display_on() {
    if (state_ == DeviceState::Uninitialized) return Status::NotReady;
    Status st = cmd(CMD_DISPLAYON);
    if (ok(st)) state_ = lit_state_;
    return st;
}

Status Ssd1351Display::set_contrast(uint8_t level) {
    if (state_ == DeviceState::Uninitialized) return Status::NotReady;
    return cmd(CMD_CONTRASTMASTER, {static_cast<uint8_t>(level & 0x0F)});
}

Status Ssd1351Display::cmd(uint8_t opcode) {
    return channel_.send_command(opcode);
}

Status Ssd1351Display::cmd(uint8_t opcode, std::initializer_list<uint8_t> args) {
    return channel_.send_command(opcode, args.begin(), args.size());
}

Status Ssd1351Display::cmd_inline(std::initializer_list<uint8_t> bytes) {
    return channel_.send_command_bytes(bytes.begin(), bytes.size());
}

} // namespace picoled
