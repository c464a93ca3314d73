#include "app.hpp"

#include "pico/stdlib.h"

#include "boards/pico_pins.hpp"
#include "drivers/pico_gpio.hpp"
#include "drivers/spi_bus.hpp"
#include "drivers/ssd1351_display.hpp"
#include "drivers/switch.hpp"
#include "color.hpp"
#include "font5x8.hpp"
#include "text_renderer.hpp"
#include "log.hpp"

namespace picoled {

bool App::init() {
    SpiBusConfig bus_cfg;
    bus_cfg.inst = spi0;
    // Bring the panel up slowly, then raise the clock once it answers
    bus_cfg.baud_hz = 8 * 1000 * 1000;
    bus_cfg.pin_sck = pins::spi0_sck;
    bus_cfg.pin_mosi = pins::spi0_mosi;
    bus_cfg.pin_cs = pins::oled_cs;

    static SpiBus spi(bus_cfg);
    spi.init();
    static PicoOutputLine dc(pins::oled_dc);
    static PicoOutputLine res(pins::oled_res);
    static PicoDelay delay;
    static PicoInputLine button_line(pins::button);
    static Switch button(button_line, true);
    button.init();
    button_ = &button;

    std::printf("init\n");
    static Ssd1351Display display(spi, dc, res, delay);
    display_ = &display;

    std::printf("begin\n");
    Status st = display.begin();
    if (!ok(st)) {
        PICOLED_LOG_ERROR("display begin failed: %s", to_string(st));
        return false;
    }
    spi.set_baud(kRunBaudHz);

    if (!ok(st = display.fill_screen(0x000000))) return false;

    // Colour bars along the bottom edge
    const uint16_t bars[3] = {encode_color(0xFF0000), encode_color(0x00FF00), encode_color(0x0000FF)};
    const uint16_t bar_w = display.width() / 3;
    for (int i = 0; i < 3; ++i) {
        Rect r{static_cast<int16_t>(i * bar_w), static_cast<int16_t>(display.height() - 16), bar_w, 16};
        if (!ok(st = display.fill_rect(r, bars[i]))) return false;
    }

    draw_circle(10, 10, 10);
    if (!ok(st = display.draw_bitmap(0, 0, circle_, kCircleSize, kCircleSize))) return false;

    // Title to the right of the circle
    static Font5x8 font;
    TextStyle style;
    style.color = encode_color(0x00FFFF);
    style.space = 1;
    Framebuffer& fb = display.framebuffer();
    const int title_x = kCircleSize + 6;
    int end = draw_text(fb, font, title_x, 6, "PICOLED", style);
    Rect title{static_cast<int16_t>(title_x), 6, static_cast<uint16_t>(end - title_x), 8};
    if (!ok(st = display.flush(fb, title))) {
        PICOLED_LOG_ERROR("title flush failed: %s", to_string(st));
        return false;
    }
    return true;
}

void App::draw_circle(int cx, int cy, int r) {
    const uint16_t on = encode_color(0xFFFFFF);
    const uint16_t off = encode_color(0x000000);
    for (int y = 0; y < kCircleSize; ++y) {
        for (int x = 0; x < kCircleSize; ++x) {
            int d = (cx - x) * (cx - x) + (cy - y) * (cy - y) - r * r;
            circle_[y * kCircleSize + x] = d < 2 ? on : off;
        }
    }
}

void App::step_box() {
    Framebuffer& fb = display_->framebuffer();
    // Erase the old box, move, redraw; flush only the union of both spots
    int old_x = box_x_;
    int old_y = box_y_;
    fb.clear_block(box_x_, box_y_, kBoxSize, kBoxSize);
    box_x_ += box_dx_;
    box_y_ += box_dy_;
    if (box_x_ < 0 || box_x_ + kBoxSize > fb.width()) { box_dx_ = -box_dx_; box_x_ += 2 * box_dx_; }
    if (box_y_ < 24 || box_y_ + kBoxSize > fb.height() - 16) { box_dy_ = -box_dy_; box_y_ += 2 * box_dy_; }
    fb.fill_rect(box_x_, box_y_, kBoxSize, kBoxSize, encode_color(0xFFA000));

    int x0 = old_x < box_x_ ? old_x : box_x_;
    int y0 = old_y < box_y_ ? old_y : box_y_;
    int x1 = (old_x > box_x_ ? old_x : box_x_) + kBoxSize;
    int y1 = (old_y > box_y_ ? old_y : box_y_) + kBoxSize;
    Rect dirty{static_cast<int16_t>(x0), static_cast<int16_t>(y0),
               static_cast<uint16_t>(x1 - x0), static_cast<uint16_t>(y1 - y0)};
    Status st = display_->flush(fb, dirty);
    if (!ok(st)) PICOLED_LOG_WARN("flush failed: %s", to_string(st));
}

void App::loop() {
    while (true) {
        uint8_t pressed = button_->get_state();
        if (pressed && !last_button_) {
            Status st = display_->state() == DeviceState::Inverted ? display_->normal() : display_->invert();
            if (!ok(st)) PICOLED_LOG_WARN("mode toggle failed: %s", to_string(st));
        }
        last_button_ = pressed;

        step_box();
        sleep_ms(20);
    }
}

} // namespace picoled
