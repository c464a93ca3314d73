#pragma once

#include <cstdint>
#include "delay.hpp"
#include "gpio_line.hpp"
#include "pico/stdlib.h"
#include "hardware/gpio.h"

namespace picoled {

class PicoOutputLine : public OutputLine {
public:
    explicit PicoOutputLine(uint8_t pin) : pin_(pin) {}
    void set_direction_output() override {
        gpio_init(pin_);
        gpio_set_dir(pin_, GPIO_OUT);
    }
    void write(Level level) override { gpio_put(pin_, level == Level::High); }
private:
    uint8_t pin_;
};

class PicoInputLine : public InputLine {
public:
    explicit PicoInputLine(uint8_t pin) : pin_(pin) {}
    void set_direction_input(Pull pull) override {
        gpio_init(pin_);
        gpio_set_dir(pin_, GPIO_IN);
        switch (pull) {
            case Pull::Up: gpio_pull_up(pin_); break;
            case Pull::Down: gpio_pull_down(pin_); break;
            case Pull::None: gpio_disable_pulls(pin_); break;
        }
    }
    Level read() const override { return gpio_get(pin_) ? Level::High : Level::Low; }
private:
    uint8_t pin_;
};

class PicoDelay : public Delay {
public:
    void sleep_ms(uint32_t ms) override { ::sleep_ms(ms); }
};

} // namespace picoled
