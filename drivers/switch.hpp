#pragma once

#include <cstdint>
#include "gpio_line.hpp"

namespace picoled {

// Push button / toggle on one GPIO. Reports 0 = open, 1 = closed,
// whichever way the line is pulled.
class Switch {
public:
    explicit Switch(InputLine& line, bool pull_up = true) : line_(line), pull_up_(pull_up) {}

    void init() { line_.set_direction_input(pull_up_ ? Pull::Up : Pull::Down); }
    uint8_t get_state() const;
    bool closed() const { return get_state() == 1; }

private:
    InputLine& line_;
    bool pull_up_;
};

} // namespace picoled
