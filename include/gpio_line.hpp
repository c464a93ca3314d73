#pragma once

#include <cstdint>

namespace picoled {

enum class Level : uint8_t { Low = 0, High = 1 };
enum class Pull : uint8_t { None, Up, Down };

// Single GPIO driven by the host (reset, D/C)
class OutputLine {
public:
    virtual ~OutputLine() = default;
    virtual void set_direction_output() = 0;
    virtual void write(Level level) = 0;
};

// Single GPIO sampled by the host (buttons)
class InputLine {
public:
    virtual ~InputLine() = default;
    virtual void set_direction_input(Pull pull) = 0;
    virtual Level read() const = 0;
};

} // namespace picoled
