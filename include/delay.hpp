#pragma once

#include <cstdint>

namespace picoled {

class Delay {
public:
    virtual ~Delay() = default;
    virtual void sleep_ms(uint32_t ms) = 0;
};

} // namespace picoled
