#include "switch.hpp"

namespace picoled {

uint8_t Switch::get_state() const {
    uint8_t level = line_.read() == Level::High ? 1 : 0;
    // Pulled up and switching to ground: the line reads high while open
    return pull_up_ ? static_cast<uint8_t>(1 - level) : level;
}

} // namespace picoled
