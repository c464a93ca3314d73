#pragma once

#include <cstdint>

namespace picoled {

class Ssd1351Display;
class Switch;

// Demo firmware: colour bars, a circle bitmap, and a square bouncing
// through the framebuffer. The button toggles inverse video.
class App {
public:
    bool init();
    void loop();
private:
    static constexpr int kCircleSize = 20;
    static constexpr int kBoxSize = 16;
    static constexpr uint32_t kRunBaudHz = 20 * 1000 * 1000;

    void draw_circle(int cx, int cy, int r);
    void step_box();

    Ssd1351Display* display_ = nullptr;
    Switch* button_ = nullptr;
    uint16_t circle_[kCircleSize * kCircleSize]{};
    // Bouncing box position / velocity
    int box_x_ = 0;
    int box_y_ = 40;
    int box_dx_ = 2;
    int box_dy_ = 1;
    uint8_t last_button_ = 0;
};

} // namespace picoled
