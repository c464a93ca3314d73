#include "pico/stdlib.h"

#include "app.hpp"
#include "log.hpp"

int main() {
    stdio_init_all();
    static picoled::App app;
    if (!app.init()) {
        PICOLED_LOG_ERROR("startup failed");
        while (true) tight_loop_contents();
    }
    app.loop();
    return 0;
}
