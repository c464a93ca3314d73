#pragma once

// printf based logging. On the Pico, pico_stdlib routes printf to the
// configured stdio (UART or USB); on the host it is plain C stdio.
#include <cstdio>

#define PICOLED_LOG_LEVEL_NONE  0
#define PICOLED_LOG_LEVEL_ERROR 1
#define PICOLED_LOG_LEVEL_WARN  2
#define PICOLED_LOG_LEVEL_INFO  3
#define PICOLED_LOG_LEVEL_DEBUG 4

#ifndef PICOLED_LOG_LEVEL
#define PICOLED_LOG_LEVEL PICOLED_LOG_LEVEL_WARN
#endif

#define PICOLED_LOG_AT(level, tag, fmt, ...)                                  \
    do {                                                                      \
        if (PICOLED_LOG_LEVEL >= (level)) {                                   \
            std::printf("[%s] " fmt "\n", tag, ##__VA_ARGS__);                \
        }                                                                     \
    } while (0)

#define PICOLED_LOG_ERROR(fmt, ...) PICOLED_LOG_AT(PICOLED_LOG_LEVEL_ERROR, "E", fmt, ##__VA_ARGS__)
#define PICOLED_LOG_WARN(fmt, ...)  PICOLED_LOG_AT(PICOLED_LOG_LEVEL_WARN,  "W", fmt, ##__VA_ARGS__)
#define PICOLED_LOG_INFO(fmt, ...)  PICOLED_LOG_AT(PICOLED_LOG_LEVEL_INFO,  "I", fmt, ##__VA_ARGS__)
#define PICOLED_LOG_DEBUG(fmt, ...) PICOLED_LOG_AT(PICOLED_LOG_LEVEL_DEBUG, "D", fmt, ##__VA_ARGS__)
