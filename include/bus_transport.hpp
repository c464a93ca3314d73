#pragma once

#include <cstddef>
#include <cstdint>
#include "status.hpp"

namespace picoled {

// Write-only byte transport (SPI MOSI + clock). Nothing is read back.
// Callers keep each write within the transport's frame limit.
class BusTransport {
public:
    virtual ~BusTransport() = default;
    virtual Status write(const uint8_t* data, size_t len) = 0;
};

} // namespace picoled
