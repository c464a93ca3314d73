#pragma once

#include <cstdint>
#include "bus_transport.hpp"
#include "hardware/spi.h"

namespace picoled {

struct SpiBusConfig {
    spi_inst_t* inst = spi0;
    uint32_t baud_hz = 16 * 1000 * 1000;
    uint8_t pin_sck = 18;
    uint8_t pin_mosi = 19;
    uint8_t pin_cs = 17;
    bool use_dma = true;
    // Upper bound for one DMA transfer to drain before it counts as hung
    uint32_t timeout_us = 100 * 1000;
};

// Write-only SPI master in mode 3 with a GPIO chip select that is asserted
// for the duration of each write.
class SpiBus : public BusTransport {
public:
    explicit SpiBus(const SpiBusConfig& config) : cfg_(config) {}

    bool init();
    Status write(const uint8_t* data, size_t len) override;
    // Reclock the running bus. Returns the rate the divider actually gives.
    uint32_t set_baud(uint32_t hz);
    uint32_t baud() const { return cfg_.baud_hz; }

private:
    Status write_dma(const uint8_t* data, size_t len);
    void drain_rx();

    SpiBusConfig cfg_;
    int dma_tx_chan_ = -1;
};

} // namespace picoled
