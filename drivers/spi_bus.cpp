#include "spi_bus.hpp"

#include "pico/stdlib.h"
#include "hardware/dma.h"
#include "hardware/gpio.h"
#include "log.hpp"

namespace picoled {

bool SpiBus::init() {
    gpio_set_function(cfg_.pin_sck,  GPIO_FUNC_SPI);
    gpio_set_function(cfg_.pin_mosi, GPIO_FUNC_SPI);

    gpio_init(cfg_.pin_cs);
    gpio_set_dir(cfg_.pin_cs, GPIO_OUT);
    gpio_put(cfg_.pin_cs, 1);

    cfg_.baud_hz = spi_init(cfg_.inst, cfg_.baud_hz);
    // Mode 3, the panel samples on the rising edge with an idle-high clock
    spi_set_format(cfg_.inst, 8, SPI_CPOL_1, SPI_CPHA_1, SPI_MSB_FIRST);
    PICOLED_LOG_INFO("spi%u at %lu Hz", spi_get_index(cfg_.inst), static_cast<unsigned long>(cfg_.baud_hz));

    // Allocate TX DMA channel (optional)
    if (cfg_.use_dma && dma_tx_chan_ < 0) {
        int ch = dma_claim_unused_channel(false);
        if (ch >= 0) {
            dma_tx_chan_ = ch;
            // Configure channel for 8-bit transfers paced by SPI TX DREQ
            dma_channel_config c = dma_channel_get_default_config(ch);
            channel_config_set_transfer_data_size(&c, DMA_SIZE_8);
            channel_config_set_read_increment(&c, true);
            channel_config_set_write_increment(&c, false);
            channel_config_set_dreq(&c, spi_get_dreq(cfg_.inst, true));
            dma_channel_configure(ch, &c,
                &spi_get_hw(cfg_.inst)->dr, // dst: SPI data register
                nullptr,                    // src set per transfer
                0,                          // count set per transfer
                false);
        } else {
            PICOLED_LOG_WARN("no free DMA channel, falling back to blocking SPI writes");
            cfg_.use_dma = false;
        }
    }
    return true;
}

uint32_t SpiBus::set_baud(uint32_t hz) {
    // Callers only reclock between writes, so no transfer is in flight here
    cfg_.baud_hz = spi_set_baudrate(cfg_.inst, hz);
    PICOLED_LOG_INFO("spi%u reclocked to %lu Hz (asked %lu)", spi_get_index(cfg_.inst),
                     static_cast<unsigned long>(cfg_.baud_hz), static_cast<unsigned long>(hz));
    return cfg_.baud_hz;
}

Status SpiBus::write(const uint8_t* data, size_t len) {
    if (!data || !len) return Status::Ok;
    gpio_put(cfg_.pin_cs, 0);
    Status st;
    if (cfg_.use_dma && dma_tx_chan_ >= 0) {
        st = write_dma(data, len);
    } else {
        int n = spi_write_blocking(cfg_.inst, data, len);
        st = (n == static_cast<int>(len)) ? Status::Ok : Status::TransportError;
    }
    gpio_put(cfg_.pin_cs, 1);
    return st;
}

Status SpiBus::write_dma(const uint8_t* data, size_t len) {
    dma_channel_transfer_from_buffer_now(dma_tx_chan_, data, len);
    const uint64_t deadline = time_us_64() + cfg_.timeout_us;
    while (dma_channel_is_busy(dma_tx_chan_)) {
        if (time_us_64() > deadline) {
            dma_channel_abort(dma_tx_chan_);
            drain_rx();
            PICOLED_LOG_ERROR("spi dma transfer of %u bytes timed out", static_cast<unsigned>(len));
            return Status::TransportError;
        }
        tight_loop_contents();
    }
    // DMA done means the FIFO was fed, not that the last byte left the wire
    while (spi_is_busy(cfg_.inst)) tight_loop_contents();
    drain_rx();
    return Status::Ok;
}

void SpiBus::drain_rx() {
    // MISO is unconnected; discard whatever the RX FIFO collected and
    // clear the overrun flag
    while (spi_is_readable(cfg_.inst)) (void)spi_get_hw(cfg_.inst)->dr;
    spi_get_hw(cfg_.inst)->icr = SPI_SSPICR_RORIC_BITS;
}

} // namespace picoled
