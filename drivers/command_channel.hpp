#pragma once

#include <cstddef>
#include <cstdint>
#include "bus_transport.hpp"
#include "gpio_line.hpp"
#include "status.hpp"

namespace picoled {

// Command/data framing for a write-only controller bus.
//
// The D/C selector idles LOW. Command bytes go out with it LOW, payload
// bytes with it HIGH, and the line is dropped back to LOW once the
// payload is out. Command arguments are sent through the data path, the
// way the SSD1351 expects them.
class CommandChannel {
public:
    static constexpr size_t kDefaultMaxTransfer = 1024;

    CommandChannel(BusTransport& bus, OutputLine& dc, size_t max_transfer_bytes = kDefaultMaxTransfer)
        : bus_(bus), dc_(dc), max_xfer_(max_transfer_bytes ? max_transfer_bytes : 1) {}

    // Drives D/C as an output and parks it LOW
    void init();

    Status send_command(uint8_t opcode);
    Status send_command(uint8_t opcode, const uint8_t* args, size_t count);
    template <size_t N>
    Status send_command(uint8_t opcode, const uint8_t (&args)[N]) {
        return send_command(opcode, args, N);
    }
    // Several bytes in the command phase (opcode with inline argument)
    Status send_command_bytes(const uint8_t* bytes, size_t count);

    Status send_data(const uint8_t* data, size_t len);

    size_t max_transfer_bytes() const { return max_xfer_; }

private:
    // Holds D/C HIGH for its lifetime
    class DataPhase {
    public:
        explicit DataPhase(OutputLine& dc) : dc_(dc) { dc_.write(Level::High); }
        ~DataPhase() { dc_.write(Level::Low); }
        DataPhase(const DataPhase&) = delete;
        DataPhase& operator=(const DataPhase&) = delete;
    private:
        OutputLine& dc_;
    };

    BusTransport& bus_;
    OutputLine& dc_;
    size_t max_xfer_;
};

} // namespace picoled
