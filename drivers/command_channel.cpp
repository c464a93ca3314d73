#include "command_channel.hpp"

#include "log.hpp"

namespace picoled {

void CommandChannel::init() {
    dc_.set_direction_output();
    dc_.write(Level::Low);
}

Status CommandChannel::send_command(uint8_t opcode) {
    // D/C is already LOW between transfers
    return bus_.write(&opcode, 1);
}

Status CommandChannel::send_command(uint8_t opcode, const uint8_t* args, size_t count) {
    if (!args || !count) return Status::InvalidArgument;
    Status st = send_command(opcode);
    if (!ok(st)) return st;
    return send_data(args, count);
}

Status CommandChannel::send_command_bytes(const uint8_t* bytes, size_t count) {
    if (!bytes || !count) return Status::InvalidArgument;
    if (count > max_xfer_) return Status::InvalidArgument;
    return bus_.write(bytes, count);
}

Status CommandChannel::send_data(const uint8_t* data, size_t len) {
    if (!data || !len) return Status::Ok;
    DataPhase phase(dc_);
    size_t start = 0;
    while (start < len) {
        size_t n = len - start;
        if (n > max_xfer_) n = max_xfer_;
        Status st = bus_.write(data + start, n);
        if (!ok(st)) {
            PICOLED_LOG_ERROR("data write failed at byte %u of %u: %s",
                              static_cast<unsigned>(start), static_cast<unsigned>(len), to_string(st));
            return st;
        }
        start += n;
    }
    return Status::Ok;
}

} // namespace picoled
