#pragma once

#include <cstdint>

namespace picoled {

// Result of any operation that touches the bus
enum class Status : uint8_t {
    Ok,
    TransportError,   // bus write failed or timed out
    InvalidArgument,  // e.g. empty argument list for a command
    NotReady,         // display used before begin()
};

inline const char* to_string(Status s) {
    switch (s) {
        case Status::Ok: return "ok";
        case Status::TransportError: return "transport error";
        case Status::InvalidArgument: return "invalid argument";
        case Status::NotReady: return "not ready";
    }
    return "unknown";
}

inline bool ok(Status s) { return s == Status::Ok; }

} // namespace picoled
