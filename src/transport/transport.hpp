#pragma once
#include <chrono>

namespace pcex {

// Every session variant offers the same contract:
//   connect(), disconnect(), request_authorization(), has_authorization(),
//   send(bytes), receive(max_len) -> one complete frame.
// connect() performs the HANDSHAKE exchange and publishes state changes.
struct SessionTimeouts {
    std::chrono::milliseconds connect{5000};
    std::chrono::milliseconds read{10000};
    std::chrono::milliseconds accept{30000};
    std::chrono::milliseconds usb{5000};
};

} // namespace pcex
