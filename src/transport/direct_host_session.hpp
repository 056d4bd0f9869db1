#pragma once
#include <memory>
#include <optional>
#include <vector>
#include "connection.hpp"
#include "error.hpp"
#include "transport.hpp"
#include "usb_host.hpp"

namespace pcex {

// Largest single bulk transfer handed to the host stack.
constexpr size_t kUsbMaxTransfer = 16 * 1024;

// Direct USB attachment: one claimed interface with a bulk IN/OUT pair.
class DirectHostSession {
public:
    DirectHostSession(UsbHost& host, StateCell& state, SessionTimeouts timeouts = {});
    ~DirectHostSession();

    Result<void> connect();
    void disconnect();
    Result<void> request_authorization();
    bool has_authorization();

    Result<void> send(const std::vector<uint8_t>& bytes);
    // Accumulates bulk reads until one full frame is available.
    Result<std::vector<uint8_t>> receive(size_t max_len);

private:
    struct Channel {
        uint8_t interface_number{0};
        uint8_t in_endpoint{0};
        uint8_t out_endpoint{0};
    };

    Result<void> open_device(const UsbDeviceInfo& dev);
    Result<void> fill(size_t want, size_t max_len);
    void close_device();
    Error fail(const Error& err);

    UsbHost& host_;
    StateCell& state_;
    SessionTimeouts timeouts_;
    std::unique_ptr<UsbDeviceHandle> handle_;
    Channel channel_;
    std::vector<uint8_t> pending_;
};

} // namespace pcex
