#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace pcex {

struct UsbEndpointInfo {
    uint8_t address{0};   // bit 7 set for IN
    bool bulk{false};

    bool is_in() const { return (address & 0x80) != 0; }
};

struct UsbInterfaceInfo {
    uint8_t number{0};
    std::vector<UsbEndpointInfo> endpoints;
};

struct UsbDeviceInfo {
    std::string node;      // platform handle, e.g. /dev/bus/usb/001/004
    uint16_t vendor_id{0};
    uint16_t product_id{0};
    std::string manufacturer;
    std::string product;
    std::string serial;
    std::vector<UsbInterfaceInfo> interfaces;
};

// Owns an open device; implementations hold the OS handle and are not copyable.
class UsbDeviceHandle {
public:
    UsbDeviceHandle() = default;
    virtual ~UsbDeviceHandle() = default;
    UsbDeviceHandle(const UsbDeviceHandle&) = delete;
    UsbDeviceHandle& operator=(const UsbDeviceHandle&) = delete;
    virtual bool claim_interface(uint8_t number) = 0;
    virtual void release_interface(uint8_t number) = 0;
    // Returns bytes moved; on failure sets ec (TransportErrc::timed_out on expiry).
    virtual size_t bulk_transfer(uint8_t endpoint, uint8_t* data, size_t len,
                                 std::chrono::milliseconds timeout, std::error_code& ec) = 0;
};

// Platform access to locally attached peers.
class UsbHost {
public:
    virtual ~UsbHost() = default;
    virtual std::vector<UsbDeviceInfo> list_devices() = 0;
    virtual bool has_permission(const UsbDeviceInfo& dev) = 0;
    // May block on an interactive prompt; returns whether access was granted.
    virtual bool request_permission(const UsbDeviceInfo& dev) = 0;
    virtual std::unique_ptr<UsbDeviceHandle> open(const UsbDeviceInfo& dev, std::error_code& ec) = 0;
};

} // namespace pcex
