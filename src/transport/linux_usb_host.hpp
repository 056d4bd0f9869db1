#pragma once
#include <functional>
#include <string>
#include "usb_host.hpp"

namespace pcex {

// usbfs backend: enumerates /sys/bus/usb/devices and talks to /dev/bus/usb nodes.
// Access is granted when the device node is readable and writable.
class LinuxUsbHost : public UsbHost {
public:
    using Prompt = std::function<bool(const UsbDeviceInfo&)>;

    explicit LinuxUsbHost(Prompt prompt = {}, std::string sysfs_root = "/sys/bus/usb/devices",
                          std::string dev_root = "/dev/bus/usb");

    std::vector<UsbDeviceInfo> list_devices() override;
    bool has_permission(const UsbDeviceInfo& dev) override;
    bool request_permission(const UsbDeviceInfo& dev) override;
    std::unique_ptr<UsbDeviceHandle> open(const UsbDeviceInfo& dev, std::error_code& ec) override;

private:
    Prompt prompt_;
    std::string sysfs_root_;
    std::string dev_root_;
};

} // namespace pcex
