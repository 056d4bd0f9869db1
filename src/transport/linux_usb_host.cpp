#include "linux_usb_host.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <fcntl.h>
#include <linux/usbdevice_fs.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace pcex {

namespace {

constexpr const char *kHubClass = "09";

std::string read_attr(const fs::path &dir, const char *name) {
  std::ifstream f(dir / name);
  std::string v;
  if (f.is_open())
    std::getline(f, v);
  return trim(v);
}

unsigned long parse_hex(const std::string &s) {
  try {
    return std::stoul(s, nullptr, 16);
  } catch (const std::exception &) {
    return 0;
  }
}

std::vector<UsbInterfaceInfo> read_interfaces(const fs::path &dev_dir) {
  std::vector<UsbInterfaceInfo> out;
  std::string prefix = dev_dir.filename().string() + ":";
  std::error_code ec;
  for (const auto &entry : fs::directory_iterator(dev_dir, ec)) {
    std::string name = entry.path().filename().string();
    if (name.compare(0, prefix.size(), prefix) != 0)
      continue;
    UsbInterfaceInfo itf;
    itf.number = (uint8_t)parse_hex(read_attr(entry.path(), "bInterfaceNumber"));
    std::error_code ec2;
    for (const auto &ep : fs::directory_iterator(entry.path(), ec2)) {
      if (ep.path().filename().string().compare(0, 3, "ep_") != 0)
        continue;
      UsbEndpointInfo info;
      info.address = (uint8_t)parse_hex(read_attr(ep.path(), "bEndpointAddress"));
      info.bulk = read_attr(ep.path(), "type") == "Bulk";
      itf.endpoints.push_back(info);
    }
    out.push_back(std::move(itf));
  }
  return out;
}

class LinuxUsbHandle : public UsbDeviceHandle {
public:
  explicit LinuxUsbHandle(int fd) : fd_(fd) {}
  ~LinuxUsbHandle() override {
    if (fd_ >= 0)
      ::close(fd_);
  }
  LinuxUsbHandle(const LinuxUsbHandle &) = delete;
  LinuxUsbHandle &operator=(const LinuxUsbHandle &) = delete;

  bool claim_interface(uint8_t number) override {
    unsigned int ifno = number;
    struct usbdevfs_ioctl command {};
    command.ifno = ifno;
    command.ioctl_code = USBDEVFS_DISCONNECT;
    if (::ioctl(fd_, USBDEVFS_IOCTL, &command) < 0 && errno != ENODATA)
      Logger::instance().log(LogLevel::DEBUG, "usb: detach driver %u: %s",
                             ifno, std::strerror(errno));
    if (::ioctl(fd_, USBDEVFS_CLAIMINTERFACE, &ifno) < 0) {
      Logger::instance().log(LogLevel::WARN, "usb: claim interface %u: %s",
                             ifno, std::strerror(errno));
      return false;
    }
    return true;
  }

  void release_interface(uint8_t number) override {
    unsigned int ifno = number;
    if (::ioctl(fd_, USBDEVFS_RELEASEINTERFACE, &ifno) < 0)
      Logger::instance().log(LogLevel::WARN, "usb: release interface %u: %s",
                             ifno, std::strerror(errno));
  }

  size_t bulk_transfer(uint8_t endpoint, uint8_t *data, size_t len,
                       std::chrono::milliseconds timeout,
                       std::error_code &ec) override {
    struct usbdevfs_bulktransfer bt {};
    bt.ep = endpoint;
    bt.len = (unsigned int)len;
    bt.timeout = (unsigned int)timeout.count();
    bt.data = data;
    int n = ::ioctl(fd_, USBDEVFS_BULK, &bt);
    if (n < 0) {
      if (errno == ETIMEDOUT)
        ec = make_error_code(TransportErrc::timed_out);
      else if (errno == ENODEV || errno == ESHUTDOWN)
        ec = make_error_code(TransportErrc::peer_closed);
      else
        ec = std::error_code(errno, std::system_category());
      return 0;
    }
    ec.clear();
    return (size_t)n;
  }

private:
  int fd_;
};

} // namespace

LinuxUsbHost::LinuxUsbHost(Prompt prompt, std::string sysfs_root,
                           std::string dev_root)
    : prompt_(std::move(prompt)), sysfs_root_(std::move(sysfs_root)),
      dev_root_(std::move(dev_root)) {}

std::vector<UsbDeviceInfo> LinuxUsbHost::list_devices() {
  std::vector<UsbDeviceInfo> out;
  std::error_code ec;
  for (const auto &entry : fs::directory_iterator(sysfs_root_, ec)) {
    const fs::path &dir = entry.path();
    std::string name = dir.filename().string();
    if (name.find(':') != std::string::npos)
      continue;
    std::string busnum = read_attr(dir, "busnum");
    std::string devnum = read_attr(dir, "devnum");
    if (busnum.empty() || devnum.empty())
      continue;
    if (read_attr(dir, "bDeviceClass") == kHubClass)
      continue;

    UsbDeviceInfo dev;
    char node[64];
    std::snprintf(node, sizeof(node), "/%03d/%03d", std::atoi(busnum.c_str()),
                  std::atoi(devnum.c_str()));
    dev.node = dev_root_ + node;
    dev.vendor_id = (uint16_t)parse_hex(read_attr(dir, "idVendor"));
    dev.product_id = (uint16_t)parse_hex(read_attr(dir, "idProduct"));
    dev.manufacturer = read_attr(dir, "manufacturer");
    dev.product = read_attr(dir, "product");
    dev.serial = read_attr(dir, "serial");
    dev.interfaces = read_interfaces(dir);
    out.push_back(std::move(dev));
  }
  if (ec)
    Logger::instance().log(LogLevel::DEBUG, "usb: cannot scan %s: %s",
                           sysfs_root_.c_str(), ec.message().c_str());
  return out;
}

bool LinuxUsbHost::has_permission(const UsbDeviceInfo &dev) {
  return ::access(dev.node.c_str(), R_OK | W_OK) == 0;
}

bool LinuxUsbHost::request_permission(const UsbDeviceInfo &dev) {
  if (has_permission(dev))
    return true;
  if (!prompt_)
    return false;
  if (!prompt_(dev))
    return false;
  return has_permission(dev);
}

std::unique_ptr<UsbDeviceHandle> LinuxUsbHost::open(const UsbDeviceInfo &dev,
                                                    std::error_code &ec) {
  int fd = ::open(dev.node.c_str(), O_RDWR | O_CLOEXEC);
  if (fd < 0) {
    ec = std::error_code(errno, std::system_category());
    return nullptr;
  }
  ec.clear();
  return std::unique_ptr<UsbDeviceHandle>(new LinuxUsbHandle(fd));
}

} // namespace pcex
