#include "direct_host_session.hpp"
#include "exchange.hpp"
#include "logging.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>

namespace pcex {

namespace {

struct BulkPair {
  uint8_t interface_number;
  uint8_t in;
  uint8_t out;
};

std::optional<BulkPair> find_bulk_pair(const UsbDeviceInfo &dev) {
  for (const auto &itf : dev.interfaces) {
    std::optional<uint8_t> in, out;
    for (const auto &ep : itf.endpoints) {
      if (!ep.bulk)
        continue;
      if (ep.is_in() && !in)
        in = ep.address;
      else if (!ep.is_in() && !out)
        out = ep.address;
    }
    if (in && out)
      return BulkPair{itf.number, *in, *out};
  }
  return std::nullopt;
}

DeviceDescriptor describe(const UsbDeviceInfo &dev) {
  DeviceDescriptor d;
  d.id = dev.node;
  d.display_name = dev.product.empty() ? dev.node : dev.product;
  d.vendor_id = dev.vendor_id;
  d.product_id = dev.product_id;
  if (!dev.manufacturer.empty())
    d.manufacturer = dev.manufacturer;
  if (!dev.product.empty())
    d.product = dev.product;
  if (!dev.serial.empty())
    d.serial = dev.serial;
  return d;
}

} // namespace

DirectHostSession::DirectHostSession(UsbHost &host, StateCell &state,
                                     SessionTimeouts timeouts)
    : host_(host), state_(state), timeouts_(timeouts) {}

DirectHostSession::~DirectHostSession() { close_device(); }

Error DirectHostSession::fail(const Error &err) {
  Logger::instance().log(LogLevel::WARN, "usb: %s", err.describe().c_str());
  close_device();
  state_.set(ConnectionState::error(err.describe(), err.code));
  return err;
}

Result<void> DirectHostSession::connect() {
  state_.set(ConnectionState::connecting());
  auto devices = host_.list_devices();
  if (devices.empty()) {
    state_.set(ConnectionState::disconnected());
    return Error{TransportErrc::no_device_found, "no USB peer attached"};
  }
  const auto &dev = devices.front();
  if (!host_.has_permission(dev)) {
    Logger::instance().log(LogLevel::INFO, "usb: %s needs authorization",
                           dev.node.c_str());
    state_.set(ConnectionState::authorization_required());
    return Error{TransportErrc::authorization_required, dev.node};
  }
  return open_device(dev);
}

Result<void> DirectHostSession::request_authorization() {
  auto devices = host_.list_devices();
  if (devices.empty())
    return Error{TransportErrc::no_device_found, "no USB peer attached"};
  const auto &dev = devices.front();
  if (!host_.request_permission(dev)) {
    state_.set(ConnectionState::authorization_required());
    return Error{TransportErrc::authorization_required,
                 "access to " + dev.node + " was not granted"};
  }
  state_.set(ConnectionState::connecting());
  return open_device(dev);
}

bool DirectHostSession::has_authorization() {
  auto devices = host_.list_devices();
  return !devices.empty() && host_.has_permission(devices.front());
}

Result<void> DirectHostSession::open_device(const UsbDeviceInfo &dev) {
  close_device();
  auto pair = find_bulk_pair(dev);
  if (!pair)
    return fail(Error{TransportErrc::endpoint_not_found, dev.node});

  std::error_code ec;
  auto handle = host_.open(dev, ec);
  if (!handle)
    return fail(Error{TransportErrc::channel_claim_failed,
                      "open " + dev.node + ": " + ec.message()});
  uint8_t ifno = pair->interface_number;
  if (!handle->claim_interface(ifno))
    return fail(Error{TransportErrc::channel_claim_failed,
                      "interface " + std::to_string(ifno) + " of " + dev.node});

  handle_ = std::move(handle);
  channel_.interface_number = ifno;
  channel_.in_endpoint = pair->in;
  channel_.out_endpoint = pair->out;
  pending_.clear();

  auto hs = perform_handshake(*this);
  if (!hs)
    return fail(hs.error());

  char ids[16];
  std::snprintf(ids, sizeof(ids), "%04x:%04x", dev.vendor_id, dev.product_id);
  Logger::instance().log(LogLevel::INFO, "usb: connected to %s (%s)",
                         dev.node.c_str(), ids);
  state_.set(ConnectionState::connected(describe(dev)));
  return {};
}

void DirectHostSession::close_device() {
  if (!handle_)
    return;
  handle_->release_interface(channel_.interface_number);
  handle_.reset();
  pending_.clear();
}

void DirectHostSession::disconnect() {
  if (handle_) {
    auto r = send(encode_packet(Command::Disconnect, PF_NONE, {}));
    if (!r)
      Logger::instance().log(LogLevel::WARN, "usb: disconnect notice not sent: %s",
                             r.error().describe().c_str());
  }
  close_device();
  state_.set(ConnectionState::disconnected());
}

Result<void> DirectHostSession::send(const std::vector<uint8_t> &bytes) {
  if (!handle_)
    return Error{TransportErrc::not_connected};
  size_t off = 0;
  std::vector<uint8_t> slice;
  while (off < bytes.size()) {
    size_t n = std::min(kUsbMaxTransfer, bytes.size() - off);
    slice.assign(bytes.begin() + off, bytes.begin() + off + n);
    std::error_code ec;
    size_t sent = handle_->bulk_transfer(channel_.out_endpoint, slice.data(), n,
                                         timeouts_.usb, ec);
    if (ec)
      return Error{ec == TransportErrc::timed_out ? ec
                                                   : make_error_code(TransportErrc::io_failure),
                   "bulk out: " + ec.message()};
    if (sent == 0)
      return Error{TransportErrc::io_failure, "bulk out moved no data"};
    off += sent;
  }
  return {};
}

Result<void> DirectHostSession::fill(size_t want, size_t max_len) {
  std::vector<uint8_t> buf(std::min(std::max<size_t>(max_len, kPrefixSize),
                                    kUsbMaxTransfer));
  // One deadline for the whole frame; zero-length reads do not extend it.
  auto deadline = std::chrono::steady_clock::now() + timeouts_.usb;
  while (pending_.size() < want) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline)
      return Error{TransportErrc::timed_out,
                   "bulk in: " + std::to_string(pending_.size()) + " of " +
                       std::to_string(want) + " bytes"};
    auto left =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    if (left.count() == 0)
      left = std::chrono::milliseconds(1);
    std::error_code ec;
    size_t n = handle_->bulk_transfer(channel_.in_endpoint, buf.data(),
                                      buf.size(), left, ec);
    if (ec) {
      if (ec == TransportErrc::timed_out || ec == TransportErrc::peer_closed)
        return Error{ec, "bulk in"};
      return Error{TransportErrc::io_failure, "bulk in: " + ec.message()};
    }
    pending_.insert(pending_.end(), buf.begin(), buf.begin() + n);
  }
  return {};
}

Result<std::vector<uint8_t>> DirectHostSession::receive(size_t max_len) {
  if (!handle_)
    return Error{TransportErrc::not_connected};
  auto r = fill(kPrefixSize, max_len);
  if (!r) {
    if (r.error().code == TransportErrc::peer_closed) {
      close_device();
      state_.set(ConnectionState::disconnected());
    }
    return r.error();
  }
  auto len = peek_payload_length(pending_.data());
  if (!len) {
    pending_.clear();
    return len.error();
  }
  size_t total = kPrefixSize + len.value() + kChecksumSize;
  if (total > max_len)
    return Error{ProtocolErrc::payload_too_large,
                 "frame of " + std::to_string(total) + " bytes exceeds " +
                     std::to_string(max_len)};
  r = fill(total, max_len);
  if (!r) {
    if (r.error().code == TransportErrc::peer_closed) {
      close_device();
      state_.set(ConnectionState::disconnected());
    }
    return r.error();
  }
  std::vector<uint8_t> frame(pending_.begin(), pending_.begin() + total);
  pending_.erase(pending_.begin(), pending_.begin() + total);
  return frame;
}

} // namespace pcex
