#include "error.hpp"

namespace pcex {

namespace {

class DecodeCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "decode"; }
  std::string message(int ev) const override {
    switch (static_cast<DecodeErrc>(ev)) {
    case DecodeErrc::too_small:
      return "frame shorter than header and checksum";
    case DecodeErrc::bad_magic:
      return "bad magic";
    case DecodeErrc::truncated_payload:
      return "payload shorter than declared length";
    case DecodeErrc::checksum_mismatch:
      return "checksum mismatch";
    case DecodeErrc::trailing_data:
      return "bytes after checksum";
    case DecodeErrc::oversized_payload:
      return "payload exceeds maximum packet size";
    }
    return "unknown decode error";
  }
};

class TransportCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "transport"; }
  std::string message(int ev) const override {
    switch (static_cast<TransportErrc>(ev)) {
    case TransportErrc::not_connected:
      return "not connected";
    case TransportErrc::no_device_found:
      return "no device found";
    case TransportErrc::authorization_required:
      return "authorization required";
    case TransportErrc::endpoint_not_found:
      return "no bulk endpoint pair";
    case TransportErrc::channel_claim_failed:
      return "failed to claim channel";
    case TransportErrc::invalid_port:
      return "invalid port";
    case TransportErrc::invalid_host:
      return "invalid host";
    case TransportErrc::connect_failed:
      return "connection failed";
    case TransportErrc::peer_closed:
      return "peer closed the connection";
    case TransportErrc::timed_out:
      return "timed out";
    case TransportErrc::address_in_use:
      return "address in use";
    case TransportErrc::io_failure:
      return "i/o failure";
    }
    return "unknown transport error";
  }
};

class ProtocolCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "protocol"; }
  std::string message(int ev) const override {
    switch (static_cast<ProtocolErrc>(ev)) {
    case ProtocolErrc::unexpected_response:
      return "unexpected response";
    case ProtocolErrc::handshake_rejected:
      return "handshake rejected";
    case ProtocolErrc::malformed_payload:
      return "malformed payload";
    case ProtocolErrc::payload_too_large:
      return "payload too large";
    }
    return "unknown protocol error";
  }
};

class RemoteCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "remote"; }
  std::string message(int ev) const override {
    switch (static_cast<RemoteErrc>(ev)) {
    case RemoteErrc::success:
      return "success";
    case RemoteErrc::unknown_command:
      return "unknown command";
    case RemoteErrc::invalid_path:
      return "invalid path";
    case RemoteErrc::file_not_found:
      return "file not found";
    case RemoteErrc::permission_denied:
      return "permission denied";
    case RemoteErrc::already_exists:
      return "already exists";
    case RemoteErrc::not_empty:
      return "directory not empty";
    case RemoteErrc::no_space:
      return "no space left";
    case RemoteErrc::io_error:
      return "i/o error";
    case RemoteErrc::timeout:
      return "timeout";
    case RemoteErrc::protocol_error:
      return "protocol error";
    }
    return "error " + std::to_string(ev);
  }
};

class TransferCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "transfer"; }
  std::string message(int ev) const override {
    switch (static_cast<TransferErrc>(ev)) {
    case TransferErrc::task_not_found:
      return "task not found";
    case TransferErrc::task_finished:
      return "task already finished";
    case TransferErrc::local_io:
      return "local file error";
    case TransferErrc::store_failure:
      return "task store failure";
    case TransferErrc::cancelled:
      return "cancelled";
    }
    return "unknown transfer error";
  }
};

} // namespace

const std::error_category &decode_category() noexcept {
  static DecodeCategory cat;
  return cat;
}
const std::error_category &transport_category() noexcept {
  static TransportCategory cat;
  return cat;
}
const std::error_category &protocol_category() noexcept {
  static ProtocolCategory cat;
  return cat;
}
const std::error_category &remote_category() noexcept {
  static RemoteCategory cat;
  return cat;
}
const std::error_category &transfer_category() noexcept {
  static TransferCategory cat;
  return cat;
}

std::error_code make_error_code(DecodeErrc e) noexcept {
  return {static_cast<int>(e), decode_category()};
}
std::error_code make_error_code(TransportErrc e) noexcept {
  return {static_cast<int>(e), transport_category()};
}
std::error_code make_error_code(ProtocolErrc e) noexcept {
  return {static_cast<int>(e), protocol_category()};
}
std::error_code make_error_code(RemoteErrc e) noexcept {
  return {static_cast<int>(e), remote_category()};
}
std::error_code make_error_code(TransferErrc e) noexcept {
  return {static_cast<int>(e), transfer_category()};
}

std::string Error::describe() const {
  std::string what = std::string(code.category().name()) + ": " + code.message();
  if (message.empty())
    return what;
  return message + " (" + what + ")";
}

} // namespace pcex
