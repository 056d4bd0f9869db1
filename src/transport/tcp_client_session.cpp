#include "tcp_client_session.hpp"
#include "exchange.hpp"
#include "logging.hpp"
#include "util.hpp"

namespace pcex {

TcpClientSession::TcpClientSession(ClientRoute route, StateCell &state,
                                   SessionTimeouts timeouts)
    : route_(route), state_(state), timeouts_(timeouts) {}

TcpClientSession::~TcpClientSession() { channel_.close(); }

void TcpClientSession::configure(const std::string &host, int port) {
  host_ = normalize_host(host);
  port_ = port;
}

Error TcpClientSession::fail(const Error &err, const std::string &hint) {
  Logger::instance().log(LogLevel::WARN, "%s: %s", tag(),
                         err.describe().c_str());
  channel_.close();
  std::string msg = hint.empty() ? err.describe() : hint + ": " + err.describe();
  state_.set(ConnectionState::error(msg, err.code));
  return Error{err.code, msg};
}

Result<void> TcpClientSession::connect() {
  state_.set(ConnectionState::connecting());
  if (!is_valid_port(port_))
    return fail(Error{TransportErrc::invalid_port,
                      "invalid port configuration: " + std::to_string(port_)},
                "");
  if (host_.empty())
    return fail(Error{TransportErrc::invalid_host, "no host configured"},
                route_ == ClientRoute::Wifi ? "enter the PC address first" : "");

  Logger::instance().log(LogLevel::INFO, "%s: connecting to %s:%d", tag(),
                         host_.c_str(), port_);
  auto r = channel_.connect(host_, (uint16_t)port_, timeouts_.connect);
  if (!r) {
    std::string hint = route_ == ClientRoute::Tunnel
                           ? "make sure the PC server is running and the "
                             "port is forwarded"
                           : "make sure the PC server is running and both "
                             "devices share a network";
    return fail(r.error(), hint);
  }

  auto hs = perform_handshake(*this);
  if (!hs)
    return fail(hs.error(), "handshake failed");

  DeviceDescriptor d;
  d.id = std::string(tag()) + ":" + host_ + ":" + std::to_string(port_);
  d.display_name = route_ == ClientRoute::Tunnel
                       ? "PC (tunnel)"
                       : "PC " + host_ + ":" + std::to_string(port_);
  Logger::instance().log(LogLevel::INFO, "%s: connected to %s", tag(),
                         channel_.peer().c_str());
  state_.set(ConnectionState::connected(d));
  return {};
}

void TcpClientSession::disconnect() {
  if (channel_.is_open()) {
    auto r = send(encode_packet(Command::Disconnect, PF_NONE, {}));
    if (!r)
      Logger::instance().log(LogLevel::WARN, "%s: disconnect notice not sent: %s",
                             tag(), r.error().describe().c_str());
  }
  channel_.close();
  state_.set(ConnectionState::disconnected());
}

Result<void> TcpClientSession::request_authorization() { return connect(); }

Result<void> TcpClientSession::send(const std::vector<uint8_t> &bytes) {
  if (!channel_.is_open())
    return Error{TransportErrc::not_connected};
  auto r = channel_.write_all(bytes.data(), bytes.size(), timeouts_.read);
  if (!r && r.error().code == TransportErrc::peer_closed) {
    channel_.close();
    state_.set(ConnectionState::disconnected());
  }
  return r;
}

Result<std::vector<uint8_t>> TcpClientSession::receive(size_t max_len) {
  if (!channel_.is_open())
    return Error{TransportErrc::not_connected};
  auto frame = channel_.read_frame(timeouts_.read);
  if (!frame) {
    const auto &code = frame.error().code;
    if (code == TransportErrc::peer_closed) {
      Logger::instance().log(LogLevel::INFO, "%s: peer closed the connection",
                             tag());
      channel_.close();
      state_.set(ConnectionState::disconnected());
    } else if (code == TransportErrc::timed_out) {
      state_.set(ConnectionState::error("read timed out", code));
    }
    return frame;
  }
  if (frame.value().size() > max_len)
    return Error{ProtocolErrc::payload_too_large,
                 "frame of " + std::to_string(frame.value().size()) +
                     " bytes exceeds " + std::to_string(max_len)};
  return frame;
}

} // namespace pcex
