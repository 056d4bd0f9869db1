#include "tcp_server_session.hpp"
#include "exchange.hpp"
#include "logging.hpp"
#include "settings.hpp"
#include "util.hpp"

namespace pcex {

TcpServerSession::TcpServerSession(StateCell &state, SessionTimeouts timeouts)
    : state_(state), timeouts_(timeouts), port_(kDefaultListenPort) {}

TcpServerSession::~TcpServerSession() { channel_.close(); }

Error TcpServerSession::fail(const Error &err, const std::string &hint) {
  Logger::instance().log(LogLevel::WARN, "listener: %s",
                         err.describe().c_str());
  channel_.close();
  std::string msg = hint.empty() ? err.describe() : hint + ": " + err.describe();
  state_.set(ConnectionState::error(msg, err.code));
  return Error{err.code, msg};
}

Result<void> TcpServerSession::connect() {
  state_.set(ConnectionState::connecting());
  if (!is_valid_port(port_))
    return fail(Error{TransportErrc::invalid_port,
                      "invalid port configuration: " + std::to_string(port_)},
                "");

  Logger::instance().log(LogLevel::INFO, "listener: waiting on %s:%d",
                         kLoopbackHost, port_);
  auto r = channel_.accept_one(kLoopbackHost, (uint16_t)port_,
                               timeouts_.accept);
  if (!r) {
    std::string hint;
    if (r.error().code == TransportErrc::address_in_use)
      hint = "check whether another application uses port " +
             std::to_string(port_);
    else if (r.error().code == TransportErrc::timed_out)
      hint = "make sure the PC server is running in forward mode";
    return fail(r.error(), hint);
  }
  Logger::instance().log(LogLevel::INFO, "listener: peer %s connected",
                         channel_.peer().c_str());

  auto hs = answer_handshake(*this);
  if (!hs)
    return fail(hs.error(), "handshake failed");
  peer_identity_ = hs.value();

  DeviceDescriptor d;
  d.id = "listener:" + std::to_string(port_);
  d.display_name = "PC (forwarded)";
  if (!peer_identity_.empty())
    d.product = peer_identity_;
  state_.set(ConnectionState::connected(d));
  return {};
}

void TcpServerSession::disconnect() {
  if (channel_.is_open()) {
    auto r = send(encode_packet(Command::Disconnect, PF_NONE, {}));
    if (!r)
      Logger::instance().log(LogLevel::WARN,
                             "listener: disconnect notice not sent: %s",
                             r.error().describe().c_str());
  }
  channel_.close();
  state_.set(ConnectionState::disconnected());
}

Result<void> TcpServerSession::request_authorization() { return connect(); }

Result<void> TcpServerSession::send(const std::vector<uint8_t> &bytes) {
  if (!channel_.is_open())
    return Error{TransportErrc::not_connected};
  auto r = channel_.write_all(bytes.data(), bytes.size(), timeouts_.read);
  if (!r && r.error().code == TransportErrc::peer_closed) {
    channel_.close();
    state_.set(ConnectionState::disconnected());
  }
  return r;
}

Result<std::vector<uint8_t>> TcpServerSession::receive(size_t max_len) {
  if (!channel_.is_open())
    return Error{TransportErrc::not_connected};
  auto frame = channel_.read_frame(timeouts_.read);
  if (!frame) {
    const auto &code = frame.error().code;
    if (code == TransportErrc::peer_closed) {
      Logger::instance().log(LogLevel::INFO, "listener: peer closed the connection");
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
