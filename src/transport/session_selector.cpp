#include "session_selector.hpp"
#include "logging.hpp"

namespace pcex {

SessionSelector::Lease::Lease(SessionSelector &owner)
    : owner_(&owner), lock_(owner.mtx_) {}

Result<void> SessionSelector::Lease::send(const std::vector<uint8_t> &bytes) {
  return std::visit([&](auto &s) { return s.send(bytes); },
                    owner_->session_locked());
}

Result<std::vector<uint8_t>>
SessionSelector::Lease::receive(size_t max_len) {
  return std::visit([&](auto &s) { return s.receive(max_len); },
                    owner_->session_locked());
}

SessionSelector::SessionSelector(Settings &settings, UsbHost &usb,
                                 SessionTimeouts timeouts)
    : settings_(settings), usb_(usb), timeouts_(timeouts) {}

SessionSelector::~SessionSelector() {
  std::lock_guard<std::mutex> lk(mtx_);
  session_.reset();
}

SessionSelector::Session &SessionSelector::session_locked() {
  if (!session_)
    rebuild_locked();
  return *session_;
}

void SessionSelector::rebuild_locked() {
  ConnectionMode mode = settings_.connection_mode();
  session_.reset();
  switch (mode) {
  case ConnectionMode::DirectHost:
    session_.emplace(std::in_place_type<DirectHostSession>, usb_, state_,
                     timeouts_);
    break;
  case ConnectionMode::TunnelServer: {
    auto &s = session_.emplace(std::in_place_type<TcpServerSession>, state_,
                               timeouts_);
    std::get<TcpServerSession>(s).configure(settings_.listen_port());
    break;
  }
  case ConnectionMode::WifiClient: {
    auto &s = session_.emplace(std::in_place_type<TcpClientSession>,
                               ClientRoute::Wifi, state_, timeouts_);
    std::get<TcpClientSession>(s).configure(settings_.wifi_host(),
                                            settings_.wifi_port());
    break;
  }
  case ConnectionMode::TunnelClient:
  case ConnectionMode::Auto: {
    auto &s = session_.emplace(std::in_place_type<TcpClientSession>,
                               ClientRoute::Tunnel, state_, timeouts_);
    std::get<TcpClientSession>(s).configure(kLoopbackHost,
                                            settings_.tunnel_port());
    mode = ConnectionMode::TunnelClient;
    break;
  }
  }
  active_mode_ = mode;
  Logger::instance().log(LogLevel::DEBUG, "selector: active variant %s",
                         mode_name(active_mode_));
}

void SessionSelector::teardown_locked() {
  if (!session_)
    return;
  std::visit([](auto &s) { s.disconnect(); }, *session_);
  session_.reset();
}

ConnectionMode SessionSelector::active_mode() {
  std::lock_guard<std::mutex> lk(mtx_);
  session_locked();
  return active_mode_;
}

void SessionSelector::set_mode(ConnectionMode mode) {
  std::lock_guard<std::mutex> lk(mtx_);
  Logger::instance().log(LogLevel::INFO, "selector: switching to %s",
                         mode_name(mode));
  teardown_locked();
  settings_.set_connection_mode(mode);
  rebuild_locked();
}

void SessionSelector::set_wifi_endpoint(const std::string &host, int port) {
  std::lock_guard<std::mutex> lk(mtx_);
  settings_.set_wifi_endpoint(host, port);
  if (session_ && active_mode_ == ConnectionMode::WifiClient) {
    teardown_locked();
    rebuild_locked();
  }
}

Result<void> SessionSelector::connect() {
  std::lock_guard<std::mutex> lk(mtx_);
  return std::visit([](auto &s) { return s.connect(); }, session_locked());
}

void SessionSelector::disconnect() {
  std::lock_guard<std::mutex> lk(mtx_);
  std::visit([](auto &s) { s.disconnect(); }, session_locked());
}

Result<void> SessionSelector::request_authorization() {
  std::lock_guard<std::mutex> lk(mtx_);
  return std::visit([](auto &s) { return s.request_authorization(); },
                    session_locked());
}

bool SessionSelector::has_authorization() {
  std::lock_guard<std::mutex> lk(mtx_);
  return std::visit([](auto &s) { return s.has_authorization(); },
                    session_locked());
}

Result<void> SessionSelector::send(const std::vector<uint8_t> &bytes) {
  return lease().send(bytes);
}

Result<std::vector<uint8_t>> SessionSelector::receive(size_t max_len) {
  return lease().receive(max_len);
}

} // namespace pcex
