#include "connection.hpp"
#include "util.hpp"
#include <vector>

namespace pcex {

const char *mode_name(ConnectionMode m) {
  switch (m) {
  case ConnectionMode::DirectHost:
    return "DirectHost";
  case ConnectionMode::TunnelClient:
    return "TunnelClient";
  case ConnectionMode::TunnelServer:
    return "TunnelServer";
  case ConnectionMode::WifiClient:
    return "WifiClient";
  case ConnectionMode::Auto:
    return "Auto";
  }
  return "Auto";
}

bool parse_mode(const std::string &s, ConnectionMode &out) {
  std::string v = to_lower(trim(s));
  if (v == "directhost" || v == "usb")
    out = ConnectionMode::DirectHost;
  else if (v == "tunnelclient" || v == "tcp_adb")
    out = ConnectionMode::TunnelClient;
  else if (v == "tunnelserver" || v == "tcp_forward")
    out = ConnectionMode::TunnelServer;
  else if (v == "wificlient" || v == "tcp_wifi")
    out = ConnectionMode::WifiClient;
  else if (v == "auto")
    out = ConnectionMode::Auto;
  else
    return false;
  return true;
}

ConnectionState ConnectionState::disconnected() { return ConnectionState{}; }

ConnectionState ConnectionState::connecting() {
  ConnectionState s;
  s.kind = Kind::Connecting;
  return s;
}

ConnectionState ConnectionState::connected(DeviceDescriptor device) {
  ConnectionState s;
  s.kind = Kind::Connected;
  s.device = std::move(device);
  return s;
}

ConnectionState ConnectionState::authorization_required() {
  ConnectionState s;
  s.kind = Kind::AuthorizationRequired;
  return s;
}

ConnectionState ConnectionState::error(std::string message,
                                       std::error_code cause) {
  ConnectionState s;
  s.kind = Kind::Error;
  s.message = std::move(message);
  s.cause = cause;
  return s;
}

const char *state_name(ConnectionState::Kind k) {
  switch (k) {
  case ConnectionState::Kind::Disconnected:
    return "Disconnected";
  case ConnectionState::Kind::Connecting:
    return "Connecting";
  case ConnectionState::Kind::Connected:
    return "Connected";
  case ConnectionState::Kind::AuthorizationRequired:
    return "AuthorizationRequired";
  case ConnectionState::Kind::Error:
    return "Error";
  }
  return "Error";
}

ConnectionState StateCell::get() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return value_;
}

void StateCell::set(ConnectionState s) {
  std::vector<Listener> targets;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    value_ = s;
    for (auto &kv : listeners_)
      targets.push_back(kv.second);
  }
  for (auto &l : targets)
    l(s);
}

int StateCell::subscribe(Listener l) {
  ConnectionState current;
  int token;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    token = next_token_++;
    listeners_[token] = l;
    current = value_;
  }
  l(current);
  return token;
}

void StateCell::unsubscribe(int token) {
  std::lock_guard<std::mutex> lk(mtx_);
  listeners_.erase(token);
}

} // namespace pcex
