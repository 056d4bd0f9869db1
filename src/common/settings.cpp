#include "settings.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <cstdio>
#include <fstream>
#include <stdexcept>

namespace pcex {

namespace {
const char *kKeyMode = "connection_mode";
const char *kKeyWifiHost = "wifi_host";
const char *kKeyWifiPort = "wifi_port";
const char *kKeyTunnelPort = "tunnel_port";
const char *kKeyListenPort = "listen_port";
} // namespace

Settings::Settings(std::string path) : path_(std::move(path)) {}

bool Settings::load() {
  if (path_.empty())
    return false;
  std::ifstream file(path_);
  if (!file.is_open())
    return false;
  std::map<std::string, std::string> parsed;
  std::string line;
  while (std::getline(file, line)) {
    auto t = trim(line);
    if (t.empty() || t[0] == '#')
      continue;
    auto eq = t.find('=');
    if (eq == std::string::npos)
      continue;
    auto key = trim(t.substr(0, eq));
    if (!key.empty())
      parsed[key] = trim(t.substr(eq + 1));
  }
  std::lock_guard<std::mutex> lk(mtx_);
  values_ = std::move(parsed);
  return true;
}

void Settings::save_locked() const {
  if (path_.empty())
    return;
  std::string tmp = path_ + ".tmp";
  {
    std::ofstream file(tmp, std::ios::trunc);
    if (!file.is_open()) {
      Logger::instance().log(LogLevel::WARN, "settings: cannot write %s",
                             tmp.c_str());
      return;
    }
    for (const auto &kv : values_)
      file << kv.first << "=" << kv.second << "\n";
  }
  if (std::rename(tmp.c_str(), path_.c_str()) != 0)
    Logger::instance().log(LogLevel::WARN, "settings: cannot replace %s",
                           path_.c_str());
}

std::string Settings::get(const std::string &key,
                          const std::string &default_value) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = values_.find(key);
  return it != values_.end() ? it->second : default_value;
}

void Settings::set(const std::string &key, const std::string &value) {
  std::lock_guard<std::mutex> lk(mtx_);
  values_[key] = value;
  save_locked();
}

int Settings::get_int(const std::string &key, int default_value) const {
  std::string v = get(key);
  if (v.empty())
    return default_value;
  try {
    return std::stoi(v);
  } catch (const std::exception &) {
    Logger::instance().log(LogLevel::WARN, "settings: %s=%s is not a number",
                           key.c_str(), v.c_str());
    return default_value;
  }
}

void Settings::set_int(const std::string &key, int value) {
  set(key, std::to_string(value));
}

ConnectionMode Settings::connection_mode() const {
  std::string v = get(kKeyMode);
  ConnectionMode mode = ConnectionMode::TunnelClient;
  if (!v.empty() && !parse_mode(v, mode)) {
    Logger::instance().log(LogLevel::WARN,
                           "settings: unknown connection_mode '%s'",
                           v.c_str());
    mode = ConnectionMode::TunnelClient;
  }
  return mode;
}

void Settings::set_connection_mode(ConnectionMode mode) {
  set(kKeyMode, mode_name(mode));
}

std::string Settings::wifi_host() const { return get(kKeyWifiHost); }

int Settings::wifi_port() const {
  return get_int(kKeyWifiPort, kDefaultTunnelPort);
}

void Settings::set_wifi_endpoint(const std::string &host, int port) {
  std::lock_guard<std::mutex> lk(mtx_);
  values_[kKeyWifiHost] = host;
  values_[kKeyWifiPort] = std::to_string(port);
  save_locked();
}

int Settings::tunnel_port() const {
  return get_int(kKeyTunnelPort, kDefaultTunnelPort);
}

int Settings::listen_port() const {
  return get_int(kKeyListenPort, kDefaultListenPort);
}

} // namespace pcex
