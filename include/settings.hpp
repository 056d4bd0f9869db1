#pragma once
#include <map>
#include <mutex>
#include <string>
#include "connection.hpp"

namespace pcex {

constexpr const char* kLoopbackHost = "127.0.0.1";
constexpr int kDefaultTunnelPort = 5555;
constexpr int kDefaultListenPort = 5556;

// Persisted key=value preferences. Every set() rewrites the backing file;
// an empty path keeps everything in memory.
class Settings {
public:
    explicit Settings(std::string path = {});

    // Returns false when the file does not exist yet.
    bool load();

    std::string get(const std::string& key, const std::string& default_value = {}) const;
    void set(const std::string& key, const std::string& value);
    int get_int(const std::string& key, int default_value) const;
    void set_int(const std::string& key, int value);

    ConnectionMode connection_mode() const;
    void set_connection_mode(ConnectionMode mode);
    std::string wifi_host() const;
    int wifi_port() const;
    void set_wifi_endpoint(const std::string& host, int port);
    int tunnel_port() const;
    int listen_port() const;

    const std::string& path() const { return path_; }

private:
    void save_locked() const;

    std::string path_;
    mutable std::mutex mtx_;
    std::map<std::string, std::string> values_;
};

} // namespace pcex
