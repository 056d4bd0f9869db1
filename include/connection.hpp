#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>

namespace pcex {

enum class ConnectionMode { DirectHost, TunnelClient, TunnelServer, WifiClient, Auto };

const char* mode_name(ConnectionMode m);
bool parse_mode(const std::string& s, ConnectionMode& out);

struct DeviceDescriptor {
    std::string id;
    std::string display_name;
    std::optional<uint16_t> vendor_id;
    std::optional<uint16_t> product_id;
    std::optional<std::string> manufacturer;
    std::optional<std::string> product;
    std::optional<std::string> serial;
};

struct ConnectionState {
    enum class Kind { Disconnected, Connecting, Connected, AuthorizationRequired, Error };

    Kind kind{Kind::Disconnected};
    DeviceDescriptor device;   // meaningful when Connected
    std::string message;       // meaningful when Error
    std::error_code cause;

    bool is_connected() const { return kind == Kind::Connected; }

    static ConnectionState disconnected();
    static ConnectionState connecting();
    static ConnectionState connected(DeviceDescriptor device);
    static ConnectionState authorization_required();
    static ConnectionState error(std::string message, std::error_code cause = {});
};

const char* state_name(ConnectionState::Kind k);

// Observable connection state. Listeners run on the thread that publishes,
// outside the internal lock, and are first called with the current value.
class StateCell {
public:
    using Listener = std::function<void(const ConnectionState&)>;

    ConnectionState get() const;
    void set(ConnectionState s);
    int subscribe(Listener l);
    void unsubscribe(int token);

private:
    mutable std::mutex mtx_;
    ConnectionState value_;
    std::map<int, Listener> listeners_;
    int next_token_{1};
};

} // namespace pcex
