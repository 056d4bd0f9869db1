#pragma once
#include <mutex>
#include <optional>
#include <variant>
#include <vector>
#include "connection.hpp"
#include "direct_host_session.hpp"
#include "error.hpp"
#include "settings.hpp"
#include "tcp_client_session.hpp"
#include "tcp_server_session.hpp"
#include "transport.hpp"
#include "usb_host.hpp"

namespace pcex {

// Owns the active session, chosen from the persisted connection mode, and
// serializes all traffic through it.
class SessionSelector {
public:
    using Session = std::variant<DirectHostSession, TcpClientSession, TcpServerSession>;

    // Exclusive use of the active session for one full exchange. Mode changes
    // and other leases wait until it is destroyed.
    class Lease {
    public:
        Result<void> send(const std::vector<uint8_t>& bytes);
        Result<std::vector<uint8_t>> receive(size_t max_len);

    private:
        friend class SessionSelector;
        explicit Lease(SessionSelector& owner);

        SessionSelector* owner_;
        std::unique_lock<std::mutex> lock_;
    };

    SessionSelector(Settings& settings, UsbHost& usb, SessionTimeouts timeouts = {});
    ~SessionSelector();
    SessionSelector(const SessionSelector&) = delete;
    SessionSelector& operator=(const SessionSelector&) = delete;

    ConnectionMode mode() const { return settings_.connection_mode(); }
    // Mode of the variant actually in use (Auto resolves to TunnelClient).
    ConnectionMode active_mode();

    // Disconnects the current session, persists the mode and builds its replacement.
    void set_mode(ConnectionMode mode);
    // Persists the Wi-Fi endpoint; a live Wi-Fi session is torn down and rebuilt.
    void set_wifi_endpoint(const std::string& host, int port);

    Result<void> connect();
    void disconnect();
    Result<void> request_authorization();
    bool has_authorization();

    // Each call takes its own lease, so another thread may run an exchange
    // between a send and the matching receive. Hold lease() for a request
    // and its reply.
    Result<void> send(const std::vector<uint8_t>& bytes);
    Result<std::vector<uint8_t>> receive(size_t max_len);

    Lease lease() { return Lease(*this); }

    ConnectionState state() const { return state_.get(); }
    int subscribe(StateCell::Listener l) { return state_.subscribe(std::move(l)); }
    void unsubscribe(int token) { state_.unsubscribe(token); }

private:
    Session& session_locked();
    void rebuild_locked();
    void teardown_locked();

    Settings& settings_;
    UsbHost& usb_;
    SessionTimeouts timeouts_;
    StateCell state_;

    std::mutex mtx_;
    ConnectionMode active_mode_{ConnectionMode::TunnelClient};
    std::optional<Session> session_;
};

} // namespace pcex
