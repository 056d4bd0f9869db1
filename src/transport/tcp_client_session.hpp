#pragma once
#include <string>
#include <vector>
#include "connection.hpp"
#include "error.hpp"
#include "tcp_channel.hpp"
#include "transport.hpp"

namespace pcex {

// Which outbound route a TcpClientSession represents. Both speak the same
// bytes; they differ in where the endpoint comes from and how they are named.
enum class ClientRoute { Tunnel, Wifi };

// Outbound TCP session: dials host:port, performs the handshake, then carries frames.
class TcpClientSession {
public:
    TcpClientSession(ClientRoute route, StateCell& state, SessionTimeouts timeouts = {});
    ~TcpClientSession();

    // Takes effect on the next connect(). "localhost" is rewritten to 127.0.0.1.
    void configure(const std::string& host, int port);
    const std::string& host() const { return host_; }
    int port() const { return port_; }
    ClientRoute route() const { return route_; }

    Result<void> connect();
    void disconnect();
    // Network routes need no grant; this simply connects.
    Result<void> request_authorization();
    bool has_authorization() const { return true; }

    Result<void> send(const std::vector<uint8_t>& bytes);
    Result<std::vector<uint8_t>> receive(size_t max_len);

private:
    const char* tag() const { return route_ == ClientRoute::Tunnel ? "tunnel" : "wifi"; }
    Error fail(const Error& err, const std::string& hint);

    ClientRoute route_;
    StateCell& state_;
    SessionTimeouts timeouts_;
    std::string host_;
    int port_{0};
    TcpChannel channel_;
};

} // namespace pcex
