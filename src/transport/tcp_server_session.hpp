#pragma once
#include <string>
#include <vector>
#include "connection.hpp"
#include "error.hpp"
#include "tcp_channel.hpp"
#include "transport.hpp"

namespace pcex {

// Role-reversed session: listens on the loopback interface and waits for the
// PC to dial in through a reverse-forwarded port. The peer speaks first.
class TcpServerSession {
public:
    explicit TcpServerSession(StateCell& state, SessionTimeouts timeouts = {});
    ~TcpServerSession();

    void configure(int listen_port) { port_ = listen_port; }
    int port() const { return port_; }

    // Blocks until a peer connects and completes the handshake, or the accept deadline passes.
    Result<void> connect();
    void disconnect();
    Result<void> request_authorization();
    bool has_authorization() const { return true; }

    Result<void> send(const std::vector<uint8_t>& bytes);
    Result<std::vector<uint8_t>> receive(size_t max_len);

    // Identity string the peer sent with its handshake.
    const std::string& peer_identity() const { return peer_identity_; }

private:
    Error fail(const Error& err, const std::string& hint);

    StateCell& state_;
    SessionTimeouts timeouts_;
    int port_{5556};
    std::string peer_identity_;
    TcpChannel channel_;
};

} // namespace pcex
