#pragma once
#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include "error.hpp"

namespace pcex {

// Blocking TCP stream with per-call deadlines. Each call drives a private
// io_context; on expiry the socket is closed and the call fails with timed_out.
class TcpChannel {
public:
    using tcp = asio::ip::tcp;
    using Duration = std::chrono::steady_clock::duration;

    TcpChannel();
    ~TcpChannel();
    TcpChannel(const TcpChannel&) = delete;
    TcpChannel& operator=(const TcpChannel&) = delete;

    Result<void> connect(const std::string& host, uint16_t port, Duration timeout);
    // Listens on bind_host:port until one peer connects, then stops listening.
    Result<void> accept_one(const std::string& bind_host, uint16_t port, Duration timeout);

    Result<void> write_all(const uint8_t* data, size_t len, Duration timeout);
    Result<void> read_exact(uint8_t* data, size_t len, Duration timeout);
    // Reads one complete frame: the 10-byte prefix, then payload and checksum.
    Result<std::vector<uint8_t>> read_frame(Duration timeout);

    bool is_open() const { return socket_.is_open(); }
    std::string peer() const;
    void close();

private:
    bool run_for(Duration timeout);
    Error io_error(const std::error_code& ec, const char* op) const;

    asio::io_context io_;
    tcp::socket socket_;
    tcp::acceptor acceptor_;
};

} // namespace pcex
