#include "tcp_channel.hpp"
#include "protocol.hpp"

namespace pcex {

TcpChannel::TcpChannel() : socket_(io_), acceptor_(io_) {}

TcpChannel::~TcpChannel() { close(); }

bool TcpChannel::run_for(Duration timeout) {
  io_.restart();
  io_.run_for(timeout);
  if (io_.stopped())
    return true;
  // Deadline hit: cancel the pending operation and let its handler run.
  std::error_code ignored;
  socket_.close(ignored);
  acceptor_.close(ignored);
  io_.run();
  return false;
}

Error TcpChannel::io_error(const std::error_code &ec, const char *op) const {
  if (ec == asio::error::eof || ec == asio::error::connection_reset ||
      ec == asio::error::broken_pipe || ec == asio::error::connection_aborted)
    return Error{TransportErrc::peer_closed, std::string(op) + ": " + ec.message()};
  if (ec == asio::error::operation_aborted || ec == asio::error::bad_descriptor)
    return Error{TransportErrc::not_connected, std::string(op) + ": " + ec.message()};
  return Error{TransportErrc::io_failure, std::string(op) + ": " + ec.message()};
}

Result<void> TcpChannel::connect(const std::string &host, uint16_t port,
                                 Duration timeout) {
  close();
  std::error_code ec;
  tcp::resolver resolver(io_);
  auto endpoints = resolver.resolve(host, std::to_string(port), ec);
  if (ec)
    return Error{TransportErrc::invalid_host,
                 "cannot resolve " + host + ": " + ec.message()};

  std::error_code result = asio::error::would_block;
  asio::async_connect(socket_, endpoints,
                      [&result](std::error_code e, const tcp::endpoint &) {
                        result = e;
                      });
  if (!run_for(timeout))
    return Error{TransportErrc::timed_out,
                 "connect to " + host + ":" + std::to_string(port)};
  if (result) {
    close();
    return Error{TransportErrc::connect_failed,
                 host + ":" + std::to_string(port) + ": " + result.message()};
  }
  socket_.set_option(tcp::no_delay(true), ec);
  return {};
}

Result<void> TcpChannel::accept_one(const std::string &bind_host,
                                    uint16_t port, Duration timeout) {
  close();
  std::error_code ec;
  auto addr = asio::ip::make_address(bind_host, ec);
  if (ec)
    return Error{TransportErrc::invalid_host, bind_host};
  tcp::endpoint ep(addr, port);
  acceptor_.open(ep.protocol(), ec);
  if (!ec)
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
  if (!ec)
    acceptor_.bind(ep, ec);
  if (!ec)
    acceptor_.listen(1, ec);
  if (ec) {
    std::error_code ignored;
    acceptor_.close(ignored);
    if (ec == asio::error::address_in_use)
      return Error{TransportErrc::address_in_use,
                   "port " + std::to_string(port) + " already in use"};
    return Error{TransportErrc::io_failure, "listen: " + ec.message()};
  }

  std::error_code result = asio::error::would_block;
  acceptor_.async_accept(socket_, [&result](std::error_code e) { result = e; });
  bool finished = run_for(timeout);
  std::error_code ignored;
  acceptor_.close(ignored);
  if (!finished)
    return Error{TransportErrc::timed_out, "no peer connected to port " +
                                               std::to_string(port)};
  if (result)
    return io_error(result, "accept");
  socket_.set_option(tcp::no_delay(true), ec);
  return {};
}

Result<void> TcpChannel::write_all(const uint8_t *data, size_t len,
                                   Duration timeout) {
  if (!socket_.is_open())
    return Error{TransportErrc::not_connected};
  std::error_code result = asio::error::would_block;
  asio::async_write(socket_, asio::buffer(data, len),
                    [&result](std::error_code e, std::size_t) { result = e; });
  if (!run_for(timeout))
    return Error{TransportErrc::timed_out, "write"};
  if (result)
    return io_error(result, "write");
  return {};
}

Result<void> TcpChannel::read_exact(uint8_t *data, size_t len,
                                    Duration timeout) {
  if (!socket_.is_open())
    return Error{TransportErrc::not_connected};
  std::error_code result = asio::error::would_block;
  asio::async_read(socket_, asio::buffer(data, len),
                   [&result](std::error_code e, std::size_t) { result = e; });
  if (!run_for(timeout))
    return Error{TransportErrc::timed_out, "read"};
  if (result)
    return io_error(result, "read");
  return {};
}

Result<std::vector<uint8_t>> TcpChannel::read_frame(Duration timeout) {
  std::vector<uint8_t> frame(kPrefixSize);
  auto r = read_exact(frame.data(), kPrefixSize, timeout);
  if (!r)
    return r.error();
  auto len = peek_payload_length(frame.data());
  if (!len)
    return len.error();
  frame.resize(kPrefixSize + len.value() + kChecksumSize);
  r = read_exact(frame.data() + kPrefixSize, len.value() + kChecksumSize,
                 timeout);
  if (!r)
    return r.error();
  return frame;
}

std::string TcpChannel::peer() const {
  std::error_code ec;
  auto ep = socket_.remote_endpoint(ec);
  if (ec)
    return "?";
  return ep.address().to_string() + ":" + std::to_string(ep.port());
}

void TcpChannel::close() {
  std::error_code ignored;
  if (socket_.is_open()) {
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }
  if (acceptor_.is_open())
    acceptor_.close(ignored);
}

} // namespace pcex
