#include "command_executor.hpp"
#include "exchange.hpp"
#include "logging.hpp"

namespace pcex {

Error remote_failure(const Packet &reply) {
  auto rec = decode_remote_error(reply.payload);
  if (!rec)
    return Error{ProtocolErrc::malformed_payload, "unreadable error record"};
  return Error{remote_error_code(rec.value().code), rec.value().message};
}

Result<void> CommandExecutor::Exchange::send(Command command, uint8_t flags,
                                             const std::vector<uint8_t> &payload) {
  return send_packet(lease_, command, flags, payload);
}

Result<Packet> CommandExecutor::Exchange::receive() {
  return receive_packet(lease_);
}

Result<Packet> CommandExecutor::Exchange::call(Command command,
                                               const std::vector<uint8_t> &payload) {
  auto sent = send(command, PF_NONE, payload);
  if (!sent)
    return sent.error();
  auto reply = receive();
  if (!reply)
    return reply;
  switch (reply.value().command) {
  case Command::ResponseOk:
  case Command::ResponseData:
    return reply;
  case Command::ResponseError: {
    Error err = remote_failure(reply.value());
    Logger::instance().log(LogLevel::DEBUG, "%s failed: %s",
                           command_name(command), err.describe().c_str());
    return err;
  }
  default:
    return Error{ProtocolErrc::unexpected_response,
                 std::string(command_name(reply.value().command)) + " in reply to " +
                     command_name(command)};
  }
}

Result<void> CommandExecutor::execute(Command command,
                                      const std::vector<uint8_t> &payload) {
  auto ex = open_exchange();
  auto reply = ex.call(command, payload);
  if (!reply)
    return reply.error();
  return {};
}

} // namespace pcex
