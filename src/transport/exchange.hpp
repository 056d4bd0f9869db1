#pragma once
#include <string>
#include <vector>
#include "error.hpp"
#include "payload.hpp"
#include "protocol.hpp"

namespace pcex {

constexpr const char* kClientIdentity = "PCEX-Client-1.0";
constexpr const char* kListenerIdentity = "PCEX-Client-1.0-Forward";

// Packet helpers over anything with send(bytes) and receive(max_len).

template <typename Channel>
Result<void> send_packet(Channel& ch, Command command, uint8_t flags,
                         const std::vector<uint8_t>& payload) {
    if (payload.size() > kMaxPayloadSize)
        return Error{ProtocolErrc::payload_too_large,
                     std::to_string(payload.size()) + " bytes for " + command_name(command)};
    return ch.send(encode_packet(command, flags, payload));
}

template <typename Channel>
Result<Packet> receive_packet(Channel& ch) {
    auto raw = ch.receive(kMaxFrameSize);
    if (!raw)
        return raw.error();
    return decode_packet(raw.value());
}

// Outbound handshake: send HANDSHAKE, require RESPONSE_OK.
template <typename Channel>
Result<void> perform_handshake(Channel& ch) {
    auto sent = send_packet(ch, Command::Handshake, PF_NONE, to_bytes(kClientIdentity));
    if (!sent)
        return sent.error();
    auto reply = receive_packet(ch);
    if (!reply)
        return reply.error();
    if (reply.value().command != Command::ResponseOk) {
        std::string detail = std::string("peer answered ") + command_name(reply.value().command);
        if (reply.value().command == Command::ResponseError) {
            auto err = decode_remote_error(reply.value().payload);
            if (err)
                detail += ": " + err.value().message;
        }
        return Error{ProtocolErrc::handshake_rejected, detail};
    }
    return {};
}

// Role-reversed handshake: the first inbound packet must be HANDSHAKE and is
// answered with RESPONSE_OK. Returns the peer's identity string.
template <typename Channel>
Result<std::string> answer_handshake(Channel& ch) {
    auto hello = receive_packet(ch);
    if (!hello)
        return hello.error();
    if (hello.value().command != Command::Handshake)
        return Error{ProtocolErrc::handshake_rejected,
                     std::string("expected HANDSHAKE, got ") + command_name(hello.value().command)};
    auto sent = send_packet(ch, Command::ResponseOk, PF_NONE, to_bytes(kListenerIdentity));
    if (!sent)
        return sent.error();
    return to_text(hello.value().payload);
}

} // namespace pcex
