#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "error.hpp"

namespace pcex {

// Frame layout, all integers little-endian:
//   magic[4] "PCEX" | command u8 | flags u8 | payload_len u32 | payload | crc32 u32
// The checksum covers every byte before it.
constexpr std::array<uint8_t, 4> kMagic = {'P', 'C', 'E', 'X'};
constexpr size_t kPrefixSize = 10;
constexpr size_t kChecksumSize = 4;
constexpr size_t kFrameOverhead = kPrefixSize + kChecksumSize;
constexpr size_t kMaxFrameSize = 65535;
constexpr size_t kMaxPayloadSize = kMaxFrameSize - kFrameOverhead;

enum class Command : uint8_t {
    Handshake = 0x01,
    ListDir = 0x02,
    GetFileInfo = 0x03,
    ReadFile = 0x04,
    WriteFile = 0x05,
    CreateDir = 0x06,
    Delete = 0x07,
    Rename = 0x08,
    Search = 0x09,
    GetDrives = 0x0A,
    GetStorageInfo = 0x0B,
    Disconnect = 0xFF,

    ResponseOk = 0x80,
    ResponseError = 0x81,
    ResponseData = 0x82,
    ResponseFileChunk = 0x83,
    ResponseEnd = 0x84
};

enum PacketFlags : uint8_t {
    PF_NONE         = 0x00,
    PF_COMPRESSED   = 0x01,
    PF_ENCRYPTED    = 0x02,
    PF_CONTINUATION = 0x04,
    PF_FINAL        = 0x08
};

struct Packet {
    Command command{Command::ResponseOk};
    uint8_t flags{PF_NONE};
    std::vector<uint8_t> payload;
};

bool operator==(const Packet& a, const Packet& b);
inline bool operator!=(const Packet& a, const Packet& b) { return !(a == b); }

const char* command_name(Command c);
bool is_response(Command c);

uint32_t crc32(const uint8_t* data, size_t len);

// Callers keep payloads within kMaxPayloadSize.
std::vector<uint8_t> encode_packet(Command command, uint8_t flags,
                                   const std::vector<uint8_t>& payload);
inline std::vector<uint8_t> encode_packet(const Packet& p) {
    return encode_packet(p.command, p.flags, p.payload);
}

Result<Packet> decode_packet(const uint8_t* data, size_t len);
inline Result<Packet> decode_packet(const std::vector<uint8_t>& bytes) {
    return decode_packet(bytes.data(), bytes.size());
}

// Validates the magic of a kPrefixSize-byte prefix and returns the declared payload length.
Result<uint32_t> peek_payload_length(const uint8_t* prefix);

} // namespace pcex
