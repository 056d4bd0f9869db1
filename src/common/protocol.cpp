#include "protocol.hpp"
#include <algorithm>

namespace pcex {

namespace {

uint32_t load_le32(const uint8_t *p) {
  return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) |
         ((uint32_t)p[3] << 24);
}

void store_le32(uint8_t *p, uint32_t v) {
  p[0] = (uint8_t)(v & 0xFF);
  p[1] = (uint8_t)((v >> 8) & 0xFF);
  p[2] = (uint8_t)((v >> 16) & 0xFF);
  p[3] = (uint8_t)((v >> 24) & 0xFF);
}

std::array<uint32_t, 256> make_crc_table() {
  std::array<uint32_t, 256> table{};
  for (uint32_t i = 0; i < 256; i++) {
    uint32_t c = i;
    for (int j = 0; j < 8; j++)
      c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
    table[i] = c;
  }
  return table;
}

} // namespace

bool operator==(const Packet &a, const Packet &b) {
  return a.command == b.command && a.flags == b.flags && a.payload == b.payload;
}

const char *command_name(Command c) {
  switch (c) {
  case Command::Handshake:
    return "HANDSHAKE";
  case Command::ListDir:
    return "LIST_DIR";
  case Command::GetFileInfo:
    return "GET_FILE_INFO";
  case Command::ReadFile:
    return "READ_FILE";
  case Command::WriteFile:
    return "WRITE_FILE";
  case Command::CreateDir:
    return "CREATE_DIR";
  case Command::Delete:
    return "DELETE";
  case Command::Rename:
    return "RENAME";
  case Command::Search:
    return "SEARCH";
  case Command::GetDrives:
    return "GET_DRIVES";
  case Command::GetStorageInfo:
    return "GET_STORAGE_INFO";
  case Command::Disconnect:
    return "DISCONNECT";
  case Command::ResponseOk:
    return "RESPONSE_OK";
  case Command::ResponseError:
    return "RESPONSE_ERROR";
  case Command::ResponseData:
    return "RESPONSE_DATA";
  case Command::ResponseFileChunk:
    return "RESPONSE_FILE_CHUNK";
  case Command::ResponseEnd:
    return "RESPONSE_END";
  }
  return "UNKNOWN";
}

bool is_response(Command c) { return (static_cast<uint8_t>(c) & 0x80) != 0 && c != Command::Disconnect; }

uint32_t crc32(const uint8_t *data, size_t len) {
  static const std::array<uint32_t, 256> table = make_crc_table();
  uint32_t c = ~0u;
  for (size_t i = 0; i < len; i++)
    c = table[(c ^ data[i]) & 0xFF] ^ (c >> 8);
  return ~c;
}

std::vector<uint8_t> encode_packet(Command command, uint8_t flags,
                                   const std::vector<uint8_t> &payload) {
  std::vector<uint8_t> buf(kFrameOverhead + payload.size());
  std::copy(kMagic.begin(), kMagic.end(), buf.begin());
  buf[4] = static_cast<uint8_t>(command);
  buf[5] = flags;
  store_le32(buf.data() + 6, (uint32_t)payload.size());
  std::copy(payload.begin(), payload.end(), buf.begin() + kPrefixSize);
  size_t covered = kPrefixSize + payload.size();
  store_le32(buf.data() + covered, crc32(buf.data(), covered));
  return buf;
}

Result<uint32_t> peek_payload_length(const uint8_t *prefix) {
  if (!std::equal(kMagic.begin(), kMagic.end(), prefix))
    return Error{DecodeErrc::bad_magic};
  uint32_t len = load_le32(prefix + 6);
  if (len > kMaxPayloadSize)
    return Error{DecodeErrc::oversized_payload,
                 "declared payload of " + std::to_string(len) + " bytes"};
  return len;
}

Result<Packet> decode_packet(const uint8_t *data, size_t len) {
  if (len < kFrameOverhead)
    return Error{DecodeErrc::too_small,
                 "got " + std::to_string(len) + " bytes"};
  if (!std::equal(kMagic.begin(), kMagic.end(), data))
    return Error{DecodeErrc::bad_magic};
  uint32_t payload_len = load_le32(data + 6);
  size_t available = len - kFrameOverhead;
  if (payload_len > available)
    return Error{DecodeErrc::truncated_payload,
                 "declared " + std::to_string(payload_len) + ", have " +
                     std::to_string(available)};
  if (payload_len > kMaxPayloadSize)
    return Error{DecodeErrc::oversized_payload};

  // A damaged length moves the checksum window, so it fails here first.
  size_t covered = kPrefixSize + payload_len;
  uint32_t expected = load_le32(data + covered);
  if (crc32(data, covered) != expected)
    return Error{DecodeErrc::checksum_mismatch};
  if (payload_len < available)
    return Error{DecodeErrc::trailing_data};

  Packet p;
  p.command = static_cast<Command>(data[4]);
  p.flags = data[5];
  p.payload.assign(data + kPrefixSize, data + covered);
  return p;
}

} // namespace pcex
