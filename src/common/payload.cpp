#include "payload.hpp"

namespace pcex {

namespace {

constexpr uint8_t kEntryDirectory = 0x01;

Error malformed(const char *what) {
  return Error{ProtocolErrc::malformed_payload, what};
}

} // namespace

void ByteWriter::put_u8(uint8_t v) { buf_.push_back(v); }

void ByteWriter::put_u32(uint32_t v) {
  for (int i = 0; i < 4; i++)
    buf_.push_back((uint8_t)((v >> (8 * i)) & 0xFF));
}

void ByteWriter::put_u64(uint64_t v) {
  for (int i = 0; i < 8; i++)
    buf_.push_back((uint8_t)((v >> (8 * i)) & 0xFF));
}

void ByteWriter::put_string(const std::string &s) {
  put_u32((uint32_t)s.size());
  buf_.insert(buf_.end(), s.begin(), s.end());
}

bool ByteReader::get_u8(uint8_t &v) {
  if (remaining() < 1)
    return false;
  v = data_[pos_++];
  return true;
}

bool ByteReader::get_u32(uint32_t &v) {
  if (remaining() < 4)
    return false;
  v = 0;
  for (int i = 0; i < 4; i++)
    v |= (uint32_t)data_[pos_ + i] << (8 * i);
  pos_ += 4;
  return true;
}

bool ByteReader::get_i32(int32_t &v) {
  uint32_t u;
  if (!get_u32(u))
    return false;
  v = static_cast<int32_t>(u);
  return true;
}

bool ByteReader::get_u64(uint64_t &v) {
  if (remaining() < 8)
    return false;
  v = 0;
  for (int i = 0; i < 8; i++)
    v |= (uint64_t)data_[pos_ + i] << (8 * i);
  pos_ += 8;
  return true;
}

bool ByteReader::get_i64(int64_t &v) {
  uint64_t u;
  if (!get_u64(u))
    return false;
  v = static_cast<int64_t>(u);
  return true;
}

bool ByteReader::get_string(std::string &s) {
  uint32_t len;
  size_t mark = pos_;
  if (!get_u32(len))
    return false;
  if (remaining() < len) {
    pos_ = mark;
    return false;
  }
  s.assign(reinterpret_cast<const char *>(data_ + pos_), len);
  pos_ += len;
  return true;
}

bool operator==(const FileEntry &a, const FileEntry &b) {
  return a.name == b.name && a.path == b.path &&
         a.is_directory == b.is_directory && a.size == b.size &&
         a.modified == b.modified;
}

std::vector<uint8_t> to_bytes(const std::string &s) {
  return std::vector<uint8_t>(s.begin(), s.end());
}

std::string to_text(const std::vector<uint8_t> &bytes) {
  return std::string(bytes.begin(), bytes.end());
}

std::vector<uint8_t> encode_path(const std::string &path) {
  ByteWriter w;
  w.put_string(path);
  return w.take();
}

Result<std::string> decode_path(const std::vector<uint8_t> &payload) {
  ByteReader r(payload);
  std::string path;
  if (!r.get_string(path))
    return malformed("path");
  return path;
}

std::vector<uint8_t> encode_rename(const std::string &path,
                                   const std::string &new_name) {
  ByteWriter w;
  w.put_string(path);
  w.put_string(new_name);
  return w.take();
}

std::vector<uint8_t> encode_search(const std::string &query,
                                   const std::string &path) {
  ByteWriter w;
  w.put_string(query);
  w.put_string(path);
  return w.take();
}

void write_file_entry(ByteWriter &w, const FileEntry &e) {
  w.put_string(e.name);
  w.put_string(e.path);
  w.put_u8(e.is_directory ? kEntryDirectory : 0);
  w.put_u64(e.size);
  w.put_u64(e.modified);
}

static bool read_file_entry(ByteReader &r, FileEntry &e) {
  uint8_t flags;
  if (!r.get_string(e.name) || !r.get_string(e.path) || !r.get_u8(flags) ||
      !r.get_u64(e.size) || !r.get_u64(e.modified))
    return false;
  e.is_directory = (flags & kEntryDirectory) != 0;
  return true;
}

std::vector<uint8_t> encode_file_entry(const FileEntry &e) {
  ByteWriter w;
  write_file_entry(w, e);
  return w.take();
}

Result<FileEntry> decode_file_entry(const std::vector<uint8_t> &payload) {
  ByteReader r(payload);
  FileEntry e;
  if (!read_file_entry(r, e))
    return malformed("file entry");
  return e;
}

std::vector<uint8_t> encode_file_list(const std::vector<FileEntry> &entries) {
  ByteWriter w;
  w.put_u32((uint32_t)entries.size());
  for (const auto &e : entries)
    write_file_entry(w, e);
  return w.take();
}

Result<std::vector<FileEntry>>
decode_file_list(const std::vector<uint8_t> &payload) {
  std::vector<FileEntry> out;
  if (payload.empty())
    return out;
  ByteReader r(payload);
  uint32_t count;
  if (!r.get_u32(count))
    return malformed("file list count");
  // Each entry is at least 25 bytes; reject counts the payload cannot hold.
  if (count > r.remaining() / 25)
    return malformed("file list count exceeds payload");
  out.reserve(count);
  for (uint32_t i = 0; i < count; i++) {
    FileEntry e;
    if (!read_file_entry(r, e))
      return malformed("file list entry");
    out.push_back(std::move(e));
  }
  return out;
}

std::vector<uint8_t> encode_storage_info(const StorageInfo &info) {
  ByteWriter w;
  w.put_u64(info.total_bytes);
  w.put_u64(info.free_bytes);
  w.put_string(info.drive);
  w.put_string(info.volume_name);
  return w.take();
}

Result<StorageInfo> decode_storage_info(const std::vector<uint8_t> &payload) {
  ByteReader r(payload);
  StorageInfo info;
  if (!r.get_u64(info.total_bytes) || !r.get_u64(info.free_bytes) ||
      !r.get_string(info.drive) || !r.get_string(info.volume_name))
    return malformed("storage info");
  return info;
}

std::vector<uint8_t> encode_drive_list(const std::vector<std::string> &drives) {
  ByteWriter w;
  w.put_u32((uint32_t)drives.size());
  for (const auto &d : drives)
    w.put_string(d);
  return w.take();
}

Result<std::vector<std::string>>
decode_drive_list(const std::vector<uint8_t> &payload) {
  std::vector<std::string> out;
  if (payload.empty())
    return out;
  ByteReader r(payload);
  uint32_t count;
  if (!r.get_u32(count))
    return malformed("drive list count");
  if (count > r.remaining() / 4)
    return malformed("drive list count exceeds payload");
  for (uint32_t i = 0; i < count; i++) {
    std::string d;
    if (!r.get_string(d))
      return malformed("drive list entry");
    out.push_back(std::move(d));
  }
  return out;
}

std::vector<uint8_t> encode_read_request(const ReadRequest &req) {
  ByteWriter w;
  w.put_string(req.path);
  w.put_u64(req.offset);
  w.put_i64(req.length);
  return w.take();
}

Result<ReadRequest> decode_read_request(const std::vector<uint8_t> &payload) {
  ByteReader r(payload);
  ReadRequest req;
  if (!r.get_string(req.path) || !r.get_u64(req.offset) ||
      !r.get_i64(req.length))
    return malformed("read request");
  return req;
}

std::vector<uint8_t> encode_write_header(const WriteHeader &hdr) {
  ByteWriter w;
  w.put_string(hdr.path);
  w.put_u64(hdr.total_size);
  w.put_u32(hdr.chunk_size);
  return w.take();
}

Result<WriteHeader> decode_write_header(const std::vector<uint8_t> &payload) {
  ByteReader r(payload);
  WriteHeader hdr;
  if (!r.get_string(hdr.path) || !r.get_u64(hdr.total_size) ||
      !r.get_u32(hdr.chunk_size))
    return malformed("write header");
  return hdr;
}

std::vector<uint8_t> encode_remote_error(const RemoteError &err) {
  ByteWriter w;
  w.put_i32(err.code);
  w.put_string(err.message);
  return w.take();
}

Result<RemoteError> decode_remote_error(const std::vector<uint8_t> &payload) {
  ByteReader r(payload);
  RemoteError err;
  if (!r.get_i32(err.code) || !r.get_string(err.message))
    return malformed("error record");
  return err;
}

} // namespace pcex
