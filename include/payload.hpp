#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "error.hpp"

namespace pcex {

// Little-endian builder for payload bodies. Strings are a u32 byte length
// followed by UTF-8 bytes.
class ByteWriter {
public:
    void put_u8(uint8_t v);
    void put_u32(uint32_t v);
    void put_i32(int32_t v) { put_u32(static_cast<uint32_t>(v)); }
    void put_u64(uint64_t v);
    void put_i64(int64_t v) { put_u64(static_cast<uint64_t>(v)); }
    void put_string(const std::string& s);

    const std::vector<uint8_t>& bytes() const { return buf_; }
    std::vector<uint8_t> take() { return std::move(buf_); }

private:
    std::vector<uint8_t> buf_;
};

// Bounds-checked reader; every getter returns false once the input runs short.
class ByteReader {
public:
    explicit ByteReader(const std::vector<uint8_t>& bytes)
        : data_(bytes.data()), size_(bytes.size()) {}
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    bool get_u8(uint8_t& v);
    bool get_u32(uint32_t& v);
    bool get_i32(int32_t& v);
    bool get_u64(uint64_t& v);
    bool get_i64(int64_t& v);
    bool get_string(std::string& s);

    size_t remaining() const { return size_ - pos_; }
    bool exhausted() const { return pos_ == size_; }

private:
    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
};

struct FileEntry {
    std::string name;
    std::string path;
    bool is_directory{false};
    uint64_t size{0};
    uint64_t modified{0}; // epoch milliseconds
};

bool operator==(const FileEntry& a, const FileEntry& b);

struct StorageInfo {
    uint64_t total_bytes{0};
    uint64_t free_bytes{0};
    std::string drive;
    std::string volume_name;

    uint64_t used_bytes() const { return total_bytes >= free_bytes ? total_bytes - free_bytes : 0; }
};

struct ReadRequest {
    std::string path;
    uint64_t offset{0};
    int64_t length{-1}; // -1 reads to end of file
};

struct WriteHeader {
    std::string path;
    uint64_t total_size{0};
    uint32_t chunk_size{0};
};

struct RemoteError {
    int32_t code{0};
    std::string message;
};

std::vector<uint8_t> to_bytes(const std::string& s);
std::string to_text(const std::vector<uint8_t>& bytes);

std::vector<uint8_t> encode_path(const std::string& path);
Result<std::string> decode_path(const std::vector<uint8_t>& payload);

std::vector<uint8_t> encode_rename(const std::string& path, const std::string& new_name);
std::vector<uint8_t> encode_search(const std::string& query, const std::string& path);

void write_file_entry(ByteWriter& w, const FileEntry& e);
std::vector<uint8_t> encode_file_entry(const FileEntry& e);
Result<FileEntry> decode_file_entry(const std::vector<uint8_t>& payload);

// An empty payload is an empty list.
std::vector<uint8_t> encode_file_list(const std::vector<FileEntry>& entries);
Result<std::vector<FileEntry>> decode_file_list(const std::vector<uint8_t>& payload);

std::vector<uint8_t> encode_storage_info(const StorageInfo& info);
Result<StorageInfo> decode_storage_info(const std::vector<uint8_t>& payload);

std::vector<uint8_t> encode_drive_list(const std::vector<std::string>& drives);
Result<std::vector<std::string>> decode_drive_list(const std::vector<uint8_t>& payload);

std::vector<uint8_t> encode_read_request(const ReadRequest& req);
Result<ReadRequest> decode_read_request(const std::vector<uint8_t>& payload);

std::vector<uint8_t> encode_write_header(const WriteHeader& hdr);
Result<WriteHeader> decode_write_header(const std::vector<uint8_t>& payload);

std::vector<uint8_t> encode_remote_error(const RemoteError& err);
Result<RemoteError> decode_remote_error(const std::vector<uint8_t>& payload);

} // namespace pcex
