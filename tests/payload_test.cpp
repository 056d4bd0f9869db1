#include <gtest/gtest.h>
#include "payload.hpp"

using namespace pcex;

namespace {

FileEntry sample_entry(const std::string& name, bool dir, uint64_t size) {
    FileEntry e;
    e.name = name;
    e.path = "C:\\Users\\" + name;
    e.is_directory = dir;
    e.size = size;
    e.modified = 1700000000000ull;
    return e;
}

} // namespace

TEST(Payload, PathIsLengthPrefixedUtf8) {
    auto bytes = encode_path("D:\\Fotos\\\xC3\xA9t\xC3\xA9");
    ASSERT_EQ(bytes.size(), 4u + 14u);
    EXPECT_EQ(bytes[0], 14);
    EXPECT_EQ(bytes[1], 0);
    auto back = decode_path(bytes);
    ASSERT_TRUE(back.ok());
    EXPECT_EQ(back.value(), "D:\\Fotos\\\xC3\xA9t\xC3\xA9");
}

TEST(Payload, FileEntryLayout) {
    FileEntry e = sample_entry("a.txt", false, 0x0102030405060708ull);
    auto bytes = encode_file_entry(e);
    // name(4+5) path(4+14) flags(1) size(8) mtime(8)
    ASSERT_EQ(bytes.size(), 9u + 18u + 1u + 8u + 8u);
    EXPECT_EQ(bytes[27], 0x00);
    EXPECT_EQ(bytes[28], 0x08);
    EXPECT_EQ(bytes[35], 0x01);

    auto dir = encode_file_entry(sample_entry("docs", true, 0));
    EXPECT_EQ(dir[4 + 4 + 4 + 13], 0x01);
}

TEST(Payload, FileListDecodesHandBuiltBytes) {
    ByteWriter w;
    w.put_u32(2);
    write_file_entry(w, sample_entry("docs", true, 0));
    write_file_entry(w, sample_entry("b.bin", false, 42));
    auto list = decode_file_list(w.bytes());
    ASSERT_TRUE(list.ok());
    ASSERT_EQ(list.value().size(), 2u);
    EXPECT_TRUE(list.value()[0].is_directory);
    EXPECT_EQ(list.value()[1].name, "b.bin");
    EXPECT_EQ(list.value()[1].size, 42u);
}

TEST(Payload, EmptyListPayloadsAreEmptyLists) {
    auto files = decode_file_list({});
    ASSERT_TRUE(files.ok());
    EXPECT_TRUE(files.value().empty());
    auto drives = decode_drive_list({});
    ASSERT_TRUE(drives.ok());
    EXPECT_TRUE(drives.value().empty());
}

TEST(Payload, ShortFileListIsMalformed) {
    auto bytes = encode_file_list({sample_entry("x", false, 1)});
    bytes.resize(bytes.size() - 2);
    auto r = decode_file_list(bytes);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ProtocolErrc::malformed_payload);

    ByteWriter w;
    w.put_u32(1000000);
    r = decode_file_list(w.bytes());
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ProtocolErrc::malformed_payload);
}

TEST(Payload, StringLongerThanPayloadIsRejected) {
    ByteWriter w;
    w.put_u32(50);
    w.put_u64(7);
    auto r = decode_path(w.bytes());
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ProtocolErrc::malformed_payload);
}

TEST(Payload, StorageInfo) {
    StorageInfo info;
    info.total_bytes = 500000000000ull;
    info.free_bytes = 123000000000ull;
    info.drive = "C:\\";
    info.volume_name = "Windows";
    auto back = decode_storage_info(encode_storage_info(info));
    ASSERT_TRUE(back.ok());
    EXPECT_EQ(back.value().total_bytes, info.total_bytes);
    EXPECT_EQ(back.value().used_bytes(), 377000000000ull);
    EXPECT_EQ(back.value().volume_name, "Windows");
}

TEST(Payload, DriveList) {
    auto back = decode_drive_list(encode_drive_list({"C:\\", "D:\\", "E:\\"}));
    ASSERT_TRUE(back.ok());
    EXPECT_EQ(back.value(), (std::vector<std::string>{"C:\\", "D:\\", "E:\\"}));
}

TEST(Payload, ReadRequestCarriesWholeFileSentinel) {
    ReadRequest req;
    req.path = "/tmp/x";
    auto bytes = encode_read_request(req);
    ASSERT_EQ(bytes.size(), 4u + 6u + 8u + 8u);
    for (size_t i = bytes.size() - 8; i < bytes.size(); i++)
        EXPECT_EQ(bytes[i], 0xFF);
    auto back = decode_read_request(bytes);
    ASSERT_TRUE(back.ok());
    EXPECT_EQ(back.value().length, -1);
    EXPECT_EQ(back.value().offset, 0u);
}

TEST(Payload, WriteHeader) {
    WriteHeader hdr;
    hdr.path = "C:\\in.bin";
    hdr.total_size = 70000;
    hdr.chunk_size = 32768;
    auto bytes = encode_write_header(hdr);
    ASSERT_EQ(bytes.size(), 4u + 9u + 8u + 4u);
    auto back = decode_write_header(bytes);
    ASSERT_TRUE(back.ok());
    EXPECT_EQ(back.value().total_size, 70000u);
    EXPECT_EQ(back.value().chunk_size, 32768u);
}

TEST(Payload, RemoteErrorKeepsNegativeAndUnknownCodes) {
    RemoteError e;
    e.code = -7;
    e.message = "odd";
    auto back = decode_remote_error(encode_remote_error(e));
    ASSERT_TRUE(back.ok());
    EXPECT_EQ(back.value().code, -7);
    EXPECT_EQ(back.value().message, "odd");
}

TEST(Payload, SearchAndRenameAreTwoStrings) {
    auto bytes = encode_rename("/a/old.txt", "new.txt");
    ByteReader r(bytes);
    std::string a, b;
    ASSERT_TRUE(r.get_string(a));
    ASSERT_TRUE(r.get_string(b));
    EXPECT_TRUE(r.exhausted());
    EXPECT_EQ(a, "/a/old.txt");
    EXPECT_EQ(b, "new.txt");

    auto search = encode_search("*.pdf", "C:\\");
    EXPECT_EQ(search.size(), 4u + 5u + 4u + 3u);
}
