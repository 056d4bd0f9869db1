#include <gtest/gtest.h>
#include "fake_host.hpp"
#include "fake_usb_host.hpp"
#include "remote_files.hpp"

using namespace pcex;
using namespace pcex::test;

namespace {

FileEntry file(const std::string& name, uint64_t size, uint64_t modified) {
    return FileEntry{name, "C:\\" + name, false, size, modified};
}

FileEntry dir(const std::string& name, uint64_t modified = 0) {
    return FileEntry{name, "C:\\" + name, true, 0, modified};
}

std::vector<std::string> names(const std::vector<FileEntry>& v) {
    std::vector<std::string> out;
    for (const auto& e : v)
        out.push_back(e.name);
    return out;
}

} // namespace

TEST(SortEntries, DirectoriesFirstThenName) {
    std::vector<FileEntry> v{file("b.txt", 1, 1), dir("Zeta"), file("A.txt", 2, 2), dir("alpha")};
    sort_entries(v, SortOrder{});
    EXPECT_EQ(names(v), (std::vector<std::string>{"alpha", "Zeta", "A.txt", "b.txt"}));
}

TEST(SortEntries, BySizeDescending) {
    std::vector<FileEntry> v{file("s", 10, 0), file("l", 300, 0), dir("d"), file("m", 50, 0)};
    sort_entries(v, SortOrder{SortKey::Size, false});
    EXPECT_EQ(names(v), (std::vector<std::string>{"d", "l", "m", "s"}));
}

TEST(SortEntries, ByDateAndType) {
    std::vector<FileEntry> v{file("x.zip", 0, 30), file("y.doc", 0, 10), file("z.avi", 0, 20)};
    sort_entries(v, SortOrder{SortKey::Date, true});
    EXPECT_EQ(names(v), (std::vector<std::string>{"y.doc", "z.avi", "x.zip"}));
    sort_entries(v, SortOrder{SortKey::Type, true});
    EXPECT_EQ(names(v), (std::vector<std::string>{"z.avi", "y.doc", "x.zip"}));
}

TEST(JoinRemotePath, AvoidsDoubleSeparator) {
    EXPECT_EQ(join_remote_path("C:\\", "new"), "C:\\new");
    EXPECT_EQ(join_remote_path("/home", "new"), "/home/new");
    EXPECT_EQ(join_remote_path("/home/", "new"), "/home/new");
    EXPECT_EQ(join_remote_path("", "new"), "new");
}

class RemoteFilesTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_.set_int("tunnel_port", pc_.listen());
        sel_.reset(new SessionSelector(settings_, usb_));
        exec_.reset(new CommandExecutor(*sel_));
        files_.reset(new RemoteFiles(*exec_));
        ASSERT_TRUE(sel_->connect().ok());
    }

    FakeHost pc_;
    FakeUsbHost usb_;
    Settings settings_;
    std::unique_ptr<SessionSelector> sel_;
    std::unique_ptr<CommandExecutor> exec_;
    std::unique_ptr<RemoteFiles> files_;
};

TEST_F(RemoteFilesTest, ListSortsReply) {
    pc_.on(Command::ListDir, [](const Packet&) {
        return std::vector<Packet>{
            data_packet(encode_file_list({file("b", 1, 0), dir("a"), file("a", 2, 0)}))};
    });
    auto r = files_->list("C:\\");
    ASSERT_TRUE(r.ok()) << r.error().describe();
    EXPECT_EQ(names(r.value()), (std::vector<std::string>{"a", "a", "b"}));
    EXPECT_TRUE(r.value()[0].is_directory);
}

TEST_F(RemoteFilesTest, EmptyDirectory) {
    pc_.on(Command::ListDir, [](const Packet&) { return std::vector<Packet>{data_packet({})}; });
    auto r = files_->list("C:\\empty");
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.value().empty());
}

TEST_F(RemoteFilesTest, SearchSendsQueryAndPath) {
    pc_.on(Command::Search, [](const Packet&) {
        return std::vector<Packet>{data_packet(encode_file_list({file("hit.txt", 5, 0)}))};
    });
    auto r = files_->search("hit", "C:\\");
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.value().size(), 1u);

    auto got = pc_.received();
    ByteReader rd(got.back().payload);
    std::string q, p;
    ASSERT_TRUE(rd.get_string(q));
    ASSERT_TRUE(rd.get_string(p));
    EXPECT_EQ(q, "hit");
    EXPECT_EQ(p, "C:\\");
}

TEST_F(RemoteFilesTest, CreateDirectoryJoinsPath) {
    std::string asked;
    pc_.on(Command::CreateDir, [&](const Packet& req) {
        asked = decode_path(req.payload).value();
        return std::vector<Packet>{data_packet(encode_file_entry(dir("new")))};
    });
    auto r = files_->create_directory("C:\\", "new");
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.value().is_directory);
    EXPECT_EQ(asked, "C:\\new");
}

TEST_F(RemoteFilesTest, RenameReturnsUpdatedEntry) {
    pc_.on(Command::Rename, [](const Packet&) {
        return std::vector<Packet>{data_packet(encode_file_entry(file("after.txt", 9, 1)))};
    });
    auto r = files_->rename("C:\\before.txt", "after.txt");
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value().name, "after.txt");
}

TEST_F(RemoteFilesTest, RemoveStopsAtFirstFailure) {
    pc_.on(Command::Delete, [](const Packet& req) {
        if (decode_path(req.payload).value() == "C:\\locked")
            return std::vector<Packet>{error_packet(4, "Access denied")};
        return std::vector<Packet>{ok_packet()};
    });
    auto r = files_->remove({"C:\\a", "C:\\locked", "C:\\b"});
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, RemoteErrc::permission_denied);
    EXPECT_EQ(r.error().message, "Access denied");

    size_t deletes = 0;
    for (const auto& p : pc_.received())
        if (p.command == Command::Delete)
            deletes++;
    EXPECT_EQ(deletes, 2u);
}

TEST_F(RemoteFilesTest, StorageAndDrives) {
    pc_.on(Command::GetStorageInfo, [](const Packet&) {
        return std::vector<Packet>{
            data_packet(encode_storage_info(StorageInfo{1000, 400, "C:", "System"}))};
    });
    pc_.on(Command::GetDrives, [](const Packet&) {
        return std::vector<Packet>{data_packet(encode_drive_list({"C:", "D:"}))};
    });
    auto info = files_->storage_info("C:");
    ASSERT_TRUE(info.ok());
    EXPECT_EQ(info.value().used_bytes(), 600u);
    EXPECT_EQ(info.value().volume_name, "System");

    auto drives = files_->drives();
    ASSERT_TRUE(drives.ok());
    EXPECT_EQ(drives.value().size(), 2u);
}

TEST_F(RemoteFilesTest, FileInfoErrorPropagates) {
    pc_.on(Command::GetFileInfo, [](const Packet&) {
        return std::vector<Packet>{error_packet(3, "No such file")};
    });
    auto r = files_->file_info("C:\\gone");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, RemoteErrc::file_not_found);
}
