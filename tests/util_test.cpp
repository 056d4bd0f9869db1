#include <gtest/gtest.h>
#include <set>
#include "error.hpp"
#include "logging.hpp"
#include "util.hpp"

using namespace pcex;

TEST(Util, LocalhostNormalizesToLoopback) {
    EXPECT_EQ(normalize_host("localhost"), "127.0.0.1");
    EXPECT_EQ(normalize_host("LocalHost"), "127.0.0.1");
    EXPECT_EQ(normalize_host(" localhost "), "127.0.0.1");
    EXPECT_EQ(normalize_host("192.168.1.20"), "192.168.1.20");
    EXPECT_EQ(normalize_host("localhost.example"), "localhost.example");
}

TEST(Util, PortRange) {
    EXPECT_FALSE(is_valid_port(0));
    EXPECT_TRUE(is_valid_port(1));
    EXPECT_TRUE(is_valid_port(65535));
    EXPECT_FALSE(is_valid_port(70000));
    EXPECT_FALSE(is_valid_port(-1));
}

TEST(Util, ParseHostPort) {
    std::string host;
    uint16_t port = 0;
    ASSERT_TRUE(parse_host_port("10.0.0.5:5555", host, port));
    EXPECT_EQ(host, "10.0.0.5");
    EXPECT_EQ(port, 5555);
    EXPECT_FALSE(parse_host_port("10.0.0.5", host, port));
    EXPECT_FALSE(parse_host_port("10.0.0.5:0", host, port));
    EXPECT_FALSE(parse_host_port("10.0.0.5:abc", host, port));
}

TEST(Util, TaskIdsAreUniqueVersion4) {
    std::set<std::string> ids;
    for (int i = 0; i < 200; i++) {
        auto id = make_task_id();
        ASSERT_EQ(id.size(), 36u);
        EXPECT_EQ(id[14], '4');
        EXPECT_NE(std::string("89ab").find(id[19]), std::string::npos);
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 200u);
}

TEST(Util, FormatBytes) {
    EXPECT_EQ(format_bytes(512), "512 B");
    EXPECT_EQ(format_bytes(1536), "1.5 KB");
    EXPECT_EQ(format_bytes(3ull * 1024 * 1024), "3.0 MB");
}

TEST(Logging, ParsesLevels) {
    LogLevel lvl = LogLevel::INFO;
    ASSERT_TRUE(parse_log_level("DEBUG", lvl));
    EXPECT_EQ(lvl, LogLevel::DEBUG);
    ASSERT_TRUE(parse_log_level("warn", lvl));
    EXPECT_EQ(lvl, LogLevel::WARN);
    EXPECT_FALSE(parse_log_level("loud", lvl));
}

TEST(Errors, DescribeNamesCategory) {
    Error e{TransportErrc::invalid_port, "invalid port configuration: 0"};
    EXPECT_EQ(e.describe(), "invalid port configuration: 0 (transport: invalid port)");
    Error remote{remote_error_code(3), "No such file"};
    EXPECT_EQ(remote.code, RemoteErrc::file_not_found);
    EXPECT_EQ(remote_error_code(99).message(), "error 99");
}

TEST(Errors, RemoteSuccessCodeStillFails) {
    Result<int> r = Error{remote_error_code(0), "odd"};
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.error().code.value(), 0);
}
