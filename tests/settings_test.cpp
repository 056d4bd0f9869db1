#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <unistd.h>
#include "settings.hpp"

using namespace pcex;

class SettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = "/tmp/pcex_settings_" + std::to_string(::getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".conf";
        std::remove(path_.c_str());
    }
    void TearDown() override { std::remove(path_.c_str()); }

    std::string path_;
};

TEST_F(SettingsTest, DefaultsWhenEmpty) {
    Settings s;
    EXPECT_EQ(s.connection_mode(), ConnectionMode::TunnelClient);
    EXPECT_EQ(s.wifi_host(), "");
    EXPECT_EQ(s.wifi_port(), 5555);
    EXPECT_EQ(s.tunnel_port(), 5555);
    EXPECT_EQ(s.listen_port(), 5556);
}

TEST_F(SettingsTest, PersistsAcrossInstances) {
    {
        Settings s(path_);
        EXPECT_FALSE(s.load());
        s.set_connection_mode(ConnectionMode::WifiClient);
        s.set_wifi_endpoint("192.168.0.12", 6000);
    }
    Settings again(path_);
    ASSERT_TRUE(again.load());
    EXPECT_EQ(again.connection_mode(), ConnectionMode::WifiClient);
    EXPECT_EQ(again.wifi_host(), "192.168.0.12");
    EXPECT_EQ(again.wifi_port(), 6000);
}

TEST_F(SettingsTest, ParsesCommentsAndWhitespace) {
    {
        std::ofstream f(path_);
        f << "# preferences\n"
          << "  connection_mode = TunnelServer  \n"
          << "listen_port=7001\n"
          << "garbage line\n";
    }
    Settings s(path_);
    ASSERT_TRUE(s.load());
    EXPECT_EQ(s.connection_mode(), ConnectionMode::TunnelServer);
    EXPECT_EQ(s.listen_port(), 7001);
}

TEST_F(SettingsTest, UnknownModeAndBadNumbersFallBack) {
    Settings s;
    s.set("connection_mode", "carrier-pigeon");
    s.set("wifi_port", "many");
    EXPECT_EQ(s.connection_mode(), ConnectionMode::TunnelClient);
    EXPECT_EQ(s.wifi_port(), 5555);
}

TEST_F(SettingsTest, OutOfRangePortIsKeptForConnectToReject) {
    Settings s;
    s.set_wifi_endpoint("10.0.0.1", 70000);
    EXPECT_EQ(s.wifi_port(), 70000);
}
