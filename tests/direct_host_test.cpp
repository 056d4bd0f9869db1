#include <gtest/gtest.h>
#include <chrono>
#include <type_traits>
#include "direct_host_session.hpp"
#include "exchange.hpp"
#include "fake_usb_host.hpp"
#include "payload.hpp"

using namespace pcex;
using namespace pcex::test;

static_assert(!std::is_copy_constructible<UsbDeviceHandle>::value,
              "device handles own an OS handle");
static_assert(!std::is_copy_assignable<UsbDeviceHandle>::value,
              "device handles own an OS handle");

class DirectHostTest : public ::testing::Test {
protected:
    void SetUp() override { usb_.devices.push_back(FakeUsbHost::make_device()); }

    FakeUsbHost usb_;
    StateCell state_;
};

TEST_F(DirectHostTest, NoDeviceLeavesSessionDisconnected) {
    usb_.devices.clear();
    DirectHostSession s(usb_, state_);
    auto r = s.connect();
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, TransportErrc::no_device_found);
    EXPECT_EQ(state_.get().kind, ConnectionState::Kind::Disconnected);
    EXPECT_FALSE(s.has_authorization());
}

TEST_F(DirectHostTest, ConnectClaimsInterfaceAndHandshakes) {
    DirectHostSession s(usb_, state_);
    auto r = s.connect();
    ASSERT_TRUE(r.ok()) << r.error().describe();

    auto st = state_.get();
    EXPECT_EQ(st.kind, ConnectionState::Kind::Connected);
    EXPECT_EQ(st.device.id, "/dev/bus/usb/001/007");
    EXPECT_EQ(st.device.display_name, "Test Phone");
    ASSERT_TRUE(st.device.vendor_id.has_value());
    EXPECT_EQ(*st.device.vendor_id, 0x18D1);
    ASSERT_TRUE(st.device.serial.has_value());
    EXPECT_EQ(*st.device.serial, "SN123");

    ASSERT_EQ(usb_.received.size(), 1u);
    EXPECT_EQ(usb_.received[0].command, Command::Handshake);
    EXPECT_EQ(to_text(usb_.received[0].payload), kClientIdentity);
    EXPECT_EQ(usb_.events, (std::vector<std::string>{"open", "claim 2"}));
}

TEST_F(DirectHostTest, MissingPermissionNeedsAuthorization) {
    usb_.permitted = false;
    DirectHostSession s(usb_, state_);
    auto r = s.connect();
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, TransportErrc::authorization_required);
    EXPECT_EQ(state_.get().kind, ConnectionState::Kind::AuthorizationRequired);
    EXPECT_TRUE(usb_.events.empty());
    EXPECT_FALSE(s.has_authorization());

    auto granted = s.request_authorization();
    ASSERT_TRUE(granted.ok()) << granted.error().describe();
    EXPECT_EQ(usb_.permission_requests, 1);
    EXPECT_EQ(state_.get().kind, ConnectionState::Kind::Connected);
    EXPECT_TRUE(s.has_authorization());
}

TEST_F(DirectHostTest, DeniedAuthorizationStaysPending) {
    usb_.permitted = false;
    usb_.grant_on_request = false;
    DirectHostSession s(usb_, state_);
    auto r = s.request_authorization();
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, TransportErrc::authorization_required);
    EXPECT_EQ(state_.get().kind, ConnectionState::Kind::AuthorizationRequired);
}

TEST_F(DirectHostTest, InterruptOnlyInterfaceIsRejected) {
    usb_.devices = {FakeUsbHost::make_device(false)};
    DirectHostSession s(usb_, state_);
    auto r = s.connect();
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, TransportErrc::endpoint_not_found);
    EXPECT_EQ(state_.get().kind, ConnectionState::Kind::Error);
    EXPECT_TRUE(usb_.events.empty());
}

TEST_F(DirectHostTest, OpenFailure) {
    usb_.fail_open = true;
    DirectHostSession s(usb_, state_);
    auto r = s.connect();
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, TransportErrc::channel_claim_failed);
    EXPECT_EQ(state_.get().kind, ConnectionState::Kind::Error);
}

TEST_F(DirectHostTest, ClaimFailureClosesHandle) {
    usb_.fail_claim = true;
    DirectHostSession s(usb_, state_);
    auto r = s.connect();
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, TransportErrc::channel_claim_failed);
    EXPECT_EQ(usb_.events, (std::vector<std::string>{"open", "claim 2", "close"}));
}

TEST_F(DirectHostTest, RejectedHandshakeReleasesInterface) {
    usb_.responder = [](const Packet&) {
        return std::vector<Packet>{Packet{Command::ResponseError, PF_NONE,
                                          encode_remote_error({10, "bad hello"})}};
    };
    DirectHostSession s(usb_, state_);
    auto r = s.connect();
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ProtocolErrc::handshake_rejected);
    EXPECT_EQ(usb_.events,
              (std::vector<std::string>{"open", "claim 2", "release 2", "close"}));
}

TEST_F(DirectHostTest, ReassemblesFramesFromShortReads) {
    DirectHostSession s(usb_, state_);
    ASSERT_TRUE(s.connect().ok());

    Packet first{Command::ResponseFileChunk, PF_CONTINUATION, std::vector<uint8_t>(100, 0x11)};
    Packet second{Command::ResponseEnd, PF_NONE, {}};
    auto bytes = encode_packet(first);
    auto tail = encode_packet(second);
    bytes.insert(bytes.end(), tail.begin(), tail.end());
    usb_.in_slice = 5;
    usb_.push_in(bytes);

    auto a = receive_packet(s);
    ASSERT_TRUE(a.ok()) << a.error().describe();
    EXPECT_EQ(a.value(), first);
    auto b = receive_packet(s);
    ASSERT_TRUE(b.ok());
    EXPECT_EQ(b.value(), second);
}

TEST_F(DirectHostTest, LargeWritesAreSliced) {
    DirectHostSession s(usb_, state_);
    ASSERT_TRUE(s.connect().ok());
    std::vector<uint8_t> body(40000);
    for (size_t i = 0; i < body.size(); i++)
        body[i] = (uint8_t)(i * 7);
    ASSERT_TRUE(send_packet(s, Command::WriteFile, PF_FINAL, body).ok());
    ASSERT_EQ(usb_.received.size(), 2u);
    EXPECT_EQ(usb_.received[1].payload, body);
    EXPECT_EQ(usb_.received[1].flags, PF_FINAL);
}

TEST_F(DirectHostTest, ReceiveTimesOutWhenPeerIsSilent) {
    DirectHostSession s(usb_, state_);
    ASSERT_TRUE(s.connect().ok());
    auto r = s.receive(kMaxFrameSize);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, TransportErrc::timed_out);
}

TEST_F(DirectHostTest, ZeroLengthReadsStillTimeOut) {
    SessionTimeouts t;
    t.usb = std::chrono::milliseconds(150);
    DirectHostSession s(usb_, state_, t);
    ASSERT_TRUE(s.connect().ok());
    usb_.empty_in_reads = true;
    int before = usb_.in_reads;

    auto started = std::chrono::steady_clock::now();
    auto r = s.receive(kMaxFrameSize);
    auto took = std::chrono::steady_clock::now() - started;
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, TransportErrc::timed_out);
    EXPECT_GT(usb_.in_reads, before);
    EXPECT_LT(took, std::chrono::seconds(5));
}

TEST_F(DirectHostTest, FrameLargerThanLimitIsRefused) {
    DirectHostSession s(usb_, state_);
    ASSERT_TRUE(s.connect().ok());
    usb_.push_in(encode_packet(Command::ResponseData, PF_NONE, std::vector<uint8_t>(64, 1)));
    auto r = s.receive(32);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ProtocolErrc::payload_too_large);
}

TEST_F(DirectHostTest, DisconnectSendsNoticeAndReleases) {
    DirectHostSession s(usb_, state_);
    ASSERT_TRUE(s.connect().ok());
    s.disconnect();
    EXPECT_EQ(state_.get().kind, ConnectionState::Kind::Disconnected);
    ASSERT_EQ(usb_.received.size(), 2u);
    EXPECT_EQ(usb_.received[1].command, Command::Disconnect);
    EXPECT_EQ(usb_.events,
              (std::vector<std::string>{"open", "claim 2", "release 2", "close"}));

    auto r = s.send(encode_packet(Command::GetDrives, PF_NONE, {}));
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, TransportErrc::not_connected);
}
