// =============================================================================
// FleetDeck - UDP primary transport tests
// =============================================================================
// Datagram parsing, plus one loopback exchange against a fake device socket.
// =============================================================================

#include <gtest/gtest.h>
#include <chrono>
#include <cstring>
#include <string>
#include <thread>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include "net/udp_primary_transport.hpp"
#include "fakes.hpp"

using namespace fleetdeck;
using namespace fleetdeck::net;
using namespace fleetdeck::fakes;
using Kind = DeviceDatagram::Kind;

// =============================================================================
// parseDeviceDatagram
// =============================================================================

TEST(DeviceDatagramTest, ReadyWithTrack) {
    auto r = parseDeviceDatagram(R"({"type":"ready","track":"screen1"})");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().kind, Kind::Ready);
    EXPECT_EQ(r.value().track, "screen1");
}

TEST(DeviceDatagramTest, ReadyDefaultsTrack) {
    auto r = parseDeviceDatagram(R"({"type":"ready"})");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().track, "video0");
}

TEST(DeviceDatagramTest, StatsFields) {
    auto r = parseDeviceDatagram(
        R"({"type":"stats","timestamp_ms":1500.0,"bytes_received":250000,"frames_decoded":90,)"
        R"("jitter_buffer_delay":4.5,"jitter_buffer_emitted":90,"estimated_playout_ms":1250.0})");
    ASSERT_TRUE(r.is_ok());
    const auto& s = r.value().stats;
    EXPECT_EQ(r.value().kind, Kind::Stats);
    EXPECT_DOUBLE_EQ(s.timestamp_ms, 1500.0);
    EXPECT_EQ(s.bytes_received, 250000u);
    EXPECT_EQ(s.frames_decoded, 90u);
    EXPECT_DOUBLE_EQ(s.jitter_buffer_delay_s, 4.5);
    EXPECT_EQ(s.jitter_buffer_emitted, 90u);
    ASSERT_TRUE(s.estimated_playout_ms.has_value());
    EXPECT_DOUBLE_EQ(*s.estimated_playout_ms, 1250.0);
}

TEST(DeviceDatagramTest, StatsWithoutPlayoutEstimate) {
    auto r = parseDeviceDatagram(R"({"type":"stats","timestamp_ms":10.0})");
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value().stats.estimated_playout_ms.has_value());
    EXPECT_EQ(r.value().stats.frames_decoded, 0u);
}

TEST(DeviceDatagramTest, ClipboardAndBye) {
    auto clip = parseDeviceDatagram(R"({"type":"clipboard","text":"copied"})");
    ASSERT_TRUE(clip.is_ok());
    EXPECT_EQ(clip.value().kind, Kind::Clipboard);
    EXPECT_EQ(clip.value().text, "copied");

    auto bye = parseDeviceDatagram(R"({"type":"bye"})");
    ASSERT_TRUE(bye.is_ok());
    EXPECT_EQ(bye.value().kind, Kind::Bye);
    EXPECT_FALSE(bye.value().text.empty());
}

TEST(DeviceDatagramTest, MalformedInputIsProtocolError) {
    for (const char* payload : {"not json", "[1,2,3]", R"({"type":"teleport"})", "{}",
                                R"({"type":"stats","frames_decoded":"many"})"}) {
        SCOPED_TRACE(payload);
        auto r = parseDeviceDatagram(payload);
        ASSERT_TRUE(r.is_err());
        EXPECT_EQ(r.error().kind, TransportError::Kind::Protocol);
    }
}

// =============================================================================
// Factory
// =============================================================================

TEST(UdpTransportFactoryTest, NeedsControlEndpoint) {
    ManualLoop loop;
    UdpTransportFactory factory(loop.queue);

    EXPECT_NE(factory.create(makeDevice("a")), nullptr);

    Device no_host = makeDevice("b");
    no_host.host.clear();
    EXPECT_EQ(factory.create(no_host), nullptr);

    Device bad_port = makeDevice("c");
    bad_port.control_port = 70000;
    EXPECT_EQ(factory.create(bad_port), nullptr);
}

TEST(UdpTransportTest, InvalidAddressFailsOpen) {
    ManualLoop loop;
    Device d = makeDevice("a");
    d.host = "not-an-ip";
    auto t = std::make_shared<UdpPrimaryTransport>(d, loop.queue);
    auto r = t->open();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, TransportError::Kind::ConnectFailed);
    EXPECT_FALSE(t->isOpen());
    EXPECT_TRUE(t->sampleStats().is_err());
}

// =============================================================================
// Loopback exchange
// =============================================================================

class UdpLoopbackTest : public ::testing::Test {
protected:
    void SetUp() override {
        device_fd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
        ASSERT_GE(device_fd, 0);

        timeval tv;
        tv.tv_sec = 2;
        tv.tv_usec = 0;
        setsockopt(device_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = 0;
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        ASSERT_EQ(::bind(device_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);

        socklen_t len = sizeof(addr);
        ASSERT_EQ(getsockname(device_fd, reinterpret_cast<sockaddr*>(&addr), &len), 0);

        Device d = makeDevice("loop");
        d.control_port = ntohs(addr.sin_port);
        transport = std::make_shared<UdpPrimaryTransport>(d, loop.queue);

        PrimaryTransport::Callbacks cb;
        cb.on_connected = [this] { connected++; };
        cb.on_track = [this](std::shared_ptr<MediaStream> m) { track = m ? m->id() : ""; };
        cb.on_clipboard = [this](const std::string& text) { clipboard = text; };
        cb.on_disconnected = [this](const std::string& reason) { disconnected = reason; };
        transport->setCallbacks(std::move(cb));
    }

    void TearDown() override {
        if (transport) transport->close();
        transport.reset();
        if (device_fd >= 0) ::close(device_fd);
    }

    // Next datagram the transport sent, parsed
    nlohmann::json receiveFromHost() {
        char buf[2048];
        peer_len = sizeof(peer);
        ssize_t n = ::recvfrom(device_fd, buf, sizeof(buf), 0, reinterpret_cast<sockaddr*>(&peer), &peer_len);
        if (n <= 0) return nlohmann::json();
        return nlohmann::json::parse(std::string(buf, static_cast<size_t>(n)), nullptr, false);
    }

    void sendToHost(const std::string& payload) {
        ::sendto(device_fd, payload.data(), payload.size(), 0, reinterpret_cast<sockaddr*>(&peer), peer_len);
    }

    // Pumps the loop until cond holds or two seconds pass
    template <typename Cond>
    bool pumpUntil(Cond cond) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (std::chrono::steady_clock::now() < deadline) {
            loop.drain();
            if (cond()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return cond();
    }

    ManualLoop loop;
    int device_fd = -1;
    sockaddr_in peer{};
    socklen_t peer_len = sizeof(sockaddr_in);
    std::shared_ptr<UdpPrimaryTransport> transport;

    int connected = 0;
    std::string track;
    std::string clipboard;
    std::string disconnected;
};

TEST_F(UdpLoopbackTest, HelloReadyCommandsAndBye) {
    ASSERT_TRUE(transport->open().is_ok());
    EXPECT_FALSE(transport->isOpen());

    auto hello = receiveFromHost();
    ASSERT_TRUE(hello.is_object());
    EXPECT_EQ(hello.value("type", ""), "hello");

    sendToHost(R"({"type":"ready","track":"video0"})");
    ASSERT_TRUE(pumpUntil([this] { return connected == 1; }));
    EXPECT_TRUE(transport->isOpen());
    EXPECT_EQ(track, "video0");

    transport->send(protocol::ControlCommand::home());
    auto key = receiveFromHost();
    ASSERT_TRUE(key.is_object());
    EXPECT_EQ(key.value("type", ""), "key");
    EXPECT_EQ(key.value("action", ""), "press");

    EXPECT_TRUE(transport->sampleStats().is_err());
    sendToHost(R"({"type":"stats","timestamp_ms":100.0,"frames_decoded":3})");
    ASSERT_TRUE(pumpUntil([this] { return transport->sampleStats().is_ok(); }));
    EXPECT_EQ(transport->sampleStats().value().frames_decoded, 3u);

    sendToHost(R"({"type":"clipboard","text":"from device"})");
    ASSERT_TRUE(pumpUntil([this] { return !clipboard.empty(); }));
    EXPECT_EQ(clipboard, "from device");

    sendToHost(R"({"type":"bye","reason":"agent exit"})");
    ASSERT_TRUE(pumpUntil([this] { return !disconnected.empty(); }));
    EXPECT_EQ(disconnected, "agent exit");
    EXPECT_FALSE(transport->isOpen());
}

TEST_F(UdpLoopbackTest, NoCallbacksAfterClose) {
    ASSERT_TRUE(transport->open().is_ok());
    ASSERT_TRUE(receiveFromHost().is_object());

    sendToHost(R"({"type":"ready"})");
    transport->close();
    loop.drain();
    EXPECT_EQ(connected, 0);
    EXPECT_FALSE(transport->isOpen());
    EXPECT_GT(transport->datagramsSent(), 0u);
}
