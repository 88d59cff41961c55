// =============================================================================
// FleetDeck - SignalingClient tests
// =============================================================================

#include <gtest/gtest.h>
#include <chrono>
#include <cstring>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include "net/signaling_client.hpp"
#include "fakes.hpp"

using namespace fleetdeck;
using namespace fleetdeck::net;
using namespace fleetdeck::fakes;
using json = nlohmann::json;

namespace {

std::optional<PixelSize> phoneSize(const DeviceId&) {
    return PixelSize{1170, 2532};
}

} // namespace

// =============================================================================
// Inbound messages (no connection needed)
// =============================================================================

class SignalingInboundTest : public ::testing::Test {
protected:
    void SetUp() override {
        clip_sub = bus.subscribe<ClipboardContentEvent>([this](const ClipboardContentEvent& e) {
            clips.push_back(e);
        });
        err_sub = bus.subscribe<StreamErrorEvent>([this](const StreamErrorEvent& e) {
            errors.push_back(e);
        });
    }

    EventBus bus;
    ManualLoop loop;
    SignalingClient client{"127.0.0.1", 1, loop.queue, bus, phoneSize};
    SubscriptionHandle clip_sub;
    SubscriptionHandle err_sub;
    std::vector<ClipboardContentEvent> clips;
    std::vector<StreamErrorEvent> errors;
};

TEST_F(SignalingInboundTest, PasteboardReadPublishesClipboard) {
    client.handleLine(R"({"type":"pasteboard/read","udid":"phone-1","body":{"data":"hello"}})");
    ASSERT_EQ(clips.size(), 1u);
    EXPECT_EQ(clips[0].device_id, "phone-1");
    EXPECT_EQ(clips[0].text, "hello");
}

TEST_F(SignalingInboundTest, DeviceFromBodyDevices) {
    client.handleLine(R"({"type":"pasteboard/read","body":{"devices":["phone-2"],"data":"x"}})");
    ASSERT_EQ(clips.size(), 1u);
    EXPECT_EQ(clips[0].device_id, "phone-2");
}

TEST_F(SignalingInboundTest, PasteboardWithoutDeviceIsDropped) {
    client.handleLine(R"({"type":"pasteboard/read","body":{"data":"orphan"}})");
    EXPECT_TRUE(clips.empty());
}

TEST_F(SignalingInboundTest, StreamErrorPublished) {
    client.handleLine(R"({"type":"stream/error","device":"phone-3","body":{"error":"encoder died"}})");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].device_id, "phone-3");
    EXPECT_EQ(errors[0].message, "encoder died");

    client.handleLine(R"({"type":"stream/error","udid":"phone-4","error":"top-level"})");
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[1].message, "top-level");
}

TEST_F(SignalingInboundTest, MalformedAndUnknownLinesIgnored) {
    EXPECT_NO_THROW(client.handleLine("{not json"));
    EXPECT_NO_THROW(client.handleLine("[]"));
    EXPECT_NO_THROW(client.handleLine(R"({"type":"stream/started","udid":"a"})"));
    EXPECT_NO_THROW(client.handleLine(R"({"type":"pasteboard/read","udid":"a","body":{"data":5}})"));
    EXPECT_TRUE(clips.empty());
    EXPECT_TRUE(errors.empty());
}

TEST_F(SignalingInboundTest, NonStringTypeIsIgnored) {
    EXPECT_NO_THROW(client.handleLine(R"({"type":5,"udid":"a","body":{"data":"x"}})"));
    EXPECT_NO_THROW(client.handleLine(R"({"type":{"nested":true}})"));
    EXPECT_TRUE(clips.empty());
    EXPECT_TRUE(errors.empty());
}

TEST_F(SignalingInboundTest, SendsAreDroppedWhileDisconnected) {
    EXPECT_FALSE(client.isAvailable());
    client.startStream("a", protocol::StreamOptions{});
    client.sendGroupCommand({"a"}, protocol::ControlCommand::home());
    EXPECT_EQ(client.messagesSent(), 0u);
}

TEST(SignalingConnectTest, RefusedConnectionIsAnError) {
    // bind then close: nothing listens on that port afterwards
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    ASSERT_EQ(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    socklen_t len = sizeof(addr);
    getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    ::close(fd);

    EventBus bus;
    ManualLoop loop;
    SignalingClient client("127.0.0.1", ntohs(addr.sin_port), loop.queue, bus, phoneSize);
    auto r = client.connect(std::chrono::milliseconds(500));
    ASSERT_TRUE(r.is_err());
    EXPECT_FALSE(client.isAvailable());
}

// =============================================================================
// Loopback server
// =============================================================================

class SignalingLoopbackTest : public ::testing::Test {
protected:
    void SetUp() override {
        listen_fd = ::socket(AF_INET, SOCK_STREAM, 0);
        ASSERT_GE(listen_fd, 0);
        int one = 1;
        setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        ASSERT_EQ(::bind(listen_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
        ASSERT_EQ(::listen(listen_fd, 1), 0);
        socklen_t len = sizeof(addr);
        ASSERT_EQ(getsockname(listen_fd, reinterpret_cast<sockaddr*>(&addr), &len), 0);

        client = std::make_unique<SignalingClient>("127.0.0.1", ntohs(addr.sin_port), loop.queue, bus, phoneSize);
        ASSERT_TRUE(client->connect(std::chrono::milliseconds(1000)).is_ok());

        server_fd = ::accept(listen_fd, nullptr, nullptr);
        ASSERT_GE(server_fd, 0);
        timeval tv;
        tv.tv_sec = 2;
        tv.tv_usec = 0;
        setsockopt(server_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    }

    void TearDown() override {
        client.reset();
        if (server_fd >= 0) ::close(server_fd);
        if (listen_fd >= 0) ::close(listen_fd);
    }

    // Next newline-terminated message from the client
    json readLine() {
        while (true) {
            auto pos = pending.find('\n');
            if (pos != std::string::npos) {
                std::string line = pending.substr(0, pos);
                pending.erase(0, pos + 1);
                return json::parse(line, nullptr, false);
            }
            char buf[1024];
            ssize_t n = ::recv(server_fd, buf, sizeof(buf), 0);
            if (n <= 0) return json();
            pending.append(buf, static_cast<size_t>(n));
        }
    }

    void writeLine(const std::string& line) {
        std::string data = line + "\n";
        ::send(server_fd, data.data(), data.size(), MSG_NOSIGNAL);
    }

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

    EventBus bus;
    ManualLoop loop;
    std::unique_ptr<SignalingClient> client;
    int listen_fd = -1;
    int server_fd = -1;
    std::string pending;
};

TEST_F(SignalingLoopbackTest, StreamStartEnvelope) {
    EXPECT_TRUE(client->isAvailable());

    protocol::StreamOptions opts;
    opts.resolution = 0.48;
    opts.fps = 20;
    opts.force = true;
    client->startStream("phone", opts);

    json msg = readLine();
    ASSERT_TRUE(msg.is_object());
    EXPECT_EQ(msg["type"], "stream/start");
    EXPECT_EQ(msg["body"]["devices"][0], "phone");
    EXPECT_EQ(msg["body"]["fps"], 20);
    EXPECT_EQ(msg["body"]["force"], true);
    EXPECT_TRUE(msg["requestId"].is_number_unsigned());
    EXPECT_TRUE(msg.contains("ts"));

    client->stopStream("phone");
    json stop = readLine();
    EXPECT_EQ(stop["type"], "stream/stop");
    EXPECT_GT(stop["requestId"].get<uint64_t>(), msg["requestId"].get<uint64_t>());
    EXPECT_EQ(client->messagesSent(), 2u);
}

TEST_F(SignalingLoopbackTest, GroupTouchCarriesDevicePixels) {
    client->sendGroupCommand({"a", "b"},
                             protocol::ControlCommand::touch(protocol::CommandKind::TouchDown, {0.5, 0.25}));
    json msg = readLine();
    ASSERT_TRUE(msg.is_object());
    EXPECT_EQ(msg["type"], "control/command");
    EXPECT_EQ(msg["body"]["devices"].size(), 2u);
}

TEST_F(SignalingLoopbackTest, DirectPressSendsBothKeyPhases) {
    client->sendGroupCommand({"a", "b"}, protocol::ControlCommand::home());
    json down = readLine();
    json up = readLine();
    EXPECT_EQ(down["body"]["type"], "key/down");
    EXPECT_EQ(up["body"]["type"], "key/up");
    EXPECT_EQ(up["body"]["body"]["code"], "HOMEBUTTON");
    EXPECT_EQ(client->messagesSent(), 2u);
}

TEST_F(SignalingLoopbackTest, InboundLinesHandledOnLoop) {
    std::vector<StreamErrorEvent> errors;
    auto sub = bus.subscribe<StreamErrorEvent>([&](const StreamErrorEvent& e) { errors.push_back(e); });

    writeLine(R"({"type":"stream/error","udid":"phone","body":{"error":"no encoder"}})");
    // nothing is delivered until the loop runs
    ASSERT_TRUE(pumpUntil([&] { return !errors.empty(); }));
    EXPECT_EQ(errors[0].device_id, "phone");
    EXPECT_EQ(client->messagesReceived(), 1u);
}

TEST_F(SignalingLoopbackTest, PeerCloseReportsUnavailable) {
    std::vector<bool> states;
    auto sub = bus.subscribe<SignalingStateEvent>([&](const SignalingStateEvent& e) { states.push_back(e.available); });

    ::close(server_fd);
    server_fd = -1;

    ASSERT_TRUE(pumpUntil([&] { return !states.empty(); }));
    EXPECT_FALSE(states[0]);
    EXPECT_FALSE(client->isAvailable());
}

TEST_F(SignalingLoopbackTest, ReconnectAfterPeerClose) {
    ::close(server_fd);
    server_fd = -1;
    ASSERT_TRUE(pumpUntil([this] { return !client->isAvailable(); }));

    ASSERT_TRUE(client->connect(std::chrono::milliseconds(1000)).is_ok());
    server_fd = ::accept(listen_fd, nullptr, nullptr);
    ASSERT_GE(server_fd, 0);
    timeval tv;
    tv.tv_sec = 2;
    tv.tv_usec = 0;
    setsockopt(server_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    EXPECT_TRUE(client->isAvailable());

    client->stopStream("phone");
    json msg = readLine();
    ASSERT_TRUE(msg.is_object());
    EXPECT_EQ(msg["type"], "stream/stop");
}
