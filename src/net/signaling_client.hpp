#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "event_bus.hpp"
#include "scheduler.hpp"
#include "transport.hpp"

namespace fleetdeck::net {

/**
 * Signaling channel over one persistent TCP connection.
 *
 * Outbound: newline-delimited envelopes
 *   {"type":"stream/start","body":{...},"requestId":n,"ts":secs}
 * Inbound lines are parsed on a receive thread and handled on the console
 * loop:
 *   pasteboard/read -> ClipboardContentEvent
 *   stream/error    -> StreamErrorEvent
 * Losing the connection publishes SignalingStateEvent; there is no automatic
 * reconnect.
 */
class SignalingClient : public SignalingChannel {
public:
    SignalingClient(std::string host, int port, TaskScheduler& loop, EventBus& bus,
                    protocol::SizeLookup sizes);
    ~SignalingClient() override;

    SignalingClient(const SignalingClient&) = delete;
    SignalingClient& operator=(const SignalingClient&) = delete;

    Result<void, TransportError> connect(std::chrono::milliseconds timeout);
    void disconnect();

    bool isAvailable() const override { return connected_.load(); }

    void sendGroupCommand(const std::vector<DeviceId>& targets,
                          const protocol::ControlCommand& cmd) override;
    void startStream(const DeviceId& device, const protocol::StreamOptions& opts) override;
    void stopStream(const DeviceId& device) override;
    void setResolution(const DeviceId& device, double resolution) override;
    void setFrameRate(const DeviceId& device, int fps) override;

    // One inbound line, on the console loop
    void handleLine(const std::string& line);

    uint64_t messagesSent() const { return messages_sent_.load(); }
    uint64_t messagesReceived() const { return messages_received_.load(); }

private:
    bool sendEnvelope(const std::string& type, nlohmann::json body);
    bool writeAll(const std::string& data);
    void receiveThread();
    void onConnectionLost(const std::string& reason);

    std::string host_;
    int port_;
    TaskScheduler& loop_;
    EventBus& bus_;
    protocol::SizeLookup sizes_;

    int socket_ = -1;
    std::atomic<bool> connected_{false};
    std::atomic<bool> running_{false};
    std::thread recv_thread_;
    std::mutex send_mtx_;
    std::atomic<uint64_t> next_request_id_{1};

    // Posted handlers check this before touching the client
    std::shared_ptr<int> alive_ = std::make_shared<int>(0);

    std::atomic<uint64_t> messages_sent_{0};
    std::atomic<uint64_t> messages_received_{0};
};

} // namespace fleetdeck::net
