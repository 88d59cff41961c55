#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include "scheduler.hpp"
#include "transport.hpp"

namespace fleetdeck::net {

// Datagrams sent by the device agent
struct DeviceDatagram {
    enum class Kind { Ready, Stats, Clipboard, Bye };

    Kind kind = Kind::Ready;
    std::string track;           // ready
    InboundVideoStats stats;     // stats
    std::string text;            // clipboard: text, bye: reason
};

// Parses one inbound datagram; Protocol error for malformed or unknown input.
//   {"type":"ready","track":"video0"}
//   {"type":"stats","timestamp_ms":..,"bytes_received":..,"frames_decoded":..,
//    "jitter_buffer_delay":..,"jitter_buffer_emitted":..,"estimated_playout_ms":..}
//   {"type":"clipboard","text":".."}
//   {"type":"bye","reason":".."}
Result<DeviceDatagram, TransportError> parseDeviceDatagram(const std::string& payload);

/**
 * Primary transport over UDP, one socket per device.
 *
 * open() sends {"type":"hello"}; the device's "ready" reply marks the channel
 * open and announces its video track. Commands are JSON datagrams
 * (protocol::encodePrimary) queued to a send thread. A receive thread parses
 * device datagrams and posts them to the console loop; callbacks therefore
 * run on the loop, and never after close().
 */
class UdpPrimaryTransport : public PrimaryTransport,
                            public std::enable_shared_from_this<UdpPrimaryTransport> {
public:
    UdpPrimaryTransport(Device device, TaskScheduler& loop);
    ~UdpPrimaryTransport() override;

    void setCallbacks(Callbacks cb) override { callbacks_ = std::move(cb); }
    Result<void, TransportError> open() override;
    bool isOpen() const override { return ready_.load() && running_.load(); }
    void send(const protocol::ControlCommand& cmd) override;
    Result<InboundVideoStats, TransportError> sampleStats() override;
    void close() override;

    const Device& device() const { return device_; }
    uint64_t datagramsSent() const { return datagrams_sent_.load(); }
    uint64_t datagramsReceived() const { return datagrams_received_.load(); }

private:
    void sendThread();
    void receiveThread();
    void enqueue(std::string payload);
    bool sendRaw(const std::string& payload);
    void handleDatagram(const DeviceDatagram& dg);
    void stopThreads();

    Device device_;
    TaskScheduler& loop_;
    Callbacks callbacks_;

    int socket_ = -1;
    std::atomic<bool> running_{false};
    std::atomic<bool> ready_{false};
    std::thread send_thread_;
    std::thread recv_thread_;

    std::mutex queue_mtx_;
    std::condition_variable send_cv_;
    std::queue<std::string> send_queue_;

    std::optional<InboundVideoStats> latest_stats_;   // loop thread only
    std::shared_ptr<MediaStream> media_;

    std::atomic<uint64_t> datagrams_sent_{0};
    std::atomic<uint64_t> datagrams_received_{0};
};

class UdpTransportFactory : public TransportFactory {
public:
    explicit UdpTransportFactory(TaskScheduler& loop) : loop_(loop) {}

    // nullptr when the descriptor has no usable control endpoint
    std::shared_ptr<PrimaryTransport> create(const Device& device) override;

private:
    TaskScheduler& loop_;
};

} // namespace fleetdeck::net
