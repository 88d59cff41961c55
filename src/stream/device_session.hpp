#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include "control/session_state.hpp"
#include "control_protocol.hpp"
#include "event_bus.hpp"
#include "scheduler.hpp"
#include "stream/playback_catchup.hpp"
#include "stream/stream_stats.hpp"
#include "transport.hpp"

namespace fleetdeck::stream {

/**
 * One device's stream pipeline.
 *
 * connect():  Disconnected -> Connecting (stream/start over signaling, primary
 *             transport opened) -> Connected on the transport's callback; the
 *             video track is attached to the tile's surface.
 * disconnect(): stop media, detach surface, playback rate 1.0, close
 *             transport, stream/stop. Idempotent.
 *
 * Transport failure or connect timeout tears down the same way and leaves the
 * device Disconnected. There is no automatic retry.
 */
class DeviceSession {
public:
    struct Options {
        std::chrono::milliseconds connect_timeout{3000};
        std::chrono::milliseconds stats_interval{1000};
        PlaybackCatchUpController::Thresholds catchup;
    };

    DeviceSession(Device device, control::ConnectionTable& table, TransportFactory& factory,
                  SignalingChannel* signaling, TaskScheduler& tasks, EventBus& bus, Options opts);
    ~DeviceSession();

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    // False if not Disconnected or no transport could be created
    bool connect(const protocol::StreamOptions& opts);
    void disconnect();

    const DeviceId& id() const { return device_.id; }
    const Device& device() const { return device_; }
    ConnectionState state() const { return table_.state(device_.id); }

    const PlaybackCatchUpController& catchUp() const { return catchup_; }
    const StreamStatsSampler& statsSampler() const { return sampler_; }

    // One statistics/lag sampling pass (normally driven by the interval timer)
    void sampleStats();

private:
    void onConnected(uint64_t gen);
    void onTrack(uint64_t gen, std::shared_ptr<MediaStream> media);
    void onFailure(uint64_t gen, const std::string& reason);
    void teardown(const char* reason);

    Device device_;
    control::ConnectionTable& table_;
    TransportFactory& factory_;
    SignalingChannel* signaling_;
    TaskScheduler& tasks_;
    EventBus& bus_;
    Options opts_;

    PlaybackCatchUpController catchup_;
    StreamStatsSampler sampler_;

    uint64_t generation_ = 0;       // bumps on every teardown; stale callbacks compare
    bool stream_started_ = false;
    double last_lag_ms_ = 0.0;
    std::shared_ptr<MediaStream> early_media_;   // track that beat on_connected
    TaskId timeout_task_ = NO_TASK;
    TaskId stats_task_ = NO_TASK;
};

} // namespace fleetdeck::stream
