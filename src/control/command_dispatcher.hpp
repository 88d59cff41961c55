#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include "control_protocol.hpp"
#include "scheduler.hpp"
#include "session_state.hpp"
#include "transport.hpp"

namespace fleetdeck::control {

/**
 * Routes one logical command to the primary channel of its source device and,
 * when mirroring is on, replicates it to the other checked devices through the
 * signaling channel's group fan-out.
 *
 * Mirroring happens iff group sync is enabled and the source device is itself
 * checked. Targets are SelectionSet minus the source.
 *
 * Mirrored touch-up is delayed (default 100 ms) so it cannot overtake the
 * down/move still travelling through signaling. Mirrored key and home presses
 * become key/down now and key/up after a short delay (default 50 ms).
 * Neither path's failure cancels the other; nothing is thrown.
 */
class CommandDispatcher {
public:
    struct Options {
        std::chrono::milliseconds mirror_up_delay{100};
        std::chrono::milliseconds key_release_delay{50};
    };

    struct Stats {
        uint64_t primary_sent = 0;
        uint64_t primary_skipped = 0;   // transport missing or not open
        uint64_t mirror_sent = 0;       // group commands handed to signaling
        uint64_t mirror_skipped = 0;    // signaling unavailable
    };

    CommandDispatcher(SessionState& state, TaskScheduler& tasks,
                      SignalingChannel* signaling, Options opts);
    CommandDispatcher(SessionState& state, TaskScheduler& tasks, SignalingChannel* signaling)
        : CommandDispatcher(state, tasks, signaling, Options{}) {}
    ~CommandDispatcher();

    CommandDispatcher(const CommandDispatcher&) = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;

    void setSignaling(SignalingChannel* signaling) { signaling_ = signaling; }

    void dispatch(const DeviceId& source, const protocol::ControlCommand& cmd);

    // Devices a command from `source` would be mirrored to (empty = no mirroring)
    std::vector<DeviceId> mirrorTargets(const DeviceId& source) const;

    // One device only, never mirrored: primary channel where open, else a
    // single-target signaling command
    void sendTo(const DeviceId& device, const protocol::ControlCommand& cmd);

    // Toolbar operation aimed at every checked device: primary channel where
    // open, one group fan-out for the rest. Returns the number of devices
    // addressed.
    size_t broadcast(const protocol::ControlCommand& cmd);

    // Delayed mirror sends (touch-up, key release) not yet fired
    size_t pendingCount() const { return pending_.size(); }
    // Sends them now, in scheduling order (console close)
    void flushPending();
    // Drops them
    void cancelPending();

    const Stats& stats() const { return stats_; }

private:
    bool sendPrimary(const DeviceId& device, const protocol::ControlCommand& cmd);
    void sendMirror(const std::vector<DeviceId>& targets, const protocol::ControlCommand& cmd);
    void sendGroupNow(const std::vector<DeviceId>& targets, const protocol::ControlCommand& cmd);
    void sendGroupLater(std::chrono::milliseconds delay, std::vector<DeviceId> targets,
                        protocol::ControlCommand cmd);

    SessionState& state_;
    TaskScheduler& tasks_;
    SignalingChannel* signaling_;
    Options opts_;
    std::map<TaskId, std::function<void()>> pending_;
    Stats stats_;
};

} // namespace fleetdeck::control
