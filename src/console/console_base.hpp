#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "config_loader.hpp"
#include "control/command_dispatcher.hpp"
#include "control/session_state.hpp"
#include "event_bus.hpp"
#include "input/touch_controller.hpp"
#include "scheduler.hpp"
#include "stream/device_session.hpp"
#include "stream/resolution_negotiator.hpp"
#include "transport.hpp"

namespace fleetdeck::console {

// Collaborators owned by the host
struct ConsoleDeps {
    TransportFactory& transports;
    SignalingChannel* signaling;   // may be null (no mirroring, no stream control)
    TaskScheduler& tasks;
    FrameScheduler& frames;
    EventBus& bus;
};

stream::LayoutInputs layoutFromConfig(const config::LayoutConfig& layout, bool grid);

// =============================================================================
// ConsoleBase: what single-device and batch consoles share
// =============================================================================
// Owns the session state, the dispatcher, the touch controller, the resolution
// controller and one DeviceSession per tracked device. Member order matters:
// device sessions go first on destruction, while the table they release into
// is still alive.
class ConsoleBase {
public:
    virtual ~ConsoleBase();

    ConsoleBase(const ConsoleBase&) = delete;
    ConsoleBase& operator=(const ConsoleBase&) = delete;

    control::SessionState& session() { return session_; }
    const control::SessionState& session() const { return session_; }
    control::CommandDispatcher& dispatcher() { return dispatcher_; }
    input::TouchController& touch() { return touch_; }
    stream::ResolutionController& resolution() { return resolution_; }
    const config::ConsoleConfig& config() const { return cfg_; }

    stream::DeviceSession* deviceSession(const DeviceId& id);
    ConnectionState state(const DeviceId& id) const { return session_.connections().state(id); }
    std::vector<DeviceId> devices() const { return session_.connections().ids(); }

    // Host input for one tile
    std::unique_ptr<InputSink> inputFor(const DeviceId& id) { return touch_.sinkFor(id); }

    void setUserScale(double scale);
    void setFrameRate(int fps);

    // Ends the touch session, sends delayed mirror commands, disconnects every
    // device. Safe to call more than once.
    void close();
    bool isClosed() const { return closed_; }

protected:
    ConsoleBase(const config::ConsoleConfig& cfg, ConsoleDeps deps, double min_scale,
                double user_scale, int fps, stream::LayoutInputs layout);

    bool trackDevice(const Device& device, VideoSurface* surface);
    // Touch cleanup, disconnect, then forget the device
    void untrackDevice(const DeviceId& id);

    // Ends the gesture in flight when its mirror targets would differ under
    // the given selection, so every device that got the down also gets the up.
    // Call before changing the selection or group sync.
    void endTouchIfMirrorChanges(const std::set<DeviceId>& next_selection, bool next_group_sync);
    std::set<DeviceId> checkedSet() const;

    bool connectDevice(const DeviceId& id);
    void disconnectDevice(const DeviceId& id);

    // Runs after every device is disconnected
    virtual void onClosed() {}

    config::ConsoleConfig cfg_;
    ConsoleDeps deps_;
    control::SessionState session_;
    control::CommandDispatcher dispatcher_;
    input::TouchController touch_;
    stream::ResolutionController resolution_;
    SubscriptionHandle state_sub_;
    SubscriptionHandle stream_error_sub_;
    std::map<DeviceId, std::unique_ptr<stream::DeviceSession>> sessions_;
    bool closed_ = false;
};

} // namespace fleetdeck::console
