#pragma once

#include <functional>
#include <map>
#include <string>
#include "control/session_state.hpp"
#include "event_bus.hpp"
#include "scheduler.hpp"
#include "transport.hpp"

namespace fleetdeck::stream {

/**
 * Keeps only visible tiles streaming (batch console).
 *
 *   hidden -> visible : connect if Disconnected
 *   visible -> hidden : disconnect if Connected
 *
 * A tile that finishes connecting while hidden is disconnected as soon as it
 * reaches Connected. Connect/disconnect are run on the task scheduler, never
 * from inside a tracker or event-bus callback.
 */
class ConnectionLifecycleManager {
public:
    using ConnectFn = std::function<void(const DeviceId&)>;
    using DisconnectFn = std::function<void(const DeviceId&)>;

    ConnectionLifecycleManager(VisibilityTracker& tracker, control::ConnectionTable& table,
                               EventBus& bus, TaskScheduler& tasks,
                               ConnectFn connect, DisconnectFn disconnect);
    ~ConnectionLifecycleManager();

    ConnectionLifecycleManager(const ConnectionLifecycleManager&) = delete;
    ConnectionLifecycleManager& operator=(const ConnectionLifecycleManager&) = delete;

    void addTile(const DeviceId& id);
    void removeTile(const DeviceId& id);

    // Stops observing and tears the tracker down (console close)
    void shutdown();

    bool isObserved(const DeviceId& id) const { return tiles_.count(id) > 0; }
    bool isVisible(const DeviceId& id) const;
    size_t visibleCount() const;

private:
    void onVisibility(const DeviceId& id, bool visible);
    void onStateChanged(const ConnectionStateChangedEvent& e);
    void reconcile(const DeviceId& id);

    VisibilityTracker& tracker_;
    control::ConnectionTable& table_;
    TaskScheduler& tasks_;
    ConnectFn connect_;
    DisconnectFn disconnect_;
    SubscriptionHandle state_sub_;

    std::map<DeviceId, bool> tiles_;   // id -> last reported visibility
    std::map<DeviceId, TaskId> queued_;
    bool shut_down_ = false;
};

} // namespace fleetdeck::stream
