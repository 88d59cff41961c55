#include "connection_lifecycle.hpp"
#include "fleet_log.hpp"

namespace fleetdeck::stream {

ConnectionLifecycleManager::ConnectionLifecycleManager(VisibilityTracker& tracker,
                                                       control::ConnectionTable& table,
                                                       EventBus& bus, TaskScheduler& tasks,
                                                       ConnectFn connect, DisconnectFn disconnect)
    : tracker_(tracker), table_(table), tasks_(tasks),
      connect_(std::move(connect)), disconnect_(std::move(disconnect)) {
    tracker_.setCallback([this](const DeviceId& id, bool visible) { onVisibility(id, visible); });
    state_sub_ = bus.subscribe<ConnectionStateChangedEvent>(
        [this](const ConnectionStateChangedEvent& e) { onStateChanged(e); });
}

ConnectionLifecycleManager::~ConnectionLifecycleManager() {
    shutdown();
}

void ConnectionLifecycleManager::addTile(const DeviceId& id) {
    if (shut_down_ || tiles_.count(id)) return;
    tiles_[id] = false;
    tracker_.observe(id);
    FLOG_DEBUG("Lifecycle", "observing %s", id.c_str());
}

void ConnectionLifecycleManager::removeTile(const DeviceId& id) {
    auto it = tiles_.find(id);
    if (it == tiles_.end()) return;
    tracker_.unobserve(id);
    tiles_.erase(it);
    auto q = queued_.find(id);
    if (q != queued_.end()) {
        tasks_.cancel(q->second);
        queued_.erase(q);
    }
    FLOG_DEBUG("Lifecycle", "stopped observing %s", id.c_str());
}

void ConnectionLifecycleManager::shutdown() {
    if (shut_down_) return;
    shut_down_ = true;
    state_sub_ = SubscriptionHandle();
    for (auto& [id, task] : queued_) tasks_.cancel(task);
    queued_.clear();
    for (auto& [id, visible] : tiles_) tracker_.unobserve(id);
    tiles_.clear();
    tracker_.setCallback(nullptr);
    tracker_.disconnect();
    FLOG_INFO("Lifecycle", "visibility tracking stopped");
}

bool ConnectionLifecycleManager::isVisible(const DeviceId& id) const {
    auto it = tiles_.find(id);
    return it != tiles_.end() && it->second;
}

size_t ConnectionLifecycleManager::visibleCount() const {
    size_t n = 0;
    for (const auto& [id, visible] : tiles_) {
        if (visible) n++;
    }
    return n;
}

void ConnectionLifecycleManager::onVisibility(const DeviceId& id, bool visible) {
    auto it = tiles_.find(id);
    if (it == tiles_.end()) return;
    if (it->second != visible) {
        FLOG_DEBUG("Lifecycle", "%s %s", id.c_str(), visible ? "visible" : "hidden");
    }
    it->second = visible;
    reconcile(id);
}

void ConnectionLifecycleManager::onStateChanged(const ConnectionStateChangedEvent& e) {
    // Finished connecting while scrolled away
    if (e.new_state == ConnectionState::Connected && tiles_.count(e.device_id) &&
        !isVisible(e.device_id)) {
        reconcile(e.device_id);
    }
}

void ConnectionLifecycleManager::reconcile(const DeviceId& id) {
    if (queued_.count(id)) return;
    queued_[id] = tasks_.post([this, id] {
        queued_.erase(id);
        auto it = tiles_.find(id);
        if (it == tiles_.end()) return;

        const ConnectionState state = table_.state(id);
        if (it->second && state == ConnectionState::Disconnected) {
            FLOG_INFO("Lifecycle", "%s visible, connecting", id.c_str());
            if (connect_) connect_(id);
        } else if (!it->second && state == ConnectionState::Connected) {
            FLOG_INFO("Lifecycle", "%s hidden, disconnecting", id.c_str());
            if (disconnect_) disconnect_(id);
        }
    });
}

} // namespace fleetdeck::stream
