#include "session_state.hpp"
#include "fleet_log.hpp"
#include <algorithm>

namespace fleetdeck::control {

// =============================================================================
// SelectionSet
// =============================================================================

bool SelectionSet::set(const DeviceId& id, bool checked) {
    bool changed = checked ? members_.insert(id).second : members_.erase(id) > 0;
    if (changed) notify();
    return changed;
}

bool SelectionSet::toggle(const DeviceId& id) {
    return set(id, !contains(id));
}

void SelectionSet::clear() {
    if (members_.empty()) return;
    members_.clear();
    notify();
}

void SelectionSet::selectAll(const std::vector<DeviceId>& ids) {
    size_t before = members_.size();
    members_.insert(ids.begin(), ids.end());
    if (members_.size() != before) notify();
}

std::vector<DeviceId> SelectionSet::members() const {
    return std::vector<DeviceId>(members_.begin(), members_.end());
}

std::vector<DeviceId> SelectionSet::others(const DeviceId& id) const {
    std::vector<DeviceId> out;
    out.reserve(members_.size());
    for (const auto& m : members_) {
        if (m != id) out.push_back(m);
    }
    return out;
}

void SelectionSet::notify() {
    SelectionChangedEvent ev;
    ev.selected = members();
    bus_.publish(ev);
}

// =============================================================================
// ConnectionTable
// =============================================================================

bool ConnectionTable::add(const Device& device, VideoSurface* surface) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connections_.count(device.id)) return false;
        DeviceConnection conn;
        conn.device = device;
        conn.surface = surface;
        connections_.emplace(device.id, std::move(conn));
        order_.push_back(device.id);
    }
    FLOG_INFO("Session", "Tracking device %s (%dx%d)", device.id.c_str(),
              device.native.width, device.native.height);

    DeviceTrackedEvent ev;
    ev.device_id = device.id;
    ev.tracked = true;
    bus_.publish(ev);
    return true;
}

bool ConnectionTable::remove(const DeviceId& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(id);
        if (it == connections_.end()) return false;
        if (it->second.state != ConnectionState::Disconnected) {
            FLOG_WARN("Session", "Removing %s while %s", id.c_str(),
                      connectionStateStr(it->second.state));
        }
        connections_.erase(it);
        order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    }
    FLOG_INFO("Session", "Untracked device %s", id.c_str());

    DeviceTrackedEvent ev;
    ev.device_id = id;
    ev.tracked = false;
    bus_.publish(ev);
    return true;
}

bool ConnectionTable::contains(const DeviceId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.count(id) > 0;
}

size_t ConnectionTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

std::optional<DeviceConnection> ConnectionTable::find(const DeviceId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(id);
    if (it == connections_.end()) return std::nullopt;
    return it->second;
}

ConnectionState ConnectionTable::state(const DeviceId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(id);
    return it != connections_.end() ? it->second.state : ConnectionState::Disconnected;
}

std::shared_ptr<PrimaryTransport> ConnectionTable::transport(const DeviceId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(id);
    return it != connections_.end() ? it->second.transport : nullptr;
}

VideoSurface* ConnectionTable::surface(const DeviceId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(id);
    return it != connections_.end() ? it->second.surface : nullptr;
}

void ConnectionTable::setSurface(const DeviceId& id, VideoSurface* surface) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(id);
    if (it != connections_.end()) it->second.surface = surface;
}

bool ConnectionTable::beginConnecting(const DeviceId& id, std::shared_ptr<PrimaryTransport> transport) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(id);
        if (it == connections_.end() || !transport) return false;
        if (it->second.state != ConnectionState::Disconnected) return false;
        it->second.transport = std::move(transport);
        it->second.state = ConnectionState::Connecting;
    }
    notifyState(id, ConnectionState::Disconnected, ConnectionState::Connecting);
    return true;
}

bool ConnectionTable::markConnected(const DeviceId& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(id);
        if (it == connections_.end()) return false;
        if (it->second.state != ConnectionState::Connecting || !it->second.transport) return false;
        it->second.state = ConnectionState::Connected;
    }
    notifyState(id, ConnectionState::Connecting, ConnectionState::Connected);
    return true;
}

bool ConnectionTable::attachMedia(const DeviceId& id, std::shared_ptr<MediaStream> media) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(id);
    if (it == connections_.end() || !media) return false;
    if (it->second.state != ConnectionState::Connected) return false;
    it->second.media = std::move(media);
    return true;
}

ConnectionTable::Released ConnectionTable::markDisconnected(const DeviceId& id) {
    Released out;
    ConnectionState prev = ConnectionState::Disconnected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(id);
        if (it == connections_.end()) return out;
        prev = it->second.state;
        out.transport = std::move(it->second.transport);
        out.media = std::move(it->second.media);
        it->second.transport.reset();
        it->second.media.reset();
        it->second.state = ConnectionState::Disconnected;
    }
    if (prev != ConnectionState::Disconnected) {
        notifyState(id, prev, ConnectionState::Disconnected);
    }
    return out;
}

std::vector<DeviceId> ConnectionTable::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

std::vector<DeviceId> ConnectionTable::idsInState(ConnectionState state) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeviceId> out;
    for (const auto& id : order_) {
        auto it = connections_.find(id);
        if (it != connections_.end() && it->second.state == state) out.push_back(id);
    }
    return out;
}

void ConnectionTable::notifyState(const DeviceId& id, ConnectionState from, ConnectionState to) {
    FLOG_DEBUG("Session", "%s: %s -> %s", id.c_str(), connectionStateStr(from), connectionStateStr(to));
    ConnectionStateChangedEvent ev;
    ev.device_id = id;
    ev.old_state = from;
    ev.new_state = to;
    bus_.publish(ev);
}

// =============================================================================
// SessionState
// =============================================================================

SessionState::SessionState(EventBus& bus)
    : bus_(bus), selection_(bus), connections_(bus) {}

bool SessionState::addDevice(const Device& device, VideoSurface* surface) {
    return connections_.add(device, surface);
}

bool SessionState::removeDevice(const DeviceId& id) {
    if (!connections_.contains(id)) return false;
    if (touch_.active && touch_.device_id == id) {
        FLOG_WARN("Session", "Removing %s with an active touch session", id.c_str());
        endTouch();
    }
    if (active_ && *active_ == id) clearActiveDevice();
    selection_.set(id, false);
    return connections_.remove(id);
}

bool SessionState::setActiveDevice(const DeviceId& id) {
    if (!connections_.contains(id)) {
        FLOG_WARN("Session", "Cannot activate untracked device %s", id.c_str());
        return false;
    }
    if (active_ && *active_ == id) return true;
    active_ = id;
    ActiveDeviceChangedEvent ev;
    ev.device_id = id;
    bus_.publish(ev);
    return true;
}

void SessionState::clearActiveDevice() {
    if (!active_) return;
    active_.reset();
    bus_.publish(ActiveDeviceChangedEvent{});
}

void SessionState::setGroupSync(bool enabled) {
    if (group_sync_ == enabled) return;
    group_sync_ = enabled;
    FLOG_INFO("Session", "Group sync %s", enabled ? "on" : "off");
    GroupSyncChangedEvent ev;
    ev.enabled = enabled;
    bus_.publish(ev);
}

bool SessionState::beginTouch(const DeviceId& id, const NormalizedPoint& pos) {
    if (touch_.active) return false;
    if (!connections_.contains(id)) return false;
    touch_.active = true;
    touch_.device_id = id;
    touch_.last_position = pos;

    TouchSessionEvent ev;
    ev.device_id = id;
    ev.active = true;
    ev.position = pos;
    bus_.publish(ev);
    return true;
}

bool SessionState::updateTouch(const NormalizedPoint& pos) {
    if (!touch_.active) return false;
    touch_.last_position = pos;
    return true;
}

std::optional<TouchSession> SessionState::endTouch() {
    if (!touch_.active) return std::nullopt;
    TouchSession done = touch_;
    touch_ = TouchSession{};

    TouchSessionEvent ev;
    ev.device_id = done.device_id;
    ev.active = false;
    ev.position = done.last_position;
    bus_.publish(ev);
    return done;
}

} // namespace fleetdeck::control
