#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "event_bus.hpp"
#include "fleet_types.hpp"
#include "transport.hpp"

namespace fleetdeck::control {

// =============================================================================
// DeviceConnection: one tracked device's transport/media/state
// =============================================================================
// Invariants (enforced by ConnectionTable):
//   media != nullptr     => state == Connected
//   transport != nullptr => state in {Connecting, Connected}
struct DeviceConnection {
    Device device;
    std::shared_ptr<PrimaryTransport> transport;
    std::shared_ptr<MediaStream> media;
    ConnectionState state = ConnectionState::Disconnected;
    VideoSurface* surface = nullptr;   // render target, owned by the host
};

struct TouchSession {
    bool active = false;
    DeviceId device_id;
    NormalizedPoint last_position;
};

// =============================================================================
// SelectionSet: devices "checked" for mirrored operation
// =============================================================================
class SelectionSet {
public:
    explicit SelectionSet(EventBus& bus) : bus_(bus) {}

    // Returns true if membership changed
    bool set(const DeviceId& id, bool checked);
    bool toggle(const DeviceId& id);
    void clear();
    void selectAll(const std::vector<DeviceId>& ids);

    bool contains(const DeviceId& id) const { return members_.count(id) > 0; }
    size_t size() const { return members_.size(); }
    bool empty() const { return members_.empty(); }

    std::vector<DeviceId> members() const;
    // Members except `id`
    std::vector<DeviceId> others(const DeviceId& id) const;

private:
    void notify();

    EventBus& bus_;
    std::set<DeviceId> members_;
};

// =============================================================================
// ConnectionTable: DeviceConnection per tracked device
// =============================================================================
class ConnectionTable {
public:
    explicit ConnectionTable(EventBus& bus) : bus_(bus) {}

    bool add(const Device& device, VideoSurface* surface);
    bool remove(const DeviceId& id);
    bool contains(const DeviceId& id) const;
    size_t size() const;

    std::optional<DeviceConnection> find(const DeviceId& id) const;
    ConnectionState state(const DeviceId& id) const;
    std::shared_ptr<PrimaryTransport> transport(const DeviceId& id) const;
    VideoSurface* surface(const DeviceId& id) const;
    void setSurface(const DeviceId& id, VideoSurface* surface);

    // Disconnected -> Connecting, taking the transport
    bool beginConnecting(const DeviceId& id, std::shared_ptr<PrimaryTransport> transport);
    // Connecting -> Connected
    bool markConnected(const DeviceId& id);
    // Requires Connected
    bool attachMedia(const DeviceId& id, std::shared_ptr<MediaStream> media);

    struct Released {
        std::shared_ptr<PrimaryTransport> transport;
        std::shared_ptr<MediaStream> media;
    };
    // Any state -> Disconnected; hands back what the caller must release
    Released markDisconnected(const DeviceId& id);

    // Tracking order
    std::vector<DeviceId> ids() const;
    std::vector<DeviceId> idsInState(ConnectionState state) const;

private:
    void notifyState(const DeviceId& id, ConnectionState from, ConnectionState to);

    EventBus& bus_;
    mutable std::mutex mutex_;
    std::map<DeviceId, DeviceConnection> connections_;
    std::vector<DeviceId> order_;
};

// =============================================================================
// SessionState: working set, selection, active device, touch session
// =============================================================================
class SessionState {
public:
    explicit SessionState(EventBus& bus);

    EventBus& bus() { return bus_; }
    SelectionSet& selection() { return selection_; }
    const SelectionSet& selection() const { return selection_; }
    ConnectionTable& connections() { return connections_; }
    const ConnectionTable& connections() const { return connections_; }

    // Working set. removeDevice also drops the device from the selection and
    // clears it as active device; it does not release transport or media.
    bool addDevice(const Device& device, VideoSurface* surface);
    bool removeDevice(const DeviceId& id);
    bool isTracked(const DeviceId& id) const { return connections_.contains(id); }

    // Active device must be tracked
    bool setActiveDevice(const DeviceId& id);
    void clearActiveDevice();
    std::optional<DeviceId> activeDevice() const { return active_; }

    bool groupSync() const { return group_sync_; }
    void setGroupSync(bool enabled);

    // Exclusive: fails while another session is active
    bool beginTouch(const DeviceId& id, const NormalizedPoint& pos);
    bool updateTouch(const NormalizedPoint& pos);
    // Returns the finished session, nullopt if none was active
    std::optional<TouchSession> endTouch();
    const TouchSession& touch() const { return touch_; }

private:
    EventBus& bus_;
    SelectionSet selection_;
    ConnectionTable connections_;
    std::optional<DeviceId> active_;
    bool group_sync_ = false;
    TouchSession touch_;
};

} // namespace fleetdeck::control
