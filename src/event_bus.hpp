// =============================================================================
// FleetDeck - Event Bus
// =============================================================================
// Thread-safe, type-erased publish/subscribe event system.
// Session state, stream sessions and controllers publish change notifications
// here; consoles and tools subscribe instead of polling.
// Usage:
//   auto sub = fleetdeck::bus().subscribe<ConnectionStateChangedEvent>([](const auto& e) { ... });
//   fleetdeck::bus().publish(ConnectionStateChangedEvent{...});
// =============================================================================
#pragma once
#include <functional>
#include <mutex>
#include <vector>
#include <unordered_map>
#include <typeindex>
#include <type_traits>
#include <memory>
#include <string>
#include <cstdint>
#include <atomic>
#include <algorithm>
#include <utility>
#include "fleet_log.hpp"
#include "fleet_types.hpp"

namespace fleetdeck {

// =============================================================================
// Event Types
// =============================================================================

struct Event {
    virtual ~Event() = default;
};

// DeviceConnection state machine transition
struct ConnectionStateChangedEvent : Event {
    DeviceId device_id;
    ConnectionState old_state = ConnectionState::Disconnected;
    ConnectionState new_state = ConnectionState::Disconnected;
};

// Device entered or left the working set
struct DeviceTrackedEvent : Event {
    DeviceId device_id;
    bool tracked = false;
};

struct SelectionChangedEvent : Event {
    std::vector<DeviceId> selected;
};

struct ActiveDeviceChangedEvent : Event {
    DeviceId device_id;   // empty when no device is active
};

struct GroupSyncChangedEvent : Event {
    bool enabled = false;
};

struct TouchSessionEvent : Event {
    DeviceId device_id;
    bool active = false;
    NormalizedPoint position;
};

struct ResolutionAppliedEvent : Event {
    DeviceId device_id;
    double scale = 0.0;
    int width = 0;
    int height = 0;
};

struct FrameRateAppliedEvent : Event {
    DeviceId device_id;
    int fps = 0;
};

struct PlaybackRateChangedEvent : Event {
    DeviceId device_id;
    double rate = 1.0;
    bool catching_up = false;
    double lag_ms = 0.0;
};

struct StreamStatsEvent : Event {
    DeviceId device_id;
    double fps = 0.0;
    double bitrate_kbps = 0.0;
};

struct ClipboardContentEvent : Event {
    DeviceId device_id;
    std::string text;
};

// Signaling reported that a device's stream failed
struct StreamErrorEvent : Event {
    DeviceId device_id;
    std::string message;
};

// Signaling connection lost or restored
struct SignalingStateEvent : Event {
    bool available = false;
};

// System
struct ShutdownEvent : Event {};

// =============================================================================
// SubscriptionHandle - RAII unsubscribe
// =============================================================================
// Owns one subscription. Destroying or reassigning the handle unsubscribes;
// the handle may outlive the bus it came from.

class SubscriptionHandle {
public:
    SubscriptionHandle() = default;
    explicit SubscriptionHandle(std::function<void()> unsub) : unsub_(std::move(unsub)) {}
    ~SubscriptionHandle() { reset(); }

    SubscriptionHandle(SubscriptionHandle&& o) noexcept : unsub_(std::exchange(o.unsub_, nullptr)) {}
    SubscriptionHandle& operator=(SubscriptionHandle&& o) noexcept {
        if (this != &o) {
            reset();
            unsub_ = std::exchange(o.unsub_, nullptr);
        }
        return *this;
    }
    SubscriptionHandle(const SubscriptionHandle&) = delete;
    SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;

    bool active() const { return static_cast<bool>(unsub_); }

    // Detach: the subscription lives as long as the bus
    void release() { unsub_ = nullptr; }

private:
    void reset() {
        // moved out first: the callback may destroy whatever owns this handle
        if (auto unsub = std::exchange(unsub_, nullptr)) unsub();
    }

    std::function<void()> unsub_;
};

// =============================================================================
// EventBus - Thread-safe publish/subscribe
// =============================================================================
// publish() calls handlers synchronously on the publishing thread, in
// subscription order, from a snapshot taken under the lock. A handler that is
// unsubscribed while a publish is in progress (by an earlier handler of the
// same event, typically during teardown) is skipped. A throwing handler is
// logged and the remaining handlers still run.

class EventBus {
public:
    using HandlerId = uint64_t;

    EventBus() : state_(std::make_shared<State>()) {}
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename T>
    SubscriptionHandle subscribe(std::function<void(const T&)> handler) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");

        auto sub = std::make_shared<Subscriber>();
        sub->fn = [handler = std::move(handler)](const Event& e) { handler(static_cast<const T&>(e)); };
        const auto key = std::type_index(typeid(T));
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            sub->id = state_->next_id++;
            state_->handlers[key].push_back(sub);
        }
        FLOG_TRACE("eventbus", "handler %llu subscribed to %s", (unsigned long long)sub->id, typeid(T).name());

        std::weak_ptr<State> weak_state = state_;
        std::weak_ptr<Subscriber> weak_sub = sub;
        return SubscriptionHandle([weak_state, weak_sub, key] {
            auto st = weak_state.lock();
            auto target = weak_sub.lock();
            if (!st || !target) return;
            target->active.store(false);
            std::lock_guard<std::mutex> lock(st->mutex);
            auto it = st->handlers.find(key);
            if (it == st->handlers.end()) return;
            auto& vec = it->second;
            vec.erase(std::remove(vec.begin(), vec.end(), target), vec.end());
        });
    }

    template<typename T>
    void publish(const T& event) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");

        std::vector<std::shared_ptr<Subscriber>> snapshot;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            auto it = state_->handlers.find(std::type_index(typeid(T)));
            if (it == state_->handlers.end() || it->second.empty()) return;
            snapshot = it->second;
        }

        for (const auto& sub : snapshot) {
            if (!sub->active.load()) continue;
            try {
                sub->fn(event);
            } catch (const std::exception& e) {
                FLOG_ERROR("eventbus", "handler %llu (%s) threw: %s",
                           (unsigned long long)sub->id, typeid(T).name(), e.what());
            }
        }
    }

    template<typename T>
    size_t subscriberCount() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        auto it = state_->handlers.find(std::type_index(typeid(T)));
        return it != state_->handlers.end() ? it->second.size() : 0;
    }

private:
    struct Subscriber {
        HandlerId id = 0;
        std::function<void(const Event&)> fn;
        std::atomic<bool> active{true};
    };

    struct State {
        std::mutex mutex;
        std::unordered_map<std::type_index, std::vector<std::shared_ptr<Subscriber>>> handlers;
        HandlerId next_id = 1;
    };

    std::shared_ptr<State> state_;
};

// Global event bus singleton
inline EventBus& bus() {
    static EventBus instance;
    return instance;
}

} // namespace fleetdeck
