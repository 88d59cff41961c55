#include "visibility_tracker.hpp"
#include "fleet_log.hpp"
#include <vector>

namespace fleetdeck::stream {

ManualVisibilityTracker::ManualVisibilityTracker(Rect viewport, double margin)
    : viewport_(viewport), margin_(margin) {}

void ManualVisibilityTracker::observe(const DeviceId& id) {
    const bool visible = intersects(id);
    observed_[id] = visible;
    if (callback_) callback_(id, visible);
}

void ManualVisibilityTracker::unobserve(const DeviceId& id) {
    observed_.erase(id);
}

void ManualVisibilityTracker::disconnect() {
    observed_.clear();
    callback_ = nullptr;
}

void ManualVisibilityTracker::setViewport(const Rect& viewport) {
    viewport_ = viewport;
    recompute();
}

void ManualVisibilityTracker::scrollTo(double top) {
    viewport_.top = top;
    FLOG_TRACE("Visibility", "scroll -> %.0f", top);
    recompute();
}

void ManualVisibilityTracker::setTileRect(const DeviceId& id, const Rect& rect) {
    rects_[id] = rect;
    recompute();
}

void ManualVisibilityTracker::removeTileRect(const DeviceId& id) {
    rects_.erase(id);
    recompute();
}

std::optional<Rect> ManualVisibilityTracker::tileRect(const DeviceId& id) const {
    auto it = rects_.find(id);
    if (it == rects_.end()) return std::nullopt;
    return it->second;
}

bool ManualVisibilityTracker::isVisible(const DeviceId& id) const {
    auto it = observed_.find(id);
    return it != observed_.end() && it->second;
}

void ManualVisibilityTracker::recompute() {
    std::vector<std::pair<DeviceId, bool>> changes;
    for (auto& [id, visible] : observed_) {
        const bool now = intersects(id);
        if (now != visible) {
            visible = now;
            changes.emplace_back(id, now);
        }
    }
    // Callbacks may observe/unobserve
    for (const auto& [id, visible] : changes) {
        if (callback_) callback_(id, visible);
    }
}

bool ManualVisibilityTracker::intersects(const DeviceId& id) const {
    auto it = rects_.find(id);
    if (it == rects_.end()) return false;
    const Rect& r = it->second;
    if (r.width <= 0.0 || r.height <= 0.0) return false;

    const double left = viewport_.left - margin_;
    const double top = viewport_.top - margin_;
    const double right = viewport_.right() + margin_;
    const double bottom = viewport_.bottom() + margin_;
    return r.left < right && r.right() > left && r.top < bottom && r.bottom() > top;
}

} // namespace fleetdeck::stream
