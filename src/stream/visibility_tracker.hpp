#pragma once

#include <map>
#include <optional>
#include <utility>
#include "fleet_types.hpp"
#include "transport.hpp"

namespace fleetdeck::stream {

/**
 * VisibilityTracker for hosts that know their tile geometry: a tile is
 * visible when its rect intersects the viewport grown by `margin` px on every
 * side (pre-fetch). observe() reports the initial state; afterwards only
 * transitions are reported.
 */
class ManualVisibilityTracker : public VisibilityTracker {
public:
    static constexpr double DEFAULT_MARGIN = 50.0;

    explicit ManualVisibilityTracker(Rect viewport = {}, double margin = DEFAULT_MARGIN);

    void setCallback(Callback cb) override { callback_ = std::move(cb); }
    void observe(const DeviceId& id) override;
    void unobserve(const DeviceId& id) override;
    void disconnect() override;

    void setViewport(const Rect& viewport);
    const Rect& viewport() const { return viewport_; }
    // Moves the viewport vertically (scrolling the grid container)
    void scrollTo(double top);

    void setTileRect(const DeviceId& id, const Rect& rect);
    void removeTileRect(const DeviceId& id);
    std::optional<Rect> tileRect(const DeviceId& id) const;

    bool isObserved(const DeviceId& id) const { return observed_.count(id) > 0; }
    bool isVisible(const DeviceId& id) const;
    double margin() const { return margin_; }

    // Re-checks every observed tile and reports transitions
    void recompute();

private:
    bool intersects(const DeviceId& id) const;

    Callback callback_;
    Rect viewport_;
    double margin_;
    std::map<DeviceId, Rect> rects_;
    std::map<DeviceId, bool> observed_;
};

} // namespace fleetdeck::stream
