#include "resolution_negotiator.hpp"
#include "fleet_log.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace fleetdeck::stream {

// =============================================================================
// ResolutionNegotiator
// =============================================================================

PixelSize ResolutionNegotiator::orient(PixelSize native, int rotation) {
    if (native.empty()) native = DEFAULT_NATIVE;
    int r = rotation % 360;
    if (r < 0) r += 360;
    const bool landscape = (r == 90 || r == 270);
    const int lo = std::min(native.width, native.height);
    const int hi = std::max(native.width, native.height);
    return landscape ? PixelSize{hi, lo} : PixelSize{lo, hi};
}

CellSize ResolutionNegotiator::cellSize(const LayoutInputs& layout) const {
    const double fraction = layout.fullscreen ? 1.0 : layout.panel_fraction;
    const double panel_w = layout.panel_width * fraction;
    CellSize cell;
    if (layout.grid) {
        const int cols = std::max(1, layout.columns);
        const double available = panel_w - layout.grid_padding * 2.0 - layout.grid_gap * (cols - 1);
        cell.width = std::max(0.0, available / cols);
        cell.height = cell.width * layout.tile_aspect;
    } else {
        cell.width = std::max(0.0, panel_w - layout.grid_padding * 2.0);
        cell.height = std::max(0.0, layout.panel_height * fraction - layout.grid_padding * 2.0);
    }
    return cell;
}

double ResolutionNegotiator::containerScale(PixelSize native, const LayoutInputs& layout) const {
    if (native.empty()) return 0.0;
    const CellSize cell = cellSize(layout);
    const double dpr = layout.device_pixel_ratio > 0.0 ? layout.device_pixel_ratio : 1.0;
    // contain fit: the binding axis decides
    const double sx = cell.width * dpr / native.width;
    const double sy = cell.height * dpr / native.height;
    return std::min(sx, sy);
}

double ResolutionNegotiator::pixelBudgetScale(PixelSize native) const {
    if (native.empty() || limits_.pixel_budget <= 0) return 0.0;
    const double pixels = static_cast<double>(native.width) * static_cast<double>(native.height);
    // 2 decimals, rounded down so the rounded scale still fits the budget
    return std::floor(std::sqrt(static_cast<double>(limits_.pixel_budget) / pixels) * 100.0) / 100.0;
}

int ResolutionNegotiator::floorEven(double v) {
    if (!(v > 0.0)) return 0;
    const int n = static_cast<int>(std::floor(v));
    return n - (n % 2);
}

ScaleDecision ResolutionNegotiator::compute(double user_cap, PixelSize native,
                                            const LayoutInputs& layout) const {
    if (native.empty()) native = DEFAULT_NATIVE;

    ScaleDecision d;
    d.user_cap = user_cap;
    d.container_scale = containerScale(native, layout);
    d.pixel_budget_scale = pixelBudgetScale(native);

    double target = std::min({user_cap, d.container_scale, d.pixel_budget_scale});
    target = std::clamp(target, limits_.min_scale, limits_.max_scale);
    // hard ceiling, even against the mode floor
    target = std::min(target, d.pixel_budget_scale);
    d.target_scale = target;

    d.width = floorEven(native.width * target);
    d.height = floorEven(native.height * target);
    return d;
}

bool ResolutionNegotiator::shouldApply(std::optional<double> last_applied, double target) const {
    if (!last_applied) return true;
    return std::fabs(target - *last_applied) > limits_.hysteresis;
}

// =============================================================================
// ResolutionController
// =============================================================================

ResolutionController::ResolutionController(ResolutionNegotiator negotiator, EventBus& bus,
                                           double user_cap, int fps, LayoutInputs layout)
    : negotiator_(std::move(negotiator)), bus_(bus), user_cap_(user_cap), fps_(fps),
      layout_(layout) {
    user_cap_ = std::clamp(user_cap_, negotiator_.limits().min_scale, negotiator_.limits().max_scale);
    fps_ = std::max(1, fps_);
}

void ResolutionController::registerDevice(const DeviceId& id, PixelSize native) {
    auto& st = devices_[id];
    st.native = native;
}

void ResolutionController::unregisterDevice(const DeviceId& id) {
    devices_.erase(id);
}

protocol::StreamOptions ResolutionController::startOptions(const DeviceId& id, bool force) {
    auto& st = devices_[id];
    st.last_decision = negotiator_.compute(user_cap_, ResolutionNegotiator::orient(st.native, st.rotation), layout_);
    st.last_applied_scale = st.last_decision.target_scale;
    st.last_applied_fps = fps_;
    st.force_pending = false;

    protocol::StreamOptions opts;
    opts.resolution = st.last_decision.target_scale;
    opts.fps = fps_;
    opts.force = force;
    FLOG_INFO("Resolution", "%s: start scale=%.3f (%dx%d) user=%.2f container=%.3f budget=%.2f fps=%d",
              id.c_str(), opts.resolution, st.last_decision.width, st.last_decision.height,
              st.last_decision.user_cap, st.last_decision.container_scale,
              st.last_decision.pixel_budget_scale, fps_);
    return opts;
}

void ResolutionController::setLive(const DeviceId& id, bool live) {
    auto it = devices_.find(id);
    if (it == devices_.end()) return;
    auto& st = it->second;
    const bool was_live = st.live;
    st.live = live;
    // Connecting keeps what startOptions() recorded
    if (was_live && !live) {
        st.last_applied_scale.reset();
        st.last_applied_fps.reset();
        st.force_pending = false;
    } else if (!was_live && live) {
        apply(id, st, false);
    }
}

void ResolutionController::setUserCap(double cap) {
    const auto& lim = negotiator_.limits();
    user_cap_ = std::clamp(cap, lim.min_scale, lim.max_scale);
    FLOG_INFO("Resolution", "User cap -> %.2f", user_cap_);
    reevaluate(true);
}

void ResolutionController::setFrameRate(int fps) {
    fps_ = std::max(1, fps);
    FLOG_INFO("Resolution", "Frame rate -> %d", fps_);
    reevaluate(false);
}

void ResolutionController::setLayout(const LayoutInputs& layout) {
    layout_ = layout;
    reevaluate(false);
}

void ResolutionController::setRotation(const DeviceId& id, int rotation) {
    auto it = devices_.find(id);
    if (it == devices_.end() || it->second.rotation == rotation) return;
    it->second.rotation = rotation;
    apply(id, it->second, false);
}

ScaleDecision ResolutionController::decisionFor(const DeviceId& id) const {
    auto it = devices_.find(id);
    PixelSize native = it != devices_.end()
        ? ResolutionNegotiator::orient(it->second.native, it->second.rotation)
        : ResolutionNegotiator::DEFAULT_NATIVE;
    return negotiator_.compute(user_cap_, native, layout_);
}

const ResolutionState* ResolutionController::state(const DeviceId& id) const {
    auto it = devices_.find(id);
    return it != devices_.end() ? &it->second : nullptr;
}

void ResolutionController::reevaluate(bool force) {
    for (auto& [id, st] : devices_) {
        apply(id, st, force);
    }
}

void ResolutionController::apply(const DeviceId& id, ResolutionState& st, bool force) {
    st.last_decision = negotiator_.compute(user_cap_, ResolutionNegotiator::orient(st.native, st.rotation), layout_);
    if (!st.live) {
        if (force) st.force_pending = true;
        return;
    }
    force = force || st.force_pending;
    st.force_pending = false;

    const double target = st.last_decision.target_scale;
    const bool changed = !st.last_applied_scale || *st.last_applied_scale != target;
    if (changed && (force || negotiator_.shouldApply(st.last_applied_scale, target))) {
        st.last_applied_scale = target;
        FLOG_INFO("Resolution", "%s: scale -> %.3f (%dx%d)%s", id.c_str(), target,
                  st.last_decision.width, st.last_decision.height, force ? " [forced]" : "");
        if (scale_callback_) scale_callback_(id, st.last_decision);

        ResolutionAppliedEvent ev;
        ev.device_id = id;
        ev.scale = target;
        ev.width = st.last_decision.width;
        ev.height = st.last_decision.height;
        bus_.publish(ev);
    }

    if (!st.last_applied_fps || *st.last_applied_fps != fps_) {
        st.last_applied_fps = fps_;
        if (fps_callback_) fps_callback_(id, fps_);

        FrameRateAppliedEvent ev;
        ev.device_id = id;
        ev.fps = fps_;
        bus_.publish(ev);
    }
}

} // namespace fleetdeck::stream
