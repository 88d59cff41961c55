#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include "control_protocol.hpp"
#include "event_bus.hpp"
#include "fleet_types.hpp"

namespace fleetdeck::stream {

// Screen real estate one device stream is shown in
struct LayoutInputs {
    bool grid = true;                  // batch grid; false = single-device panel
    int columns = 4;
    double panel_width = 1920.0;       // host width the panel is laid out in
    double panel_height = 1080.0;
    double panel_fraction = 0.9;       // ignored in fullscreen
    bool fullscreen = false;
    double grid_gap = 12.0;
    double grid_padding = 16.0;
    double tile_aspect = 16.0 / 9.0;   // tile height / width
    double device_pixel_ratio = 1.0;
};

struct NegotiatorLimits {
    double min_scale = 0.1;            // 0.1 batch, 0.25 single-device
    double max_scale = 1.0;
    long long pixel_budget = 720LL * 1280LL;
    double hysteresis = 0.05;
};

struct ScaleDecision {
    double user_cap = 1.0;
    double container_scale = 1.0;
    double pixel_budget_scale = 1.0;
    double target_scale = 1.0;
    int width = 0;                     // requested frame, even
    int height = 0;
};

struct CellSize {
    double width = 0.0;
    double height = 0.0;
};

/**
 * Computes the stream scale to request from a device:
 *   target = clamp(min(user cap, container fit, pixel budget), min_scale, 1)
 * with the pixel budget applied last as a hard ceiling. Frame dimensions are
 * floored to even numbers.
 */
class ResolutionNegotiator {
public:
    static constexpr PixelSize DEFAULT_NATIVE{1170, 2532};

    explicit ResolutionNegotiator(NegotiatorLimits limits = {}) : limits_(limits) {}

    const NegotiatorLimits& limits() const { return limits_; }

    // Portrait (height >= width) for rotation 0/180, landscape for 90/270.
    // Empty sizes fall back to DEFAULT_NATIVE.
    static PixelSize orient(PixelSize native, int rotation);

    // One tile (grid) or the whole panel (single), host px
    CellSize cellSize(const LayoutInputs& layout) const;

    double containerScale(PixelSize native, const LayoutInputs& layout) const;
    double pixelBudgetScale(PixelSize native) const;

    ScaleDecision compute(double user_cap, PixelSize native, const LayoutInputs& layout) const;

    // Re-apply to a live stream only when the change exceeds the hysteresis band
    bool shouldApply(std::optional<double> last_applied, double target) const;

    static int floorEven(double v);

private:
    NegotiatorLimits limits_;
};

// Per-device record of what the stream was last told
struct ResolutionState {
    PixelSize native;
    int rotation = 0;
    bool live = false;
    bool force_pending = false;        // forced change arrived while not live
    std::optional<double> last_applied_scale;
    std::optional<int> last_applied_fps;
    ScaleDecision last_decision;
};

/**
 * Owns the user cap, frame rate and layout inputs, and keeps every live
 * stream's parameters in line with them. Scale pushes go through hysteresis
 * unless forced (user cap change); frame rate is pushed on any change.
 */
class ResolutionController {
public:
    using ScaleCommandCallback = std::function<void(const DeviceId&, const ScaleDecision&)>;
    using FrameRateCommandCallback = std::function<void(const DeviceId&, int fps)>;

    ResolutionController(ResolutionNegotiator negotiator, EventBus& bus,
                         double user_cap, int fps, LayoutInputs layout);

    void setScaleCommandCallback(ScaleCommandCallback cb) { scale_callback_ = cb; }
    void setFrameRateCommandCallback(FrameRateCommandCallback cb) { fps_callback_ = cb; }

    void registerDevice(const DeviceId& id, PixelSize native);
    void unregisterDevice(const DeviceId& id);

    // Options for stream/start; records them as applied
    protocol::StreamOptions startOptions(const DeviceId& id, bool force);
    // Going live pushes whatever changed since startOptions()
    void setLive(const DeviceId& id, bool live);

    void setUserCap(double cap);
    void setFrameRate(int fps);
    void setLayout(const LayoutInputs& layout);
    void setRotation(const DeviceId& id, int rotation);

    double userCap() const { return user_cap_; }
    int frameRate() const { return fps_; }
    const LayoutInputs& layout() const { return layout_; }
    const ResolutionNegotiator& negotiator() const { return negotiator_; }

    ScaleDecision decisionFor(const DeviceId& id) const;
    const ResolutionState* state(const DeviceId& id) const;

    // Re-evaluates every live device
    void reevaluate(bool force);

private:
    void apply(const DeviceId& id, ResolutionState& st, bool force);

    ResolutionNegotiator negotiator_;
    EventBus& bus_;
    double user_cap_;
    int fps_;
    LayoutInputs layout_;
    std::map<DeviceId, ResolutionState> devices_;

    ScaleCommandCallback scale_callback_;
    FrameRateCommandCallback fps_callback_;
};

} // namespace fleetdeck::stream
