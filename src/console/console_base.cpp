#include "console_base.hpp"
#include "fleet_log.hpp"

namespace fleetdeck::console {

stream::LayoutInputs layoutFromConfig(const config::LayoutConfig& layout, bool grid) {
    stream::LayoutInputs in;
    in.grid = grid;
    in.columns = layout.columns;
    in.panel_width = layout.viewport_width;
    in.panel_height = layout.viewport_height;
    in.panel_fraction = layout.panel_fraction;
    in.fullscreen = layout.fullscreen;
    in.grid_gap = layout.grid_gap;
    in.grid_padding = layout.grid_padding;
    in.tile_aspect = layout.tile_aspect;
    in.device_pixel_ratio = layout.device_pixel_ratio;
    return in;
}

namespace {

control::CommandDispatcher::Options dispatcherOptions(const config::DispatchConfig& d) {
    control::CommandDispatcher::Options opts;
    opts.mirror_up_delay = std::chrono::milliseconds(d.mirror_up_delay_ms);
    opts.key_release_delay = std::chrono::milliseconds(d.key_release_delay_ms);
    return opts;
}

stream::NegotiatorLimits negotiatorLimits(const config::ResolutionConfig& r, double min_scale) {
    stream::NegotiatorLimits limits;
    limits.min_scale = min_scale;
    limits.pixel_budget = r.pixel_budget;
    limits.hysteresis = r.hysteresis;
    return limits;
}

} // namespace

ConsoleBase::ConsoleBase(const config::ConsoleConfig& cfg, ConsoleDeps deps, double min_scale,
                         double user_scale, int fps, stream::LayoutInputs layout)
    : cfg_(cfg), deps_(deps),
      session_(deps.bus),
      dispatcher_(session_, deps.tasks, deps.signaling, dispatcherOptions(cfg.dispatch)),
      touch_(session_, dispatcher_, deps.frames, cfg.throttle.move_epsilon),
      resolution_(stream::ResolutionNegotiator(negotiatorLimits(cfg.resolution, min_scale)),
                  deps.bus, user_scale, fps, layout) {
    resolution_.setScaleCommandCallback([this](const DeviceId& id, const stream::ScaleDecision& d) {
        if (deps_.signaling && deps_.signaling->isAvailable()) {
            deps_.signaling->setResolution(id, d.target_scale);
        }
    });
    resolution_.setFrameRateCommandCallback([this](const DeviceId& id, int fps) {
        if (deps_.signaling && deps_.signaling->isAvailable()) {
            deps_.signaling->setFrameRate(id, fps);
        }
    });

    state_sub_ = deps.bus.subscribe<ConnectionStateChangedEvent>([this](const ConnectionStateChangedEvent& e) {
        if (!sessions_.count(e.device_id)) return;
        resolution_.setLive(e.device_id, e.new_state == ConnectionState::Connected);
    });
    stream_error_sub_ = deps.bus.subscribe<StreamErrorEvent>([this](const StreamErrorEvent& e) {
        if (!sessions_.count(e.device_id)) return;
        FLOG_WARN("Console", "%s: stream failed (%s), disconnecting", e.device_id.c_str(), e.message.c_str());
        disconnectDevice(e.device_id);
    });
}

ConsoleBase::~ConsoleBase() {
    close();
    state_sub_ = SubscriptionHandle();
    stream_error_sub_ = SubscriptionHandle();
    sessions_.clear();
}

stream::DeviceSession* ConsoleBase::deviceSession(const DeviceId& id) {
    auto it = sessions_.find(id);
    return it != sessions_.end() ? it->second.get() : nullptr;
}

void ConsoleBase::setUserScale(double scale) {
    resolution_.setUserCap(scale);
}

void ConsoleBase::setFrameRate(int fps) {
    resolution_.setFrameRate(fps);
}

void ConsoleBase::close() {
    if (closed_) return;
    closed_ = true;

    touch_.cancel();
    dispatcher_.flushPending();
    for (auto& [id, ds] : sessions_) ds->disconnect();
    onClosed();

    FLOG_INFO("Console", "closed (%zu devices)", sessions_.size());
}

bool ConsoleBase::trackDevice(const Device& device, VideoSurface* surface) {
    if (closed_ || !session_.addDevice(device, surface)) return false;

    resolution_.registerDevice(device.id, device.native);

    stream::DeviceSession::Options opts;
    opts.connect_timeout = std::chrono::milliseconds(cfg_.signaling.connect_timeout_ms);
    opts.stats_interval = std::chrono::milliseconds(cfg_.catchup.sample_interval_ms);
    opts.catchup.high_lag_ms = cfg_.catchup.high_lag_ms;
    opts.catchup.low_lag_ms = cfg_.catchup.low_lag_ms;
    opts.catchup.accelerated_rate = cfg_.catchup.accelerated_rate;

    sessions_[device.id] = std::make_unique<stream::DeviceSession>(
        device, session_.connections(), deps_.transports, deps_.signaling, deps_.tasks, deps_.bus, opts);
    FLOG_DEBUG("Console", "tracking %s (%dx%d)", device.id.c_str(), device.native.width, device.native.height);
    return true;
}

void ConsoleBase::untrackDevice(const DeviceId& id) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return;

    auto next = checkedSet();
    next.erase(id);
    endTouchIfMirrorChanges(next, session_.groupSync());
    touch_.cancelFor(id);
    it->second->disconnect();
    sessions_.erase(it);
    resolution_.unregisterDevice(id);
    session_.removeDevice(id);
    FLOG_DEBUG("Console", "forgot %s", id.c_str());
}

void ConsoleBase::endTouchIfMirrorChanges(const std::set<DeviceId>& next_selection, bool next_group_sync) {
    if (!touch_.hasSession()) return;
    const DeviceId source = session_.touch().device_id;

    std::vector<DeviceId> next_targets;
    if (next_group_sync && next_selection.count(source)) {
        for (const auto& id : next_selection) {
            if (id != source) next_targets.push_back(id);
        }
    }
    if (next_targets == dispatcher_.mirrorTargets(source)) return;

    FLOG_INFO("Console", "%s: mirror targets changed mid-gesture, ending touch", source.c_str());
    touch_.cancel();
}

std::set<DeviceId> ConsoleBase::checkedSet() const {
    const auto members = session_.selection().members();
    return std::set<DeviceId>(members.begin(), members.end());
}

bool ConsoleBase::connectDevice(const DeviceId& id) {
    auto* ds = deviceSession(id);
    if (closed_ || !ds || ds->state() != ConnectionState::Disconnected) return false;
    return ds->connect(resolution_.startOptions(id, cfg_.stream.force));
}

void ConsoleBase::disconnectDevice(const DeviceId& id) {
    if (touch_.hasSession() && session_.touch().device_id == id) touch_.cancel();
    if (auto* ds = deviceSession(id)) ds->disconnect();
}

} // namespace fleetdeck::console
