#include "batch_console.hpp"
#include "fleet_log.hpp"
#include <algorithm>

using namespace fleetdeck::protocol;

namespace fleetdeck::console {

BatchConsole::BatchConsole(const config::ConsoleConfig& cfg, ConsoleDeps deps, VisibilityTracker& visibility)
    : ConsoleBase(cfg, deps, cfg.resolution.batch_min_scale, cfg.stream.batch_scale,
                  cfg.stream.batch_fps, layoutFromConfig(cfg.layout, true)) {
    session_.setGroupSync(true);
    lifecycle_ = std::make_unique<stream::ConnectionLifecycleManager>(
        visibility, session_.connections(), deps.bus, deps.tasks,
        [this](const DeviceId& id) { connectDevice(id); },
        [this](const DeviceId& id) { disconnectDevice(id); });
    FLOG_INFO("Console", "batch console (%d columns, scale %.2f, %d fps)",
              resolution_.layout().columns, resolution_.userCap(), resolution_.frameRate());
}

BatchConsole::~BatchConsole() {
    close();
}

bool BatchConsole::addTile(const Device& device, VideoSurface* surface) {
    if (!trackDevice(device, surface)) return false;
    lifecycle_->addTile(device.id);
    return true;
}

bool BatchConsole::removeTile(const DeviceId& id) {
    if (!session_.isTracked(id)) return false;
    lifecycle_->removeTile(id);
    untrackDevice(id);
    return true;
}

Rect BatchConsole::tileRect(size_t index) const {
    const auto& layout = resolution_.layout();
    const auto cell = resolution_.negotiator().cellSize(layout);
    const size_t cols = static_cast<size_t>(std::max(1, layout.columns));
    const size_t row = index / cols;
    const size_t col = index % cols;

    Rect r;
    r.left = layout.grid_padding + col * (cell.width + layout.grid_gap);
    r.top = layout.grid_padding + row * (cell.height + layout.grid_gap);
    r.width = cell.width;
    r.height = cell.height;
    return r;
}

std::optional<size_t> BatchConsole::tileIndex(const DeviceId& id) const {
    const auto ids = devices();
    auto it = std::find(ids.begin(), ids.end(), id);
    if (it == ids.end()) return std::nullopt;
    return static_cast<size_t>(it - ids.begin());
}

bool BatchConsole::setChecked(const DeviceId& id, bool checked) {
    if (!session_.isTracked(id)) return false;
    auto next = checkedSet();
    if (checked) {
        next.insert(id);
    } else {
        next.erase(id);
    }
    endTouchIfMirrorChanges(next, true);
    session_.selection().set(id, checked);
    return true;
}

bool BatchConsole::toggleChecked(const DeviceId& id) {
    if (!session_.isTracked(id)) return false;
    return setChecked(id, !session_.selection().contains(id));
}

void BatchConsole::checkAll() {
    const auto ids = devices();
    endTouchIfMirrorChanges(std::set<DeviceId>(ids.begin(), ids.end()), true);
    session_.selection().selectAll(ids);
}

void BatchConsole::clearChecked() {
    endTouchIfMirrorChanges({}, true);
    session_.selection().clear();
}

size_t BatchConsole::pressHome() {
    return dispatcher_.broadcast(ControlCommand::home());
}

size_t BatchConsole::volumeUp() {
    return dispatcher_.broadcast(ControlCommand::keyPhase(CommandKind::KeyPress, KEY_VOLUME_UP));
}

size_t BatchConsole::volumeDown() {
    return dispatcher_.broadcast(ControlCommand::keyPhase(CommandKind::KeyPress, KEY_VOLUME_DOWN));
}

size_t BatchConsole::lockScreen() {
    return dispatcher_.broadcast(ControlCommand::keyPhase(CommandKind::KeyPress, KEY_LOCK));
}

size_t BatchConsole::paste(const std::string& text) {
    return dispatcher_.broadcast(ControlCommand::paste(text));
}

void BatchConsole::setColumns(int columns) {
    auto layout = resolution_.layout();
    layout.columns = std::max(1, columns);
    updateLayout(layout);
}

void BatchConsole::setFullscreen(bool fullscreen) {
    auto layout = resolution_.layout();
    layout.fullscreen = fullscreen;
    updateLayout(layout);
}

void BatchConsole::setViewport(double width, double height) {
    auto layout = resolution_.layout();
    layout.panel_width = width;
    layout.panel_height = height;
    updateLayout(layout);
}

void BatchConsole::setDevicePixelRatio(double dpr) {
    auto layout = resolution_.layout();
    layout.device_pixel_ratio = dpr > 0.0 ? dpr : 1.0;
    updateLayout(layout);
}

size_t BatchConsole::connectedCount() const {
    return session_.connections().idsInState(ConnectionState::Connected).size();
}

void BatchConsole::onClosed() {
    lifecycle_->shutdown();
}

void BatchConsole::updateLayout(const stream::LayoutInputs& layout) {
    FLOG_INFO("Console", "layout: %d columns, panel %.0fx%.0f%s, dpr %.2f", layout.columns,
              layout.panel_width, layout.panel_height, layout.fullscreen ? " fullscreen" : "",
              layout.device_pixel_ratio);
    resolution_.setLayout(layout);
}

} // namespace fleetdeck::console
