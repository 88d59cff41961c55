#include "single_device_console.hpp"
#include "fleet_log.hpp"
#include <set>

using namespace fleetdeck::protocol;

namespace fleetdeck::console {

namespace {

class ActiveInputSink : public InputSink {
public:
    explicit ActiveInputSink(SingleDeviceConsole& console) : console_(console) {}

    void onPointerDown(const PointerEvent& ev) override {
        if (auto id = console_.activeDevice()) console_.touch().pointerDown(*id, ev);
    }
    void onPointerMove(const PointerEvent& ev) override {
        if (auto id = console_.activeDevice()) console_.touch().pointerMove(*id, ev);
    }
    void onPointerUp(const PointerEvent& ev) override {
        if (auto id = console_.activeDevice()) console_.touch().pointerUp(*id, ev);
    }
    void onPointerLeave() override {
        if (auto id = console_.activeDevice()) console_.touch().pointerLeave(*id);
    }
    void onKeyDown(const std::string& key) override {
        if (auto id = console_.activeDevice()) console_.touch().keyDown(*id, key);
    }
    void onKeyUp(const std::string& key) override {
        if (auto id = console_.activeDevice()) console_.touch().keyUp(*id, key);
    }
    void onContextAction() override {
        if (auto id = console_.activeDevice()) console_.touch().contextAction(*id);
    }

private:
    SingleDeviceConsole& console_;
};

} // namespace

SingleDeviceConsole::SingleDeviceConsole(const config::ConsoleConfig& cfg, ConsoleDeps deps)
    : ConsoleBase(cfg, deps, cfg.resolution.single_min_scale, cfg.stream.default_scale,
                  cfg.stream.default_fps, layoutFromConfig(cfg.layout, false)) {
    clipboard_sub_ = deps.bus.subscribe<ClipboardContentEvent>(
        [this](const ClipboardContentEvent& e) { onClipboard(e); });
    FLOG_INFO("Console", "single-device console (scale %.2f, %d fps)",
              resolution_.userCap(), resolution_.frameRate());
}

SingleDeviceConsole::~SingleDeviceConsole() {
    clipboard_sub_ = SubscriptionHandle();
    close();
}

bool SingleDeviceConsole::addDevice(const Device& device, VideoSurface* surface) {
    if (!trackDevice(device, surface)) return false;
    auto next = checkedSet();
    next.insert(device.id);
    endTouchIfMirrorChanges(next, session_.groupSync());
    session_.selection().set(device.id, true);
    if (!session_.activeDevice()) session_.setActiveDevice(device.id);
    return true;
}

bool SingleDeviceConsole::removeDevice(const DeviceId& id) {
    if (!session_.isTracked(id)) return false;
    const bool was_active = session_.activeDevice() && *session_.activeDevice() == id;
    untrackDevice(id);
    if (was_active) fallbackToFirst();
    return true;
}

void SingleDeviceConsole::syncDevices(const std::vector<Device>& current,
                                      const std::function<VideoSurface*(const DeviceId&)>& surface_for) {
    std::set<DeviceId> wanted;
    for (const auto& d : current) wanted.insert(d.id);

    for (const auto& id : devices()) {
        if (!wanted.count(id)) {
            FLOG_INFO("Console", "%s left the working set", id.c_str());
            removeDevice(id);
        }
    }
    for (const auto& d : current) {
        if (!session_.isTracked(d.id)) addDevice(d, surface_for ? surface_for(d.id) : nullptr);
    }
}

bool SingleDeviceConsole::selectDevice(const DeviceId& id) {
    if (session_.activeDevice() && *session_.activeDevice() == id) return true;
    if (isStreaming()) {
        FLOG_WARN("Console", "cannot switch to %s while streaming", id.c_str());
        return false;
    }
    return session_.setActiveDevice(id);
}

bool SingleDeviceConsole::startStream() {
    auto id = session_.activeDevice();
    if (!id) {
        FLOG_WARN("Console", "no active device to stream");
        return false;
    }
    return connectDevice(*id);
}

void SingleDeviceConsole::stopStream() {
    if (auto id = session_.activeDevice()) disconnectDevice(*id);
}

bool SingleDeviceConsole::isStreaming() const {
    auto id = session_.activeDevice();
    return id && state(*id) != ConnectionState::Disconnected;
}

bool SingleDeviceConsole::setGroupSync(bool enabled) {
    if (enabled) {
        auto id = session_.activeDevice();
        if (!id || state(*id) != ConnectionState::Connected) {
            FLOG_WARN("Console", "group sync needs a connected device");
            return false;
        }
    }
    endTouchIfMirrorChanges(checkedSet(), enabled);
    session_.setGroupSync(enabled);
    return true;
}

bool SingleDeviceConsole::pressHome() {
    auto id = session_.activeDevice();
    if (!id) return false;
    dispatcher_.dispatch(*id, ControlCommand::home());
    return true;
}

bool SingleDeviceConsole::paste(const std::string& text) {
    auto id = session_.activeDevice();
    if (!id) return false;
    dispatcher_.dispatch(*id, ControlCommand::paste(text));
    return true;
}

bool SingleDeviceConsole::writeClipboard(const std::string& text) {
    auto id = session_.activeDevice();
    if (!id) return false;
    dispatcher_.dispatch(*id, ControlCommand::clipboardWrite(text));
    return true;
}

bool SingleDeviceConsole::readClipboard() {
    auto id = session_.activeDevice();
    if (!id) return false;
    dispatcher_.sendTo(*id, ControlCommand::clipboardRead());
    return true;
}

std::unique_ptr<InputSink> SingleDeviceConsole::activeInput() {
    return std::make_unique<ActiveInputSink>(*this);
}

void SingleDeviceConsole::fallbackToFirst() {
    auto ids = devices();
    if (ids.empty()) {
        FLOG_INFO("Console", "working set empty, no active device");
        return;
    }
    session_.setActiveDevice(ids.front());
    FLOG_INFO("Console", "active device -> %s", ids.front().c_str());
}

void SingleDeviceConsole::onClipboard(const ClipboardContentEvent& e) {
    auto id = session_.activeDevice();
    if (!id || *id != e.device_id) {
        FLOG_DEBUG("Console", "clipboard reply from inactive %s dropped", e.device_id.c_str());
        return;
    }
    last_clipboard_ = e.text;
    if (clipboard_callback_) clipboard_callback_(e.device_id, e.text);
}

} // namespace fleetdeck::console
