#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "console/console_base.hpp"

namespace fleetdeck::console {

/**
 * Streams one active device at a time out of the working set.
 *
 * - Every device in the working set is checked, so with group sync on the
 *   active device's input is mirrored to all the others.
 * - The active device defaults to the first one and cannot change while its
 *   stream is not Disconnected.
 * - A working-set refresh that drops the active device stops its stream and
 *   falls back to the first remaining device.
 * - Group sync can only be switched on while the active device is Connected.
 */
class SingleDeviceConsole : public ConsoleBase {
public:
    using ClipboardCallback = std::function<void(const DeviceId&, const std::string&)>;

    SingleDeviceConsole(const config::ConsoleConfig& cfg, ConsoleDeps deps);
    ~SingleDeviceConsole() override;

    bool addDevice(const Device& device, VideoSurface* surface);
    bool removeDevice(const DeviceId& id);

    // Reconciles the working set with the device descriptor source. New
    // devices get `surface_for(id)` as their render target.
    void syncDevices(const std::vector<Device>& current,
                     const std::function<VideoSurface*(const DeviceId&)>& surface_for);

    std::optional<DeviceId> activeDevice() const { return session_.activeDevice(); }
    bool selectDevice(const DeviceId& id);

    bool startStream();
    void stopStream();
    bool isStreaming() const;

    bool setGroupSync(bool enabled);
    bool groupSync() const { return session_.groupSync(); }

    // Active device (mirrored when group sync is on)
    bool pressHome();
    bool paste(const std::string& text);
    bool writeClipboard(const std::string& text);
    // Active device only; the reply arrives through the clipboard callback
    bool readClipboard();

    void setClipboardCallback(ClipboardCallback cb) { clipboard_callback_ = std::move(cb); }
    const std::string& lastClipboard() const { return last_clipboard_; }

    // Host input routed to whichever device is active when the event arrives
    std::unique_ptr<InputSink> activeInput();

private:
    void fallbackToFirst();
    void onClipboard(const ClipboardContentEvent& e);

    SubscriptionHandle clipboard_sub_;
    ClipboardCallback clipboard_callback_;
    std::string last_clipboard_;
};

} // namespace fleetdeck::console
