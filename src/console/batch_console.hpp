#pragma once

#include <memory>
#include <optional>
#include <string>
#include "console/console_base.hpp"
#include "stream/connection_lifecycle.hpp"

namespace fleetdeck::console {

/**
 * Grid of device tiles, each with its own stream. Only visible tiles stay
 * connected (ConnectionLifecycleManager). Group sync is always on: touching a
 * checked tile mirrors to every other checked tile. Toolbar operations go to
 * all checked devices.
 */
class BatchConsole : public ConsoleBase {
public:
    BatchConsole(const config::ConsoleConfig& cfg, ConsoleDeps deps, VisibilityTracker& visibility);
    ~BatchConsole() override;

    bool addTile(const Device& device, VideoSurface* surface);
    bool removeTile(const DeviceId& id);
    size_t tileCount() const { return sessions_.size(); }

    // Position of the index-th tile in the grid container (host px)
    Rect tileRect(size_t index) const;
    std::optional<size_t> tileIndex(const DeviceId& id) const;

    // Checked set
    bool setChecked(const DeviceId& id, bool checked);
    bool toggleChecked(const DeviceId& id);
    void checkAll();
    void clearChecked();

    // Toolbar; return the number of devices addressed
    size_t pressHome();
    size_t volumeUp();
    size_t volumeDown();
    size_t lockScreen();
    size_t paste(const std::string& text);

    // Layout inputs; each change re-negotiates every live stream
    void setColumns(int columns);
    void setFullscreen(bool fullscreen);
    void setViewport(double width, double height);
    void setDevicePixelRatio(double dpr);

    const stream::ConnectionLifecycleManager& lifecycle() const { return *lifecycle_; }
    size_t connectedCount() const;

protected:
    void onClosed() override;

private:
    void updateLayout(const stream::LayoutInputs& layout);

    std::unique_ptr<stream::ConnectionLifecycleManager> lifecycle_;
};

} // namespace fleetdeck::console
