// =============================================================================
// FleetDeck - Shared value types
// =============================================================================
#pragma once
#include <string>

namespace fleetdeck {

using DeviceId = std::string;

enum class ConnectionState { Disconnected, Connecting, Connected };

inline const char* connectionStateStr(ConnectionState s) {
    switch (s) {
    case ConnectionState::Disconnected: return "disconnected";
    case ConnectionState::Connecting: return "connecting";
    case ConnectionState::Connected: return "connected";
    default: return "?";
    }
}

// Device-relative position, both axes in [0,1]
struct NormalizedPoint {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const NormalizedPoint& o) const { return x == o.x && y == o.y; }
    bool operator!=(const NormalizedPoint& o) const { return !(*this == o); }
};

struct PixelSize {
    int width = 0;
    int height = 0;

    bool empty() const { return width <= 0 || height <= 0; }
    bool operator==(const PixelSize& o) const { return width == o.width && height == o.height; }
    bool operator!=(const PixelSize& o) const { return !(*this == o); }
    bool operator<(const PixelSize& o) const {
        return width != o.width ? width < o.width : height < o.height;
    }
};

// On-screen rectangle in host (CSS-like) pixels
struct Rect {
    double left = 0.0;
    double top = 0.0;
    double width = 0.0;
    double height = 0.0;

    double right() const { return left + width; }
    double bottom() const { return top + height; }
};

// Pointer position in host client coordinates
struct PointerPosition {
    double x = 0.0;
    double y = 0.0;
};

// Entry of the external device descriptor source
struct Device {
    DeviceId id;
    PixelSize native;          // reported display size, device pixels
    std::string host;          // control endpoint hint
    int control_port = 0;
};

} // namespace fleetdeck
