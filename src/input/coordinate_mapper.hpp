#pragma once

#include <optional>
#include "fleet_types.hpp"

namespace fleetdeck::input {

// Coordinate mapping between a tile on screen and the device's display.
//
// - rect:      on-screen bounding rectangle of the video element (host px)
// - intrinsic: decoded video size (px)
// - rotation:  0/90/180/270 clockwise degrees; 90/270 swap the display aspect
//
// The video is shown with a "contain" fit (letterbox / pillarbox). Points in
// the bars map to nothing.

// Displayed region of the video inside its rect
struct FittedRegion {
    double left = 0.0;
    double top = 0.0;
    double width = 0.0;
    double height = 0.0;

    bool contains(double px, double py) const {
        return px >= left && px <= left + width && py >= top && py <= top + height;
    }
};

// Normalizes to 0/90/180/270; anything else becomes 0
int normalizeRotation(int degrees);

// Display aspect (width / height) of `intrinsic` shown at `rotation`; 0 if empty
double displayAspect(const PixelSize& intrinsic, int rotation);

// Contain-fit of `aspect` (w/h) into `rect`; nullopt for empty rect or aspect
std::optional<FittedRegion> fitContain(const Rect& rect, double aspect);

// Undo the display rotation of a normalized point
NormalizedPoint unrotate(const NormalizedPoint& p, int rotation);

// Pointer -> normalized device coordinate; nullopt when outside the video
std::optional<NormalizedPoint> mapPointer(const PointerPosition& pointer,
                                          const Rect& rect,
                                          const PixelSize& intrinsic,
                                          int rotation);

struct DevicePoint {
    int x = 0;
    int y = 0;
};

// Normalized -> device pixels (floor), clamped to the display
DevicePoint toDevicePixels(const NormalizedPoint& p, const PixelSize& native);

} // namespace fleetdeck::input
