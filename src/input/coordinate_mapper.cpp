#include "coordinate_mapper.hpp"

#include <algorithm>
#include <cmath>

namespace fleetdeck::input {

int normalizeRotation(int degrees) {
    int r = degrees % 360;
    if (r < 0) r += 360;
    switch (r) {
        case 0:
        case 90:
        case 180:
        case 270:
            return r;
        default:
            // Unsupported angle: treat as identity
            return 0;
    }
}

double displayAspect(const PixelSize& intrinsic, int rotation) {
    if (intrinsic.empty()) return 0.0;
    const double w = static_cast<double>(intrinsic.width);
    const double h = static_cast<double>(intrinsic.height);
    const int r = normalizeRotation(rotation);
    return (r == 90 || r == 270) ? h / w : w / h;
}

std::optional<FittedRegion> fitContain(const Rect& rect, double aspect) {
    if (rect.width <= 0.0 || rect.height <= 0.0 || !(aspect > 0.0)) return std::nullopt;

    FittedRegion region;
    const double rect_aspect = rect.width / rect.height;
    if (aspect > rect_aspect) {
        // wider than the rect: full width, bars top and bottom
        region.width = rect.width;
        region.height = rect.width / aspect;
    } else {
        region.height = rect.height;
        region.width = rect.height * aspect;
    }
    region.left = rect.left + (rect.width - region.width) * 0.5;
    region.top = rect.top + (rect.height - region.height) * 0.5;
    return region;
}

NormalizedPoint unrotate(const NormalizedPoint& p, int rotation) {
    switch (normalizeRotation(rotation)) {
        case 90:
            return {p.y, 1.0 - p.x};
        case 180:
            return {1.0 - p.x, 1.0 - p.y};
        case 270:
            return {1.0 - p.y, p.x};
        default:
            return p;
    }
}

std::optional<NormalizedPoint> mapPointer(const PointerPosition& pointer,
                                          const Rect& rect,
                                          const PixelSize& intrinsic,
                                          int rotation) {
    const double aspect = displayAspect(intrinsic, rotation);
    auto region = fitContain(rect, aspect);
    if (!region || !region->contains(pointer.x, pointer.y)) return std::nullopt;

    NormalizedPoint n;
    n.x = std::clamp((pointer.x - region->left) / region->width, 0.0, 1.0);
    n.y = std::clamp((pointer.y - region->top) / region->height, 0.0, 1.0);
    return unrotate(n, rotation);
}

DevicePoint toDevicePixels(const NormalizedPoint& p, const PixelSize& native) {
    DevicePoint d;
    if (native.empty()) return d;
    d.x = static_cast<int>(std::floor(std::clamp(p.x, 0.0, 1.0) * native.width));
    d.y = static_cast<int>(std::floor(std::clamp(p.y, 0.0, 1.0) * native.height));
    d.x = std::min(d.x, native.width - 1);
    d.y = std::min(d.y, native.height - 1);
    return d;
}

} // namespace fleetdeck::input
