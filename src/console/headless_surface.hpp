#pragma once

#include <memory>
#include "transport.hpp"

namespace fleetdeck::console {

// VideoSurface without a renderer: a fixed virtual rect that reports the
// device's native size as the decoded size while a stream is attached.
class HeadlessSurface : public VideoSurface {
public:
    HeadlessSurface(PixelSize native, Rect rect) : native_(native), rect_(rect) {}

    PixelSize intrinsicSize() const override { return stream_ ? native_ : PixelSize{}; }
    Rect boundingRect() const override { return rect_; }
    int rotation() const override { return rotation_; }

    void attach(std::shared_ptr<MediaStream> stream) override { stream_ = std::move(stream); }
    void detach() override { stream_.reset(); }
    void setPlaybackRate(double rate) override { rate_ = rate; }

    void setRect(const Rect& rect) { rect_ = rect; }
    void setRotation(int degrees) { rotation_ = degrees; }
    bool attached() const { return stream_ != nullptr; }
    double playbackRate() const { return rate_; }

private:
    PixelSize native_;
    Rect rect_;
    int rotation_ = 0;
    double rate_ = 1.0;
    std::shared_ptr<MediaStream> stream_;
};

} // namespace fleetdeck::console
