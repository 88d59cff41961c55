#include "move_throttler.hpp"

namespace fleetdeck::input {

MoveThrottler::MoveThrottler(FrameScheduler& frames, SendFn send, double epsilon)
    : frames_(frames), send_(std::move(send)), epsilon_(epsilon) {}

MoveThrottler::~MoveThrottler() {
    if (frame_ != NO_FRAME) frames_.cancelFrame(frame_);
}

void MoveThrottler::push(const NormalizedPoint& pos) {
    pending_ = pos;
    last_known_ = pos;
    if (frame_ != NO_FRAME) return;
    frame_ = frames_.requestFrame([this] { onFrame(); });
}

void MoveThrottler::onFrame() {
    frame_ = NO_FRAME;
    sendPending();
}

bool MoveThrottler::flush() {
    if (frame_ != NO_FRAME) {
        frames_.cancelFrame(frame_);
        frame_ = NO_FRAME;
    }
    return sendPending();
}

void MoveThrottler::reset() {
    pending_.reset();
    if (frame_ != NO_FRAME) {
        frames_.cancelFrame(frame_);
        frame_ = NO_FRAME;
    }
    last_sent_.reset();
    last_known_.reset();
}

bool MoveThrottler::sendPending() {
    if (!pending_) return false;
    const NormalizedPoint next = *pending_;
    pending_.reset();
    if (shouldSkip(next)) {
        suppressed_count_++;
        return false;
    }
    if (send_) send_(next);
    last_sent_ = next;
    sent_count_++;
    return true;
}

bool MoveThrottler::shouldSkip(const NormalizedPoint& pos) const {
    if (!last_sent_) return false;
    const double dx = pos.x - last_sent_->x;
    const double dy = pos.y - last_sent_->y;
    return (dx * dx + dy * dy) < epsilon_ * epsilon_;
}

} // namespace fleetdeck::input
