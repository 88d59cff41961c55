#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include "fleet_types.hpp"
#include "scheduler.hpp"

namespace fleetdeck::input {

/**
 * Coalesces pointer moves of one touch session to at most one send per frame.
 *
 * push() records the newest position and schedules a single frame callback.
 * The callback (and flush()) sends the pending position unless it lies within
 * `epsilon` (euclidean, normalized units) of the last *sent* position.
 * Suppressed positions stay available through lastKnown().
 */
class MoveThrottler {
public:
    using SendFn = std::function<void(const NormalizedPoint&)>;

    static constexpr double DEFAULT_EPSILON = 0.0015;

    MoveThrottler(FrameScheduler& frames, SendFn send, double epsilon = DEFAULT_EPSILON);
    ~MoveThrottler();

    MoveThrottler(const MoveThrottler&) = delete;
    MoveThrottler& operator=(const MoveThrottler&) = delete;

    void push(const NormalizedPoint& pos);

    // Cancels the scheduled frame and sends the pending position now (still
    // subject to epsilon). Returns true if a move was sent.
    bool flush();

    // Drops pending, scheduled and last-sent state
    void reset();

    bool hasPending() const { return pending_.has_value(); }
    bool isScheduled() const { return frame_ != NO_FRAME; }
    std::optional<NormalizedPoint> lastSent() const { return last_sent_; }
    std::optional<NormalizedPoint> lastKnown() const { return last_known_; }

    double epsilon() const { return epsilon_; }
    void setEpsilon(double eps) { epsilon_ = eps; }

    uint64_t sentCount() const { return sent_count_; }
    uint64_t suppressedCount() const { return suppressed_count_; }

private:
    void onFrame();
    bool sendPending();
    bool shouldSkip(const NormalizedPoint& pos) const;

    FrameScheduler& frames_;
    SendFn send_;
    double epsilon_;

    std::optional<NormalizedPoint> pending_;
    std::optional<NormalizedPoint> last_sent_;
    std::optional<NormalizedPoint> last_known_;
    FrameHandle frame_ = NO_FRAME;

    uint64_t sent_count_ = 0;
    uint64_t suppressed_count_ = 0;
};

} // namespace fleetdeck::input
