#pragma once

#include <functional>
#include <optional>
#include "transport.hpp"

namespace fleetdeck::stream {

/**
 * Keeps perceived input latency bounded by speeding playback up while the
 * receive buffer is backed up.
 *
 *   NORMAL     --lag > high-->  CATCH_UP (rate = accelerated)
 *   CATCH_UP   --lag <= low-->  NORMAL   (rate = 1.0)
 *
 * Two thresholds so lag hovering between them never flips the rate.
 */
class PlaybackCatchUpController {
public:
    enum class State { NORMAL, CATCH_UP };

    struct Thresholds {
        double high_lag_ms = 180.0;
        double low_lag_ms = 80.0;
        double accelerated_rate = 1.15;
    };

    using RateCallback = std::function<void(double rate)>;

    PlaybackCatchUpController() : PlaybackCatchUpController(Thresholds{}) {}
    explicit PlaybackCatchUpController(Thresholds t) : thresholds_(t) {}

    void setRateCallback(RateCallback cb) { rate_callback_ = cb; }

    // Lag in ms from transport statistics: playout deadline minus sample
    // time, else jitter-buffer delay per emitted frame (over the last
    // interval when frames were emitted, cumulative otherwise).
    std::optional<double> estimateLag(const InboundVideoStats& stats);

    // Feeds one lag sample; returns the playback rate now in effect
    double onLagSample(double lag_ms);

    // Stream stopped: back to 1.0 and forget sampling history
    void reset();

    State state() const { return state_; }
    bool catchingUp() const { return state_ == State::CATCH_UP; }
    double rate() const { return rate_; }
    const Thresholds& thresholds() const { return thresholds_; }

private:
    void setRate(double rate);

    Thresholds thresholds_;
    State state_ = State::NORMAL;
    double rate_ = 1.0;
    RateCallback rate_callback_;

    std::optional<InboundVideoStats> prev_;
};

const char* catchUpStateStr(PlaybackCatchUpController::State s);

} // namespace fleetdeck::stream
