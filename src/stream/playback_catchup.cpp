#include "playback_catchup.hpp"
#include "fleet_log.hpp"

namespace fleetdeck::stream {

const char* catchUpStateStr(PlaybackCatchUpController::State s) {
    switch (s) {
    case PlaybackCatchUpController::State::NORMAL: return "NORMAL";
    case PlaybackCatchUpController::State::CATCH_UP: return "CATCH_UP";
    default: return "?";
    }
}

std::optional<double> PlaybackCatchUpController::estimateLag(const InboundVideoStats& stats) {
    std::optional<double> lag;

    if (stats.estimated_playout_ms && *stats.estimated_playout_ms > stats.timestamp_ms) {
        lag = *stats.estimated_playout_ms - stats.timestamp_ms;
    } else if (prev_ && stats.jitter_buffer_emitted > prev_->jitter_buffer_emitted &&
               stats.jitter_buffer_delay_s >= prev_->jitter_buffer_delay_s) {
        const double delay = stats.jitter_buffer_delay_s - prev_->jitter_buffer_delay_s;
        const double emitted = static_cast<double>(stats.jitter_buffer_emitted - prev_->jitter_buffer_emitted);
        lag = delay / emitted * 1000.0;
    } else if (stats.jitter_buffer_emitted > 0) {
        lag = stats.jitter_buffer_delay_s / static_cast<double>(stats.jitter_buffer_emitted) * 1000.0;
    }

    prev_ = stats;
    return lag;
}

double PlaybackCatchUpController::onLagSample(double lag_ms) {
    if (state_ == State::NORMAL && lag_ms > thresholds_.high_lag_ms) {
        state_ = State::CATCH_UP;
        FLOG_INFO("CatchUp", "lag %.0fms > %.0fms: %s -> %s (rate %.2f)",
                  lag_ms, thresholds_.high_lag_ms, catchUpStateStr(State::NORMAL),
                  catchUpStateStr(state_), thresholds_.accelerated_rate);
        setRate(thresholds_.accelerated_rate);
    } else if (state_ == State::CATCH_UP && lag_ms <= thresholds_.low_lag_ms) {
        state_ = State::NORMAL;
        FLOG_INFO("CatchUp", "lag %.0fms <= %.0fms: %s -> %s",
                  lag_ms, thresholds_.low_lag_ms, catchUpStateStr(State::CATCH_UP),
                  catchUpStateStr(state_));
        setRate(1.0);
    }
    return rate_;
}

void PlaybackCatchUpController::reset() {
    state_ = State::NORMAL;
    prev_.reset();
    setRate(1.0);
}

void PlaybackCatchUpController::setRate(double rate) {
    if (rate_ == rate) return;
    rate_ = rate;
    if (rate_callback_) rate_callback_(rate_);
}

} // namespace fleetdeck::stream
