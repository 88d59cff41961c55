#include "stream_stats.hpp"

namespace fleetdeck::stream {

std::optional<StreamStatsSampler::Rates> StreamStatsSampler::update(const InboundVideoStats& stats) {
    if (!prev_) {
        prev_ = stats;
        return std::nullopt;
    }

    const double elapsed_ms = stats.timestamp_ms - prev_->timestamp_ms;
    if (elapsed_ms < MIN_INTERVAL_MS) return std::nullopt;  // Don't update too frequently

    if (stats.bytes_received < prev_->bytes_received ||
        stats.frames_decoded < prev_->frames_decoded) {
        // counters restarted with a new track
        prev_ = stats;
        return std::nullopt;
    }

    const double elapsed_sec = elapsed_ms / 1000.0;
    const uint64_t new_bytes = stats.bytes_received - prev_->bytes_received;
    const uint64_t new_frames = stats.frames_decoded - prev_->frames_decoded;

    Rates r;
    r.fps = new_frames / elapsed_sec;
    r.bitrate_kbps = (new_bytes * 8.0 / 1000.0) / elapsed_sec;

    prev_ = stats;
    last_ = r;
    return r;
}

} // namespace fleetdeck::stream
