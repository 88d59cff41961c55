#pragma once

#include <cstdint>
#include <optional>
#include "transport.hpp"

namespace fleetdeck::stream {

/**
 * Decoded FPS and receive bitrate of one inbound video track, computed from
 * successive cumulative samples (call once per sampling interval).
 */
class StreamStatsSampler {
public:
    struct Rates {
        double fps = 0.0;
        double bitrate_kbps = 0.0;
    };

    // nullopt for the first sample, for samples < 100ms apart and for
    // counter resets
    std::optional<Rates> update(const InboundVideoStats& stats);

    void reset() { prev_.reset(); last_ = Rates{}; }

    const Rates& last() const { return last_; }

private:
    static constexpr double MIN_INTERVAL_MS = 100.0;

    std::optional<InboundVideoStats> prev_;
    Rates last_;
};

} // namespace fleetdeck::stream
