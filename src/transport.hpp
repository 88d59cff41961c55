// =============================================================================
// FleetDeck - Host and transport interfaces
// =============================================================================
// Everything the engine talks to but does not own:
//   PrimaryTransport  - per-device low-latency command channel + video track
//   SignalingChannel  - shared reliable channel: stream control and the
//                       mirrored (group fan-out) command path
//   VideoSurface      - render target of one tile
//   InputSink         - receiver of host pointer/key events for one tile
//   VisibilityTracker - viewport intersection facility of the host
// =============================================================================
#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "control_protocol.hpp"
#include "fleet_types.hpp"
#include "result.hpp"

namespace fleetdeck {

// Receiver-side statistics of one inbound video track
struct InboundVideoStats {
    double timestamp_ms = 0.0;                 // sample time
    uint64_t bytes_received = 0;
    uint64_t frames_decoded = 0;
    double jitter_buffer_delay_s = 0.0;        // cumulative
    uint64_t jitter_buffer_emitted = 0;        // cumulative
    std::optional<double> estimated_playout_ms;  // same clock as timestamp_ms
};

class MediaStream {
public:
    virtual ~MediaStream() = default;
    virtual std::string id() const = 0;
    virtual void stop() = 0;
};

class VideoSurface {
public:
    virtual ~VideoSurface() = default;

    virtual PixelSize intrinsicSize() const = 0;
    virtual Rect boundingRect() const = 0;
    virtual int rotation() const { return 0; }

    virtual void attach(std::shared_ptr<MediaStream> stream) = 0;
    virtual void detach() = 0;
    virtual void setPlaybackRate(double rate) = 0;
};

class PrimaryTransport {
public:
    struct Callbacks {
        std::function<void()> on_connected;
        std::function<void(const std::string& reason)> on_disconnected;
        std::function<void(const TransportError& error)> on_error;
        std::function<void(std::shared_ptr<MediaStream> stream)> on_track;
        std::function<void(const std::string& text)> on_clipboard;
    };

    virtual ~PrimaryTransport() = default;

    // Callbacks are delivered on the console loop
    virtual void setCallbacks(Callbacks cb) = 0;

    // Starts connecting; completion is reported through on_connected / on_error
    virtual Result<void, TransportError> open() = 0;
    virtual bool isOpen() const = 0;

    // Fire-and-forget. A no-op when the channel is not open.
    virtual void send(const protocol::ControlCommand& cmd) = 0;

    virtual Result<InboundVideoStats, TransportError> sampleStats() = 0;
    virtual void close() = 0;
};

class TransportFactory {
public:
    virtual ~TransportFactory() = default;
    virtual std::shared_ptr<PrimaryTransport> create(const Device& device) = 0;
};

class SignalingChannel {
public:
    virtual ~SignalingChannel() = default;

    virtual bool isAvailable() const = 0;

    // Mirror path: one logical command replicated to every target
    virtual void sendGroupCommand(const std::vector<DeviceId>& targets,
                                  const protocol::ControlCommand& cmd) = 0;

    virtual void startStream(const DeviceId& device, const protocol::StreamOptions& opts) = 0;
    virtual void stopStream(const DeviceId& device) = 0;
    virtual void setResolution(const DeviceId& device, double resolution) = 0;
    virtual void setFrameRate(const DeviceId& device, int fps) = 0;
};

struct PointerEvent {
    PointerPosition position;
    int button = 0;   // 0 = primary
};

class InputSink {
public:
    virtual ~InputSink() = default;
    virtual void onPointerDown(const PointerEvent& ev) = 0;
    virtual void onPointerMove(const PointerEvent& ev) = 0;
    virtual void onPointerUp(const PointerEvent& ev) = 0;
    virtual void onPointerLeave() = 0;
    virtual void onKeyDown(const std::string& key) = 0;
    virtual void onKeyUp(const std::string& key) = 0;
    virtual void onContextAction() = 0;
};

class VisibilityTracker {
public:
    using Callback = std::function<void(const DeviceId& id, bool visible)>;

    virtual ~VisibilityTracker() = default;
    virtual void setCallback(Callback cb) = 0;
    virtual void observe(const DeviceId& id) = 0;
    virtual void unobserve(const DeviceId& id) = 0;
    virtual void disconnect() = 0;
};

} // namespace fleetdeck
