#include "device_session.hpp"
#include "fleet_log.hpp"
#include <utility>

namespace fleetdeck::stream {

DeviceSession::DeviceSession(Device device, control::ConnectionTable& table, TransportFactory& factory,
                             SignalingChannel* signaling, TaskScheduler& tasks, EventBus& bus,
                             Options opts)
    : device_(std::move(device)), table_(table), factory_(factory), signaling_(signaling),
      tasks_(tasks), bus_(bus), opts_(opts), catchup_(opts.catchup) {
    catchup_.setRateCallback([this](double rate) {
        if (auto* surface = table_.surface(device_.id)) surface->setPlaybackRate(rate);
        PlaybackRateChangedEvent ev;
        ev.device_id = device_.id;
        ev.rate = rate;
        ev.catching_up = catchup_.catchingUp();
        ev.lag_ms = last_lag_ms_;
        bus_.publish(ev);
    });
}

DeviceSession::~DeviceSession() {
    teardown("session destroyed");
}

bool DeviceSession::connect(const protocol::StreamOptions& opts) {
    if (table_.state(device_.id) != ConnectionState::Disconnected) {
        FLOG_DEBUG("DeviceSession", "%s: connect ignored (%s)", device_.id.c_str(),
                   connectionStateStr(table_.state(device_.id)));
        return false;
    }

    auto transport = factory_.create(device_);
    if (!transport) {
        FLOG_ERROR("DeviceSession", "%s: no primary transport available", device_.id.c_str());
        return false;
    }

    const uint64_t gen = ++generation_;
    PrimaryTransport::Callbacks cb;
    cb.on_connected = [this, gen] { onConnected(gen); };
    cb.on_track = [this, gen](std::shared_ptr<MediaStream> media) { onTrack(gen, std::move(media)); };
    cb.on_disconnected = [this, gen](const std::string& reason) { onFailure(gen, reason); };
    cb.on_error = [this, gen](const TransportError& e) {
        onFailure(gen, std::string(transportErrorKindStr(e.kind)) + ": " + e.message);
    };
    cb.on_clipboard = [this](const std::string& text) {
        ClipboardContentEvent ev;
        ev.device_id = device_.id;
        ev.text = text;
        bus_.publish(ev);
    };
    transport->setCallbacks(std::move(cb));

    if (!table_.beginConnecting(device_.id, transport)) {
        FLOG_WARN("DeviceSession", "%s: not tracked, connect aborted", device_.id.c_str());
        return false;
    }

    FLOG_INFO("DeviceSession", "%s: connecting (scale=%.2f fps=%d force=%d)", device_.id.c_str(),
              opts.resolution, opts.fps, opts.force ? 1 : 0);

    if (signaling_ && signaling_->isAvailable()) {
        signaling_->startStream(device_.id, opts);
        stream_started_ = true;
    } else {
        FLOG_WARN("DeviceSession", "%s: signaling unavailable, stream/start not sent", device_.id.c_str());
    }

    auto opened = transport->open();
    if (opened.is_err()) {
        onFailure(gen, "open failed: " + opened.error().message);
        return false;
    }

    timeout_task_ = tasks_.postDelayed(opts_.connect_timeout, [this, gen] {
        timeout_task_ = NO_TASK;
        if (gen != generation_) return;
        if (table_.state(device_.id) == ConnectionState::Connecting) {
            onFailure(gen, "connect timeout");
        }
    });
    return true;
}

void DeviceSession::disconnect() {
    teardown("disconnect requested");
}

void DeviceSession::onConnected(uint64_t gen) {
    if (gen != generation_) return;
    tasks_.cancel(timeout_task_);
    timeout_task_ = NO_TASK;

    if (!table_.markConnected(device_.id)) {
        FLOG_WARN("DeviceSession", "%s: connected callback in state %s", device_.id.c_str(),
                  connectionStateStr(table_.state(device_.id)));
        return;
    }
    FLOG_INFO("DeviceSession", "%s: connected", device_.id.c_str());

    if (early_media_) {
        auto media = std::move(early_media_);
        early_media_.reset();
        onTrack(gen, std::move(media));
    }

    stats_task_ = tasks_.postEvery(opts_.stats_interval, [this] { sampleStats(); });
}

void DeviceSession::onTrack(uint64_t gen, std::shared_ptr<MediaStream> media) {
    if (gen != generation_ || !media) return;
    if (table_.state(device_.id) != ConnectionState::Connected) {
        early_media_ = std::move(media);
        return;
    }
    table_.attachMedia(device_.id, media);
    if (auto* surface = table_.surface(device_.id)) surface->attach(media);
    FLOG_INFO("DeviceSession", "%s: video track %s attached", device_.id.c_str(), media->id().c_str());
}

void DeviceSession::onFailure(uint64_t gen, const std::string& reason) {
    if (gen != generation_) return;
    FLOG_WARN("DeviceSession", "%s: transport failure (%s)", device_.id.c_str(), reason.c_str());
    teardown("transport failure");
}

void DeviceSession::teardown(const char* reason) {
    generation_++;
    tasks_.cancel(timeout_task_);
    timeout_task_ = NO_TASK;
    tasks_.cancel(stats_task_);
    stats_task_ = NO_TASK;
    early_media_.reset();

    const ConnectionState prev = table_.state(device_.id);
    auto released = table_.markDisconnected(device_.id);

    if (released.media) released.media->stop();
    if (auto* surface = table_.surface(device_.id)) {
        surface->detach();
        surface->setPlaybackRate(1.0);
    }
    last_lag_ms_ = 0.0;
    catchup_.reset();
    sampler_.reset();

    if (released.transport) released.transport->close();

    if (stream_started_) {
        stream_started_ = false;
        if (signaling_ && signaling_->isAvailable()) signaling_->stopStream(device_.id);
    }

    if (prev != ConnectionState::Disconnected) {
        FLOG_INFO("DeviceSession", "%s: disconnected (%s)", device_.id.c_str(), reason);
    }
}

void DeviceSession::sampleStats() {
    if (table_.state(device_.id) != ConnectionState::Connected) return;
    auto transport = table_.transport(device_.id);
    if (!transport) return;

    auto sample = transport->sampleStats();
    if (sample.is_err()) {
        FLOG_WARN("DeviceSession", "%s: stats unavailable: %s", device_.id.c_str(),
                  sample.error().message.c_str());
        return;
    }
    const InboundVideoStats& stats = sample.value();

    if (auto rates = sampler_.update(stats)) {
        StreamStatsEvent ev;
        ev.device_id = device_.id;
        ev.fps = rates->fps;
        ev.bitrate_kbps = rates->bitrate_kbps;
        bus_.publish(ev);
    }

    if (auto lag = catchup_.estimateLag(stats)) {
        last_lag_ms_ = *lag;
        catchup_.onLagSample(*lag);
        FLOG_TRACE("DeviceSession", "%s: lag=%.0fms rate=%.2f", device_.id.c_str(), *lag, catchup_.rate());
    }
}

} // namespace fleetdeck::stream
