#include "udp_primary_transport.hpp"
#include <cerrno>
#include <cstring>
#include <system_error>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include "fleet_log.hpp"

namespace fleetdeck::net {

namespace {

class UdpVideoTrack : public MediaStream {
public:
    explicit UdpVideoTrack(std::string id) : id_(std::move(id)) {}
    std::string id() const override { return id_; }
    // Frames stop with the channel; nothing of its own to release
    void stop() override { FLOG_DEBUG("udp", "track %s stopped", id_.c_str()); }

private:
    std::string id_;
};

} // namespace

Result<DeviceDatagram, TransportError> parseDeviceDatagram(const std::string& payload) {
    using Kind = TransportError::Kind;
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error& e) {
        return TransportError(std::string("malformed datagram: ") + e.what(), Kind::Protocol);
    }
    if (!j.is_object()) return TransportError("datagram is not an object", Kind::Protocol);

    const std::string type = j.value("type", "");
    DeviceDatagram dg;
    try {
        if (type == "ready") {
            dg.kind = DeviceDatagram::Kind::Ready;
            dg.track = j.value("track", "video0");
        } else if (type == "stats") {
            dg.kind = DeviceDatagram::Kind::Stats;
            dg.stats.timestamp_ms = j.value("timestamp_ms", 0.0);
            dg.stats.bytes_received = j.value("bytes_received", uint64_t{0});
            dg.stats.frames_decoded = j.value("frames_decoded", uint64_t{0});
            dg.stats.jitter_buffer_delay_s = j.value("jitter_buffer_delay", 0.0);
            dg.stats.jitter_buffer_emitted = j.value("jitter_buffer_emitted", uint64_t{0});
            auto it = j.find("estimated_playout_ms");
            if (it != j.end() && it->is_number()) dg.stats.estimated_playout_ms = it->get<double>();
        } else if (type == "clipboard") {
            dg.kind = DeviceDatagram::Kind::Clipboard;
            dg.text = j.value("text", "");
        } else if (type == "bye") {
            dg.kind = DeviceDatagram::Kind::Bye;
            dg.text = j.value("reason", "device closed the channel");
        } else {
            return TransportError("unknown datagram type '" + type + "'", Kind::Protocol);
        }
    } catch (const nlohmann::json::exception& e) {
        return TransportError(std::string("bad ") + type + " datagram: " + e.what(), Kind::Protocol);
    }
    return dg;
}

UdpPrimaryTransport::UdpPrimaryTransport(Device device, TaskScheduler& loop)
    : device_(std::move(device)), loop_(loop) {}

UdpPrimaryTransport::~UdpPrimaryTransport() {
    stopThreads();
}

Result<void, TransportError> UdpPrimaryTransport::open() {
    using Kind = TransportError::Kind;
    if (running_.load()) return {};

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(device_.control_port));
    if (inet_pton(AF_INET, device_.host.c_str(), &addr.sin_addr) <= 0) {
        return TransportError("invalid control address " + device_.host, Kind::ConnectFailed);
    }

    socket_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (socket_ < 0) {
        return TransportError(std::string("socket: ") + std::strerror(errno), Kind::ConnectFailed);
    }

    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 500000;
    if (setsockopt(socket_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
        FLOG_WARN("udp", "%s: SO_RCVTIMEO failed (%s)", device_.id.c_str(), std::strerror(errno));
    }

    // Connected UDP: only datagrams from the device are delivered
    if (::connect(socket_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        std::string err = std::strerror(errno);
        ::close(socket_);
        socket_ = -1;
        return TransportError("connect: " + err, Kind::ConnectFailed);
    }

    running_.store(true);
    try {
        send_thread_ = std::thread(&UdpPrimaryTransport::sendThread, this);
        recv_thread_ = std::thread(&UdpPrimaryTransport::receiveThread, this);
    } catch (const std::system_error& e) {
        stopThreads();
        return TransportError(std::string("failed to start threads: ") + e.what(), Kind::Other);
    }

    enqueue(R"({"type":"hello"})");
    FLOG_INFO("udp", "%s: hello -> %s:%d", device_.id.c_str(), device_.host.c_str(), device_.control_port);
    return {};
}

void UdpPrimaryTransport::send(const protocol::ControlCommand& cmd) {
    if (!isOpen()) return;
    enqueue(protocol::encodePrimary(cmd).dump());
}

Result<InboundVideoStats, TransportError> UdpPrimaryTransport::sampleStats() {
    if (!running_.load()) return TransportError("transport closed", TransportError::Kind::Closed);
    if (!latest_stats_) return TransportError("no statistics received yet", TransportError::Kind::NotConnected);
    return *latest_stats_;
}

void UdpPrimaryTransport::close() {
    if (!running_.load() && socket_ < 0) return;
    if (ready_.load()) sendRaw(R"({"type":"bye"})");
    stopThreads();
    callbacks_ = Callbacks{};
    if (media_) media_->stop();
    media_.reset();
    latest_stats_.reset();
    FLOG_INFO("udp", "%s: closed (sent=%llu recv=%llu)", device_.id.c_str(),
              (unsigned long long)datagrams_sent_.load(), (unsigned long long)datagrams_received_.load());
}

void UdpPrimaryTransport::stopThreads() {
    running_.store(false);
    ready_.store(false);

    // shutdown before join so recv() unblocks immediately
    if (socket_ >= 0) ::shutdown(socket_, SHUT_RDWR);
    send_cv_.notify_one();

    if (send_thread_.joinable()) send_thread_.join();
    if (recv_thread_.joinable()) recv_thread_.join();

    if (socket_ >= 0) {
        ::close(socket_);
        socket_ = -1;
    }
    std::lock_guard<std::mutex> lock(queue_mtx_);
    std::queue<std::string>().swap(send_queue_);
}

void UdpPrimaryTransport::enqueue(std::string payload) {
    {
        std::lock_guard<std::mutex> lock(queue_mtx_);
        send_queue_.push(std::move(payload));
    }
    send_cv_.notify_one();
}

bool UdpPrimaryTransport::sendRaw(const std::string& payload) {
    if (socket_ < 0) return false;
    ssize_t sent = ::send(socket_, payload.data(), payload.size(), 0);
    if (sent != static_cast<ssize_t>(payload.size())) {
        FLOG_ERROR("udp", "%s: send error: sent %zd of %zu", device_.id.c_str(), sent, payload.size());
        return false;
    }
    datagrams_sent_.fetch_add(1);
    return true;
}

void UdpPrimaryTransport::sendThread() {
    FLOG_DEBUG("udp", "%s: send thread started", device_.id.c_str());
    while (running_.load()) {
        std::string payload;
        {
            std::unique_lock<std::mutex> lock(queue_mtx_);
            send_cv_.wait_for(lock, std::chrono::milliseconds(30),
                              [this] { return !send_queue_.empty() || !running_.load(); });
            if (send_queue_.empty()) continue;
            payload = std::move(send_queue_.front());
            send_queue_.pop();
        }
        sendRaw(payload);
    }
    FLOG_DEBUG("udp", "%s: send thread ended", device_.id.c_str());
}

void UdpPrimaryTransport::receiveThread() {
    FLOG_DEBUG("udp", "%s: receive thread started", device_.id.c_str());
    char buf[2048];
    std::weak_ptr<UdpPrimaryTransport> weak = weak_from_this();

    while (running_.load()) {
        ssize_t received = ::recv(socket_, buf, sizeof(buf), 0);
        if (received <= 0) continue;   // timeout, or shutdown in progress
        datagrams_received_.fetch_add(1);

        auto parsed = parseDeviceDatagram(std::string(buf, static_cast<size_t>(received)));
        if (parsed.is_err()) {
            FLOG_WARN("udp", "%s: %s", device_.id.c_str(), parsed.error().message.c_str());
            continue;
        }
        loop_.post([weak, dg = parsed.value()] {
            if (auto self = weak.lock()) self->handleDatagram(dg);
        });
    }
    FLOG_DEBUG("udp", "%s: receive thread ended", device_.id.c_str());
}

void UdpPrimaryTransport::handleDatagram(const DeviceDatagram& dg) {
    if (!running_.load()) return;

    switch (dg.kind) {
    case DeviceDatagram::Kind::Ready: {
        if (ready_.exchange(true)) return;
        FLOG_INFO("udp", "%s: ready (track %s)", device_.id.c_str(), dg.track.c_str());
        media_ = std::make_shared<UdpVideoTrack>(dg.track);
        auto on_connected = callbacks_.on_connected;
        auto on_track = callbacks_.on_track;
        auto media = media_;
        if (on_connected) on_connected();
        if (on_track && running_.load()) on_track(media);
        break;
    }
    case DeviceDatagram::Kind::Stats:
        latest_stats_ = dg.stats;
        break;
    case DeviceDatagram::Kind::Clipboard: {
        auto on_clipboard = callbacks_.on_clipboard;
        if (on_clipboard) on_clipboard(dg.text);
        break;
    }
    case DeviceDatagram::Kind::Bye: {
        FLOG_WARN("udp", "%s: device closed the channel (%s)", device_.id.c_str(), dg.text.c_str());
        ready_.store(false);
        auto on_disconnected = callbacks_.on_disconnected;
        if (on_disconnected) on_disconnected(dg.text);
        break;
    }
    }
}

std::shared_ptr<PrimaryTransport> UdpTransportFactory::create(const Device& device) {
    if (device.host.empty() || device.control_port <= 0 || device.control_port > 65535) {
        FLOG_ERROR("udp", "%s: no control endpoint in descriptor", device.id.c_str());
        return nullptr;
    }
    return std::make_shared<UdpPrimaryTransport>(device, loop_);
}

} // namespace fleetdeck::net
