#include "signaling_client.hpp"
#include <cerrno>
#include <cstring>
#include <system_error>
#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <fcntl.h>
#include <unistd.h>
#include "fleet_log.hpp"

using json = nlohmann::json;
using namespace fleetdeck::protocol;

namespace fleetdeck::net {

SignalingClient::SignalingClient(std::string host, int port, TaskScheduler& loop, EventBus& bus,
                                 SizeLookup sizes)
    : host_(std::move(host)), port_(port), loop_(loop), bus_(bus), sizes_(std::move(sizes)) {}

SignalingClient::~SignalingClient() {
    disconnect();
}

Result<void, TransportError> SignalingClient::connect(std::chrono::milliseconds timeout) {
    using Kind = TransportError::Kind;
    if (connected_.load()) return {};
    // Lost earlier: reap the old socket and receive thread first
    if (running_.load()) disconnect();

    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    const std::string port = std::to_string(port_);
    int gai = getaddrinfo(host_.c_str(), port.c_str(), &hints, &res);
    if (gai != 0 || !res) {
        return TransportError("resolve " + host_ + ": " + gai_strerror(gai), Kind::ConnectFailed);
    }

    int fd = ::socket(res->ai_family, res->ai_socktype, res->ai_protocol);
    if (fd < 0) {
        freeaddrinfo(res);
        return TransportError(std::string("socket: ") + std::strerror(errno), Kind::ConnectFailed);
    }

    // Non-blocking connect bounded by `timeout`
    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    int rc = ::connect(fd, res->ai_addr, res->ai_addrlen);
    freeaddrinfo(res);
    if (rc != 0 && errno != EINPROGRESS) {
        std::string err = std::strerror(errno);
        ::close(fd);
        return TransportError("connect " + host_ + ":" + port + ": " + err, Kind::ConnectFailed);
    }
    if (rc != 0) {
        pollfd pfd{fd, POLLOUT, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (ready <= 0) {
            ::close(fd);
            return TransportError("connect " + host_ + ":" + port + " timed out", Kind::Timeout);
        }
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
        if (so_error != 0) {
            ::close(fd);
            return TransportError("connect " + host_ + ":" + port + ": " + std::strerror(so_error),
                                  Kind::ConnectFailed);
        }
    }
    fcntl(fd, F_SETFL, flags);

    int one = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 500000;
    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
        FLOG_WARN("Signaling", "SO_RCVTIMEO failed (%s)", std::strerror(errno));
    }

    socket_ = fd;
    running_.store(true);
    connected_.store(true);
    try {
        recv_thread_ = std::thread(&SignalingClient::receiveThread, this);
    } catch (const std::system_error& e) {
        disconnect();
        return TransportError(std::string("failed to start receive thread: ") + e.what(), Kind::Other);
    }

    FLOG_INFO("Signaling", "connected to %s:%d", host_.c_str(), port_);
    return {};
}

void SignalingClient::disconnect() {
    const bool was_running = running_.exchange(false);
    connected_.store(false);

    if (socket_ >= 0) ::shutdown(socket_, SHUT_RDWR);
    if (recv_thread_.joinable()) recv_thread_.join();
    if (socket_ >= 0) {
        ::close(socket_);
        socket_ = -1;
    }
    if (was_running) {
        FLOG_INFO("Signaling", "disconnected (sent=%llu recv=%llu)",
                  (unsigned long long)messages_sent_.load(), (unsigned long long)messages_received_.load());
    }
}

void SignalingClient::sendGroupCommand(const std::vector<DeviceId>& targets, const ControlCommand& cmd) {
    for (auto& body : encodeGroupCommand(targets, cmd, sizes_)) {
        sendEnvelope(MSG_CONTROL_COMMAND, std::move(body));
    }
}

void SignalingClient::startStream(const DeviceId& device, const StreamOptions& opts) {
    sendEnvelope(MSG_STREAM_START, encodeStreamStart(device, opts));
}

void SignalingClient::stopStream(const DeviceId& device) {
    sendEnvelope(MSG_STREAM_STOP, encodeStreamStop(device));
}

void SignalingClient::setResolution(const DeviceId& device, double resolution) {
    sendEnvelope(MSG_SET_RESOLUTION, encodeSetResolution(device, resolution));
}

void SignalingClient::setFrameRate(const DeviceId& device, int fps) {
    sendEnvelope(MSG_SET_FRAME_RATE, encodeSetFrameRate(device, fps));
}

bool SignalingClient::sendEnvelope(const std::string& type, json body) {
    if (!connected_.load()) {
        FLOG_DEBUG("Signaling", "not connected, %s dropped", type.c_str());
        return false;
    }
    const auto ts = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    auto env = makeEnvelope(type, std::move(body), next_request_id_.fetch_add(1), ts);
    std::string line = env.dump();
    line.push_back('\n');

    if (!writeAll(line)) {
        onConnectionLost(std::string("send failed: ") + std::strerror(errno));
        return false;
    }
    messages_sent_.fetch_add(1);
    FLOG_TRACE("Signaling", "-> %s", type.c_str());
    return true;
}

bool SignalingClient::writeAll(const std::string& data) {
    std::lock_guard<std::mutex> lock(send_mtx_);
    if (socket_ < 0) return false;
    size_t total = 0;
    while (total < data.size()) {
        ssize_t sent = ::send(socket_, data.data() + total, data.size() - total, MSG_NOSIGNAL);
        if (sent <= 0) {
            if (sent < 0 && errno == EINTR) continue;
            return false;
        }
        total += static_cast<size_t>(sent);
    }
    return true;
}

void SignalingClient::receiveThread() {
    FLOG_DEBUG("Signaling", "receive thread started");
    std::weak_ptr<int> alive = alive_;
    std::string buffer;
    char recv_buf[4096];

    while (running_.load()) {
        ssize_t n = ::recv(socket_, recv_buf, sizeof(recv_buf), 0);
        if (n == 0) {
            loop_.post([this, alive] {
                if (alive.lock()) onConnectionLost("closed by peer");
            });
            break;
        }
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            if (running_.load()) {
                std::string err = std::strerror(errno);
                loop_.post([this, alive, err] {
                    if (alive.lock()) onConnectionLost("recv failed: " + err);
                });
            }
            break;
        }
        buffer.append(recv_buf, static_cast<size_t>(n));

        size_t pos;
        while ((pos = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, pos);
            buffer.erase(0, pos + 1);
            if (line.empty()) continue;
            messages_received_.fetch_add(1);
            loop_.post([this, alive, line = std::move(line)] {
                if (alive.lock()) handleLine(line);
            });
        }
        if (buffer.size() > 1024 * 1024) {
            FLOG_WARN("Signaling", "inbound line exceeds 1 MiB, dropped");
            buffer.clear();
        }
    }
    FLOG_DEBUG("Signaling", "receive thread ended");
}

void SignalingClient::onConnectionLost(const std::string& reason) {
    if (!connected_.exchange(false)) return;
    FLOG_WARN("Signaling", "connection lost: %s", reason.c_str());
    SignalingStateEvent ev;
    ev.available = false;
    bus_.publish(ev);
}

namespace {

// Device id of an inbound message: top-level "udid"/"device", else the first
// entry of body.devices
DeviceId inboundDevice(const json& msg) {
    if (msg.contains("udid") && msg["udid"].is_string()) return msg["udid"].get<std::string>();
    if (msg.contains("device") && msg["device"].is_string()) return msg["device"].get<std::string>();
    auto body = msg.find("body");
    if (body != msg.end() && body->is_object()) {
        auto devs = body->find("devices");
        if (devs != body->end() && devs->is_array() && !devs->empty() && (*devs)[0].is_string()) {
            return (*devs)[0].get<std::string>();
        }
    }
    return {};
}

} // namespace

void SignalingClient::handleLine(const std::string& line) {
    json msg;
    try {
        msg = json::parse(line);
    } catch (const json::parse_error& e) {
        FLOG_WARN("Signaling", "malformed message: %s", e.what());
        return;
    }
    if (!msg.is_object()) return;

    std::string type;
    try {
        type = msg.value("type", "");
        const DeviceId device = inboundDevice(msg);
        if (type == MSG_PASTEBOARD_READ) {
            if (device.empty()) {
                FLOG_WARN("Signaling", "pasteboard/read reply without device");
                return;
            }
            ClipboardContentEvent ev;
            ev.device_id = device;
            auto body = msg.find("body");
            if (body != msg.end() && body->is_object()) ev.text = body->value("data", "");
            bus_.publish(ev);
        } else if (type == MSG_STREAM_ERROR) {
            StreamErrorEvent ev;
            ev.device_id = device;
            auto body = msg.find("body");
            if (body != msg.end() && body->is_object()) ev.message = body->value("error", "stream error");
            else if (msg.contains("error") && msg["error"].is_string()) ev.message = msg["error"].get<std::string>();
            FLOG_WARN("Signaling", "%s: stream error: %s", device.c_str(), ev.message.c_str());
            bus_.publish(ev);
        } else {
            FLOG_TRACE("Signaling", "<- %s (ignored)", type.c_str());
        }
    } catch (const json::exception& e) {
        FLOG_WARN("Signaling", "bad %s message: %s", type.c_str(), e.what());
    }
}

} // namespace fleetdeck::net
