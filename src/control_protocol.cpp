#include "control_protocol.hpp"
#include "input/coordinate_mapper.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>

namespace fleetdeck::protocol {

ControlCommand ControlCommand::touch(CommandKind phase, NormalizedPoint p) {
    ControlCommand c;
    c.kind = phase;
    c.point = p;
    return c;
}

ControlCommand ControlCommand::keyPhase(CommandKind phase, std::string key) {
    ControlCommand c;
    c.kind = phase;
    c.key = std::move(key);
    return c;
}

ControlCommand ControlCommand::paste(std::string text) {
    ControlCommand c;
    c.kind = CommandKind::Paste;
    c.text = std::move(text);
    return c;
}

ControlCommand ControlCommand::home() {
    ControlCommand c;
    c.kind = CommandKind::HomePress;
    c.key = KEY_HOME;
    return c;
}

ControlCommand ControlCommand::clipboardRead() {
    ControlCommand c;
    c.kind = CommandKind::ClipboardRead;
    return c;
}

ControlCommand ControlCommand::clipboardWrite(std::string text) {
    ControlCommand c;
    c.kind = CommandKind::ClipboardWrite;
    c.text = std::move(text);
    return c;
}

bool isTouch(CommandKind kind) {
    return kind == CommandKind::TouchDown || kind == CommandKind::TouchMove ||
           kind == CommandKind::TouchUp;
}

const char* kindName(CommandKind kind) {
    switch (kind) {
    case CommandKind::TouchDown:      return "touch-down";
    case CommandKind::TouchMove:      return "touch-move";
    case CommandKind::TouchUp:        return "touch-up";
    case CommandKind::KeyPress:       return "key-press";
    case CommandKind::KeyDown:        return "key-down";
    case CommandKind::KeyUp:          return "key-up";
    case CommandKind::Paste:          return "paste";
    case CommandKind::HomePress:      return "home-press";
    case CommandKind::ClipboardRead:  return "clipboard-read";
    case CommandKind::ClipboardWrite: return "clipboard-write";
    default:                          return "unknown";
    }
}

double round4(double v) {
    return std::round(v * 10000.0) / 10000.0;
}

std::string keyCode(const std::string& key) {
    std::string out = key;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

static const char* touchAction(CommandKind kind) {
    switch (kind) {
    case CommandKind::TouchDown: return "down";
    case CommandKind::TouchMove: return "move";
    default:                     return "up";
    }
}

nlohmann::json encodePrimary(const ControlCommand& cmd) {
    switch (cmd.kind) {
    case CommandKind::TouchDown:
    case CommandKind::TouchMove:
    case CommandKind::TouchUp:
        return {{"type", "touch"}, {"action", touchAction(cmd.kind)},
                {"x", round4(cmd.point.x)}, {"y", round4(cmd.point.y)}};
    case CommandKind::KeyPress:
        return {{"type", "key"}, {"key", cmd.key}, {"action", "press"}};
    case CommandKind::KeyDown:
        return {{"type", "key"}, {"key", cmd.key}, {"action", "down"}};
    case CommandKind::KeyUp:
        return {{"type", "key"}, {"key", cmd.key}, {"action", "up"}};
    case CommandKind::HomePress:
        return {{"type", "key"}, {"key", KEY_HOME}, {"action", "press"}};
    case CommandKind::Paste:
        return {{"type", "paste"}, {"text", cmd.text}};
    case CommandKind::ClipboardRead:
        return {{"type", "clipboard"}, {"action", "read"}};
    case CommandKind::ClipboardWrite:
        return {{"type", "clipboard"}, {"action", "write"}, {"text", cmd.text}};
    }
    return nlohmann::json::object();
}

static nlohmann::json groupBody(const std::vector<DeviceId>& devices, const char* type) {
    return {{"devices", devices}, {"type", type}};
}

std::vector<nlohmann::json> encodeGroupCommand(const std::vector<DeviceId>& targets,
                                               const ControlCommand& cmd,
                                               const SizeLookup& sizes) {
    std::vector<nlohmann::json> out;
    if (targets.empty()) return out;

    switch (cmd.kind) {
    case CommandKind::TouchDown:
    case CommandKind::TouchMove: {
        // one message per distinct native size, coordinates in device pixels
        std::map<PixelSize, std::vector<DeviceId>> groups;
        for (const auto& id : targets) {
            auto size = sizes ? sizes(id) : std::nullopt;
            if (!size || size->empty()) continue;
            groups[*size].push_back(id);
        }
        const char* type = cmd.kind == CommandKind::TouchDown ? "touch/down" : "touch/move";
        for (const auto& [size, ids] : groups) {
            auto px = input::toDevicePixels(cmd.point, size);
            auto body = groupBody(ids, type);
            body["body"] = {{"x", px.x}, {"y", px.y}};
            out.push_back(std::move(body));
        }
        break;
    }
    case CommandKind::TouchUp: {
        auto body = groupBody(targets, "touch/up");
        body["body"] = {{"x", 0}, {"y", 0}};
        out.push_back(std::move(body));
        break;
    }
    case CommandKind::KeyDown:
    case CommandKind::KeyUp: {
        auto body = groupBody(targets, cmd.kind == CommandKind::KeyDown ? "key/down" : "key/up");
        body["body"] = {{"code", keyCode(cmd.key)}};
        out.push_back(std::move(body));
        break;
    }
    case CommandKind::KeyPress:
    case CommandKind::HomePress: {
        const std::string code = keyCode(cmd.kind == CommandKind::HomePress ? KEY_HOME : cmd.key);
        auto down = groupBody(targets, "key/down");
        down["body"] = {{"code", code}};
        auto up = groupBody(targets, "key/up");
        up["body"] = {{"code", code}};
        out.push_back(std::move(down));
        out.push_back(std::move(up));
        break;
    }
    case CommandKind::Paste: {
        auto body = groupBody(targets, "input/paste");
        body["body"] = {{"text", cmd.text}};
        out.push_back(std::move(body));
        break;
    }
    case CommandKind::ClipboardRead:
        out.push_back(groupBody(targets, MSG_PASTEBOARD_READ));
        break;
    case CommandKind::ClipboardWrite: {
        auto body = groupBody(targets, MSG_PASTEBOARD_WRITE);
        body["body"] = {{"uti", CLIPBOARD_UTI}, {"data", cmd.text}};
        out.push_back(std::move(body));
        break;
    }
    }
    return out;
}

nlohmann::json encodeStreamStart(const DeviceId& device, const StreamOptions& opts) {
    return {{"devices", nlohmann::json::array({device})},
            {"resolution", round4(opts.resolution)},
            {"fps", opts.fps},
            {"force", opts.force}};
}

nlohmann::json encodeStreamStop(const DeviceId& device) {
    return {{"devices", nlohmann::json::array({device})}};
}

nlohmann::json encodeSetResolution(const DeviceId& device, double resolution) {
    return {{"devices", nlohmann::json::array({device})}, {"resolution", round4(resolution)}};
}

nlohmann::json encodeSetFrameRate(const DeviceId& device, int fps) {
    return {{"devices", nlohmann::json::array({device})}, {"fps", fps}};
}

nlohmann::json makeEnvelope(const std::string& type, nlohmann::json body,
                            uint64_t request_id, int64_t ts) {
    return {{"type", type}, {"body", std::move(body)},
            {"requestId", request_id}, {"ts", ts}};
}

} // namespace fleetdeck::protocol
