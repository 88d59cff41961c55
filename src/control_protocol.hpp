// =============================================================================
// FleetDeck - Control Protocol
// =============================================================================
// Command vocabulary shared by the primary (per-device datagram) channel and
// the signaling channel, plus the JSON encoders for both wires.
//
// Primary channel (one datagram per command, device implied):
//   {"type":"touch","action":"down|move|up","x":0.1234,"y":0.5678}
//   {"type":"key","key":"homebutton","action":"press|down|up"}
//   {"type":"paste","text":"..."}
//   {"type":"clipboard","action":"read"} / {"type":"clipboard","action":"write","text":"..."}
//
// Signaling channel (newline-delimited envelopes):
//   {"type":"control/command","requestId":7,"ts":1700000000,
//    "body":{"devices":["a","b"],"type":"touch/down","body":{"x":540,"y":960}}}
// =============================================================================
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "fleet_types.hpp"

namespace fleetdeck::protocol {

enum class CommandKind {
    TouchDown,
    TouchMove,
    TouchUp,
    KeyPress,
    KeyDown,
    KeyUp,
    Paste,
    HomePress,
    ClipboardRead,
    ClipboardWrite
};

// Key names on the primary channel
inline constexpr const char* KEY_HOME        = "homebutton";
inline constexpr const char* KEY_VOLUME_UP   = "volumeup";
inline constexpr const char* KEY_VOLUME_DOWN = "volumedown";
inline constexpr const char* KEY_LOCK        = "lock";

inline constexpr const char* CLIPBOARD_UTI = "public.plain-text";

// Signaling message types
inline constexpr const char* MSG_CONTROL_COMMAND  = "control/command";
inline constexpr const char* MSG_STREAM_START     = "stream/start";
inline constexpr const char* MSG_STREAM_STOP      = "stream/stop";
inline constexpr const char* MSG_SET_RESOLUTION   = "stream/set-resolution";
inline constexpr const char* MSG_SET_FRAME_RATE   = "stream/set-frame-rate";
inline constexpr const char* MSG_STREAM_ERROR     = "stream/error";
inline constexpr const char* MSG_PASTEBOARD_READ  = "pasteboard/read";
inline constexpr const char* MSG_PASTEBOARD_WRITE = "pasteboard/write";

struct ControlCommand {
    CommandKind kind = CommandKind::TouchMove;
    NormalizedPoint point;   // touch phases
    std::string key;         // key phases
    std::string text;        // paste, clipboard write

    static ControlCommand touch(CommandKind phase, NormalizedPoint p);
    static ControlCommand keyPhase(CommandKind phase, std::string key);
    static ControlCommand paste(std::string text);
    static ControlCommand home();
    static ControlCommand clipboardRead();
    static ControlCommand clipboardWrite(std::string text);
};

bool isTouch(CommandKind kind);
const char* kindName(CommandKind kind);

// Stream parameters sent with stream/start
struct StreamOptions {
    double resolution = 0.6;
    int fps = 20;
    bool force = true;
};

// Rounds to 4 decimal places (primary-channel coordinate precision)
double round4(double v);

// "homebutton" -> "HOMEBUTTON"
std::string keyCode(const std::string& key);

nlohmann::json encodePrimary(const ControlCommand& cmd);

// Native size lookup used to address mirrored touches in device pixels
using SizeLookup = std::function<std::optional<PixelSize>(const DeviceId&)>;

// Bodies of the control/command messages that replicate `cmd` to `targets`.
// Touch down/move are split per native size (targets with unknown size are
// dropped). KeyPress/HomePress become key/down and key/up back to back, the
// form used when a press is sent over signaling directly; the dispatcher
// sends the two phases itself with a release delay.
std::vector<nlohmann::json> encodeGroupCommand(const std::vector<DeviceId>& targets,
                                               const ControlCommand& cmd,
                                               const SizeLookup& sizes);

nlohmann::json encodeStreamStart(const DeviceId& device, const StreamOptions& opts);
nlohmann::json encodeStreamStop(const DeviceId& device);
nlohmann::json encodeSetResolution(const DeviceId& device, double resolution);
nlohmann::json encodeSetFrameRate(const DeviceId& device, int fps);

nlohmann::json makeEnvelope(const std::string& type, nlohmann::json body,
                            uint64_t request_id, int64_t ts);

} // namespace fleetdeck::protocol
