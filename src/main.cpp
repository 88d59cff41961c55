// =============================================================================
// FleetDeck - Headless console entry point
// =============================================================================
//   fleetdeck_console [--config path] [--devices path] [--batch]
//
// Loads fleetdeck.json and the device catalog, connects signaling and runs a
// single-device or batch console on one loop thread. Operator commands are
// read from stdin, one per line (type "help").
// =============================================================================

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <deque>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "config_loader.hpp"
#include "console/batch_console.hpp"
#include "console/headless_surface.hpp"
#include "console/single_device_console.hpp"
#include "event_bus.hpp"
#include "fleet_log.hpp"
#include "net/signaling_client.hpp"
#include "net/udp_primary_transport.hpp"
#include "scheduler.hpp"
#include "stream/visibility_tracker.hpp"

using namespace fleetdeck;

namespace {

// Pointer commands address a virtual 1080x1920 surface per device
constexpr Rect VIRTUAL_SURFACE{0.0, 0.0, 1080.0, 1920.0};

std::atomic<bool> g_quit{false};

void onSignal(int) { g_quit.store(true); }

struct Options {
    std::string config_path = "fleetdeck.json";
    std::string devices_path = "devices.json";
    bool batch = false;
};

// Lines read by the stdin thread, drained on the loop
struct StdinLines {
    std::mutex mtx;
    std::deque<std::string> lines;
    bool eof = false;
};

struct Host {
    config::ConsoleConfig cfg;
    config::DeviceCatalog catalog;
    std::string devices_path;
    std::shared_ptr<TimerQueue> loop;
    std::unique_ptr<TimedFrameScheduler> frames;
    std::unique_ptr<net::UdpTransportFactory> transports;
    std::unique_ptr<net::SignalingClient> signaling;
    std::map<DeviceId, std::unique_ptr<console::HeadlessSurface>> surfaces;
    std::unique_ptr<stream::ManualVisibilityTracker> tracker;
    std::unique_ptr<console::SingleDeviceConsole> single;
    std::unique_ptr<console::BatchConsole> batch;
    double scroll = 0.0;

    console::ConsoleBase& console() {
        if (batch) return *batch;
        return *single;
    }
};

// =============================================================================
// Setup
// =============================================================================

bool parseArgs(int argc, char** argv, Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (arg == "--devices" && i + 1 < argc) {
            opts.devices_path = argv[++i];
        } else if (arg == "--batch") {
            opts.batch = true;
        } else {
            std::fprintf(stderr, "usage: %s [--config path] [--devices path] [--batch]\n", argv[0]);
            return false;
        }
    }
    return true;
}

VideoSurface* surfaceFor(Host& host, const Device& device) {
    auto& slot = host.surfaces[device.id];
    if (!slot) {
        PixelSize native = device.native.empty() ? stream::ResolutionNegotiator::DEFAULT_NATIVE : device.native;
        slot = std::make_unique<console::HeadlessSurface>(native, VIRTUAL_SURFACE);
    }
    return slot.get();
}

Rect batchViewport(const Host& host) {
    const auto& layout = host.batch->resolution().layout();
    const double fraction = layout.fullscreen ? 1.0 : layout.panel_fraction;
    return Rect{0.0, host.scroll, layout.panel_width * fraction, layout.panel_height};
}

// Tile rects follow the grid; the tracker re-checks visibility
void relayoutTiles(Host& host) {
    const auto ids = host.batch->devices();
    for (size_t i = 0; i < ids.size(); ++i) {
        host.tracker->setTileRect(ids[i], host.batch->tileRect(i));
    }
    host.tracker->setViewport(batchViewport(host));
}

void buildConsole(Host& host, bool batch_mode) {
    console::ConsoleDeps deps{*host.transports, host.signaling.get(), *host.loop, *host.frames, bus()};

    if (batch_mode) {
        host.tracker = std::make_unique<stream::ManualVisibilityTracker>(Rect{}, host.cfg.layout.visibility_margin);
        host.batch = std::make_unique<console::BatchConsole>(host.cfg, deps, *host.tracker);
        host.tracker->setViewport(batchViewport(host));
        const auto devices = host.catalog.all();
        for (size_t i = 0; i < devices.size(); ++i) {
            host.tracker->setTileRect(devices[i].id, host.batch->tileRect(i));
            host.batch->addTile(devices[i], surfaceFor(host, devices[i]));
        }
    } else {
        host.single = std::make_unique<console::SingleDeviceConsole>(host.cfg, deps);
        for (const auto& d : host.catalog.all()) host.single->addDevice(d, surfaceFor(host, d));
        host.single->setClipboardCallback([](const DeviceId& id, const std::string& text) {
            std::printf("[clipboard %s] %s\n", id.c_str(), text.c_str());
            std::fflush(stdout);
        });
    }
}

// =============================================================================
// Commands
// =============================================================================

void printHelp(bool batch) {
    std::printf("commands:\n"
                "  status                     devices and connection states\n"
                "  tap|down|move|up X Y [ID]  pointer on the 1080x1920 virtual surface\n"
                "  home | paste TEXT          home button / paste\n"
                "  scale V | fps N            stream scale cap / frame rate\n");
    if (batch) {
        std::printf("  check ID | uncheck ID | checkall | uncheckall\n"
                    "  volup | voldown | lock\n"
                    "  columns N | fullscreen on|off | scroll PX\n");
    } else {
        std::printf("  select ID | start | stop | sync on|off | reload\n"
                    "  clip-read | clip-write TEXT\n");
    }
    std::printf("  quit\n");
    std::fflush(stdout);
}

void printStatus(Host& host) {
    auto& c = host.console();
    const auto& session = c.session();
    for (const auto& id : c.devices()) {
        const bool active = session.activeDevice() && *session.activeDevice() == id;
        std::printf("  %s%-20s %-12s%s\n", active ? "*" : " ", id.c_str(),
                    connectionStateStr(c.state(id)), session.selection().contains(id) ? " [checked]" : "");
    }
    std::printf("  sync=%s scale=%.2f fps=%d signaling=%s\n", session.groupSync() ? "on" : "off",
                c.resolution().userCap(), c.resolution().frameRate(),
                host.signaling && host.signaling->isAvailable() ? "up" : "down");
    std::fflush(stdout);
}

// Pointer target: explicit id, else the active device (single console)
std::optional<DeviceId> pointerTarget(Host& host, const std::vector<std::string>& args) {
    if (args.size() > 3) return args[3];
    if (host.single) return host.single->activeDevice();
    return std::nullopt;
}

std::string restOf(const std::string& line, const std::string& cmd) {
    auto pos = line.find(cmd);
    if (pos == std::string::npos) return {};
    pos += cmd.size();
    while (pos < line.size() && line[pos] == ' ') ++pos;
    return line.substr(pos);
}

bool handlePointer(Host& host, const std::vector<std::string>& args) {
    if (args.size() < 3) return false;
    auto id = pointerTarget(host, args);
    if (!id) {
        std::printf("no target device\n");
        return true;
    }
    PointerEvent ev;
    ev.position = PointerPosition{std::atof(args[1].c_str()), std::atof(args[2].c_str())};

    auto& touch = host.console().touch();
    const std::string& cmd = args[0];
    if (cmd == "down") {
        touch.pointerDown(*id, ev);
    } else if (cmd == "move") {
        touch.pointerMove(*id, ev);
    } else if (cmd == "up") {
        touch.pointerUp(*id, ev);
    } else if (cmd == "tap") {
        if (touch.pointerDown(*id, ev)) touch.pointerUp(*id, ev);
        else std::printf("tap ignored (no video or outside the surface)\n");
    }
    return true;
}

bool handleSingle(Host& host, const std::vector<std::string>& args, const std::string& line) {
    auto& c = *host.single;
    const std::string& cmd = args[0];
    if (cmd == "select" && args.size() > 1) {
        if (!c.selectDevice(args[1])) std::printf("cannot select %s\n", args[1].c_str());
    } else if (cmd == "start") {
        if (!c.startStream()) std::printf("start failed\n");
    } else if (cmd == "stop") {
        c.stopStream();
    } else if (cmd == "sync" && args.size() > 1) {
        if (!c.setGroupSync(args[1] == "on")) std::printf("sync needs a connected device\n");
    } else if (cmd == "home") {
        c.pressHome();
    } else if (cmd == "paste") {
        c.paste(restOf(line, "paste"));
    } else if (cmd == "clip-read") {
        c.readClipboard();
    } else if (cmd == "clip-write") {
        c.writeClipboard(restOf(line, "clip-write"));
    } else if (cmd == "reload") {
        auto loaded = host.catalog.load(host.devices_path);
        if (loaded.is_err()) {
            std::printf("reload failed: %s\n", loaded.error().message.c_str());
            return true;
        }
        c.syncDevices(host.catalog.all(), [&host](const DeviceId& id) -> VideoSurface* {
            auto d = host.catalog.find(id);
            return d ? surfaceFor(host, *d) : nullptr;
        });
    } else {
        return false;
    }
    return true;
}

bool handleBatch(Host& host, const std::vector<std::string>& args, const std::string& line) {
    auto& c = *host.batch;
    const std::string& cmd = args[0];
    if (cmd == "check" && args.size() > 1) {
        c.setChecked(args[1], true);
    } else if (cmd == "uncheck" && args.size() > 1) {
        c.setChecked(args[1], false);
    } else if (cmd == "checkall") {
        c.checkAll();
    } else if (cmd == "uncheckall") {
        c.clearChecked();
    } else if (cmd == "home") {
        std::printf("home -> %zu devices\n", c.pressHome());
    } else if (cmd == "volup") {
        std::printf("volume up -> %zu devices\n", c.volumeUp());
    } else if (cmd == "voldown") {
        std::printf("volume down -> %zu devices\n", c.volumeDown());
    } else if (cmd == "lock") {
        std::printf("lock -> %zu devices\n", c.lockScreen());
    } else if (cmd == "paste") {
        std::printf("paste -> %zu devices\n", c.paste(restOf(line, "paste")));
    } else if (cmd == "columns" && args.size() > 1) {
        c.setColumns(std::atoi(args[1].c_str()));
        relayoutTiles(host);
    } else if (cmd == "fullscreen" && args.size() > 1) {
        c.setFullscreen(args[1] == "on");
        relayoutTiles(host);
    } else if (cmd == "scroll" && args.size() > 1) {
        host.scroll = std::atof(args[1].c_str());
        host.tracker->scrollTo(host.scroll);
    } else {
        return false;
    }
    return true;
}

// Returns false on quit
bool handleCommand(Host& host, const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> args;
    for (std::string tok; iss >> tok;) args.push_back(tok);
    if (args.empty()) return true;

    const std::string& cmd = args[0];
    if (cmd == "quit" || cmd == "exit") return false;
    if (cmd == "help") {
        printHelp(host.batch != nullptr);
    } else if (cmd == "status") {
        printStatus(host);
    } else if (cmd == "tap" || cmd == "down" || cmd == "move" || cmd == "up") {
        if (!handlePointer(host, args)) std::printf("usage: %s X Y [ID]\n", cmd.c_str());
    } else if (cmd == "scale" && args.size() > 1) {
        host.console().setUserScale(std::atof(args[1].c_str()));
    } else if (cmd == "fps" && args.size() > 1) {
        host.console().setFrameRate(std::atoi(args[1].c_str()));
    } else {
        const bool handled = host.batch ? handleBatch(host, args, line) : handleSingle(host, args, line);
        if (!handled) std::printf("unknown command '%s' (try help)\n", cmd.c_str());
    }
    std::fflush(stdout);
    return true;
}

} // namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    Options opts;
    if (!parseArgs(argc, argv, opts)) return 2;

    Host host;
    host.cfg = config::loadConfig(opts.config_path);
    log::setLogLevel(log::parseLevel(host.cfg.log.level));
    if (!host.cfg.log.log_path.empty() && !log::openLogFile(host.cfg.log.log_path.c_str())) {
        FLOG_WARN("main", "cannot open log file %s", host.cfg.log.log_path.c_str());
    }

    host.devices_path = opts.devices_path;
    auto loaded = host.catalog.load(opts.devices_path);
    if (loaded.is_err()) {
        FLOG_ERROR("main", "device catalog: %s", loaded.error().message.c_str());
        log::closeLogFile();
        return 1;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    host.loop = std::make_shared<TimerQueue>();
    host.frames = std::make_unique<TimedFrameScheduler>(
        *host.loop, std::chrono::milliseconds(host.cfg.throttle.frame_interval_ms));
    host.transports = std::make_unique<net::UdpTransportFactory>(*host.loop);
    host.signaling = std::make_unique<net::SignalingClient>(
        host.cfg.signaling.host, host.cfg.signaling.port, *host.loop, bus(),
        [&host](const DeviceId& id) { return host.catalog.nativeSize(id); });

    auto connected = host.signaling->connect(std::chrono::milliseconds(host.cfg.signaling.connect_timeout_ms));
    if (connected.is_err()) {
        FLOG_WARN("main", "signaling unavailable (%s): no stream control, no mirroring",
                  connected.error().message.c_str());
    }

    buildConsole(host, opts.batch);
    FLOG_INFO("main", "%s console ready with %zu devices", opts.batch ? "batch" : "single-device",
              host.catalog.size());

    // stdin reader: only hands lines over, never touches the console
    auto input = std::make_shared<StdinLines>();
    std::thread reader([input, loop = host.loop] {
        std::string line;
        while (std::getline(std::cin, line)) {
            {
                std::lock_guard<std::mutex> lock(input->mtx);
                input->lines.push_back(line);
            }
            loop->wake();
        }
        {
            std::lock_guard<std::mutex> lock(input->mtx);
            input->eof = true;
        }
        loop->wake();
    });
    reader.detach();

    printHelp(opts.batch);

    bool running = true;
    while (running && !g_quit.load()) {
        host.loop->waitForWork(std::chrono::milliseconds(100));
        host.loop->runDue();

        std::deque<std::string> lines;
        bool eof = false;
        {
            std::lock_guard<std::mutex> lock(input->mtx);
            lines.swap(input->lines);
            eof = input->eof;
        }
        for (const auto& line : lines) {
            if (!handleCommand(host, line)) {
                running = false;
                break;
            }
        }
        if (eof) running = false;
    }

    FLOG_INFO("main", "shutting down");
    host.console().close();
    host.loop->runDue();
    bus().publish(ShutdownEvent{});

    host.batch.reset();
    host.single.reset();
    host.tracker.reset();
    host.signaling->disconnect();
    log::closeLogFile();
    return 0;
}
