#pragma once
// =============================================================================
// FleetDeck Config Loader
// =============================================================================
// Loads console settings from fleetdeck.json and the device catalog from
// devices.json with nlohmann/json. Missing keys keep their defaults.
// =============================================================================

#include <string>
#include <fstream>
#include <map>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>
#include "fleet_log.hpp"
#include "fleet_types.hpp"
#include "result.hpp"

namespace fleetdeck {
namespace config {

struct SignalingConfig {
    std::string host = "127.0.0.1";
    int port = 9230;
    int connect_timeout_ms = 3000;
};

struct StreamConfig {
    double default_scale = 0.6;     // single-device console
    int default_fps = 20;
    double batch_scale = 0.2;       // batch console
    int batch_fps = 10;
    bool force = true;
};

struct LayoutConfig {
    int columns = 4;
    double grid_gap = 12.0;
    double grid_padding = 16.0;
    double panel_fraction = 0.9;
    double tile_aspect = 16.0 / 9.0;   // tile height / width
    double device_pixel_ratio = 1.0;
    double viewport_width = 1920.0;
    double viewport_height = 1080.0;
    bool fullscreen = false;
    double visibility_margin = 50.0;
};

struct ResolutionConfig {
    int pixel_budget = 720 * 1280;
    double hysteresis = 0.05;
    double batch_min_scale = 0.1;
    double single_min_scale = 0.25;
};

struct ThrottleConfig {
    double move_epsilon = 0.0015;
    int frame_interval_ms = 16;
};

struct CatchUpConfig {
    int sample_interval_ms = 1000;
    double high_lag_ms = 180.0;
    double low_lag_ms = 80.0;
    double accelerated_rate = 1.15;
};

struct DispatchConfig {
    int mirror_up_delay_ms = 100;
    int key_release_delay_ms = 50;
};

struct LogConfig {
    std::string log_path = "fleetdeck.log";
    std::string level = "info";
};

struct ConsoleConfig {
    SignalingConfig signaling;
    StreamConfig stream;
    LayoutConfig layout;
    ResolutionConfig resolution;
    ThrottleConfig throttle;
    CatchUpConfig catchup;
    DispatchConfig dispatch;
    LogConfig log;
};

// Safe JSON accessor with section/key and default value
template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& section,
          const std::string& key, const T& def) {
    auto sec = j.find(section);
    if (sec == j.end() || !sec->is_object()) return def;
    auto it = sec->find(key);
    if (it == sec->end() || it->is_null()) return def;
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        FLOG_WARN("config", "%s.%s: %s (using default)", section.c_str(), key.c_str(), e.what());
    }
    return def;
}

inline ConsoleConfig parseConfig(const nlohmann::json& j) {
    ConsoleConfig config;
    const ConsoleConfig d;

    config.signaling.host = jsonGet<std::string>(j, "signaling", "host", d.signaling.host);
    config.signaling.port = jsonGet<int>(j, "signaling", "port", d.signaling.port);
    config.signaling.connect_timeout_ms = jsonGet<int>(j, "signaling", "connect_timeout_ms", d.signaling.connect_timeout_ms);

    config.stream.default_scale = jsonGet<double>(j, "stream", "default_scale", d.stream.default_scale);
    config.stream.default_fps = jsonGet<int>(j, "stream", "default_fps", d.stream.default_fps);
    config.stream.batch_scale = jsonGet<double>(j, "stream", "batch_scale", d.stream.batch_scale);
    config.stream.batch_fps = jsonGet<int>(j, "stream", "batch_fps", d.stream.batch_fps);
    config.stream.force = jsonGet<bool>(j, "stream", "force", d.stream.force);

    config.layout.columns = jsonGet<int>(j, "layout", "columns", d.layout.columns);
    config.layout.grid_gap = jsonGet<double>(j, "layout", "grid_gap", d.layout.grid_gap);
    config.layout.grid_padding = jsonGet<double>(j, "layout", "grid_padding", d.layout.grid_padding);
    config.layout.panel_fraction = jsonGet<double>(j, "layout", "panel_fraction", d.layout.panel_fraction);
    config.layout.tile_aspect = jsonGet<double>(j, "layout", "tile_aspect", d.layout.tile_aspect);
    config.layout.device_pixel_ratio = jsonGet<double>(j, "layout", "device_pixel_ratio", d.layout.device_pixel_ratio);
    config.layout.viewport_width = jsonGet<double>(j, "layout", "viewport_width", d.layout.viewport_width);
    config.layout.viewport_height = jsonGet<double>(j, "layout", "viewport_height", d.layout.viewport_height);
    config.layout.fullscreen = jsonGet<bool>(j, "layout", "fullscreen", d.layout.fullscreen);
    config.layout.visibility_margin = jsonGet<double>(j, "layout", "visibility_margin", d.layout.visibility_margin);

    config.resolution.pixel_budget = jsonGet<int>(j, "resolution", "pixel_budget", d.resolution.pixel_budget);
    config.resolution.hysteresis = jsonGet<double>(j, "resolution", "hysteresis", d.resolution.hysteresis);
    config.resolution.batch_min_scale = jsonGet<double>(j, "resolution", "batch_min_scale", d.resolution.batch_min_scale);
    config.resolution.single_min_scale = jsonGet<double>(j, "resolution", "single_min_scale", d.resolution.single_min_scale);

    config.throttle.move_epsilon = jsonGet<double>(j, "throttle", "move_epsilon", d.throttle.move_epsilon);
    config.throttle.frame_interval_ms = jsonGet<int>(j, "throttle", "frame_interval_ms", d.throttle.frame_interval_ms);

    config.catchup.sample_interval_ms = jsonGet<int>(j, "catchup", "sample_interval_ms", d.catchup.sample_interval_ms);
    config.catchup.high_lag_ms = jsonGet<double>(j, "catchup", "high_lag_ms", d.catchup.high_lag_ms);
    config.catchup.low_lag_ms = jsonGet<double>(j, "catchup", "low_lag_ms", d.catchup.low_lag_ms);
    config.catchup.accelerated_rate = jsonGet<double>(j, "catchup", "accelerated_rate", d.catchup.accelerated_rate);

    config.dispatch.mirror_up_delay_ms = jsonGet<int>(j, "dispatch", "mirror_up_delay_ms", d.dispatch.mirror_up_delay_ms);
    config.dispatch.key_release_delay_ms = jsonGet<int>(j, "dispatch", "key_release_delay_ms", d.dispatch.key_release_delay_ms);

    config.log.log_path = jsonGet<std::string>(j, "log", "log_path", d.log.log_path);
    config.log.level = jsonGet<std::string>(j, "log", "level", d.log.level);

    if (config.layout.columns < 1) {
        FLOG_WARN("config", "layout.columns=%d invalid, using %d", config.layout.columns, d.layout.columns);
        config.layout.columns = d.layout.columns;
    }
    if (config.catchup.low_lag_ms > config.catchup.high_lag_ms) {
        FLOG_WARN("config", "catchup.low_lag_ms > high_lag_ms, using defaults");
        config.catchup.low_lag_ms = d.catchup.low_lag_ms;
        config.catchup.high_lag_ms = d.catchup.high_lag_ms;
    }
    return config;
}

// @param configPath  Path to config file
// @param strict      If true, only try the exact path (no fallback search)
inline ConsoleConfig loadConfig(const std::string& configPath = "fleetdeck.json",
                                bool strict = false) {
    ConsoleConfig config;

    std::ifstream file(configPath);
    if (!file.is_open() && !strict) {
        file.open("../fleetdeck.json");
    }
    if (!file.is_open()) {
        FLOG_WARN("config", "%s not found, using defaults", configPath.c_str());
        return config;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config = parseConfig(j);
    } catch (const nlohmann::json::exception& e) {
        FLOG_ERROR("config", "JSON parse error: %s", e.what());
        return ConsoleConfig{};
    }

    FLOG_INFO("config", "Loaded: signaling=%s:%d columns=%d budget=%d",
              config.signaling.host.c_str(), config.signaling.port,
              config.layout.columns, config.resolution.pixel_budget);

    return config;
}

// =============================================================================
// DeviceCatalog - device descriptors from devices.json
// =============================================================================
// {"devices":[{"id":"...","width":1170,"height":2532,"host":"10.0.0.5","control_port":7100}]}
// Read-only after load.
class DeviceCatalog {
public:
    Result<size_t> load(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            FLOG_WARN("DeviceCatalog", "devices file not found: %s", path.c_str());
            return Err<size_t>("devices file not found: " + path);
        }
        try {
            return loadJson(nlohmann::json::parse(file));
        } catch (const nlohmann::json::exception& e) {
            FLOG_ERROR("DeviceCatalog", "JSON parse error: %s", e.what());
            return Err<size_t>(std::string("JSON parse error: ") + e.what());
        }
    }

    Result<size_t> loadJson(const nlohmann::json& j) {
        if (!j.contains("devices") || !j["devices"].is_array()) {
            FLOG_WARN("DeviceCatalog", "Invalid devices file format");
            return Err<size_t>("missing \"devices\" array");
        }

        devices_.clear();
        order_.clear();
        for (const auto& dev : j["devices"]) {
            if (!dev.is_object()) continue;
            Device d;
            d.id = dev.value("id", "");
            d.native.width = dev.value("width", 0);
            d.native.height = dev.value("height", 0);
            d.host = dev.value("host", "");
            d.control_port = dev.value("control_port", 0);

            if (d.id.empty()) continue;
            if (devices_.count(d.id)) {
                FLOG_WARN("DeviceCatalog", "Duplicate device id %s ignored", d.id.c_str());
                continue;
            }
            FLOG_DEBUG("DeviceCatalog", "Loaded: %s -> %dx%d", d.id.c_str(), d.native.width, d.native.height);
            order_.push_back(d.id);
            devices_[d.id] = std::move(d);
        }
        FLOG_INFO("DeviceCatalog", "Loaded %zu devices", devices_.size());
        return Ok(devices_.size());
    }

    std::optional<Device> find(const DeviceId& id) const {
        auto it = devices_.find(id);
        if (it == devices_.end()) return std::nullopt;
        return it->second;
    }

    // Native size if the descriptor reports a usable one
    std::optional<PixelSize> nativeSize(const DeviceId& id) const {
        auto it = devices_.find(id);
        if (it == devices_.end() || it->second.native.empty()) return std::nullopt;
        return it->second.native;
    }

    // Descriptors in file order
    std::vector<Device> all() const {
        std::vector<Device> out;
        out.reserve(order_.size());
        for (const auto& id : order_) out.push_back(devices_.at(id));
        return out;
    }

    size_t size() const { return devices_.size(); }

private:
    std::map<DeviceId, Device> devices_;
    std::vector<DeviceId> order_;
};

} // namespace config
} // namespace fleetdeck
