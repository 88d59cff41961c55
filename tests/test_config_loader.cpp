// =============================================================================
// Unit tests for config_loader.hpp
// Tests: defaults, section parsing, validation, file loading, device catalog
// =============================================================================
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include "config_loader.hpp"

using namespace fleetdeck;
using namespace fleetdeck::config;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
static void writeTmpJson(const char* path, const char* content) {
    std::ofstream f(path);
    f << content;
}

// ---------------------------------------------------------------------------
// Defaults
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, DefaultValues) {
    ConsoleConfig cfg;
    EXPECT_EQ(cfg.signaling.host, "127.0.0.1");
    EXPECT_EQ(cfg.signaling.port, 9230);
    EXPECT_EQ(cfg.signaling.connect_timeout_ms, 3000);
    EXPECT_DOUBLE_EQ(cfg.stream.default_scale, 0.6);
    EXPECT_EQ(cfg.stream.default_fps, 20);
    EXPECT_DOUBLE_EQ(cfg.stream.batch_scale, 0.2);
    EXPECT_EQ(cfg.stream.batch_fps, 10);
    EXPECT_TRUE(cfg.stream.force);
    EXPECT_EQ(cfg.layout.columns, 4);
    EXPECT_EQ(cfg.resolution.pixel_budget, 921600);
    EXPECT_DOUBLE_EQ(cfg.resolution.hysteresis, 0.05);
    EXPECT_DOUBLE_EQ(cfg.throttle.move_epsilon, 0.0015);
    EXPECT_DOUBLE_EQ(cfg.catchup.high_lag_ms, 180.0);
    EXPECT_DOUBLE_EQ(cfg.catchup.low_lag_ms, 80.0);
    EXPECT_DOUBLE_EQ(cfg.catchup.accelerated_rate, 1.15);
    EXPECT_EQ(cfg.dispatch.mirror_up_delay_ms, 100);
    EXPECT_EQ(cfg.dispatch.key_release_delay_ms, 50);
    EXPECT_EQ(cfg.log.log_path, "fleetdeck.log");
    EXPECT_EQ(cfg.log.level, "info");
}

TEST(ConfigLoaderTest, LoadConfigMissingFileReturnsDefaults) {
    ConsoleConfig cfg = loadConfig("__nonexistent_fleetdeck_xyz.json", true);
    EXPECT_EQ(cfg.signaling.port, 9230);
    EXPECT_EQ(cfg.log.log_path, "fleetdeck.log");
}

// ---------------------------------------------------------------------------
// parseConfig
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, ParseOverridesOnlyPresentKeys) {
    auto j = nlohmann::json::parse(R"({
        "signaling": { "host": "10.0.0.2", "port": 9300 },
        "layout": { "columns": 6, "fullscreen": true },
        "catchup": { "high_lag_ms": 250 },
        "log": { "level": "debug" }
    })");
    ConsoleConfig cfg = parseConfig(j);
    EXPECT_EQ(cfg.signaling.host, "10.0.0.2");
    EXPECT_EQ(cfg.signaling.port, 9300);
    EXPECT_EQ(cfg.signaling.connect_timeout_ms, 3000);
    EXPECT_EQ(cfg.layout.columns, 6);
    EXPECT_TRUE(cfg.layout.fullscreen);
    EXPECT_DOUBLE_EQ(cfg.catchup.high_lag_ms, 250.0);
    EXPECT_DOUBLE_EQ(cfg.catchup.low_lag_ms, 80.0);
    EXPECT_EQ(cfg.log.level, "debug");
}

TEST(ConfigLoaderTest, WrongTypeKeepsDefault) {
    auto j = nlohmann::json::parse(R"({ "signaling": { "port": "not a number" }, "stream": 5 })");
    ConsoleConfig cfg = parseConfig(j);
    EXPECT_EQ(cfg.signaling.port, 9230);
    EXPECT_EQ(cfg.stream.default_fps, 20);
}

TEST(ConfigLoaderTest, InvalidValuesFallBack) {
    auto j = nlohmann::json::parse(R"({
        "layout": { "columns": 0 },
        "catchup": { "high_lag_ms": 50, "low_lag_ms": 120 }
    })");
    ConsoleConfig cfg = parseConfig(j);
    EXPECT_EQ(cfg.layout.columns, 4);
    EXPECT_DOUBLE_EQ(cfg.catchup.high_lag_ms, 180.0);
    EXPECT_DOUBLE_EQ(cfg.catchup.low_lag_ms, 80.0);
}

// ---------------------------------------------------------------------------
// File loading
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, LoadConfigFromFile) {
    const char* tmp = "__test_fleetdeck_tmp.json";
    writeTmpJson(tmp, R"({
        "stream": { "batch_scale": 0.3, "batch_fps": 12 },
        "log": { "log_path": "custom.log" }
    })");
    ConsoleConfig cfg = loadConfig(tmp, true);
    std::remove(tmp);

    EXPECT_DOUBLE_EQ(cfg.stream.batch_scale, 0.3);
    EXPECT_EQ(cfg.stream.batch_fps, 12);
    EXPECT_EQ(cfg.log.log_path, "custom.log");
}

TEST(ConfigLoaderTest, MalformedFileReturnsDefaults) {
    const char* tmp = "__test_fleetdeck_bad.json";
    writeTmpJson(tmp, R"({ "stream": { "batch_fps": 12 )");
    ConsoleConfig cfg = loadConfig(tmp, true);
    std::remove(tmp);
    EXPECT_EQ(cfg.stream.batch_fps, 10);
}

// ---------------------------------------------------------------------------
// DeviceCatalog
// ---------------------------------------------------------------------------
TEST(DeviceCatalogTest, LoadsDescriptorsInFileOrder) {
    DeviceCatalog catalog;
    auto r = catalog.loadJson(nlohmann::json::parse(R"({"devices":[
        {"id":"zeta","width":1170,"height":2532,"host":"10.0.0.5","control_port":7100},
        {"id":"alpha","width":1080,"height":1920},
        {"id":"zeta","width":1,"height":1},
        {"width":720,"height":1280},
        "garbage"
    ]})"));
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), 2u);

    auto all = catalog.all();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].id, "zeta");
    EXPECT_EQ(all[1].id, "alpha");

    auto zeta = catalog.find("zeta");
    ASSERT_TRUE(zeta.has_value());
    EXPECT_EQ(zeta->native, (PixelSize{1170, 2532}));
    EXPECT_EQ(zeta->host, "10.0.0.5");
    EXPECT_EQ(zeta->control_port, 7100);
    EXPECT_FALSE(catalog.find("nobody").has_value());
}

TEST(DeviceCatalogTest, NativeSizeNeedsUsableDimensions) {
    DeviceCatalog catalog;
    catalog.loadJson(nlohmann::json::parse(R"({"devices":[
        {"id":"sized","width":1170,"height":2532},
        {"id":"unsized"}
    ]})"));
    ASSERT_TRUE(catalog.nativeSize("sized").has_value());
    EXPECT_EQ(catalog.nativeSize("sized")->height, 2532);
    EXPECT_FALSE(catalog.nativeSize("unsized").has_value());
    EXPECT_FALSE(catalog.nativeSize("nobody").has_value());
}

TEST(DeviceCatalogTest, MissingDevicesArrayIsError) {
    DeviceCatalog catalog;
    auto r = catalog.loadJson(nlohmann::json::parse(R"({"phones":[]})"));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().message, "missing \"devices\" array");
}

TEST(DeviceCatalogTest, LoadFromFile) {
    const char* tmp = "__test_devices_tmp.json";
    writeTmpJson(tmp, R"({"devices":[{"id":"a","width":100,"height":200}]})");
    DeviceCatalog catalog;
    auto r = catalog.load(tmp);
    std::remove(tmp);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(catalog.size(), 1u);
}

TEST(DeviceCatalogTest, LoadMissingFileIsError) {
    DeviceCatalog catalog;
    auto r = catalog.load("__nonexistent_devices_xyz.json");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error().message.find("not found"), std::string::npos);
    EXPECT_EQ(catalog.size(), 0u);
}

TEST(DeviceCatalogTest, ReloadReplacesContents) {
    DeviceCatalog catalog;
    catalog.loadJson(nlohmann::json::parse(R"({"devices":[{"id":"a"},{"id":"b"}]})"));
    catalog.loadJson(nlohmann::json::parse(R"({"devices":[{"id":"c"}]})"));
    ASSERT_EQ(catalog.size(), 1u);
    EXPECT_EQ(catalog.all()[0].id, "c");
}
