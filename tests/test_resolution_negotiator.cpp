// =============================================================================
// FleetDeck - ResolutionNegotiator / ResolutionController Unit Tests
// =============================================================================

#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>
#include "stream/resolution_negotiator.hpp"

using namespace fleetdeck;
using namespace fleetdeck::stream;

namespace {

// 4-column grid in a 1600px panel on a dpr-2 display
LayoutInputs gridLayout() {
    LayoutInputs l;
    l.grid = true;
    l.columns = 4;
    l.panel_width = 1600.0;
    l.device_pixel_ratio = 2.0;
    return l;
}

} // namespace

// =============================================================================
// Negotiator
// =============================================================================

TEST(ResolutionNegotiatorTest, PortraitPhoneInFourColumnGrid) {
    ResolutionNegotiator neg;
    auto d = neg.compute(0.5, {1170, 2532}, gridLayout());

    // the 16:9 cell is height-bound: 343 x 609.8 host px
    EXPECT_NEAR(d.container_scale, 0.4817, 1e-3);
    EXPECT_DOUBLE_EQ(d.pixel_budget_scale, 0.55);
    EXPECT_DOUBLE_EQ(d.target_scale, d.container_scale);

    EXPECT_EQ(d.width, 562);
    EXPECT_EQ(d.height, 1218);
    EXPECT_EQ(d.width % 2, 0);
    EXPECT_EQ(d.height % 2, 0);
    EXPECT_LE(static_cast<long long>(d.width) * d.height, 720LL * 1280LL);
}

TEST(ResolutionNegotiatorTest, CellSizeFromGridGeometry) {
    ResolutionNegotiator neg;
    auto cell = neg.cellSize(gridLayout());
    EXPECT_DOUBLE_EQ(cell.width, 343.0);
    EXPECT_NEAR(cell.height, 343.0 * 16.0 / 9.0, 1e-9);

    auto full = gridLayout();
    full.fullscreen = true;
    EXPECT_DOUBLE_EQ(neg.cellSize(full).width, (1600.0 - 32.0 - 36.0) / 4.0);
}

TEST(ResolutionNegotiatorTest, PixelBudgetScaleRoundsDown) {
    ResolutionNegotiator neg;
    EXPECT_DOUBLE_EQ(neg.pixelBudgetScale({1170, 2532}), 0.55);
    EXPECT_DOUBLE_EQ(neg.pixelBudgetScale({720, 1280}), 1.0);
    EXPECT_DOUBLE_EQ(neg.pixelBudgetScale({1440, 2560}), 0.5);
}

TEST(ResolutionNegotiatorTest, InvariantsHoldAcrossInputMatrix) {
    ResolutionNegotiator neg;
    const long long budget = neg.limits().pixel_budget;
    const std::vector<PixelSize> natives = {
        {1170, 2532}, {1080, 1920}, {720, 1280}, {2160, 3840},
        {100, 4000}, {4000, 100}, {3000, 3000}, {8000, 8000}};

    for (const auto& raw : natives) {
        const PixelSize native = ResolutionNegotiator::orient(raw, 0);
        for (int columns : {1, 2, 4, 8}) {
            for (double panel : {800.0, 1600.0, 3840.0}) {
                for (double dpr : {1.0, 2.0, 3.0}) {
                    for (double cap : {0.1, 0.5, 1.0}) {
                        LayoutInputs layout = gridLayout();
                        layout.columns = columns;
                        layout.panel_width = panel;
                        layout.device_pixel_ratio = dpr;
                        auto d = neg.compute(cap, native, layout);

                        SCOPED_TRACE(std::to_string(native.width) + "x" + std::to_string(native.height) +
                                     " cols=" + std::to_string(columns) + " panel=" + std::to_string(panel) +
                                     " dpr=" + std::to_string(dpr) + " cap=" + std::to_string(cap));

                        const double unclamped = std::min({cap, d.container_scale, d.pixel_budget_scale});
                        EXPECT_LE(d.target_scale, d.pixel_budget_scale);
                        EXPECT_LE(d.target_scale, 1.0);
                        if (unclamped >= neg.limits().min_scale) {
                            EXPECT_DOUBLE_EQ(d.target_scale, unclamped);
                            EXPECT_LE(d.target_scale, cap);
                            EXPECT_LE(d.target_scale, d.container_scale);
                        }
                        EXPECT_EQ(d.width % 2, 0);
                        EXPECT_EQ(d.height % 2, 0);
                        EXPECT_LE(static_cast<long long>(d.width) * d.height, budget);
                    }
                }
            }
        }
    }
}

TEST(ResolutionNegotiatorTest, SingleDeviceFloorApplies) {
    NegotiatorLimits limits;
    limits.min_scale = 0.25;
    ResolutionNegotiator neg(limits);

    LayoutInputs panel;
    panel.grid = false;
    auto d = neg.compute(0.1, {720, 1280}, panel);
    EXPECT_DOUBLE_EQ(d.target_scale, 0.25);
    EXPECT_EQ(d.width, 180);
    EXPECT_EQ(d.height, 320);
}

TEST(ResolutionNegotiatorTest, PixelBudgetBeatsModeFloor) {
    NegotiatorLimits limits;
    limits.min_scale = 0.25;
    limits.pixel_budget = 100 * 100;
    ResolutionNegotiator neg(limits);

    LayoutInputs panel;
    panel.grid = false;
    auto d = neg.compute(1.0, {1000, 1000}, panel);
    EXPECT_DOUBLE_EQ(d.target_scale, 0.1);
    EXPECT_LE(static_cast<long long>(d.width) * d.height, 100LL * 100LL);
}

TEST(ResolutionNegotiatorTest, OrientKeepsPortraitConvention) {
    EXPECT_EQ(ResolutionNegotiator::orient({2532, 1170}, 0), (PixelSize{1170, 2532}));
    EXPECT_EQ(ResolutionNegotiator::orient({1170, 2532}, 90), (PixelSize{2532, 1170}));
    EXPECT_EQ(ResolutionNegotiator::orient({1170, 2532}, 180), (PixelSize{1170, 2532}));
    EXPECT_EQ(ResolutionNegotiator::orient({0, 0}, 0), ResolutionNegotiator::DEFAULT_NATIVE);
}

TEST(ResolutionNegotiatorTest, FloorEven) {
    EXPECT_EQ(ResolutionNegotiator::floorEven(563.55), 562);
    EXPECT_EQ(ResolutionNegotiator::floorEven(3.0), 2);
    EXPECT_EQ(ResolutionNegotiator::floorEven(4.0), 4);
    EXPECT_EQ(ResolutionNegotiator::floorEven(0.0), 0);
    EXPECT_EQ(ResolutionNegotiator::floorEven(-3.0), 0);
}

TEST(ResolutionNegotiatorTest, HysteresisBand) {
    ResolutionNegotiator neg;
    EXPECT_TRUE(neg.shouldApply(std::nullopt, 0.5));
    EXPECT_FALSE(neg.shouldApply(0.5, 0.53));
    EXPECT_FALSE(neg.shouldApply(0.5, 0.47));
    EXPECT_TRUE(neg.shouldApply(0.5, 0.56));
    EXPECT_TRUE(neg.shouldApply(0.5, 0.40));
}

// =============================================================================
// Controller
// =============================================================================

class ResolutionControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        controller = std::make_unique<ResolutionController>(ResolutionNegotiator{}, bus, 0.5, 20, gridLayout());
        controller->setScaleCommandCallback([this](const DeviceId& id, const ScaleDecision& d) {
            scale_cmds.push_back({id, d.target_scale});
        });
        controller->setFrameRateCommandCallback([this](const DeviceId& id, int fps) {
            fps_cmds.push_back({id, fps});
        });
        controller->registerDevice("phone", {1170, 2532});
    }

    // stream/start, then live
    void goLive() {
        controller->startOptions("phone", true);
        controller->setLive("phone", false);   // Connecting
        controller->setLive("phone", true);
    }

    EventBus bus;
    std::unique_ptr<ResolutionController> controller;
    std::vector<std::pair<DeviceId, double>> scale_cmds;
    std::vector<std::pair<DeviceId, int>> fps_cmds;
};

TEST_F(ResolutionControllerTest, StartOptionsCarryNegotiatedScale) {
    auto opts = controller->startOptions("phone", true);
    EXPECT_NEAR(opts.resolution, 0.4817, 1e-3);
    EXPECT_EQ(opts.fps, 20);
    EXPECT_TRUE(opts.force);
    ASSERT_NE(controller->state("phone"), nullptr);
    EXPECT_TRUE(controller->state("phone")->last_applied_scale.has_value());
}

TEST_F(ResolutionControllerTest, NothingPushedToStreamsThatAreNotLive) {
    auto layout = gridLayout();
    layout.columns = 8;
    controller->setLayout(layout);
    controller->setFrameRate(5);
    EXPECT_TRUE(scale_cmds.empty());
    EXPECT_TRUE(fps_cmds.empty());
}

TEST_F(ResolutionControllerTest, NoPushRightAfterConnecting) {
    goLive();
    controller->reevaluate(false);
    EXPECT_TRUE(scale_cmds.empty());
    EXPECT_TRUE(fps_cmds.empty());
}

TEST_F(ResolutionControllerTest, ChangesWhileConnectingArePushedOnConnect) {
    controller->startOptions("phone", true);
    controller->setLive("phone", false);

    auto layout = gridLayout();
    layout.columns = 8;
    controller->setLayout(layout);
    controller->setFrameRate(5);
    EXPECT_TRUE(scale_cmds.empty());
    EXPECT_TRUE(fps_cmds.empty());

    controller->setLive("phone", true);
    ASSERT_EQ(scale_cmds.size(), 1u);
    EXPECT_NEAR(scale_cmds[0].second, 0.2324, 1e-3);
    ASSERT_EQ(fps_cmds.size(), 1u);
    EXPECT_EQ(fps_cmds[0].second, 5);

    // already applied: staying live pushes nothing more
    controller->setLive("phone", true);
    EXPECT_EQ(scale_cmds.size(), 1u);
    EXPECT_EQ(fps_cmds.size(), 1u);
}

TEST_F(ResolutionControllerTest, UserCapChangeWhileConnectingStillBypassesHysteresis) {
    controller->startOptions("phone", true);
    controller->setLive("phone", false);
    controller->setUserCap(0.47);
    EXPECT_TRUE(scale_cmds.empty());

    controller->setLive("phone", true);
    ASSERT_EQ(scale_cmds.size(), 1u);
    EXPECT_DOUBLE_EQ(scale_cmds[0].second, 0.47);
}

TEST_F(ResolutionControllerTest, LayoutJitterInsideHysteresisIsNotPushed) {
    goLive();
    auto layout = gridLayout();
    layout.panel_width = 1620.0;
    controller->setLayout(layout);
    EXPECT_TRUE(scale_cmds.empty());
}

TEST_F(ResolutionControllerTest, LargeLayoutChangeIsPushed) {
    goLive();
    int applied_events = 0;
    auto sub = bus.subscribe<ResolutionAppliedEvent>([&](const ResolutionAppliedEvent& e) {
        applied_events++;
        EXPECT_EQ(e.width % 2, 0);
        EXPECT_EQ(e.height % 2, 0);
    });

    auto layout = gridLayout();
    layout.columns = 8;
    controller->setLayout(layout);

    ASSERT_EQ(scale_cmds.size(), 1u);
    EXPECT_EQ(scale_cmds[0].first, "phone");
    EXPECT_NEAR(scale_cmds[0].second, 0.2324, 1e-3);
    EXPECT_EQ(applied_events, 1);
}

TEST_F(ResolutionControllerTest, UserCapChangeBypassesHysteresis) {
    goLive();
    controller->setUserCap(0.47);
    ASSERT_EQ(scale_cmds.size(), 1u);
    EXPECT_DOUBLE_EQ(scale_cmds[0].second, 0.47);
}

TEST_F(ResolutionControllerTest, UserCapIsClampedToLimits) {
    controller->setUserCap(5.0);
    EXPECT_DOUBLE_EQ(controller->userCap(), 1.0);
    controller->setUserCap(0.01);
    EXPECT_DOUBLE_EQ(controller->userCap(), 0.1);
}

TEST_F(ResolutionControllerTest, FrameRatePushedOnAnyChange) {
    goLive();
    int fps_events = 0;
    auto sub = bus.subscribe<FrameRateAppliedEvent>([&](const FrameRateAppliedEvent&) { fps_events++; });

    controller->setFrameRate(20);
    EXPECT_TRUE(fps_cmds.empty());

    controller->setFrameRate(19);
    ASSERT_EQ(fps_cmds.size(), 1u);
    EXPECT_EQ(fps_cmds[0].second, 19);
    EXPECT_EQ(fps_events, 1);
}

TEST_F(ResolutionControllerTest, GoingOfflineForgetsAppliedValues) {
    goLive();
    controller->setLive("phone", false);
    const auto* st = controller->state("phone");
    ASSERT_NE(st, nullptr);
    EXPECT_FALSE(st->last_applied_scale.has_value());
    EXPECT_FALSE(st->last_applied_fps.has_value());
}

TEST_F(ResolutionControllerTest, RotationRenegotiates) {
    goLive();
    controller->setRotation("phone", 90);
    // landscape 2532x1170 in a portrait cell is width-bound: much smaller
    ASSERT_EQ(scale_cmds.size(), 1u);
    EXPECT_LT(scale_cmds[0].second, 0.4);
}
