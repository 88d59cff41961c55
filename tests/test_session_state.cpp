// =============================================================================
// FleetDeck - SessionState / ConnectionTable / SelectionSet Unit Tests
// =============================================================================

#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "control/session_state.hpp"
#include "fakes.hpp"

using namespace fleetdeck;
using namespace fleetdeck::control;
using namespace fleetdeck::fakes;

class SessionStateTest : public ::testing::Test {
protected:
    void SetUp() override {
        state_sub = bus.subscribe<ConnectionStateChangedEvent>([this](const ConnectionStateChangedEvent& e) {
            transitions.push_back(e.device_id + ":" + connectionStateStr(e.old_state) + "->" +
                                  connectionStateStr(e.new_state));
        });
        sel_sub = bus.subscribe<SelectionChangedEvent>([this](const SelectionChangedEvent& e) {
            selections.push_back(e.selected);
        });
    }

    EventBus bus;
    SessionState state{bus};
    SubscriptionHandle state_sub;
    SubscriptionHandle sel_sub;
    std::vector<std::string> transitions;
    std::vector<std::vector<DeviceId>> selections;
};

// =============================================================================
// Working set
// =============================================================================

TEST_F(SessionStateTest, AddKeepsTrackingOrder) {
    EXPECT_TRUE(state.addDevice(makeDevice("z"), nullptr));
    EXPECT_TRUE(state.addDevice(makeDevice("a"), nullptr));
    EXPECT_TRUE(state.addDevice(makeDevice("m"), nullptr));
    EXPECT_FALSE(state.addDevice(makeDevice("a"), nullptr));

    EXPECT_EQ(state.connections().ids(), (std::vector<DeviceId>{"z", "a", "m"}));
    EXPECT_EQ(state.connections().state("a"), ConnectionState::Disconnected);
}

TEST_F(SessionStateTest, TrackedEventsPublished) {
    std::vector<std::pair<DeviceId, bool>> events;
    auto sub = bus.subscribe<DeviceTrackedEvent>([&](const DeviceTrackedEvent& e) {
        events.push_back({e.device_id, e.tracked});
    });
    state.addDevice(makeDevice("a"), nullptr);
    state.removeDevice("a");
    ASSERT_EQ(events.size(), 2u);
    EXPECT_TRUE(events[0].second);
    EXPECT_FALSE(events[1].second);
    EXPECT_FALSE(state.removeDevice("a"));
}

TEST_F(SessionStateTest, RemoveClearsSelectionActiveAndTouch) {
    state.addDevice(makeDevice("a"), nullptr);
    state.addDevice(makeDevice("b"), nullptr);
    state.selection().selectAll({"a", "b"});
    ASSERT_TRUE(state.setActiveDevice("a"));
    ASSERT_TRUE(state.beginTouch("a", {0.1, 0.1}));

    EXPECT_TRUE(state.removeDevice("a"));

    EXPECT_FALSE(state.isTracked("a"));
    EXPECT_FALSE(state.selection().contains("a"));
    EXPECT_TRUE(state.selection().contains("b"));
    EXPECT_FALSE(state.activeDevice().has_value());
    EXPECT_FALSE(state.touch().active);
}

// =============================================================================
// Connection state machine
// =============================================================================

TEST_F(SessionStateTest, ConnectSequence) {
    state.addDevice(makeDevice("a"), nullptr);
    auto& table = state.connections();
    auto transport = std::make_shared<FakeTransport>("a");

    EXPECT_FALSE(table.markConnected("a"));
    EXPECT_FALSE(table.attachMedia("a", std::make_shared<FakeMedia>()));

    ASSERT_TRUE(table.beginConnecting("a", transport));
    EXPECT_FALSE(table.beginConnecting("a", transport));
    EXPECT_FALSE(table.attachMedia("a", std::make_shared<FakeMedia>()));

    ASSERT_TRUE(table.markConnected("a"));
    EXPECT_TRUE(table.attachMedia("a", std::make_shared<FakeMedia>()));

    auto conn = table.find("a");
    ASSERT_TRUE(conn.has_value());
    EXPECT_EQ(conn->state, ConnectionState::Connected);
    EXPECT_EQ(conn->transport, transport);
    EXPECT_NE(conn->media, nullptr);

    EXPECT_EQ(transitions, (std::vector<std::string>{
        "a:disconnected->connecting", "a:connecting->connected"}));
}

TEST_F(SessionStateTest, BeginConnectingNeedsTransport) {
    state.addDevice(makeDevice("a"), nullptr);
    EXPECT_FALSE(state.connections().beginConnecting("a", nullptr));
    EXPECT_FALSE(state.connections().beginConnecting("ghost", std::make_shared<FakeTransport>()));
    EXPECT_TRUE(transitions.empty());
}

TEST_F(SessionStateTest, DisconnectHandsBackResources) {
    state.addDevice(makeDevice("a"), nullptr);
    auto& table = state.connections();
    auto transport = std::make_shared<FakeTransport>("a");
    auto media = std::make_shared<FakeMedia>();
    table.beginConnecting("a", transport);
    table.markConnected("a");
    table.attachMedia("a", media);

    auto released = table.markDisconnected("a");
    EXPECT_EQ(released.transport, transport);
    EXPECT_EQ(released.media, media);
    EXPECT_EQ(table.transport("a"), nullptr);
    EXPECT_EQ(table.state("a"), ConnectionState::Disconnected);
    EXPECT_EQ(transitions.back(), "a:connected->disconnected");

    // already disconnected: nothing to release, no event
    size_t before = transitions.size();
    auto again = table.markDisconnected("a");
    EXPECT_EQ(again.transport, nullptr);
    EXPECT_EQ(transitions.size(), before);
}

TEST_F(SessionStateTest, IdsInState) {
    for (const char* id : {"a", "b", "c"}) state.addDevice(makeDevice(id), nullptr);
    state.connections().beginConnecting("b", std::make_shared<FakeTransport>("b"));
    state.connections().beginConnecting("c", std::make_shared<FakeTransport>("c"));
    state.connections().markConnected("c");

    EXPECT_EQ(state.connections().idsInState(ConnectionState::Disconnected), (std::vector<DeviceId>{"a"}));
    EXPECT_EQ(state.connections().idsInState(ConnectionState::Connecting), (std::vector<DeviceId>{"b"}));
    EXPECT_EQ(state.connections().idsInState(ConnectionState::Connected), (std::vector<DeviceId>{"c"}));
}

TEST_F(SessionStateTest, SurfaceCanBeReplaced) {
    FakeSurface one, two;
    state.addDevice(makeDevice("a"), &one);
    EXPECT_EQ(state.connections().surface("a"), &one);
    state.connections().setSurface("a", &two);
    EXPECT_EQ(state.connections().surface("a"), &two);
    EXPECT_EQ(state.connections().surface("ghost"), nullptr);
}

// =============================================================================
// Selection
// =============================================================================

TEST_F(SessionStateTest, SelectionPublishesOnlyOnChange) {
    auto& sel = state.selection();
    EXPECT_TRUE(sel.set("a", true));
    EXPECT_FALSE(sel.set("a", true));
    EXPECT_TRUE(sel.toggle("b"));
    EXPECT_TRUE(sel.toggle("a"));
    sel.selectAll({"b"});
    sel.clear();
    sel.clear();

    ASSERT_EQ(selections.size(), 4u);
    EXPECT_EQ(selections[1], (std::vector<DeviceId>{"a", "b"}));
    EXPECT_EQ(selections[2], (std::vector<DeviceId>{"b"}));
    EXPECT_TRUE(selections[3].empty());
}

TEST_F(SessionStateTest, OthersExcludesSource) {
    state.selection().selectAll({"a", "b", "c"});
    EXPECT_EQ(state.selection().others("b"), (std::vector<DeviceId>{"a", "c"}));
    EXPECT_EQ(state.selection().others("x").size(), 3u);
}

// =============================================================================
// Active device / group sync
// =============================================================================

TEST_F(SessionStateTest, ActiveDeviceMustBeTracked) {
    std::vector<DeviceId> changes;
    auto sub = bus.subscribe<ActiveDeviceChangedEvent>([&](const ActiveDeviceChangedEvent& e) {
        changes.push_back(e.device_id);
    });

    EXPECT_FALSE(state.setActiveDevice("a"));
    state.addDevice(makeDevice("a"), nullptr);
    EXPECT_TRUE(state.setActiveDevice("a"));
    EXPECT_TRUE(state.setActiveDevice("a"));
    state.clearActiveDevice();
    state.clearActiveDevice();

    EXPECT_EQ(changes, (std::vector<DeviceId>{"a", ""}));
}

TEST_F(SessionStateTest, GroupSyncEventOnChange) {
    int events = 0;
    auto sub = bus.subscribe<GroupSyncChangedEvent>([&](const GroupSyncChangedEvent&) { events++; });
    state.setGroupSync(true);
    state.setGroupSync(true);
    state.setGroupSync(false);
    EXPECT_EQ(events, 2);
    EXPECT_FALSE(state.groupSync());
}

// =============================================================================
// Touch session
// =============================================================================

TEST_F(SessionStateTest, TouchSessionIsExclusive) {
    state.addDevice(makeDevice("a"), nullptr);
    state.addDevice(makeDevice("b"), nullptr);

    ASSERT_TRUE(state.beginTouch("a", {0.1, 0.2}));
    EXPECT_FALSE(state.beginTouch("b", {0.5, 0.5}));
    EXPECT_TRUE(state.updateTouch({0.3, 0.4}));

    auto done = state.endTouch();
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done->device_id, "a");
    EXPECT_EQ(done->last_position, (NormalizedPoint{0.3, 0.4}));

    EXPECT_FALSE(state.endTouch().has_value());
    EXPECT_FALSE(state.updateTouch({0.0, 0.0}));
    EXPECT_TRUE(state.beginTouch("b", {0.5, 0.5}));
}

TEST_F(SessionStateTest, TouchNeedsTrackedDevice) {
    EXPECT_FALSE(state.beginTouch("ghost", {0.5, 0.5}));
    EXPECT_FALSE(state.touch().active);
}
