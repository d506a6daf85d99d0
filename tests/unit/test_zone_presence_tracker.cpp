#include <gtest/gtest.h>

#include "footfall/tracking/zone_presence_tracker.hpp"

using namespace footfall;

namespace {

Zone square(const std::string& name, double x0, double y0, double size) {
    return Zone(name, {{x0, y0}, {x0 + size, y0}, {x0 + size, y0 + size}, {x0, y0 + size}});
}

}  // namespace

TEST(ZonePresenceTrackerTest, EnterAndExit) {
    ZonePresenceTracker tracker;
    std::vector<Zone> zones{square("counter", 0, 0, 100)};

    EXPECT_TRUE(tracker.update(1, {200, 200}, zones).empty());

    auto entered = tracker.update(1, {50, 50}, zones);
    ASSERT_EQ(entered.entered.size(), 1u);
    EXPECT_EQ(entered.entered[0], "counter");
    EXPECT_TRUE(entered.exited.empty());

    EXPECT_TRUE(tracker.update(1, {60, 60}, zones).empty());

    auto exited = tracker.update(1, {200, 200}, zones);
    ASSERT_EQ(exited.exited.size(), 1u);
    EXPECT_EQ(exited.exited[0], "counter");
    EXPECT_EQ(tracker.tracked_count(), 0u);
}

TEST(ZonePresenceTrackerTest, OverlappingZones) {
    ZonePresenceTracker tracker;
    std::vector<Zone> zones{square("b_zone", 0, 0, 100), square("a_zone", 50, 50, 100)};

    auto both = tracker.update(1, {75, 75}, zones);
    ASSERT_EQ(both.entered.size(), 2u);
    // Zone order
    EXPECT_EQ(both.entered[0], "b_zone");
    EXPECT_EQ(both.entered[1], "a_zone");

    auto left = tracker.update(1, {300, 300}, zones);
    ASSERT_EQ(left.exited.size(), 2u);
    // Name order
    EXPECT_EQ(left.exited[0], "a_zone");
    EXPECT_EQ(left.exited[1], "b_zone");
}

TEST(ZonePresenceTrackerTest, MoveBetweenZones) {
    ZonePresenceTracker tracker;
    std::vector<Zone> zones{square("left", 0, 0, 100), square("right", 200, 0, 100)};

    tracker.update(1, {50, 50}, zones);
    auto moved = tracker.update(1, {250, 50}, zones);

    ASSERT_EQ(moved.entered.size(), 1u);
    ASSERT_EQ(moved.exited.size(), 1u);
    EXPECT_EQ(moved.entered[0], "right");
    EXPECT_EQ(moved.exited[0], "left");
    EXPECT_EQ(tracker.membership(1), (std::set<std::string>{"right"}));
}

TEST(ZonePresenceTrackerTest, RemovedZoneShowsAsExit) {
    ZonePresenceTracker tracker;
    tracker.update(1, {50, 50}, {square("counter", 0, 0, 100)});

    auto transitions = tracker.update(1, {50, 50}, {});
    ASSERT_EQ(transitions.exited.size(), 1u);
    EXPECT_EQ(transitions.exited[0], "counter");
}

TEST(ZonePresenceTrackerTest, TracksAreIndependent) {
    ZonePresenceTracker tracker;
    std::vector<Zone> zones{square("counter", 0, 0, 100)};

    tracker.update(1, {50, 50}, zones);
    auto other = tracker.update(2, {50, 50}, zones);

    EXPECT_EQ(other.entered.size(), 1u);
    EXPECT_EQ(tracker.tracked_count(), 2u);
}

TEST(ZonePresenceTrackerTest, ForgetIsSilent) {
    ZonePresenceTracker tracker;
    std::vector<Zone> zones{square("counter", 0, 0, 100)};

    tracker.update(1, {50, 50}, zones);
    tracker.forget(1);

    EXPECT_TRUE(tracker.membership(1).empty());
    // Next sighting counts as a fresh entry
    EXPECT_EQ(tracker.update(1, {50, 50}, zones).entered.size(), 1u);
}
