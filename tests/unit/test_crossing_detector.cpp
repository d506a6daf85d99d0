#include <gtest/gtest.h>

#include "footfall/tracking/crossing_detector.hpp"

using namespace footfall;
using namespace std::chrono_literals;

class CrossingDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        detector_.sync_lines({Line{{0, 100}, {200, 100}}});
    }

    Timestamp at(std::chrono::milliseconds offset) const {
        return t0_ + offset;
    }

    CrossingDetector detector_;
    Timestamp t0_ = Timestamp{} + 1000s;
};

TEST_F(CrossingDetectorTest, FirstObservationNeverFires) {
    EXPECT_FALSE(detector_.update(1, {50, 150}, at(0ms)).has_value());
    EXPECT_EQ(detector_.remembered_side(1, 0), 1);
}

TEST_F(CrossingDetectorTest, NegativeToPositiveIsEntry) {
    detector_.update(1, {50, 50}, at(0ms));
    auto event = detector_.update(1, {50, 150}, at(1000ms));

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(*event, CrossEvent::ENTRY);
}

TEST_F(CrossingDetectorTest, PositiveToNegativeIsExit) {
    detector_.update(1, {50, 150}, at(0ms));
    auto event = detector_.update(1, {50, 50}, at(1000ms));

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(*event, CrossEvent::EXIT);
}

TEST_F(CrossingDetectorTest, SameSideNoEvent) {
    detector_.update(1, {50, 50}, at(0ms));
    EXPECT_FALSE(detector_.update(1, {150, 20}, at(1000ms)).has_value());
}

TEST_F(CrossingDetectorTest, FirstCrossingIsNotDebounced) {
    // No previous event: even an immediate crossing fires
    detector_.update(1, {50, 50}, at(0ms));
    EXPECT_TRUE(detector_.update(1, {50, 150}, at(10ms)).has_value());
}

TEST_F(CrossingDetectorTest, OnLineSampleKeepsSide) {
    detector_.update(1, {50, 50}, at(0ms));
    EXPECT_FALSE(detector_.update(1, {50, 100}, at(500ms)).has_value());
    EXPECT_EQ(detector_.remembered_side(1, 0), -1);

    auto event = detector_.update(1, {50, 150}, at(1000ms));
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(*event, CrossEvent::ENTRY);
}

TEST_F(CrossingDetectorTest, QuickReCrossingIsDebounced) {
    detector_.update(1, {50, 50}, at(0ms));
    ASSERT_TRUE(detector_.update(1, {50, 150}, at(100ms)).has_value());

    // Back within 750 ms: suppressed, but memory follows
    EXPECT_FALSE(detector_.update(1, {50, 50}, at(400ms)).has_value());
    EXPECT_EQ(detector_.remembered_side(1, 0), -1);

    // Crossing again after the window fires from the updated side
    auto event = detector_.update(1, {50, 150}, at(900ms));
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(*event, CrossEvent::ENTRY);
}

TEST_F(CrossingDetectorTest, SuppressedCrossingDoesNotExtendWindow) {
    detector_.update(1, {50, 50}, at(0ms));
    ASSERT_TRUE(detector_.update(1, {50, 150}, at(0ms)).has_value());
    EXPECT_FALSE(detector_.update(1, {50, 50}, at(700ms)).has_value());

    // 750 ms after the last emitted event, not after the suppressed one
    EXPECT_TRUE(detector_.update(1, {50, 150}, at(750ms)).has_value());
}

TEST_F(CrossingDetectorTest, DebounceIsPerTrack) {
    detector_.update(1, {50, 50}, at(0ms));
    detector_.update(2, {60, 50}, at(0ms));

    EXPECT_TRUE(detector_.update(1, {50, 150}, at(100ms)).has_value());
    EXPECT_TRUE(detector_.update(2, {60, 150}, at(110ms)).has_value());
}

TEST_F(CrossingDetectorTest, DegenerateLineNeverFires) {
    detector_.sync_lines({Line{{10, 10}, {10, 10}}});
    detector_.update(1, {0, 0}, at(0ms));
    EXPECT_FALSE(detector_.update(1, {100, 100}, at(1000ms)).has_value());
    EXPECT_EQ(detector_.memory_size(), 0u);
}

TEST_F(CrossingDetectorTest, AtMostOneEventPerFrame) {
    detector_.sync_lines({Line{{0, 100}, {200, 100}}, Line{{0, 120}, {200, 120}}});

    detector_.update(1, {50, 50}, at(0ms));
    auto event = detector_.update(1, {50, 150}, at(1000ms));
    ASSERT_TRUE(event.has_value());

    // Both lines refreshed their memory
    EXPECT_EQ(detector_.remembered_side(1, 0), 1);
    EXPECT_EQ(detector_.remembered_side(1, 1), 1);
}

TEST_F(CrossingDetectorTest, LineChangeClearsMemory) {
    detector_.update(1, {50, 50}, at(0ms));

    EXPECT_FALSE(detector_.sync_lines({Line{{0, 100}, {200, 100}}}));
    EXPECT_EQ(detector_.memory_size(), 1u);

    EXPECT_TRUE(detector_.sync_lines({Line{{0, 200}, {200, 200}}}));
    EXPECT_EQ(detector_.memory_size(), 0u);

    // Fresh first observation
    EXPECT_FALSE(detector_.update(1, {50, 250}, at(1000ms)).has_value());
}

TEST_F(CrossingDetectorTest, AppendedLineKeepsExistingMemory) {
    detector_.update(1, {50, 90}, at(0ms));

    EXPECT_TRUE(detector_.sync_lines({Line{{0, 100}, {200, 100}},
                                      Line{{300, 0}, {300, 400}}}));
    EXPECT_EQ(detector_.remembered_side(1, 0), -1);

    auto event = detector_.update(1, {50, 110}, at(2000ms));
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(*event, CrossEvent::ENTRY);
}

TEST_F(CrossingDetectorTest, RemovedLineDropsShiftedMemory) {
    detector_.sync_lines({Line{{0, 100}, {200, 100}}, Line{{0, 300}, {200, 300}}});
    detector_.update(1, {50, 50}, at(0ms));
    EXPECT_EQ(detector_.memory_size(), 2u);

    // Line 1 moves to index 0; its old memory must not apply there
    detector_.sync_lines({Line{{0, 300}, {200, 300}}});
    EXPECT_EQ(detector_.memory_size(), 0u);
    EXPECT_FALSE(detector_.update(1, {50, 350}, at(2000ms)).has_value());
}

TEST_F(CrossingDetectorTest, ForgetDropsTrackState) {
    detector_.update(1, {50, 50}, at(0ms));
    detector_.update(2, {50, 50}, at(0ms));
    detector_.forget(1);

    EXPECT_EQ(detector_.remembered_side(1, 0), 0);
    EXPECT_EQ(detector_.remembered_side(2, 0), -1);
    EXPECT_FALSE(detector_.update(1, {50, 150}, at(1000ms)).has_value());
}

TEST_F(CrossingDetectorTest, NoLinesNoEvents) {
    CrossingDetector empty;
    EXPECT_FALSE(empty.update(1, {0, 0}, at(0ms)).has_value());
    EXPECT_FALSE(empty.update(1, {500, 500}, at(1000ms)).has_value());
}
