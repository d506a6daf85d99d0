#include <gtest/gtest.h>

#include "footfall/core/types.hpp"

#include <stdexcept>

using namespace footfall;

TEST(TypesTest, PixelFormatBytesPerPixel) {
    EXPECT_EQ(bytes_per_pixel(PixelFormat::RGB24), 3u);
    EXPECT_EQ(bytes_per_pixel(PixelFormat::BGR24), 3u);
    EXPECT_EQ(bytes_per_pixel(PixelFormat::GRAY8), 1u);
    EXPECT_EQ(bytes_per_pixel(PixelFormat::UNKNOWN), 0u);
}

TEST(TypesTest, FrameMetadataDataSize) {
    FrameMetadata meta;
    meta.width = 1280;
    meta.height = 720;
    meta.format = PixelFormat::BGR24;
    meta.stride = 0;

    EXPECT_EQ(meta.data_size(), 1280u * 720u * 3u);

    // With stride (padded rows)
    meta.stride = 1280 * 3 + 64;
    EXPECT_EQ(meta.data_size(), (1280u * 3u + 64u) * 720u);
}

TEST(TypesTest, FrameConstruction) {
    Frame frame(640, 480, PixelFormat::BGR24);

    EXPECT_TRUE(frame.valid());
    EXPECT_EQ(frame.size().width, 640u);
    EXPECT_EQ(frame.size().height, 480u);
    EXPECT_NE(frame.ptr(), nullptr);
}

TEST(TypesTest, FrameInvalid) {
    Frame frame;
    EXPECT_FALSE(frame.valid());
}

TEST(TypesTest, BoundingBoxDimensions) {
    BoundingBox box{10.0f, 20.0f, 50.0f, 100.0f};

    EXPECT_FLOAT_EQ(box.width(), 40.0f);
    EXPECT_FLOAT_EQ(box.height(), 80.0f);
    EXPECT_FLOAT_EQ(box.area(), 3200.0f);
    EXPECT_TRUE(box.valid());

    Point c = box.centroid();
    EXPECT_DOUBLE_EQ(c.x, 30.0);
    EXPECT_DOUBLE_EQ(c.y, 60.0);
}

TEST(TypesTest, BoundingBoxDegenerate) {
    BoundingBox flat{10.0f, 10.0f, 10.0f, 50.0f};
    EXPECT_FALSE(flat.valid());
    EXPECT_FLOAT_EQ(flat.area(), 0.0f);
    EXPECT_FLOAT_EQ(flat.iou(flat), 0.0f);

    BoundingBox inverted{50.0f, 50.0f, 10.0f, 10.0f};
    EXPECT_FALSE(inverted.valid());
    EXPECT_FLOAT_EQ(inverted.width(), 0.0f);
}

TEST(TypesTest, BoundingBoxIoU) {
    BoundingBox box1{0.0f, 0.0f, 10.0f, 10.0f};

    // Identical boxes
    EXPECT_FLOAT_EQ(box1.iou(box1), 1.0f);

    // Non-overlapping boxes
    BoundingBox box2{20.0f, 20.0f, 30.0f, 30.0f};
    EXPECT_FLOAT_EQ(box1.iou(box2), 0.0f);

    // Touching edges do not overlap
    BoundingBox box3{10.0f, 0.0f, 20.0f, 10.0f};
    EXPECT_FLOAT_EQ(box1.iou(box3), 0.0f);

    // Half overlap: 50 / 150
    BoundingBox box4{5.0f, 0.0f, 15.0f, 10.0f};
    EXPECT_NEAR(box1.iou(box4), 1.0f / 3.0f, 1e-6f);
    EXPECT_FLOAT_EQ(box1.iou(box4), box4.iou(box1));
}

TEST(TypesTest, LineDegenerate) {
    Line line{{1.0, 2.0}, {1.0, 2.0}};
    EXPECT_TRUE(line.is_degenerate());

    Line ok{{0.0, 0.0}, {1.0, 0.0}};
    EXPECT_FALSE(ok.is_degenerate());
    EXPECT_NE(line, ok);
}

TEST(TypesTest, ZoneRequiresFourPoints) {
    std::vector<Point> square{{0, 0}, {10, 0}, {10, 10}, {0, 10}};
    Zone zone("lobby", square);
    EXPECT_EQ(zone.name(), "lobby");
    EXPECT_EQ(zone.points()[2], (Point{10, 10}));

    std::vector<Point> triangle{{0, 0}, {10, 0}, {10, 10}};
    EXPECT_THROW(Zone("lobby", triangle), std::invalid_argument);

    std::vector<Point> pentagon{{0, 0}, {10, 0}, {10, 10}, {5, 15}, {0, 10}};
    EXPECT_THROW(Zone("lobby", pentagon), std::invalid_argument);
}

TEST(TypesTest, ZoneRequiresName) {
    std::vector<Point> square{{0, 0}, {10, 0}, {10, 10}, {0, 10}};
    EXPECT_THROW(Zone("", square), std::invalid_argument);
}

TEST(TypesTest, CrossEventToString) {
    EXPECT_STREQ(to_string(CrossEvent::ENTRY), "ENTRY");
    EXPECT_STREQ(to_string(CrossEvent::EXIT), "EXIT");
}

TEST(TypesTest, EpochSeconds) {
    Timestamp t{std::chrono::milliseconds(1500)};
    EXPECT_DOUBLE_EQ(to_epoch_seconds(t), 1.5);
}
