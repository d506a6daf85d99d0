#include <gtest/gtest.h>

#include "footfall/capture/frame_convert.hpp"
#include "footfall/capture/frame_source.hpp"
#include "footfall/capture/sim_source.hpp"
#include "footfall/core/config.hpp"
#include "footfall/core/logger.hpp"

#include <opencv2/core.hpp>

// Camera, file and stream sources need real devices or media and are not
// covered here

using namespace footfall;

namespace {

SourceConfig sim_config(uint32_t walkers, uint64_t frame_limit = 0) {
    SourceConfig config;
    config.type = SourceType::SIMULATION;
    config.walkers = walkers;
    config.frame_limit = frame_limit;
    config.realtime = false;
    return config;
}

}  // namespace

TEST(SourceConfigTest, DefaultValues) {
    SourceConfig config;

    EXPECT_EQ(config.type, SourceType::SIMULATION);
    EXPECT_EQ(config.width, 640u);
    EXPECT_EQ(config.height, 480u);
    EXPECT_EQ(config.fps, 15u);
    EXPECT_TRUE(config.realtime);
    EXPECT_EQ(config.frame_limit, 0u);
}

TEST(SourceTypeTest, ToString) {
    EXPECT_STREQ(to_string(SourceType::SIMULATION), "SIMULATION");
    EXPECT_STREQ(to_string(SourceType::FILE), "FILE");
    EXPECT_STREQ(to_string(SourceType::CAMERA), "CAMERA");
    EXPECT_STREQ(to_string(SourceType::STREAM), "STREAM");
}

TEST(SourceTypeTest, Parse) {
    SourceType type = SourceType::SIMULATION;

    EXPECT_TRUE(parse_source_type("rtsp", type));
    EXPECT_EQ(type, SourceType::STREAM);
    EXPECT_TRUE(parse_source_type("usb", type));
    EXPECT_EQ(type, SourceType::CAMERA);
    EXPECT_TRUE(parse_source_type("file", type));
    EXPECT_EQ(type, SourceType::FILE);

    EXPECT_FALSE(parse_source_type("hologram", type));
    EXPECT_EQ(type, SourceType::FILE);
}

TEST(FrameConvertTest, FrameToMatSharesBuffer) {
    Frame frame(8, 4, PixelFormat::BGR24);
    cv::Mat image = frame_to_mat(frame);

    ASSERT_FALSE(image.empty());
    EXPECT_EQ(image.cols, 8);
    EXPECT_EQ(image.rows, 4);
    EXPECT_EQ(image.type(), CV_8UC3);

    image.setTo(cv::Scalar(7, 8, 9));
    EXPECT_EQ(frame.ptr()[0], 7);
    EXPECT_EQ(frame.ptr()[1], 8);
    EXPECT_EQ(frame.ptr()[2], 9);
}

TEST(FrameConvertTest, InvalidFrameGivesEmptyMat) {
    Frame frame;
    EXPECT_TRUE(frame_to_mat(frame).empty());
}

TEST(FrameConvertTest, MatToFrameCopies) {
    cv::Mat image(4, 6, CV_8UC1, cv::Scalar(42));

    FramePtr frame = mat_to_frame(image, 5);
    ASSERT_NE(frame, nullptr);
    EXPECT_EQ(frame->metadata.format, PixelFormat::GRAY8);
    EXPECT_EQ(frame->metadata.frame_id, 5u);
    EXPECT_EQ(frame->metadata.width, 6u);
    EXPECT_EQ(frame->metadata.height, 4u);

    image.setTo(cv::Scalar(0));
    EXPECT_EQ(frame->ptr()[0], 42);
}

TEST(FrameConvertTest, MatToFrameRejectsUnsupported) {
    EXPECT_EQ(mat_to_frame(cv::Mat()), nullptr);
    EXPECT_EQ(mat_to_frame(cv::Mat(4, 4, CV_8UC4, cv::Scalar::all(0))), nullptr);
    EXPECT_EQ(mat_to_frame(cv::Mat(4, 4, CV_32FC3, cv::Scalar::all(0))), nullptr);
}

TEST(SimFrameSourceTest, WalkersAlternateDirection) {
    SimFrameSource source(sim_config(4));

    const auto& walkers = source.walkers();
    ASSERT_EQ(walkers.size(), 4u);
    EXPECT_GT(walkers[0].speed, 0.0f);
    EXPECT_LT(walkers[1].speed, 0.0f);
    EXPECT_GT(walkers[2].speed, 0.0f);
    EXPECT_LT(walkers[3].speed, 0.0f);
    EXPECT_LT(walkers[0].x, walkers[1].x);
}

TEST(SimFrameSourceTest, RenderIsDeterministic) {
    SimFrameSource a(sim_config(3));
    SimFrameSource b(sim_config(3));

    cv::Mat first = frame_to_mat(*a.render(37));
    cv::Mat second = frame_to_mat(*b.render(37));

    EXPECT_EQ(cv::norm(first, second, cv::NORM_INF), 0.0);
}

TEST(SimFrameSourceTest, EmptySceneIsBackground) {
    SimFrameSource source(sim_config(0));

    cv::Mat image = frame_to_mat(*source.render(0));
    cv::Vec3b pixel = image.at<cv::Vec3b>(240, 320);
    EXPECT_EQ(pixel[0], SimFrameSource::kBackground[0]);
    EXPECT_EQ(pixel[1], SimFrameSource::kBackground[1]);
    EXPECT_EQ(pixel[2], SimFrameSource::kBackground[2]);
}

TEST(SimFrameSourceTest, WalkerMovesDown) {
    SimFrameSource source(sim_config(1));

    // 8 px per frame; at frame 30 the box top is at y = 240 - 120
    cv::Mat image = frame_to_mat(*source.render(30));
    cv::Vec3b inside = image.at<cv::Vec3b>(180, 320);
    cv::Vec3b below = image.at<cv::Vec3b>(300, 320);

    EXPECT_NE(inside[1], SimFrameSource::kBackground[1]);
    EXPECT_EQ(below[1], SimFrameSource::kBackground[1]);
}

TEST(SimFrameSourceTest, ReadRequiresStart) {
    SimFrameSource source(sim_config(1));
    EXPECT_EQ(source.read(), nullptr);

    source.start();
    EXPECT_TRUE(source.is_running());
    EXPECT_NE(source.read(), nullptr);

    source.stop();
    EXPECT_FALSE(source.is_running());
    EXPECT_EQ(source.read(), nullptr);
}

TEST(SimFrameSourceTest, FrameLimitEndsStream) {
    SimFrameSource source(sim_config(2, 3));
    source.start();

    for (uint64_t i = 1; i <= 3; ++i) {
        FramePtr frame = source.read();
        ASSERT_NE(frame, nullptr);
        EXPECT_EQ(frame->metadata.frame_id, i);
        EXPECT_EQ(frame->metadata.width, 640u);
    }
    EXPECT_EQ(source.read(), nullptr);
    EXPECT_EQ(source.get_stats().frames_read, 3u);
}

TEST(SimFrameSourceTest, RejectsZeroGeometry) {
    SourceConfig config = sim_config(1);
    config.fps = 0;

    SimFrameSource source(config);
    EXPECT_FALSE(source.initialize(Config{}));
}

class SourceFactoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::init("", LogLevel::OFF, LogLevel::OFF);
    }
};

TEST_F(SourceFactoryTest, SimulationFromConfig) {
    Config config;
    ASSERT_TRUE(config.load_string(R"(
capture:
  source: simulation
  width: 320
  height: 240
  fps: 10
  realtime: false
  simulation:
    walkers: 2
    frame_limit: 5
)"));

    auto source = create_frame_source(config);
    ASSERT_NE(source, nullptr);
    EXPECT_EQ(source->name(), "SimFrameSource");
    EXPECT_EQ(source->frame_size().width, 320u);
    EXPECT_EQ(source->frame_size().height, 240u);
    EXPECT_EQ(source->config().walkers, 2u);
    EXPECT_EQ(source->config().frame_limit, 5u);
    EXPECT_FALSE(source->config().realtime);
}

TEST_F(SourceFactoryTest, DefaultsToSimulation) {
    Config config;
    auto source = create_frame_source(config);
    ASSERT_NE(source, nullptr);
    EXPECT_EQ(source->config().type, SourceType::SIMULATION);
}

TEST_F(SourceFactoryTest, UnknownSourceFails) {
    Config config;
    ASSERT_TRUE(config.load_string("capture:\n  source: hologram\n"));
    EXPECT_EQ(create_frame_source(config), nullptr);
}
