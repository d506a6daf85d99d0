#include "footfall/capture/sim_source.hpp"
#include "footfall/capture/frame_convert.hpp"
#include "footfall/core/logger.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <thread>

namespace footfall {

namespace {

// BGR walker palette, saturated so histogram embeddings differ
constexpr uint8_t kPalette[][3] = {
    {40, 200, 40},
    {200, 60, 40},
    {40, 60, 220},
    {30, 210, 230},
    {210, 40, 200},
    {220, 200, 40},
};

}  // namespace

SimFrameSource::SimFrameSource(const SourceConfig& config)
    : config_(config)
{
    build_walkers();
}

SimFrameSource::~SimFrameSource() {
    stop();
}

bool SimFrameSource::initialize(const Config& /* config */) {
    if (config_.width == 0 || config_.height == 0 || config_.fps == 0) {
        FOOTFALL_LOG_ERROR("capture", "Invalid simulation geometry {}x{} @ {} fps",
                           config_.width, config_.height, config_.fps);
        return false;
    }

    FOOTFALL_LOG_INFO("capture", "SimFrameSource initialized: {}x{} @ {} fps, {} walkers",
                      config_.width, config_.height, config_.fps, walkers_.size());
    return true;
}

void SimFrameSource::start() {
    if (running_.load(std::memory_order_acquire)) {
        return;
    }

    frame_counter_ = 0;
    next_frame_time_ = Clock::now();
    running_.store(true, std::memory_order_release);

    FOOTFALL_LOG_INFO("capture", "SimFrameSource started");
}

void SimFrameSource::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    FOOTFALL_LOG_INFO("capture", "SimFrameSource stopped");
}

bool SimFrameSource::is_running() const {
    return running_.load(std::memory_order_acquire);
}

FramePtr SimFrameSource::read() {
    if (!running_.load(std::memory_order_acquire)) {
        return nullptr;
    }
    if (config_.frame_limit > 0 && frame_counter_ >= config_.frame_limit) {
        return nullptr;
    }

    if (config_.realtime) {
        auto now = Clock::now();
        if (now < next_frame_time_) {
            std::this_thread::sleep_until(next_frame_time_);
        }
        next_frame_time_ = Clock::now() + std::chrono::microseconds(1000000 / config_.fps);
    }

    FramePtr frame = render(frame_counter_);
    frame->metadata.frame_id = ++frame_counter_;
    frame->metadata.timestamp = Clock::now();

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.frames_read++;
    }

    return frame;
}

SourceStats SimFrameSource::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

FramePtr SimFrameSource::render(uint64_t n) const {
    auto frame = std::make_shared<Frame>(config_.width, config_.height, PixelFormat::BGR24);
    cv::Mat image = frame_to_mat(*frame);
    image.setTo(cv::Scalar(kBackground[0], kBackground[1], kBackground[2]));

    const float box_w = config_.width * kWalkerWidthRatio;
    const float box_h = config_.height * kWalkerHeightRatio;
    const float travel = config_.height + box_h;

    for (const auto& walker : walkers_) {
        float step = static_cast<float>((n + walker.offset) % period_);
        float distance = step * std::abs(walker.speed);

        // Top edge, starting fully above (down) or below (up) the frame
        float top = walker.speed > 0.0f ? distance - box_h : config_.height - distance;
        if (distance > travel) {
            continue;
        }

        cv::Rect rect(cv::Point(static_cast<int>(std::lround(walker.x - box_w / 2.0f)),
                                static_cast<int>(std::lround(top))),
                      cv::Size(static_cast<int>(box_w), static_cast<int>(box_h)));
        rect &= cv::Rect(0, 0, image.cols, image.rows);
        if (rect.area() > 0) {
            image(rect).setTo(cv::Scalar(walker.b, walker.g, walker.r));
        }
    }

    return frame;
}

void SimFrameSource::build_walkers() {
    walkers_.clear();
    if (config_.walkers == 0 || config_.height == 0 || config_.fps == 0) {
        return;
    }

    // Each walker crosses the frame in about four seconds, then pauses off-screen
    const float speed = std::max(1.0f, config_.height / (config_.fps * 4.0f));
    const float box_h = config_.height * kWalkerHeightRatio;
    period_ = static_cast<uint64_t>(std::ceil((config_.height + box_h) / speed)) + config_.fps;

    const size_t palette_size = sizeof(kPalette) / sizeof(kPalette[0]);
    for (uint32_t i = 0; i < config_.walkers; ++i) {
        const uint8_t* colour = kPalette[i % palette_size];
        Walker walker;
        walker.x = config_.width * (i + 1.0f) / (config_.walkers + 1.0f);
        walker.speed = (i % 2 == 0) ? speed : -speed;
        walker.offset = period_ * i / config_.walkers;
        walker.b = colour[0];
        walker.g = colour[1];
        walker.r = colour[2];
        walkers_.push_back(walker);
    }
}

}  // namespace footfall
