#include "footfall/capture/opencv_source.hpp"
#include "footfall/capture/frame_convert.hpp"
#include "footfall/core/logger.hpp"

#include <opencv2/imgproc.hpp>

namespace footfall {

OpenCvFrameSource::OpenCvFrameSource(const SourceConfig& config)
    : config_(config)
{
}

OpenCvFrameSource::~OpenCvFrameSource() {
    stop();
}

bool OpenCvFrameSource::initialize(const Config& /* config */) {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    return open();
}

bool OpenCvFrameSource::open() {
    try {
        switch (config_.type) {
            case SourceType::CAMERA:
                capture_.open(config_.camera_index);
                if (capture_.isOpened()) {
                    capture_.set(cv::CAP_PROP_FRAME_WIDTH, config_.width);
                    capture_.set(cv::CAP_PROP_FRAME_HEIGHT, config_.height);
                    capture_.set(cv::CAP_PROP_FPS, config_.fps);
                }
                break;
            case SourceType::FILE:
            case SourceType::STREAM:
                if (config_.uri.empty()) {
                    FOOTFALL_LOG_ERROR("capture", "No URI configured for {} source",
                                       to_string(config_.type));
                    return false;
                }
                capture_.open(config_.uri);
                break;
            default:
                FOOTFALL_LOG_ERROR("capture", "OpenCvFrameSource cannot open {} sources",
                                   to_string(config_.type));
                return false;
        }
    } catch (const cv::Exception& e) {
        FOOTFALL_LOG_ERROR("capture", "VideoCapture open failed: {}", e.what());
        return false;
    }

    if (!capture_.isOpened()) {
        FOOTFALL_LOG_ERROR("capture", "Failed to open {} source '{}'",
                           to_string(config_.type),
                           config_.type == SourceType::CAMERA
                               ? std::to_string(config_.camera_index) : config_.uri);
        return false;
    }

    size_.width = static_cast<uint32_t>(capture_.get(cv::CAP_PROP_FRAME_WIDTH));
    size_.height = static_cast<uint32_t>(capture_.get(cv::CAP_PROP_FRAME_HEIGHT));

    FOOTFALL_LOG_INFO("capture", "Opened {} source: {}x{} @ {:.1f} fps",
                      to_string(config_.type), size_.width, size_.height,
                      capture_.get(cv::CAP_PROP_FPS));
    return true;
}

void OpenCvFrameSource::start() {
    if (running_.load(std::memory_order_acquire)) {
        return;
    }
    running_.store(true, std::memory_order_release);
    FOOTFALL_LOG_INFO("capture", "OpenCvFrameSource started");
}

void OpenCvFrameSource::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }

    std::lock_guard<std::mutex> lock(capture_mutex_);
    capture_.release();
    FOOTFALL_LOG_INFO("capture", "OpenCvFrameSource stopped");
}

bool OpenCvFrameSource::is_running() const {
    return running_.load(std::memory_order_acquire);
}

FramePtr OpenCvFrameSource::read() {
    if (!running_.load(std::memory_order_acquire)) {
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(capture_mutex_);
    if (!capture_.isOpened()) {
        return nullptr;
    }

    cv::Mat image;
    try {
        if (!capture_.read(image) || image.empty()) {
            if (config_.type == SourceType::FILE && config_.loop_file) {
                FOOTFALL_LOG_DEBUG("capture", "End of file, rewinding");
                capture_.set(cv::CAP_PROP_POS_FRAMES, 0);
                capture_.read(image);
            }
        }
    } catch (const cv::Exception& e) {
        FOOTFALL_LOG_ERROR("capture", "Frame read failed: {}", e.what());
        image.release();
    }

    if (image.empty()) {
        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        stats_.read_failures++;
        FOOTFALL_LOG_INFO("capture", "End of stream after {} frames", frame_counter_);
        return nullptr;
    }

    if (image.channels() == 1) {
        cv::cvtColor(image, image, cv::COLOR_GRAY2BGR);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, image, cv::COLOR_BGRA2BGR);
    }

    FramePtr frame = mat_to_frame(image, ++frame_counter_);
    if (frame) {
        size_ = frame->size();
        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        stats_.frames_read++;
    }
    return frame;
}

FrameSize OpenCvFrameSource::frame_size() const {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    return size_;
}

SourceStats OpenCvFrameSource::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

}  // namespace footfall
