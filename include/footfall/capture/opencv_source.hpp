#pragma once

#include "footfall/capture/frame_source.hpp"

#include <opencv2/videoio.hpp>

#include <atomic>
#include <mutex>

namespace footfall {

/**
 * @brief cv::VideoCapture backed source for files, cameras and streams
 */
class OpenCvFrameSource : public IFrameSource {
public:
    explicit OpenCvFrameSource(const SourceConfig& config);
    ~OpenCvFrameSource() override;

    // IModule interface
    bool initialize(const Config& config) override;
    void start() override;
    void stop() override;
    bool is_running() const override;
    std::string name() const override { return "OpenCvFrameSource"; }

    // IFrameSource interface
    FramePtr read() override;
    FrameSize frame_size() const override;
    SourceStats get_stats() const override;
    const SourceConfig& config() const override { return config_; }

private:
    bool open();

    SourceConfig config_;

    // Guards capture_ between read() and stop()
    mutable std::mutex capture_mutex_;
    cv::VideoCapture capture_;
    FrameSize size_;

    std::atomic<bool> running_{false};
    uint64_t frame_counter_ = 0;

    mutable std::mutex stats_mutex_;
    SourceStats stats_;
};

}  // namespace footfall
