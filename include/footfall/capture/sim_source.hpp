#pragma once

#include "footfall/capture/frame_source.hpp"

#include <atomic>
#include <mutex>
#include <vector>

namespace footfall {

/**
 * @brief Synthetic frame source for running without a camera
 *
 * Renders coloured rectangular "walkers" on a dark background. Walkers move
 * vertically across the frame, alternating direction, so a horizontal line
 * through the middle sees both entries and exits. Output is deterministic
 * for a given configuration.
 */
class SimFrameSource : public IFrameSource {
public:
    struct Walker {
        float x;            // Horizontal centre, pixels
        float speed;        // Pixels per frame, negative moves up
        uint64_t offset;    // Phase offset, frames
        uint8_t b, g, r;
    };

    explicit SimFrameSource(const SourceConfig& config);
    ~SimFrameSource() override;

    // IModule interface
    bool initialize(const Config& config) override;
    void start() override;
    void stop() override;
    bool is_running() const override;
    std::string name() const override { return "SimFrameSource"; }

    // IFrameSource interface
    FramePtr read() override;
    FrameSize frame_size() const override { return {config_.width, config_.height}; }
    SourceStats get_stats() const override;
    const SourceConfig& config() const override { return config_; }

    /**
     * @brief Render frame number n without advancing the source
     */
    FramePtr render(uint64_t n) const;

    const std::vector<Walker>& walkers() const { return walkers_; }

    static constexpr uint8_t kBackground[3] = {50, 30, 30};  // BGR
    static constexpr float kWalkerWidthRatio = 0.08f;
    static constexpr float kWalkerHeightRatio = 0.25f;

private:
    void build_walkers();

    SourceConfig config_;
    std::vector<Walker> walkers_;
    uint64_t period_ = 1;

    std::atomic<bool> running_{false};
    uint64_t frame_counter_ = 0;
    TimePoint next_frame_time_;

    mutable std::mutex stats_mutex_;
    SourceStats stats_;
};

}  // namespace footfall
