#pragma once

#include "footfall/core/types.hpp"

#include <cstdint>
#include <map>
#include <vector>

namespace footfall {

/**
 * @brief Frame tracker configuration
 */
struct FrameTrackerConfig {
    float match_threshold = 0.3f;   // Minimum IoU to continue a track
    int max_age = 15;               // Frames a track may go unmatched before removal
};

/**
 * @brief Greedy IoU tracker
 *
 * Associates each frame's detections with live tracks by descending IoU.
 * Track ids are sequential from 1 and never reused within a run. There is
 * no motion model: a track that is not matched keeps its last box until it
 * expires.
 *
 * Not thread-safe; owned by the frame loop.
 */
class FrameTracker {
public:
    explicit FrameTracker(const FrameTrackerConfig& config = FrameTrackerConfig{});

    /**
     * @brief Advance one frame
     *
     * @param detections This frame's detections
     * @param embeddings One embedding per detection (same order), or empty
     * @param frame_size Frame dimensions
     * @return Surviving tracks ordered by track id
     * @throws std::invalid_argument if embeddings is non-empty and its size
     *         differs from detections
     */
    std::vector<Track> update(const std::vector<Detection>& detections,
                              const std::vector<Embedding>& embeddings,
                              FrameSize frame_size);

    /**
     * @brief Advance one frame without appearance information
     */
    std::vector<Track> update(const std::vector<Detection>& detections,
                              FrameSize frame_size);

    /**
     * @brief Ids removed during the last update()
     */
    const std::vector<uint64_t>& expired() const { return expired_; }

    size_t live_count() const { return tracks_.size(); }
    uint64_t next_track_id() const { return next_id_; }

    void set_match_threshold(float threshold) { config_.match_threshold = threshold; }
    void set_max_age(int max_age) { config_.max_age = max_age; }
    const FrameTrackerConfig& config() const { return config_; }

    /**
     * @brief Drop all tracks and restart ids from 1
     */
    void reset();

private:
    struct TrackState {
        BoundingBox bbox;
        int age = 0;
        int frames_since_match = 0;
    };

    FrameTrackerConfig config_;
    uint64_t next_id_ = 1;
    std::map<uint64_t, TrackState> tracks_;  // Ordered: ties resolve to lowest id
    std::vector<uint64_t> expired_;
};

}  // namespace footfall
