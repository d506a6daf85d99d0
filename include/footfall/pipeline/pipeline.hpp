#pragma once

#include "footfall/core/types.hpp"
#include "footfall/pipeline/scene.hpp"
#include "footfall/session/session_store.hpp"
#include "footfall/tracking/crossing_detector.hpp"
#include "footfall/tracking/frame_tracker.hpp"
#include "footfall/tracking/identity_resolver.hpp"
#include "footfall/tracking/zone_presence_tracker.hpp"

#include <cstdint>
#include <vector>

namespace footfall {

/**
 * @brief Output of one processed frame
 */
struct FrameResult {
    std::vector<AnnotatedTrack> tracks;
    std::vector<Session> sessions;    // All sessions, creation order
    size_t active_sessions = 0;
    size_t entries = 0;               // Crossing events emitted this frame
    size_t exits = 0;
};

/**
 * @brief Per-frame journey processing
 *
 * Chains tracking, identity resolution, line crossing, zone presence and
 * session bookkeeping. All state lives in this object; a new run starts
 * from a new instance.
 */
class JourneyPipeline {
public:
    JourneyPipeline();

    /**
     * @brief Process the detections of one frame
     *
     * @param detections Person detections, already confidence-filtered
     * @param embeddings One appearance vector per detection
     * @param frame_size Frame dimensions
     * @param scene Scene at this frame
     * @param now Wall-clock time of the frame
     * @throws std::invalid_argument if embeddings and detections differ in count
     */
    FrameResult process(const std::vector<Detection>& detections,
                        const std::vector<Embedding>& embeddings,
                        FrameSize frame_size,
                        const SceneSnapshot& scene,
                        Timestamp now);

    uint64_t frames_processed() const { return frames_processed_; }

    const FrameTracker& tracker() const { return tracker_; }
    const IdentityResolver& identities() const { return identities_; }
    const CrossingDetector& crossings() const { return crossings_; }
    const ZonePresenceTracker& zones() const { return zones_; }
    const SessionStore& sessions() const { return sessions_; }

private:
    void apply(const TrackingParams& params);

    FrameTracker tracker_;
    IdentityResolver identities_;
    CrossingDetector crossings_;
    ZonePresenceTracker zones_;
    SessionStore sessions_;

    uint64_t frames_processed_ = 0;
};

}  // namespace footfall
