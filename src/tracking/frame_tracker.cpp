#include "footfall/tracking/frame_tracker.hpp"
#include "footfall/core/logger.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace footfall {

namespace {

struct Candidate {
    uint64_t track_id;
    size_t detection_index;
    float iou;
};

}  // namespace

FrameTracker::FrameTracker(const FrameTrackerConfig& config)
    : config_(config)
{
}

std::vector<Track> FrameTracker::update(const std::vector<Detection>& detections,
                                        FrameSize frame_size) {
    return update(detections, {}, frame_size);
}

std::vector<Track> FrameTracker::update(const std::vector<Detection>& detections,
                                        const std::vector<Embedding>& embeddings,
                                        FrameSize /* frame_size */) {
    if (!embeddings.empty() && embeddings.size() != detections.size()) {
        throw std::invalid_argument("FrameTracker: " + std::to_string(embeddings.size()) +
                                    " embeddings for " + std::to_string(detections.size()) +
                                    " detections");
    }

    expired_.clear();

    for (auto& [id, state] : tracks_) {
        state.age++;
        state.frames_since_match++;
    }

    // Every (track, detection) pair, best overlap first
    std::vector<Candidate> candidates;
    candidates.reserve(tracks_.size() * detections.size());
    for (const auto& [id, state] : tracks_) {
        for (size_t di = 0; di < detections.size(); ++di) {
            candidates.push_back({id, di, state.bbox.iou(detections[di].bbox)});
        }
    }
    std::stable_sort(candidates.begin(), candidates.end(),
        [](const Candidate& a, const Candidate& b) {
            if (a.iou != b.iou) return a.iou > b.iou;
            if (a.track_id != b.track_id) return a.track_id < b.track_id;
            return a.detection_index < b.detection_index;
        });

    std::vector<bool> claimed(detections.size(), false);
    std::vector<uint64_t> matched;

    for (const auto& c : candidates) {
        if (c.iou < config_.match_threshold || c.iou <= 0.0f) {
            break;
        }
        if (claimed[c.detection_index] ||
            std::find(matched.begin(), matched.end(), c.track_id) != matched.end()) {
            continue;
        }

        auto& state = tracks_[c.track_id];
        state.bbox = detections[c.detection_index].bbox;
        state.frames_since_match = 0;
        matched.push_back(c.track_id);
        claimed[c.detection_index] = true;
    }

    for (size_t di = 0; di < detections.size(); ++di) {
        if (claimed[di] || !detections[di].bbox.valid()) {
            continue;
        }
        uint64_t id = next_id_++;
        tracks_[id] = TrackState{detections[di].bbox, 1, 0};
        claimed[di] = true;
        FOOTFALL_LOG_TRACE("tracker", "New track {}", id);
    }

    for (auto it = tracks_.begin(); it != tracks_.end();) {
        if (it->second.frames_since_match > config_.max_age) {
            FOOTFALL_LOG_TRACE("tracker", "Track {} expired after {} frames",
                               it->first, it->second.age);
            expired_.push_back(it->first);
            it = tracks_.erase(it);
        } else {
            ++it;
        }
    }

    std::vector<Track> out;
    out.reserve(tracks_.size());

    for (const auto& [id, state] : tracks_) {
        Track track;
        track.track_id = id;
        track.bbox = state.bbox;

        // Appearance comes from whichever detection overlaps most this frame
        int best_index = -1;
        float best_iou = 0.0f;
        for (size_t di = 0; di < detections.size(); ++di) {
            float iou = state.bbox.iou(detections[di].bbox);
            if (iou > best_iou) {
                best_iou = iou;
                best_index = static_cast<int>(di);
            }
        }

        if (best_index >= 0) {
            track.confidence = detections[best_index].confidence;
            if (!embeddings.empty()) {
                track.embedding = embeddings[best_index];
            }
        } else {
            track.confidence = 1.0f;
        }

        out.push_back(std::move(track));
    }

    return out;
}

void FrameTracker::reset() {
    tracks_.clear();
    expired_.clear();
    next_id_ = 1;
}

}  // namespace footfall
