#include "footfall/pipeline/pipeline.hpp"
#include "footfall/core/logger.hpp"

#include <stdexcept>
#include <string>

namespace footfall {

JourneyPipeline::JourneyPipeline() = default;

void JourneyPipeline::apply(const TrackingParams& params) {
    tracker_.set_match_threshold(params.match_threshold);
    tracker_.set_max_age(params.max_age);
    identities_.set_similarity_threshold(params.similarity_threshold);
    crossings_.set_debounce(params.debounce);
    sessions_.set_inactivity_timeout(params.inactivity_timeout);
}

FrameResult JourneyPipeline::process(const std::vector<Detection>& detections,
                                     const std::vector<Embedding>& embeddings,
                                     FrameSize frame_size,
                                     const SceneSnapshot& scene,
                                     Timestamp now) {
    if (embeddings.size() != detections.size()) {
        throw std::invalid_argument("JourneyPipeline: " + std::to_string(embeddings.size()) +
                                    " embeddings for " + std::to_string(detections.size()) +
                                    " detections");
    }

    apply(scene.params);
    crossings_.sync_lines(scene.lines);

    std::vector<Track> tracks = tracker_.update(detections, embeddings, frame_size);

    for (uint64_t id : tracker_.expired()) {
        // A track lost inside a zone leaves it
        if (auto person = identities_.cached(id)) {
            for (const auto& name : zones_.membership(id)) {
                sessions_.on_zone_exit(*person, name, now);
            }
        }
        identities_.release(id);
        crossings_.forget(id);
        zones_.forget(id);
    }

    FrameResult result;
    result.tracks.reserve(tracks.size());

    for (auto& track : tracks) {
        track.global_person_id = identities_.assign_identity(track.track_id, track.embedding);
        int person = track.global_person_id;

        sessions_.observe(person, now);

        Point reference = track.bbox.centroid();

        if (!scene.lines.empty()) {
            track.cross_event = crossings_.update(track.track_id, reference, now);
            if (track.cross_event == CrossEvent::ENTRY) {
                sessions_.on_entry(person, now);
                result.entries++;
            } else if (track.cross_event == CrossEvent::EXIT) {
                sessions_.on_exit(person, now);
                result.exits++;
            }
        }

        if (!scene.zones.empty() || zones_.tracked_count() > 0) {
            ZoneTransitions transitions = zones_.update(track.track_id, reference, scene.zones);
            for (const auto& name : transitions.entered) {
                sessions_.on_zone_entry(person, name, now);
            }
            for (const auto& name : transitions.exited) {
                sessions_.on_zone_exit(person, name, now);
            }
        }

        track.session_id = sessions_.session_id(person);

        result.tracks.push_back(AnnotatedTrack{track.track_id, track.bbox, track.global_person_id,
                                               track.session_id, track.cross_event});
    }

    sessions_.mark_inactive_if_not_seen(now);

    result.sessions = sessions_.all_sessions();
    for (const auto& session : result.sessions) {
        if (session.state() == SessionState::ACTIVE) {
            result.active_sessions++;
        }
    }

    frames_processed_++;

    if (result.entries > 0 || result.exits > 0) {
        FOOTFALL_LOG_DEBUG("pipeline", "Frame {}: {} tracks, +{} entries, +{} exits",
                           frames_processed_, result.tracks.size(), result.entries, result.exits);
    }

    return result;
}

}  // namespace footfall
