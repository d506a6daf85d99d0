#pragma once

#include "footfall/core/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <unordered_map>

namespace footfall {

/**
 * @brief Identity resolver configuration
 */
struct IdentityResolverConfig {
    float similarity_threshold = 0.62f;  // Minimum cosine similarity to reuse an identity
    float gallery_momentum = 0.8f;       // EMA weight of the existing gallery vector
};

/**
 * @brief Maps per-run track ids to persistent person identities
 *
 * Each identity keeps one L2-normalized gallery vector, refreshed with an
 * exponential moving average every time one of its tracks is seen. A new
 * track is bound to the most similar identity when the cosine similarity
 * reaches the threshold, otherwise it founds a new identity.
 *
 * Never throws. Empty or all-zero embeddings cannot match any identity.
 * Not thread-safe; owned by the frame loop.
 */
class IdentityResolver {
public:
    explicit IdentityResolver(const IdentityResolverConfig& config = IdentityResolverConfig{});

    /**
     * @brief Resolve the global person id of a track
     *
     * @param track_id Tracker id
     * @param embedding Appearance of the track this frame
     * @return Global person id (sequential from 1)
     */
    int assign_identity(uint64_t track_id, const Embedding& embedding);

    /**
     * @brief Forget the binding of an expired track
     *
     * The identity and its gallery vector stay.
     */
    void release(uint64_t track_id);

    /**
     * @brief Cached identity of a track, if it was resolved before
     */
    std::optional<int> cached(uint64_t track_id) const;

    /**
     * @brief Copy of an identity's gallery vector
     */
    std::optional<Embedding> gallery(int person_id) const;

    size_t identity_count() const { return gallery_.size(); }

    void set_similarity_threshold(float threshold) { config_.similarity_threshold = threshold; }
    const IdentityResolverConfig& config() const { return config_; }

private:
    int create_identity(const Embedding& normalized);
    void blend(int person_id, const Embedding& normalized);

    IdentityResolverConfig config_;
    int next_person_id_ = 1;
    std::unordered_map<uint64_t, int> track_to_person_;
    std::map<int, Embedding> gallery_;  // Ordered so equal similarities favour the oldest identity
};

}  // namespace footfall
