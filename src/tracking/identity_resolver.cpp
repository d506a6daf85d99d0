#include "footfall/tracking/identity_resolver.hpp"
#include "footfall/core/geometry.hpp"
#include "footfall/core/logger.hpp"

namespace footfall {

IdentityResolver::IdentityResolver(const IdentityResolverConfig& config)
    : config_(config)
{
}

int IdentityResolver::assign_identity(uint64_t track_id, const Embedding& embedding) {
    Embedding normalized = l2_normalize(embedding);

    auto cached_it = track_to_person_.find(track_id);
    if (cached_it != track_to_person_.end()) {
        blend(cached_it->second, normalized);
        return cached_it->second;
    }

    if (gallery_.empty() || l2_norm(normalized) == 0.0f) {
        int person_id = create_identity(normalized);
        track_to_person_[track_id] = person_id;
        return person_id;
    }

    int best_id = 0;
    float best_similarity = -1.0f;
    for (const auto& [person_id, vector] : gallery_) {
        float similarity = cosine_similarity(normalized, vector);
        if (similarity > best_similarity) {
            best_similarity = similarity;
            best_id = person_id;
        }
    }

    if (best_id != 0 && best_similarity >= config_.similarity_threshold) {
        FOOTFALL_LOG_DEBUG("identity", "Track {} stitched to person {} (similarity {:.3f})",
                           track_id, best_id, best_similarity);
        track_to_person_[track_id] = best_id;
        blend(best_id, normalized);
        return best_id;
    }

    int person_id = create_identity(normalized);
    track_to_person_[track_id] = person_id;
    FOOTFALL_LOG_DEBUG("identity", "Track {} is new person {} (best similarity {:.3f})",
                       track_id, person_id, best_similarity);
    return person_id;
}

void IdentityResolver::release(uint64_t track_id) {
    track_to_person_.erase(track_id);
}

std::optional<int> IdentityResolver::cached(uint64_t track_id) const {
    auto it = track_to_person_.find(track_id);
    if (it == track_to_person_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Embedding> IdentityResolver::gallery(int person_id) const {
    auto it = gallery_.find(person_id);
    if (it == gallery_.end()) {
        return std::nullopt;
    }
    return it->second;
}

int IdentityResolver::create_identity(const Embedding& normalized) {
    int person_id = next_person_id_++;
    gallery_[person_id] = normalized;
    return person_id;
}

void IdentityResolver::blend(int person_id, const Embedding& normalized) {
    auto it = gallery_.find(person_id);
    if (it == gallery_.end()) {
        gallery_[person_id] = normalized;
        return;
    }

    Embedding& vector = it->second;
    if (normalized.size() != vector.size() || l2_norm(normalized) == 0.0f) {
        return;
    }

    const float momentum = config_.gallery_momentum;
    for (size_t i = 0; i < vector.size(); ++i) {
        vector[i] = momentum * vector[i] + (1.0f - momentum) * normalized[i];
    }
    vector = l2_normalize(vector);
}

}  // namespace footfall
