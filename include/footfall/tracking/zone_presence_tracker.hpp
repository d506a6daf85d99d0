#pragma once

#include "footfall/core/types.hpp"

#include <cstdint>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace footfall {

/**
 * @brief Zones a track entered and left during one update
 */
struct ZoneTransitions {
    std::vector<std::string> entered;
    std::vector<std::string> exited;

    bool empty() const { return entered.empty() && exited.empty(); }
};

/**
 * @brief Per-track zone membership
 *
 * Diffs the set of zones containing a track's reference point against the
 * set recorded on the previous update of the same track.
 */
class ZonePresenceTracker {
public:
    /**
     * @brief Update membership of one track
     *
     * @param track_id Tracker id
     * @param point Reference point (box centroid)
     * @param zones Current zones
     * @return Zones entered (in zone order) and exited (in name order)
     */
    ZoneTransitions update(uint64_t track_id, const Point& point, const std::vector<Zone>& zones);

    /**
     * @brief Drop the membership of an expired track without emitting exits
     */
    void forget(uint64_t track_id);

    /**
     * @brief Zones the track was inside at its last update
     */
    std::set<std::string> membership(uint64_t track_id) const;

    size_t tracked_count() const { return membership_.size(); }

private:
    std::unordered_map<uint64_t, std::set<std::string>> membership_;
};

}  // namespace footfall
