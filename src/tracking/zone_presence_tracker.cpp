#include "footfall/tracking/zone_presence_tracker.hpp"
#include "footfall/core/geometry.hpp"

namespace footfall {

ZoneTransitions ZonePresenceTracker::update(uint64_t track_id,
                                            const Point& point,
                                            const std::vector<Zone>& zones) {
    ZoneTransitions transitions;
    std::set<std::string> current;

    auto previous_it = membership_.find(track_id);
    const std::set<std::string> empty;
    const std::set<std::string>& previous =
        previous_it != membership_.end() ? previous_it->second : empty;

    for (const auto& zone : zones) {
        if (!point_in_zone(point, zone)) {
            continue;
        }
        if (current.insert(zone.name()).second && previous.count(zone.name()) == 0) {
            transitions.entered.push_back(zone.name());
        }
    }

    for (const auto& name : previous) {
        if (current.count(name) == 0) {
            transitions.exited.push_back(name);
        }
    }

    if (current.empty()) {
        membership_.erase(track_id);
    } else {
        membership_[track_id] = std::move(current);
    }

    return transitions;
}

void ZonePresenceTracker::forget(uint64_t track_id) {
    membership_.erase(track_id);
}

std::set<std::string> ZonePresenceTracker::membership(uint64_t track_id) const {
    auto it = membership_.find(track_id);
    if (it == membership_.end()) {
        return {};
    }
    return it->second;
}

}  // namespace footfall
