#include "footfall/tracking/crossing_detector.hpp"
#include "footfall/core/geometry.hpp"
#include "footfall/core/logger.hpp"

namespace footfall {

CrossingDetector::CrossingDetector(const CrossingDetectorConfig& config)
    : config_(config)
{
}

bool CrossingDetector::sync_lines(const std::vector<Line>& lines) {
    if (lines == lines_) {
        return false;
    }

    // Keep memory only where the same line still sits at the same index
    size_t dropped = 0;
    for (auto it = sides_.begin(); it != sides_.end();) {
        size_t index = it->first.second;
        if (index < lines.size() && index < lines_.size() && lines[index] == lines_[index]) {
            ++it;
        } else {
            it = sides_.erase(it);
            ++dropped;
        }
    }

    FOOTFALL_LOG_DEBUG("crossing", "Line set changed ({} -> {} lines), dropped {} side entries",
                       lines_.size(), lines.size(), dropped);
    lines_ = lines;
    return true;
}

std::optional<CrossEvent> CrossingDetector::update(uint64_t track_id,
                                                   const Point& point,
                                                   Timestamp now) {
    std::optional<CrossEvent> event;

    for (size_t index = 0; index < lines_.size(); ++index) {
        int side = side_of_line(point, lines_[index]);
        if (side == 0) {
            continue;
        }

        auto [it, inserted] = sides_.try_emplace(SideKey{track_id, index}, side);
        if (inserted) {
            continue;
        }

        int previous = it->second;
        it->second = side;

        if (previous == side || event) {
            continue;
        }

        auto last = last_event_.find(track_id);
        if (last != last_event_.end() && now - last->second < config_.debounce) {
            FOOTFALL_LOG_TRACE("crossing", "Track {} crossing of line {} debounced",
                               track_id, index);
            continue;
        }

        event = previous < side ? CrossEvent::ENTRY : CrossEvent::EXIT;
        last_event_[track_id] = now;
        FOOTFALL_LOG_DEBUG("crossing", "Track {} {} via line {}",
                           track_id, to_string(*event), index);
    }

    return event;
}

void CrossingDetector::forget(uint64_t track_id) {
    auto it = sides_.lower_bound(SideKey{track_id, 0});
    while (it != sides_.end() && it->first.first == track_id) {
        it = sides_.erase(it);
    }
    last_event_.erase(track_id);
}

int CrossingDetector::remembered_side(uint64_t track_id, size_t line_index) const {
    auto it = sides_.find(SideKey{track_id, line_index});
    return it == sides_.end() ? 0 : it->second;
}

}  // namespace footfall
