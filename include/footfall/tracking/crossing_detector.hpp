#pragma once

#include "footfall/core/types.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace footfall {

/**
 * @brief Crossing detector configuration
 */
struct CrossingDetectorConfig {
    // Minimum time between two emitted events of the same track
    std::chrono::milliseconds debounce{750};
};

/**
 * @brief Directed-line crossing detector
 *
 * Remembers, per (track, line), the last nonzero side the track's reference
 * point was observed on. A change from -1 to +1 is an ENTRY, +1 to -1 an
 * EXIT. Samples exactly on a line keep the remembered side.
 *
 * At most one event per track per frame: the first line (in order) whose
 * crossing passes the debounce wins. Suppressed crossings still update side
 * memory but do not restart the debounce window.
 *
 * Not thread-safe; owned by the frame loop.
 */
class CrossingDetector {
public:
    explicit CrossingDetector(const CrossingDetectorConfig& config = CrossingDetectorConfig{});

    /**
     * @brief Adopt the current line set
     *
     * Side memory is keyed by line index. Entries survive only where the
     * new list holds an equal line at the same index.
     *
     * @return true if the line set changed
     */
    bool sync_lines(const std::vector<Line>& lines);

    /**
     * @brief Observe a track's reference point against the synced lines
     *
     * @param track_id Tracker id
     * @param point Reference point (box centroid)
     * @param now Frame timestamp
     * @return The emitted event, if any
     */
    std::optional<CrossEvent> update(uint64_t track_id, const Point& point, Timestamp now);

    /**
     * @brief Drop all memory of a track
     */
    void forget(uint64_t track_id);

    /**
     * @brief Remembered nonzero side of a track for a line (0 if none)
     */
    int remembered_side(uint64_t track_id, size_t line_index) const;

    const std::vector<Line>& lines() const { return lines_; }
    size_t memory_size() const { return sides_.size(); }

    void set_debounce(std::chrono::milliseconds debounce) { config_.debounce = debounce; }
    const CrossingDetectorConfig& config() const { return config_; }

private:
    using SideKey = std::pair<uint64_t, size_t>;  // (track id, line index)

    CrossingDetectorConfig config_;
    std::vector<Line> lines_;
    std::map<SideKey, int> sides_;
    std::unordered_map<uint64_t, Timestamp> last_event_;
};

}  // namespace footfall
