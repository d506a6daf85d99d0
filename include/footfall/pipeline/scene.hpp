#pragma once

#include "footfall/core/types.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace footfall {

class Config;

/**
 * @brief Tunable tracking parameters
 */
struct TrackingParams {
    float detection_confidence = 0.55f;
    float similarity_threshold = 0.62f;
    std::chrono::milliseconds inactivity_timeout{5000};
    float match_threshold = 0.3f;
    int max_age = 15;
    std::chrono::milliseconds debounce{750};
};

/**
 * @brief Consistent copy of the scene at one revision
 */
struct SceneSnapshot {
    uint64_t revision = 0;
    std::vector<Line> lines;
    std::vector<Zone> zones;
    TrackingParams params;
};

/**
 * @brief Runtime configuration surface of the pipeline
 *
 * Lines, zones and tracking parameters may be changed from any thread
 * between frames. The frame loop reads one snapshot per frame.
 */
class SceneRegistry {
public:
    void add_line(const Line& line);
    void set_lines(const std::vector<Line>& lines);

    /**
     * @return false if index is out of range
     */
    bool remove_line(size_t index);

    /**
     * @brief Add a zone, replacing any zone with the same name
     */
    void add_zone(const Zone& zone);

    /**
     * @return false if no zone has that name
     */
    bool remove_zone(const std::string& name);

    void set_params(const TrackingParams& params);
    TrackingParams params() const;

    std::vector<Line> lines() const;
    std::vector<Zone> zones() const;

    SceneSnapshot snapshot() const;
    uint64_t revision() const;

    /**
     * @brief Replace lines, zones and parameters from configuration
     *
     * Reads scene.lines ([x1, y1, x2, y2] per line), scene.zones
     * ({name, points: [x1, y1, ..., x4, y4]} per zone) and tracking.*.
     * Malformed entries are logged and skipped.
     */
    void load(const Config& config);

private:
    mutable std::mutex mutex_;
    uint64_t revision_ = 0;
    std::vector<Line> lines_;
    std::vector<Zone> zones_;
    TrackingParams params_;
};

}  // namespace footfall
