#include "footfall/pipeline/scene.hpp"
#include "footfall/core/config.hpp"
#include "footfall/core/logger.hpp"

#include <algorithm>

namespace footfall {

namespace {

std::chrono::milliseconds seconds_to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0 + 0.5));
}

}  // namespace

void SceneRegistry::add_line(const Line& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(line);
    ++revision_;
}

void SceneRegistry::set_lines(const std::vector<Line>& lines) {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_ = lines;
    ++revision_;
}

bool SceneRegistry::remove_line(size_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= lines_.size()) {
        return false;
    }
    lines_.erase(lines_.begin() + static_cast<std::ptrdiff_t>(index));
    ++revision_;
    return true;
}

void SceneRegistry::add_zone(const Zone& zone) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(zones_.begin(), zones_.end(),
                           [&](const Zone& z) { return z.name() == zone.name(); });
    if (it != zones_.end()) {
        *it = zone;
    } else {
        zones_.push_back(zone);
    }
    ++revision_;
}

bool SceneRegistry::remove_zone(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(zones_.begin(), zones_.end(),
                           [&](const Zone& z) { return z.name() == name; });
    if (it == zones_.end()) {
        return false;
    }
    zones_.erase(it);
    ++revision_;
    return true;
}

void SceneRegistry::set_params(const TrackingParams& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    params_ = params;
    ++revision_;
}

TrackingParams SceneRegistry::params() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return params_;
}

std::vector<Line> SceneRegistry::lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
}

std::vector<Zone> SceneRegistry::zones() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return zones_;
}

SceneSnapshot SceneRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return SceneSnapshot{revision_, lines_, zones_, params_};
}

uint64_t SceneRegistry::revision() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return revision_;
}

void SceneRegistry::load(const Config& config) {
    TrackingParams defaults;
    TrackingParams params;
    params.detection_confidence =
        config.get_float("tracking.detection_confidence", defaults.detection_confidence);
    params.similarity_threshold =
        config.get_float("tracking.similarity_threshold", defaults.similarity_threshold);
    params.inactivity_timeout = seconds_to_ms(config.get_double(
        "tracking.inactivity_timeout", defaults.inactivity_timeout.count() / 1000.0));
    params.match_threshold =
        config.get_float("tracking.match_threshold", defaults.match_threshold);
    params.max_age = config.get_int("tracking.max_age", defaults.max_age);
    params.debounce = seconds_to_ms(config.get_double(
        "tracking.debounce", defaults.debounce.count() / 1000.0));

    std::vector<Line> lines;
    size_t line_count = config.size("scene.lines");
    for (size_t i = 0; i < line_count; ++i) {
        auto coords = config.get_float_list("scene.lines." + std::to_string(i));
        if (coords.size() != 4) {
            FOOTFALL_LOG_WARN("scene", "Skipping line {}: expected [x1, y1, x2, y2]", i);
            continue;
        }
        Line line{{coords[0], coords[1]}, {coords[2], coords[3]}};
        if (line.is_degenerate()) {
            FOOTFALL_LOG_WARN("scene", "Line {} is degenerate and will never fire", i);
        }
        lines.push_back(line);
    }

    std::vector<Zone> zones;
    size_t zone_count = config.size("scene.zones");
    for (size_t i = 0; i < zone_count; ++i) {
        std::string prefix = "scene.zones." + std::to_string(i);
        std::string name = config.get_string(prefix + ".name");
        auto coords = config.get_float_list(prefix + ".points");

        if (coords.size() % 2 != 0) {
            FOOTFALL_LOG_WARN("scene", "Skipping zone {}: odd number of coordinates", i);
            continue;
        }

        std::vector<Point> points;
        for (size_t c = 0; c + 1 < coords.size(); c += 2) {
            points.push_back({coords[c], coords[c + 1]});
        }

        try {
            Zone zone(name, points);
            auto it = std::find_if(zones.begin(), zones.end(),
                                   [&](const Zone& z) { return z.name() == zone.name(); });
            if (it != zones.end()) {
                *it = std::move(zone);
            } else {
                zones.push_back(std::move(zone));
            }
        } catch (const std::invalid_argument& e) {
            FOOTFALL_LOG_WARN("scene", "Skipping zone {}: {}", i, e.what());
        }
    }

    size_t loaded_lines = lines.size();
    size_t loaded_zones = zones.size();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_ = std::move(lines);
        zones_ = std::move(zones);
        params_ = params;
        ++revision_;
    }

    FOOTFALL_LOG_INFO("scene", "Scene loaded: {} lines, {} zones", loaded_lines, loaded_zones);
}

}  // namespace footfall
