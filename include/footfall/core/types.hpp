#pragma once

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace footfall {

// ============================================================================
// Time Types
// ============================================================================

// Monotonic clock for frame pacing and statistics
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;
using Milliseconds = std::chrono::milliseconds;

// Wall clock for session timestamps (reported to consumers)
using WallClock = std::chrono::system_clock;
using Timestamp = WallClock::time_point;
using Seconds = std::chrono::duration<double>;

inline double to_epoch_seconds(Timestamp t) {
    return std::chrono::duration_cast<Seconds>(t.time_since_epoch()).count();
}

// ============================================================================
// Pixel Format
// ============================================================================
enum class PixelFormat : uint8_t {
    UNKNOWN = 0,
    BGR24,
    RGB24,
    GRAY8
};

inline constexpr size_t bytes_per_pixel(PixelFormat format) {
    switch (format) {
        case PixelFormat::BGR24:
        case PixelFormat::RGB24:
            return 3;
        case PixelFormat::GRAY8:
            return 1;
        default:
            return 0;
    }
}

// ============================================================================
// Frame
// ============================================================================
struct FrameSize {
    uint32_t width = 0;
    uint32_t height = 0;
};

struct FrameMetadata {
    uint64_t frame_id = 0;
    TimePoint timestamp = Clock::now();
    uint32_t width = 0;
    uint32_t height = 0;
    PixelFormat format = PixelFormat::UNKNOWN;
    uint32_t stride = 0;  // Bytes per row (may include padding)

    size_t data_size() const {
        if (stride > 0) {
            return static_cast<size_t>(stride) * height;
        }
        return static_cast<size_t>(width) * height * bytes_per_pixel(format);
    }
};

struct Frame {
    FrameMetadata metadata;
    std::shared_ptr<uint8_t[]> data;

    Frame() = default;

    Frame(uint32_t width, uint32_t height, PixelFormat format)
        : metadata{0, Clock::now(), width, height, format, 0}
    {
        data = std::shared_ptr<uint8_t[]>(new uint8_t[metadata.data_size()]);
    }

    bool valid() const {
        return data != nullptr && metadata.width > 0 && metadata.height > 0;
    }

    FrameSize size() const { return {metadata.width, metadata.height}; }
    uint8_t* ptr() { return data.get(); }
    const uint8_t* ptr() const { return data.get(); }
};

using FramePtr = std::shared_ptr<Frame>;

// ============================================================================
// Geometry Primitives
// ============================================================================
struct Point {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const { return !(*this == other); }
};

/**
 * @brief Axis-aligned box in absolute pixel coordinates (x1,y1 top-left)
 */
struct BoundingBox {
    float x1 = 0.0f;
    float y1 = 0.0f;
    float x2 = 0.0f;
    float y2 = 0.0f;

    float width() const { return std::max(0.0f, x2 - x1); }
    float height() const { return std::max(0.0f, y2 - y1); }
    float area() const { return width() * height(); }

    bool valid() const { return x2 > x1 && y2 > y1; }

    Point centroid() const {
        return {(static_cast<double>(x1) + x2) / 2.0, (static_cast<double>(y1) + y2) / 2.0};
    }

    // Intersection over Union, 0 for disjoint or degenerate boxes
    float iou(const BoundingBox& other) const {
        float ix1 = std::max(x1, other.x1);
        float iy1 = std::max(y1, other.y1);
        float ix2 = std::min(x2, other.x2);
        float iy2 = std::min(y2, other.y2);

        float inter_area = std::max(0.0f, ix2 - ix1) * std::max(0.0f, iy2 - iy1);
        if (inter_area <= 0.0f) {
            return 0.0f;
        }

        float union_area = area() + other.area() - inter_area;
        return union_area > 0.0f ? inter_area / union_area : 0.0f;
    }
};

/**
 * @brief Directed boundary line
 *
 * Point order defines direction: moving from the negative to the positive
 * side of (p1 -> p2) is an entry.
 */
struct Line {
    Point p1;
    Point p2;

    bool is_degenerate() const { return p1 == p2; }

    bool operator==(const Line& other) const { return p1 == other.p1 && p2 == other.p2; }
    bool operator!=(const Line& other) const { return !(*this == other); }
};

/**
 * @brief Named quadrilateral region
 *
 * @throws std::invalid_argument unless given a non-empty name and exactly 4 points
 */
class Zone {
public:
    static constexpr size_t kCornerCount = 4;

    Zone(std::string name, const std::vector<Point>& points)
        : name_(std::move(name))
    {
        if (name_.empty()) {
            throw std::invalid_argument("Zone name must not be empty");
        }
        if (points.size() != kCornerCount) {
            throw std::invalid_argument("Zone '" + name_ + "' must have exactly 4 points, got " +
                                        std::to_string(points.size()));
        }
        std::copy(points.begin(), points.end(), points_.begin());
    }

    const std::string& name() const { return name_; }
    const std::array<Point, kCornerCount>& points() const { return points_; }

    bool operator==(const Zone& other) const {
        return name_ == other.name_ && points_ == other.points_;
    }

private:
    std::string name_;
    std::array<Point, kCornerCount> points_;
};

// ============================================================================
// Detection / Tracking
// ============================================================================

// Appearance descriptor; an empty vector is the neutral "no appearance" value
using Embedding = std::vector<float>;

struct Detection {
    BoundingBox bbox;
    float confidence = 0.0f;
};

enum class CrossEvent : uint8_t {
    ENTRY = 0,
    EXIT
};

inline const char* to_string(CrossEvent event) {
    switch (event) {
        case CrossEvent::ENTRY: return "ENTRY";
        case CrossEvent::EXIT: return "EXIT";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Per-frame tracker output, annotated further down the pipeline
 */
struct Track {
    uint64_t track_id = 0;
    BoundingBox bbox;
    float confidence = 0.0f;
    Embedding embedding;

    // Filled by the pipeline
    int global_person_id = 0;
    std::optional<std::string> session_id;
    std::optional<CrossEvent> cross_event;
};

/**
 * @brief Track as handed to external consumers (no embedding)
 */
struct AnnotatedTrack {
    uint64_t track_id = 0;
    BoundingBox bbox;
    int global_person_id = 0;
    std::optional<std::string> session_id;
    std::optional<CrossEvent> cross_event;
};

}  // namespace footfall
