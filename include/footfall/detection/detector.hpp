#pragma once

#include "footfall/core/types.hpp"

#include <opencv2/core.hpp>

#include <memory>
#include <string>
#include <vector>

namespace footfall {

class Config;

/**
 * @brief Detection backend type
 */
enum class DetectorBackend : uint8_t {
    AUTO = 0,   // DNN when a model is configured, else blob
    DNN,        // cv::dnn SSD-style person detector
    BLOB        // Foreground contours on a static dark background
};

inline const char* to_string(DetectorBackend backend) {
    switch (backend) {
        case DetectorBackend::AUTO: return "AUTO";
        case DetectorBackend::DNN: return "DNN";
        case DetectorBackend::BLOB: return "BLOB";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Detection configuration
 */
struct DetectorConfig {
    DetectorBackend backend = DetectorBackend::AUTO;

    // DNN
    std::string model_path;          // Weights (.xml, .onnx, .caffemodel, ...)
    std::string config_path;         // Network description, if separate
    uint32_t input_width = 544;
    uint32_t input_height = 320;
    double scale = 1.0;              // Pixel scale applied before inference
    float mean = 0.0f;               // Subtracted from every channel
    bool swap_rb = false;
    int person_label = 1;            // Class id of "person" in the model output

    // Blob
    int foreground_threshold = 60;   // Gray level separating walkers from background
    double min_area = 200.0;         // Minimum contour area, pixels
};

/**
 * @brief Detection statistics
 */
struct DetectorStats {
    uint64_t frames_processed = 0;
    Duration total_inference_time{0};

    Duration average_inference_time() const {
        return frames_processed > 0
            ? total_inference_time / static_cast<int64_t>(frames_processed)
            : Duration{0};
    }
};

/**
 * @brief Person detector interface
 */
class IPersonDetector {
public:
    virtual ~IPersonDetector() = default;

    /**
     * @brief Detect persons in a BGR image
     *
     * Boxes are clamped to the image; degenerate boxes are dropped.
     *
     * @param image BGR image
     * @param confidence_threshold Minimum detection confidence
     */
    virtual std::vector<Detection> detect(const cv::Mat& image, float confidence_threshold) = 0;

    virtual DetectorBackend backend() const = 0;
    virtual DetectorStats get_stats() const = 0;
};

/**
 * @brief Create detector from detection.* settings
 *
 * @return Detector or nullptr on failure
 */
std::unique_ptr<IPersonDetector> create_detector(const Config& config);

/**
 * @brief Create detector with explicit configuration
 */
std::unique_ptr<IPersonDetector> create_detector(const DetectorConfig& detector_config);

/**
 * @brief Clamp a box to the image bounds
 *
 * The result is invalid() when nothing of the box remains.
 */
BoundingBox clamp_box(const BoundingBox& box, int width, int height);

}  // namespace footfall
