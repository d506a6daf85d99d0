#include "footfall/detection/detector.hpp"
#include "footfall/detection/blob_detector.hpp"
#include "footfall/detection/dnn_detector.hpp"
#include "footfall/core/config.hpp"
#include "footfall/core/logger.hpp"

#include <algorithm>

namespace footfall {

BoundingBox clamp_box(const BoundingBox& box, int width, int height) {
    float max_x = static_cast<float>(std::max(0, width));
    float max_y = static_cast<float>(std::max(0, height));
    return BoundingBox{std::clamp(box.x1, 0.0f, max_x), std::clamp(box.y1, 0.0f, max_y),
                       std::clamp(box.x2, 0.0f, max_x), std::clamp(box.y2, 0.0f, max_y)};
}

std::unique_ptr<IPersonDetector> create_detector(const Config& config) {
    DetectorConfig dc;

    std::string backend_str = config.get_string("detection.backend", "auto");
    if (backend_str == "dnn") dc.backend = DetectorBackend::DNN;
    else if (backend_str == "blob") dc.backend = DetectorBackend::BLOB;
    else if (backend_str == "auto") dc.backend = DetectorBackend::AUTO;
    else {
        FOOTFALL_LOG_ERROR("detection", "Unknown detection backend '{}'", backend_str);
        return nullptr;
    }

    dc.model_path = config.get_string("detection.model_path", "");
    dc.config_path = config.get_string("detection.config_path", "");
    dc.input_width = config.get_uint("detection.input_width", dc.input_width);
    dc.input_height = config.get_uint("detection.input_height", dc.input_height);
    dc.scale = config.get_double("detection.scale", dc.scale);
    dc.mean = config.get_float("detection.mean", dc.mean);
    dc.swap_rb = config.get_bool("detection.swap_rb", dc.swap_rb);
    dc.person_label = config.get_int("detection.person_label", dc.person_label);
    dc.foreground_threshold = config.get_int("detection.blob.threshold", dc.foreground_threshold);
    dc.min_area = config.get_double("detection.blob.min_area", dc.min_area);

    return create_detector(dc);
}

std::unique_ptr<IPersonDetector> create_detector(const DetectorConfig& detector_config) {
    DetectorBackend backend = detector_config.backend;

    if (backend == DetectorBackend::AUTO) {
        backend = detector_config.model_path.empty() ? DetectorBackend::BLOB : DetectorBackend::DNN;
        FOOTFALL_LOG_INFO("detection", "Auto-selected detector backend: {}", to_string(backend));
    }

    switch (backend) {
        case DetectorBackend::DNN: {
            auto detector = std::make_unique<DnnPersonDetector>(detector_config);
            if (!detector->load_model()) {
                return nullptr;
            }
            return detector;
        }

        case DetectorBackend::BLOB:
            return std::make_unique<BlobDetector>(detector_config);

        default:
            FOOTFALL_LOG_ERROR("detection", "Could not determine detector backend");
            break;
    }

    return nullptr;
}

}  // namespace footfall
