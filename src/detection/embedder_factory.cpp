#include "footfall/detection/embedder.hpp"
#include "footfall/detection/dnn_embedder.hpp"
#include "footfall/detection/histogram_embedder.hpp"
#include "footfall/core/config.hpp"
#include "footfall/core/logger.hpp"

#include <cmath>

namespace footfall {

cv::Mat crop_box(const cv::Mat& image, const BoundingBox& box) {
    if (image.empty()) {
        return cv::Mat();
    }

    cv::Rect rect(cv::Point(static_cast<int>(std::floor(box.x1)), static_cast<int>(std::floor(box.y1))),
                  cv::Point(static_cast<int>(std::ceil(box.x2)), static_cast<int>(std::ceil(box.y2))));
    rect &= cv::Rect(0, 0, image.cols, image.rows);
    if (rect.area() <= 0) {
        return cv::Mat();
    }
    return image(rect);
}

std::unique_ptr<IEmbedder> create_embedder(const Config& config) {
    EmbedderConfig ec;

    std::string backend_str = config.get_string("embedding.backend", "auto");
    if (backend_str == "dnn") ec.backend = EmbedderBackend::DNN;
    else if (backend_str == "histogram") ec.backend = EmbedderBackend::HISTOGRAM;
    else if (backend_str == "auto") ec.backend = EmbedderBackend::AUTO;
    else {
        FOOTFALL_LOG_ERROR("detection", "Unknown embedding backend '{}'", backend_str);
        return nullptr;
    }

    ec.model_path = config.get_string("embedding.model_path", "");
    ec.config_path = config.get_string("embedding.config_path", "");
    ec.input_width = config.get_uint("embedding.input_width", ec.input_width);
    ec.input_height = config.get_uint("embedding.input_height", ec.input_height);
    ec.scale = config.get_double("embedding.scale", ec.scale);
    ec.swap_rb = config.get_bool("embedding.swap_rb", ec.swap_rb);
    ec.hue_bins = config.get_int("embedding.histogram.hue_bins", ec.hue_bins);
    ec.saturation_bins = config.get_int("embedding.histogram.saturation_bins", ec.saturation_bins);

    return create_embedder(ec);
}

std::unique_ptr<IEmbedder> create_embedder(const EmbedderConfig& embedder_config) {
    EmbedderBackend backend = embedder_config.backend;

    if (backend == EmbedderBackend::AUTO) {
        backend = embedder_config.model_path.empty() ? EmbedderBackend::HISTOGRAM
                                                     : EmbedderBackend::DNN;
        FOOTFALL_LOG_INFO("detection", "Auto-selected embedding backend: {}", to_string(backend));
    }

    switch (backend) {
        case EmbedderBackend::DNN: {
            auto embedder = std::make_unique<DnnReidEmbedder>(embedder_config);
            if (!embedder->load_model()) {
                return nullptr;
            }
            return embedder;
        }

        case EmbedderBackend::HISTOGRAM:
            if (embedder_config.hue_bins <= 0 || embedder_config.saturation_bins <= 0) {
                FOOTFALL_LOG_ERROR("detection", "Histogram bins must be positive");
                return nullptr;
            }
            return std::make_unique<HistogramEmbedder>(embedder_config);

        default:
            FOOTFALL_LOG_ERROR("detection", "Could not determine embedding backend");
            break;
    }

    return nullptr;
}

}  // namespace footfall
