#include "footfall/detection/dnn_embedder.hpp"
#include "footfall/core/geometry.hpp"
#include "footfall/core/logger.hpp"

namespace footfall {

DnnReidEmbedder::DnnReidEmbedder(const EmbedderConfig& config)
    : config_(config)
{
}

bool DnnReidEmbedder::load_model() {
    if (config_.model_path.empty()) {
        FOOTFALL_LOG_ERROR("detection", "DnnReidEmbedder: No model path specified");
        return false;
    }

    try {
        net_ = cv::dnn::readNet(config_.model_path, config_.config_path);
        if (net_.empty()) {
            FOOTFALL_LOG_ERROR("detection", "DnnReidEmbedder: Empty network from {}",
                               config_.model_path);
            return false;
        }

        cv::Mat probe(static_cast<int>(config_.input_height), static_cast<int>(config_.input_width),
                      CV_8UC3, cv::Scalar::all(0));
        dimension_ = run(probe).total();
    } catch (const cv::Exception& e) {
        FOOTFALL_LOG_ERROR("detection", "DnnReidEmbedder: Failed to load {}: {}",
                           config_.model_path, e.what());
        return false;
    }

    if (dimension_ == 0) {
        FOOTFALL_LOG_ERROR("detection", "DnnReidEmbedder: Network produced no output");
        return false;
    }

    FOOTFALL_LOG_INFO("detection", "DnnReidEmbedder loaded {} (dimension {})",
                      config_.model_path, dimension_);
    return true;
}

cv::Mat DnnReidEmbedder::run(const cv::Mat& image) {
    cv::Mat blob = cv::dnn::blobFromImage(
        image, config_.scale,
        cv::Size(static_cast<int>(config_.input_width), static_cast<int>(config_.input_height)),
        cv::Scalar(), config_.swap_rb, false);
    net_.setInput(blob);
    return net_.forward();
}

Embedding DnnReidEmbedder::embed(const cv::Mat& crop) {
    Embedding zero(dimension_, 0.0f);
    if (crop.empty() || dimension_ == 0) {
        return zero;
    }

    cv::Mat output;
    try {
        output = run(crop);
    } catch (const cv::Exception& e) {
        FOOTFALL_LOG_WARN("detection", "DnnReidEmbedder: Inference failed: {}", e.what());
        return zero;
    }

    if (output.total() != dimension_ || output.depth() != CV_32F) {
        return zero;
    }

    const float* data = output.ptr<float>();
    return l2_normalize(Embedding(data, data + dimension_));
}

}  // namespace footfall
