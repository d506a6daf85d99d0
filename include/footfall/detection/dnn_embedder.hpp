#pragma once

#include "footfall/detection/embedder.hpp"

#include <opencv2/dnn.hpp>

namespace footfall {

/**
 * @brief cv::dnn person re-identification embedder
 *
 * Resizes the crop to the network input, runs it and L2-normalizes the
 * flattened output. The dimension is probed once at load time.
 */
class DnnReidEmbedder : public IEmbedder {
public:
    explicit DnnReidEmbedder(const EmbedderConfig& config);

    /**
     * @brief Load the network and probe its output dimension
     *
     * @return true if the model loaded
     */
    bool load_model();

    Embedding embed(const cv::Mat& crop) override;

    size_t dimension() const override { return dimension_; }
    EmbedderBackend backend() const override { return EmbedderBackend::DNN; }

private:
    cv::Mat run(const cv::Mat& image);

    EmbedderConfig config_;
    cv::dnn::Net net_;
    size_t dimension_ = 0;
};

}  // namespace footfall
