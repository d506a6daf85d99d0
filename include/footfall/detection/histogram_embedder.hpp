#pragma once

#include "footfall/detection/embedder.hpp"

namespace footfall {

/**
 * @brief Hue/saturation histogram appearance descriptor
 *
 * hue_bins x saturation_bins bins over the crop in HSV, flattened and
 * L2-normalized. Cheap and model-free; separates differently coloured
 * clothing well enough for simulated scenes.
 */
class HistogramEmbedder : public IEmbedder {
public:
    explicit HistogramEmbedder(const EmbedderConfig& config);

    Embedding embed(const cv::Mat& crop) override;

    size_t dimension() const override {
        return static_cast<size_t>(config_.hue_bins) * static_cast<size_t>(config_.saturation_bins);
    }
    EmbedderBackend backend() const override { return EmbedderBackend::HISTOGRAM; }

private:
    EmbedderConfig config_;
};

}  // namespace footfall
