#include "footfall/detection/histogram_embedder.hpp"
#include "footfall/core/geometry.hpp"

#include <opencv2/imgproc.hpp>

namespace footfall {

HistogramEmbedder::HistogramEmbedder(const EmbedderConfig& config)
    : config_(config)
{
}

Embedding HistogramEmbedder::embed(const cv::Mat& crop) {
    Embedding zero(dimension(), 0.0f);
    if (crop.empty() || crop.channels() != 3 || crop.depth() != CV_8U) {
        return zero;
    }

    cv::Mat hsv;
    cv::cvtColor(crop, hsv, cv::COLOR_BGR2HSV);

    const int channels[] = {0, 1};
    const int bins[] = {config_.hue_bins, config_.saturation_bins};
    const float hue_range[] = {0.0f, 180.0f};
    const float saturation_range[] = {0.0f, 256.0f};
    const float* ranges[] = {hue_range, saturation_range};

    cv::Mat hist;
    cv::calcHist(&hsv, 1, channels, cv::Mat(), hist, 2, bins, ranges, true, false);

    Embedding embedding(dimension());
    for (int h = 0; h < config_.hue_bins; ++h) {
        for (int s = 0; s < config_.saturation_bins; ++s) {
            embedding[static_cast<size_t>(h * config_.saturation_bins + s)] = hist.at<float>(h, s);
        }
    }

    return l2_normalize(embedding);
}

}  // namespace footfall
