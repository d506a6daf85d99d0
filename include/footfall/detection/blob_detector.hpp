#pragma once

#include "footfall/detection/detector.hpp"

namespace footfall {

/**
 * @brief Foreground-contour detector for static dark backgrounds
 *
 * Thresholds the gray image and reports the bounding box of every external
 * contour larger than the minimum area. Confidence is the contour's fill
 * ratio of its box. Pairs with the simulated frame source.
 */
class BlobDetector : public IPersonDetector {
public:
    explicit BlobDetector(const DetectorConfig& config);

    std::vector<Detection> detect(const cv::Mat& image, float confidence_threshold) override;

    DetectorBackend backend() const override { return DetectorBackend::BLOB; }
    DetectorStats get_stats() const override { return stats_; }

private:
    DetectorConfig config_;
    DetectorStats stats_;
};

}  // namespace footfall
