#pragma once

#include "footfall/detection/detector.hpp"

#include <opencv2/dnn.hpp>

namespace footfall {

/**
 * @brief cv::dnn person detector for SSD-style networks
 *
 * Expects a single [1, 1, N, 7] output whose rows are
 * (image_id, label, confidence, x_min, y_min, x_max, y_max) with
 * coordinates normalized to [0, 1].
 */
class DnnPersonDetector : public IPersonDetector {
public:
    explicit DnnPersonDetector(const DetectorConfig& config);

    /**
     * @brief Load the network
     *
     * @return true if the model loaded
     */
    bool load_model();

    std::vector<Detection> detect(const cv::Mat& image, float confidence_threshold) override;

    DetectorBackend backend() const override { return DetectorBackend::DNN; }
    DetectorStats get_stats() const override { return stats_; }

    /**
     * @brief Convert a raw [1, 1, N, 7] network output to detections
     */
    static std::vector<Detection> parse_output(const cv::Mat& output,
                                               int image_width,
                                               int image_height,
                                               int person_label,
                                               float confidence_threshold);

private:
    DetectorConfig config_;
    cv::dnn::Net net_;
    bool loaded_ = false;
    DetectorStats stats_;
};

}  // namespace footfall
