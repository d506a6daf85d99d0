#include "footfall/detection/dnn_detector.hpp"
#include "footfall/core/logger.hpp"

#include <cmath>

namespace footfall {

DnnPersonDetector::DnnPersonDetector(const DetectorConfig& config)
    : config_(config)
{
}

bool DnnPersonDetector::load_model() {
    if (config_.model_path.empty()) {
        FOOTFALL_LOG_ERROR("detection", "DnnPersonDetector: No model path specified");
        return false;
    }

    try {
        net_ = cv::dnn::readNet(config_.model_path, config_.config_path);
    } catch (const cv::Exception& e) {
        FOOTFALL_LOG_ERROR("detection", "DnnPersonDetector: Failed to load {}: {}",
                           config_.model_path, e.what());
        return false;
    }

    if (net_.empty()) {
        FOOTFALL_LOG_ERROR("detection", "DnnPersonDetector: Empty network from {}",
                           config_.model_path);
        return false;
    }

    loaded_ = true;
    FOOTFALL_LOG_INFO("detection", "DnnPersonDetector loaded {} (input {}x{})",
                      config_.model_path, config_.input_width, config_.input_height);
    return true;
}

std::vector<Detection> DnnPersonDetector::detect(const cv::Mat& image, float confidence_threshold) {
    if (!loaded_ || image.empty()) {
        return {};
    }

    auto start = Clock::now();

    cv::Mat output;
    try {
        cv::Mat blob = cv::dnn::blobFromImage(
            image, config_.scale,
            cv::Size(static_cast<int>(config_.input_width), static_cast<int>(config_.input_height)),
            cv::Scalar::all(config_.mean), config_.swap_rb, false);
        net_.setInput(blob);
        output = net_.forward();
    } catch (const cv::Exception& e) {
        FOOTFALL_LOG_ERROR("detection", "DnnPersonDetector: Inference failed: {}", e.what());
        return {};
    }

    stats_.frames_processed++;
    stats_.total_inference_time += Clock::now() - start;

    return parse_output(output, image.cols, image.rows, config_.person_label,
                        confidence_threshold);
}

std::vector<Detection> DnnPersonDetector::parse_output(const cv::Mat& output,
                                                       int image_width,
                                                       int image_height,
                                                       int person_label,
                                                       float confidence_threshold) {
    std::vector<Detection> detections;

    if (output.empty() || output.dims != 4 || output.size[3] != 7 ||
        output.type() != CV_32F) {
        return detections;
    }

    const int rows = output.size[2];
    cv::Mat table(rows, 7, CV_32F, const_cast<uchar*>(output.ptr()));

    for (int i = 0; i < rows; ++i) {
        const float* row = table.ptr<float>(i);
        int label = static_cast<int>(row[1]);
        float confidence = row[2];

        if (confidence < confidence_threshold || label != person_label) {
            continue;
        }

        BoundingBox box{std::floor(row[3] * image_width), std::floor(row[4] * image_height),
                        std::floor(row[5] * image_width), std::floor(row[6] * image_height)};
        box = clamp_box(box, image_width, image_height);
        if (!box.valid()) {
            continue;
        }

        detections.push_back(Detection{box, confidence});
    }

    return detections;
}

}  // namespace footfall
