#include "footfall/detection/blob_detector.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>

namespace footfall {

BlobDetector::BlobDetector(const DetectorConfig& config)
    : config_(config)
{
}

std::vector<Detection> BlobDetector::detect(const cv::Mat& image, float confidence_threshold) {
    std::vector<Detection> detections;
    if (image.empty()) {
        return detections;
    }

    auto start = Clock::now();

    cv::Mat gray;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = image;
    }

    cv::Mat mask;
    cv::threshold(gray, mask, config_.foreground_threshold, 255, cv::THRESH_BINARY);

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(mask, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    for (const auto& contour : contours) {
        double area = cv::contourArea(contour);
        if (area < config_.min_area) {
            continue;
        }

        cv::Rect rect = cv::boundingRect(contour);
        // Contour area of a filled w x h rectangle is (w - 1) x (h - 1)
        double rect_area = std::max(1, rect.width - 1) * static_cast<double>(std::max(1, rect.height - 1));
        float confidence = static_cast<float>(std::min(1.0, area / rect_area));
        if (confidence < confidence_threshold) {
            continue;
        }

        BoundingBox box{static_cast<float>(rect.x), static_cast<float>(rect.y),
                        static_cast<float>(rect.x + rect.width),
                        static_cast<float>(rect.y + rect.height)};
        box = clamp_box(box, image.cols, image.rows);
        if (box.valid()) {
            detections.push_back(Detection{box, confidence});
        }
    }

    // findContours order is not spatial; sort for stable detection indices
    std::sort(detections.begin(), detections.end(), [](const Detection& a, const Detection& b) {
        if (a.bbox.x1 != b.bbox.x1) return a.bbox.x1 < b.bbox.x1;
        return a.bbox.y1 < b.bbox.y1;
    });

    stats_.frames_processed++;
    stats_.total_inference_time += Clock::now() - start;

    return detections;
}

}  // namespace footfall
