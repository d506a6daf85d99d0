#pragma once

#include "footfall/core/types.hpp"

#include <opencv2/core.hpp>

#include <memory>
#include <string>

namespace footfall {

class Config;

/**
 * @brief Embedding backend type
 */
enum class EmbedderBackend : uint8_t {
    AUTO = 0,   // DNN when a model is configured, else histogram
    DNN,        // cv::dnn re-identification network
    HISTOGRAM   // HSV colour histogram
};

inline const char* to_string(EmbedderBackend backend) {
    switch (backend) {
        case EmbedderBackend::AUTO: return "AUTO";
        case EmbedderBackend::DNN: return "DNN";
        case EmbedderBackend::HISTOGRAM: return "HISTOGRAM";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Embedding configuration
 */
struct EmbedderConfig {
    EmbedderBackend backend = EmbedderBackend::AUTO;

    // DNN
    std::string model_path;
    std::string config_path;
    uint32_t input_width = 64;
    uint32_t input_height = 128;
    double scale = 1.0;
    bool swap_rb = false;

    // Histogram
    int hue_bins = 16;
    int saturation_bins = 4;
};

/**
 * @brief Appearance embedder interface
 */
class IEmbedder {
public:
    virtual ~IEmbedder() = default;

    /**
     * @brief Compute an L2-normalized appearance vector for a person crop
     *
     * Empty or unusable crops yield a zero vector of dimension().
     */
    virtual Embedding embed(const cv::Mat& crop) = 0;

    virtual size_t dimension() const = 0;
    virtual EmbedderBackend backend() const = 0;
};

/**
 * @brief Create embedder from embedding.* settings
 *
 * @return Embedder or nullptr on failure
 */
std::unique_ptr<IEmbedder> create_embedder(const Config& config);

/**
 * @brief Create embedder with explicit configuration
 */
std::unique_ptr<IEmbedder> create_embedder(const EmbedderConfig& embedder_config);

/**
 * @brief Crop a detection box out of an image (shares pixels)
 *
 * Returns an empty matrix when the clamped box is empty.
 */
cv::Mat crop_box(const cv::Mat& image, const BoundingBox& box);

}  // namespace footfall
