#pragma once

#include "footfall/core/types.hpp"

#include <opencv2/core.hpp>

namespace footfall {

/**
 * @brief Wrap frame pixels in a cv::Mat header without copying
 *
 * The returned matrix borrows the frame's buffer and must not outlive it.
 * Returns an empty matrix for invalid frames or unsupported formats.
 */
cv::Mat frame_to_mat(const Frame& frame);

/**
 * @brief Copy an 8-bit 1- or 3-channel image into a new frame
 *
 * @return Frame or nullptr for empty or unsupported images
 */
FramePtr mat_to_frame(const cv::Mat& image, uint64_t frame_id = 0);

}  // namespace footfall
