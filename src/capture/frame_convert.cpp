#include "footfall/capture/frame_convert.hpp"

namespace footfall {

cv::Mat frame_to_mat(const Frame& frame) {
    if (!frame.valid()) {
        return cv::Mat();
    }

    int type;
    switch (frame.metadata.format) {
        case PixelFormat::BGR24:
        case PixelFormat::RGB24:
            type = CV_8UC3;
            break;
        case PixelFormat::GRAY8:
            type = CV_8UC1;
            break;
        default:
            return cv::Mat();
    }

    size_t step = frame.metadata.stride > 0 ? frame.metadata.stride : cv::Mat::AUTO_STEP;
    return cv::Mat(static_cast<int>(frame.metadata.height),
                   static_cast<int>(frame.metadata.width),
                   type,
                   const_cast<uint8_t*>(frame.ptr()),
                   step);
}

FramePtr mat_to_frame(const cv::Mat& image, uint64_t frame_id) {
    if (image.empty() || image.depth() != CV_8U) {
        return nullptr;
    }

    PixelFormat format;
    if (image.channels() == 3) {
        format = PixelFormat::BGR24;
    } else if (image.channels() == 1) {
        format = PixelFormat::GRAY8;
    } else {
        return nullptr;
    }

    auto frame = std::make_shared<Frame>(static_cast<uint32_t>(image.cols),
                                         static_cast<uint32_t>(image.rows),
                                         format);
    frame->metadata.frame_id = frame_id;

    cv::Mat target = frame_to_mat(*frame);
    image.copyTo(target);
    return frame;
}

}  // namespace footfall
