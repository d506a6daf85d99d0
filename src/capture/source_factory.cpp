#include "footfall/capture/frame_source.hpp"
#include "footfall/capture/opencv_source.hpp"
#include "footfall/capture/sim_source.hpp"
#include "footfall/core/config.hpp"
#include "footfall/core/logger.hpp"

namespace footfall {

bool parse_source_type(const std::string& name, SourceType& type) {
    if (name == "simulation" || name == "sim") type = SourceType::SIMULATION;
    else if (name == "file") type = SourceType::FILE;
    else if (name == "camera" || name == "usb") type = SourceType::CAMERA;
    else if (name == "stream" || name == "rtsp") type = SourceType::STREAM;
    else return false;
    return true;
}

std::unique_ptr<IFrameSource> create_frame_source(const Config& config) {
    SourceConfig sc;

    std::string source_str = config.get_string("capture.source", "simulation");
    if (!parse_source_type(source_str, sc.type)) {
        FOOTFALL_LOG_ERROR("capture", "Unknown capture source '{}'", source_str);
        return nullptr;
    }

    sc.uri = config.get_string("capture.uri", "");
    sc.camera_index = config.get_int("capture.camera_index", 0);
    sc.loop_file = config.get_bool("capture.loop_file", false);
    sc.width = config.get_uint("capture.width", 640);
    sc.height = config.get_uint("capture.height", 480);
    sc.fps = config.get_uint("capture.fps", 15);
    sc.realtime = config.get_bool("capture.realtime", true);
    sc.walkers = config.get_uint("capture.simulation.walkers", 3);
    sc.frame_limit = config.get_uint("capture.simulation.frame_limit", 0);

    auto source = create_frame_source(sc);

    if (source) {
        if (!source->initialize(config)) {
            FOOTFALL_LOG_ERROR("capture", "Failed to initialize frame source");
            return nullptr;
        }
    }

    return source;
}

std::unique_ptr<IFrameSource> create_frame_source(const SourceConfig& source_config) {
    FOOTFALL_LOG_INFO("capture", "Creating frame source: {}", to_string(source_config.type));

    switch (source_config.type) {
        case SourceType::SIMULATION:
            return std::make_unique<SimFrameSource>(source_config);

        case SourceType::FILE:
        case SourceType::CAMERA:
        case SourceType::STREAM:
            return std::make_unique<OpenCvFrameSource>(source_config);

        default:
            FOOTFALL_LOG_ERROR("capture", "Could not determine frame source");
            break;
    }

    return nullptr;
}

}  // namespace footfall
