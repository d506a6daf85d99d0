#pragma once

#include "footfall/core/module.hpp"
#include "footfall/core/types.hpp"

#include <memory>
#include <string>

namespace footfall {

class Config;

/**
 * @brief Frame source type
 */
enum class SourceType : uint8_t {
    SIMULATION = 0,  // Synthetic walkers, no hardware needed
    FILE,            // Video file
    CAMERA,          // Local camera by index
    STREAM           // Network stream URL (RTSP/HTTP)
};

inline const char* to_string(SourceType type) {
    switch (type) {
        case SourceType::SIMULATION: return "SIMULATION";
        case SourceType::FILE: return "FILE";
        case SourceType::CAMERA: return "CAMERA";
        case SourceType::STREAM: return "STREAM";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Frame source configuration
 */
struct SourceConfig {
    SourceType type = SourceType::SIMULATION;

    std::string uri;             // File path or stream URL
    int camera_index = 0;
    bool loop_file = false;      // Restart files at end of stream

    // Requested (camera) or generated (simulation) geometry
    uint32_t width = 640;
    uint32_t height = 480;
    uint32_t fps = 15;
    bool realtime = true;        // Pace reads at fps

    // Simulation
    uint32_t walkers = 3;
    uint64_t frame_limit = 0;    // 0 = endless
};

/**
 * @brief Capture statistics
 */
struct SourceStats {
    uint64_t frames_read = 0;
    uint64_t read_failures = 0;
};

/**
 * @brief Pull-based frame source
 *
 * read() blocks until the next frame is available and returns nullptr at
 * end of stream or after stop().
 */
class IFrameSource : public IModule {
public:
    virtual ~IFrameSource() = default;

    /**
     * @brief Read the next frame
     *
     * @return Frame in BGR24, or nullptr at end of stream
     */
    virtual FramePtr read() = 0;

    /**
     * @brief Frame dimensions (known after initialize())
     */
    virtual FrameSize frame_size() const = 0;

    virtual SourceStats get_stats() const = 0;

    virtual const SourceConfig& config() const = 0;
};

/**
 * @brief Parse a source name ("simulation", "file", "camera", "stream")
 *
 * @return false for unknown names
 */
bool parse_source_type(const std::string& name, SourceType& type);

/**
 * @brief Create and initialize a frame source from capture.* settings
 *
 * @return Source or nullptr on failure
 */
std::unique_ptr<IFrameSource> create_frame_source(const Config& config);

/**
 * @brief Create (uninitialized) frame source from explicit configuration
 */
std::unique_ptr<IFrameSource> create_frame_source(const SourceConfig& source_config);

}  // namespace footfall
