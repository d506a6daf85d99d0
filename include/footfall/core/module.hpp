#pragma once

#include <string>

namespace footfall {

class Config;

/**
 * @brief Base interface for long-lived components
 *
 * Frame sources and the pipeline runner follow the same
 * initialize -> start -> stop lifecycle.
 */
class IModule {
public:
    virtual ~IModule() = default;

    /**
     * @brief Initialize module with configuration
     *
     * Called once before start(). Should validate configuration and
     * acquire resources (open devices, load models).
     *
     * @return true if initialization successful
     */
    virtual bool initialize(const Config& config) = 0;

    /**
     * @brief Start module operation
     */
    virtual void start() = 0;

    /**
     * @brief Stop module operation
     *
     * Must be safe to call multiple times.
     */
    virtual void stop() = 0;

    /**
     * @brief Check if module is currently running
     */
    virtual bool is_running() const = 0;

    /**
     * @brief Module name for logging
     */
    virtual std::string name() const = 0;
};

}  // namespace footfall
