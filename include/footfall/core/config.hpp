#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace footfall {

/**
 * @brief Configuration management class
 *
 * Provides hierarchical configuration access with:
 * - YAML file loading
 * - Type-safe value retrieval with defaults
 * - Sequence indexing through numeric key segments ("scene.zones.0.name")
 * - Hot-reload of the loaded file
 * - Command-line override support
 */
class Config {
public:
    Config();
    ~Config();

    // Non-copyable, non-moveable (guards its own mutex)
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * @brief Load configuration from YAML file
     *
     * @param path Path to YAML file
     * @return true if loaded successfully
     */
    bool load(const std::string& path);

    /**
     * @brief Load configuration from an in-memory YAML document
     */
    bool load_string(const std::string& yaml);

    /**
     * @brief Reload configuration from previously loaded file
     *
     * Notifies wildcard ("*") watchers on success.
     *
     * @return true if reloaded successfully
     */
    bool reload();

    /**
     * @brief Get string value
     *
     * @param key Dot-separated key path (e.g., "capture.source")
     * @param default_value Value to return if key not found
     * @return Configuration value or default
     */
    std::string get_string(const std::string& key,
                           const std::string& default_value = "") const;

    int get_int(const std::string& key, int default_value = 0) const;
    uint32_t get_uint(const std::string& key, uint32_t default_value = 0) const;
    float get_float(const std::string& key, float default_value = 0.0f) const;
    double get_double(const std::string& key, double default_value = 0.0) const;
    bool get_bool(const std::string& key, bool default_value = false) const;

    std::vector<std::string> get_string_list(const std::string& key) const;
    std::vector<int> get_int_list(const std::string& key) const;
    std::vector<float> get_float_list(const std::string& key) const;

    /**
     * @brief Number of elements of a sequence node (0 if missing or not a sequence)
     */
    size_t size(const std::string& key) const;

    /**
     * @brief Check if key exists
     */
    bool has(const std::string& key) const;

    /**
     * @brief Set value (for runtime updates or command-line overrides)
     */
    template<typename T>
    void set(const std::string& key, const T& value);

    /**
     * @brief Override value from command line
     *
     * Command-line overrides take precedence over file values.
     */
    void override(const std::string& key, const std::string& value);

    /**
     * @brief Parse command-line arguments
     *
     * Supports --key=value, --key value and bare --flag formats.
     */
    void parse_args(int argc, char* argv[]);

    /**
     * @brief Register callback for configuration changes
     *
     * @param key Key to watch (or "*" for all changes)
     * @param callback Function to call on change
     */
    using ChangeCallback = std::function<void(const std::string& key)>;
    void on_change(const std::string& key, ChangeCallback callback);

    const std::string& file_path() const { return file_path_; }

private:
    std::string file_path_;

    struct Impl;
    std::unique_ptr<Impl> impl_;

    mutable std::mutex mutex_;

    std::unordered_map<std::string, std::vector<ChangeCallback>> callbacks_;
    std::unordered_map<std::string, std::string> overrides_;

    bool find_override(const std::string& key, std::string& value) const;
    void notify_change(const std::string& key);
};

/**
 * @brief Global configuration instance
 */
Config& global_config();

}  // namespace footfall
