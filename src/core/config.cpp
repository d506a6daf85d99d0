#include "footfall/core/config.hpp"
#include "footfall/core/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace footfall {

// ============================================================================
// Implementation details
// ============================================================================

namespace {

std::vector<std::string> split_key(const std::string& key) {
    std::vector<std::string> parts;
    std::stringstream ss(key);
    std::string part;
    while (std::getline(ss, part, '.')) {
        parts.push_back(part);
    }
    return parts;
}

bool is_index(const std::string& part) {
    return !part.empty() &&
           std::all_of(part.begin(), part.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

}  // namespace

struct Config::Impl {
    YAML::Node root;

    static YAML::Node child(const YAML::Node& parent, const std::string& part) {
        if (parent.IsMap()) {
            return parent[part];
        }
        if (parent.IsSequence() && is_index(part)) {
            size_t index = std::stoul(part);
            if (index < parent.size()) {
                return parent[index];
            }
        }
        return YAML::Node(YAML::NodeType::Undefined);
    }

    // Rebinds with reset() instead of operator=, which would write through
    // to the underlying tree.
    YAML::Node navigate(const std::string& key) const {
        YAML::Node current(root);

        for (const auto& p : split_key(key)) {
            YAML::Node next = child(current, p);
            if (!next.IsDefined()) {
                return YAML::Node(YAML::NodeType::Undefined);
            }
            current.reset(next);
        }

        return current;
    }

    template<typename T>
    bool scalar(const std::string& key, T& out) const {
        try {
            auto node = navigate(key);
            if (node && node.IsScalar()) {
                out = node.template as<T>();
                return true;
            }
        } catch (const YAML::Exception& e) {
            FOOTFALL_LOG_DEBUG("config", "Key '{}' has wrong type: {}", key, e.what());
        }
        return false;
    }

    template<typename T>
    std::vector<T> list(const std::string& key) const {
        std::vector<T> result;
        try {
            auto node = navigate(key);
            if (node && node.IsSequence()) {
                for (const auto& item : node) {
                    result.push_back(item.template as<T>());
                }
            }
        } catch (const YAML::Exception& e) {
            FOOTFALL_LOG_DEBUG("config", "Key '{}' is not a valid list: {}", key, e.what());
            result.clear();
        }
        return result;
    }
};

Config::Config() = default;
Config::~Config() = default;

// ============================================================================
// Config Implementation
// ============================================================================

bool Config::load(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        auto impl = std::make_unique<Impl>();
        impl->root = YAML::LoadFile(path);
        impl_ = std::move(impl);
        file_path_ = path;

        FOOTFALL_LOG_INFO("config", "Loaded configuration from: {}", path);
        return true;
    } catch (const YAML::Exception& e) {
        FOOTFALL_LOG_ERROR("config", "Failed to load config from {}: {}", path, e.what());
        return false;
    }
}

bool Config::load_string(const std::string& yaml) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        auto impl = std::make_unique<Impl>();
        impl->root = YAML::Load(yaml);
        impl_ = std::move(impl);
        return true;
    } catch (const YAML::Exception& e) {
        FOOTFALL_LOG_ERROR("config", "Failed to parse config: {}", e.what());
        return false;
    }
}

bool Config::reload() {
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (file_path_.empty() || !impl_) {
            return false;
        }

        try {
            impl_->root = YAML::LoadFile(file_path_);
        } catch (const YAML::Exception& e) {
            FOOTFALL_LOG_ERROR("config", "Failed to reload config: {}", e.what());
            return false;
        }
    }

    FOOTFALL_LOG_INFO("config", "Reloaded configuration from: {}", file_path_);
    notify_change("*");
    return true;
}

bool Config::find_override(const std::string& key, std::string& value) const {
    auto it = overrides_.find(key);
    if (it == overrides_.end()) {
        return false;
    }
    value = it->second;
    return true;
}

std::string Config::get_string(const std::string& key,
                               const std::string& default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string value;
    if (find_override(key, value)) {
        return value;
    }

    if (impl_ && impl_->scalar(key, value)) {
        return value;
    }
    return default_value;
}

int Config::get_int(const std::string& key, int default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string raw;
    if (find_override(key, raw)) {
        try {
            return std::stoi(raw);
        } catch (const std::exception&) {
            FOOTFALL_LOG_WARN("config", "Override {}='{}' is not an integer", key, raw);
        }
    }

    int value = default_value;
    if (impl_ && impl_->scalar(key, value)) {
        return value;
    }
    return default_value;
}

uint32_t Config::get_uint(const std::string& key, uint32_t default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string raw;
    if (find_override(key, raw)) {
        try {
            return static_cast<uint32_t>(std::stoul(raw));
        } catch (const std::exception&) {
            FOOTFALL_LOG_WARN("config", "Override {}='{}' is not an unsigned integer", key, raw);
        }
    }

    uint32_t value = default_value;
    if (impl_ && impl_->scalar(key, value)) {
        return value;
    }
    return default_value;
}

float Config::get_float(const std::string& key, float default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string raw;
    if (find_override(key, raw)) {
        try {
            return std::stof(raw);
        } catch (const std::exception&) {
            FOOTFALL_LOG_WARN("config", "Override {}='{}' is not a number", key, raw);
        }
    }

    float value = default_value;
    if (impl_ && impl_->scalar(key, value)) {
        return value;
    }
    return default_value;
}

double Config::get_double(const std::string& key, double default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string raw;
    if (find_override(key, raw)) {
        try {
            return std::stod(raw);
        } catch (const std::exception&) {
            FOOTFALL_LOG_WARN("config", "Override {}='{}' is not a number", key, raw);
        }
    }

    double value = default_value;
    if (impl_ && impl_->scalar(key, value)) {
        return value;
    }
    return default_value;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string raw;
    if (find_override(key, raw)) {
        std::transform(raw.begin(), raw.end(), raw.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return raw == "true" || raw == "1" || raw == "yes";
    }

    bool value = default_value;
    if (impl_ && impl_->scalar(key, value)) {
        return value;
    }
    return default_value;
}

std::vector<std::string> Config::get_string_list(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!impl_) return {};
    return impl_->list<std::string>(key);
}

std::vector<int> Config::get_int_list(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!impl_) return {};
    return impl_->list<int>(key);
}

std::vector<float> Config::get_float_list(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!impl_) return {};
    return impl_->list<float>(key);
}

size_t Config::size(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!impl_) return 0;

    auto node = impl_->navigate(key);
    return (node && node.IsSequence()) ? node.size() : 0;
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (overrides_.find(key) != overrides_.end()) {
        return true;
    }
    if (!impl_) return false;

    auto node = impl_->navigate(key);
    return node.IsDefined() && !node.IsNull();
}

template<typename T>
void Config::set(const std::string& key, const T& value) {
    std::stringstream ss;
    ss << value;
    override(key, ss.str());
}

// Explicit instantiations
template void Config::set<int>(const std::string&, const int&);
template void Config::set<float>(const std::string&, const float&);
template void Config::set<double>(const std::string&, const double&);
template void Config::set<bool>(const std::string&, const bool&);
template void Config::set<std::string>(const std::string&, const std::string&);

void Config::override(const std::string& key, const std::string& value) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        overrides_[key] = value;
    }
    notify_change(key);
}

void Config::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.substr(0, 2) != "--") {
            continue;
        }

        arg = arg.substr(2);
        auto eq_pos = arg.find('=');

        std::string key, value;

        if (eq_pos != std::string::npos) {
            key = arg.substr(0, eq_pos);
            value = arg.substr(eq_pos + 1);
        } else if (i + 1 < argc && argv[i + 1][0] != '-') {
            key = arg;
            value = argv[++i];
        } else {
            // Boolean flag
            key = arg;
            value = "true";
        }

        // Dashes separate nested keys on the command line
        std::replace(key.begin(), key.end(), '-', '.');

        override(key, value);
        FOOTFALL_LOG_DEBUG("config", "Config override: {} = {}", key, value);
    }
}

void Config::on_change(const std::string& key, ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_[key].push_back(std::move(callback));
}

void Config::notify_change(const std::string& key) {
    // Callbacks run unlocked so they may read the config back
    std::vector<ChangeCallback> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = callbacks_.find(key);
        if (it != callbacks_.end()) {
            to_call.insert(to_call.end(), it->second.begin(), it->second.end());
        }
        it = callbacks_.find("*");
        if (it != callbacks_.end() && key != "*") {
            to_call.insert(to_call.end(), it->second.begin(), it->second.end());
        }
    }

    for (const auto& cb : to_call) {
        cb(key);
    }
}

// ============================================================================
// Global Configuration
// ============================================================================
Config& global_config() {
    static Config instance;
    return instance;
}

}  // namespace footfall
