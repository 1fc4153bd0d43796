#include "config/engine_config.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace cth {

namespace {

int env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    if (!value) return fallback;

    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed == std::string(value).size()) {
            return parsed;
        }
    } catch (const std::exception&) {
        // Reported below
    }
    throw std::runtime_error(std::string("Invalid integer in ") + name + ": " + value);
}

double env_double(const char* name, double fallback) {
    const char* value = std::getenv(name);
    if (!value) return fallback;

    try {
        size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed == std::string(value).size()) {
            return parsed;
        }
    } catch (const std::exception&) {
        // Reported below
    }
    throw std::runtime_error(std::string("Invalid number in ") + name + ": " + value);
}

bool env_bool(const char* name, bool fallback) {
    const char* value = std::getenv(name);
    if (!value) return fallback;

    const std::string text = value;
    return text == "1" || text == "true" || text == "TRUE" || text == "yes" || text == "on";
}

} // namespace

// ============================================================================
// EngineConfig
// ============================================================================

EngineConfig EngineConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }

    EngineConfig config;

    // Builder config
    if (j.contains("time_window_seconds")) config.time_window_seconds = j["time_window_seconds"];
    if (j.contains("max_log_length")) config.max_log_length = j["max_log_length"];
    if (j.contains("orphan_bucket_minutes")) config.orphan_bucket_minutes = j["orphan_bucket_minutes"];

    // Analyzer config
    if (j.contains("max_path_length")) config.max_path_length = j["max_path_length"];
    if (j.contains("min_probability")) config.min_probability = j["min_probability"];
    if (j.contains("max_paths")) config.max_paths = j["max_paths"];
    if (j.contains("core_component_count")) config.core_component_count = j["core_component_count"];

    // Session config
    if (j.contains("max_fallback_entities")) config.max_fallback_entities = j["max_fallback_entities"];

    // Output config
    if (j.contains("json_indent")) config.json_indent = j["json_indent"];
    if (j.contains("verbose")) config.verbose = j["verbose"];

    return config;
}

json EngineConfig::to_json() const {
    json j;

    // Builder config
    j["time_window_seconds"] = time_window_seconds;
    j["max_log_length"] = max_log_length;
    j["orphan_bucket_minutes"] = orphan_bucket_minutes;

    // Analyzer config
    j["max_path_length"] = max_path_length;
    j["min_probability"] = min_probability;
    j["max_paths"] = max_paths;
    j["core_component_count"] = core_component_count;

    // Session config
    j["max_fallback_entities"] = max_fallback_entities;

    // Output config
    j["json_indent"] = json_indent;
    j["verbose"] = verbose;

    return j;
}

void EngineConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file for writing: " + path);
    }
    file << to_json().dump(2);
}

EngineConfig EngineConfig::from_environment() {
    EngineConfig config;

    config.time_window_seconds = env_int("CTH_TIME_WINDOW", config.time_window_seconds);
    config.max_path_length = env_int("CTH_MAX_PATH_LENGTH", config.max_path_length);
    config.min_probability = env_double("CTH_MIN_PROBABILITY", config.min_probability);
    config.max_paths = env_int("CTH_MAX_PATHS", config.max_paths);
    config.verbose = env_bool("CTH_VERBOSE", config.verbose);

    return config;
}

bool EngineConfig::validate(std::string& error_message) const {
    if (time_window_seconds < 0) {
        error_message = "Time window must not be negative";
        return false;
    }

    if (max_log_length <= 0) {
        error_message = "Max log length must be positive";
        return false;
    }

    // Buckets must tile the hour so that flooring stays aligned to it
    if (orphan_bucket_minutes <= 0 || orphan_bucket_minutes > 60 || 60 % orphan_bucket_minutes != 0) {
        error_message = "Orphan bucket width must be a divisor of 60 minutes";
        return false;
    }

    if (max_path_length < 1) {
        error_message = "Max path length must be at least 1";
        return false;
    }

    if (min_probability < 0.0 || min_probability > 1.0) {
        error_message = "Min probability must be between 0.0 and 1.0";
        return false;
    }

    if (max_paths < 0) {
        error_message = "Max paths must not be negative";
        return false;
    }

    if (core_component_count < 0) {
        error_message = "Core component count must not be negative";
        return false;
    }

    if (max_fallback_entities < 0) {
        error_message = "Max fallback entities must not be negative";
        return false;
    }

    return true;
}

BuilderConfig EngineConfig::builder_config() const {
    BuilderConfig config;
    config.time_window_seconds = time_window_seconds;
    config.max_log_length = static_cast<size_t>(max_log_length);
    config.orphan_bucket_minutes = orphan_bucket_minutes;
    config.verbose = verbose;
    return config;
}

AnalyzerConfig EngineConfig::analyzer_config() const {
    AnalyzerConfig config;
    config.max_path_length = max_path_length;
    config.min_probability = min_probability;
    config.default_max_paths = max_paths;
    config.core_component_count = core_component_count;
    config.verbose = verbose;
    return config;
}

// ============================================================================
// Utility Functions
// ============================================================================

EngineConfig load_engine_config(const std::string& config_path) {
    if (!config_path.empty()) {
        return EngineConfig::from_json_file(config_path);
    }
    return EngineConfig::from_environment();
}

} // namespace cth
