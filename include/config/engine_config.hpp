#pragma once

#include "analysis/propagation_analyzer.hpp"
#include "builder/cth_builder.hpp"
#include <string>

namespace cth {

// ============================================================================
// Engine Configuration
// ============================================================================

/**
 * @brief Settings for every engine component, loadable from a flat JSON file
 *        or from CTH_* environment variables
 */
struct EngineConfig {
    // Builder Configuration
    int time_window_seconds = 300;          ///< Correlation slack after a trace ends
    int max_log_length = 100;               ///< Log excerpt length in characters
    int orphan_bucket_minutes = 5;          ///< Bucket width for trace-less anomalies

    // Analyzer Configuration
    int max_path_length = 10;               ///< Hyperedges per propagation path
    double min_probability = 0.1;           ///< Cumulative probability cut-off
    int max_paths = 5;                      ///< Default result limit for path queries
    int core_component_count = 5;           ///< Core components listed in scope reports

    // Session Configuration
    int max_fallback_entities = 3;          ///< Entity tokens taken from unstructured alerts

    // Output Configuration
    int json_indent = 2;                    ///< Indentation of written JSON files
    bool verbose = false;                   ///< Verbose logging

    /**
     * @brief Load configuration from JSON file; absent keys keep their defaults
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static EngineConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file
     */
    void to_json_file(const std::string& path) const;

    /**
     * @brief Defaults overridden by CTH_TIME_WINDOW, CTH_MAX_PATH_LENGTH,
     *        CTH_MIN_PROBABILITY, CTH_MAX_PATHS and CTH_VERBOSE
     * @throws std::runtime_error on a non-numeric value
     */
    static EngineConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;

    nlohmann::json to_json() const;

    BuilderConfig builder_config() const;
    AnalyzerConfig analyzer_config() const;
};

/**
 * @brief Config file when a path is given, environment otherwise
 */
EngineConfig load_engine_config(const std::string& config_path = "");

} // namespace cth
