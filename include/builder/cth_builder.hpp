#pragma once

#include "graph/cth_graph.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace cth {

// ============================================================================
// Builder Configuration
// ============================================================================

/**
 * @brief Configuration for hyperedge construction
 */
struct BuilderConfig {
    int time_window_seconds = 300;          ///< Slack after a trace ends for correlating signals
    size_t max_log_length = 100;            ///< Log excerpts are truncated to this many characters
    int orphan_bucket_minutes = 5;          ///< Bucket width for signals without a trace
    bool verbose = false;                   ///< Log dropped records and per-trace decisions
};

// ============================================================================
// Build Statistics
// ============================================================================

/**
 * @brief Counters collected during one build call
 */
struct BuildStatistics {
    int traces_processed = 0;
    int traces_skipped = 0;            // No nodes or no parseable start time
    int traces_without_anomaly = 0;    // Parsed, but nothing noteworthy
    int trace_edges = 0;
    int orphaned_edges = 0;
    int duplicate_edges = 0;           // Edge id already present in the target graph
    int records_dropped = 0;           // Malformed metric/log/span records

    void print_summary() const;

    nlohmann::json to_json() const;
};

// ============================================================================
// CTH Builder
// ============================================================================

/**
 * @brief Turns a batch of traces, metrics and logs into hyperedges
 *
 * Input document:
 * {
 *   "traces":  [{"trace_id": "...", "spans": [{"service", "start_time", "end_time",
 *                                              "status", "tags": {"pod", "container", "node"}}]}],
 *   "metrics": [{"entity", "metric_name", "value", "timestamp", "is_anomalous", "tags"}],
 *   "logs":    [{"entity", "message", "level", "timestamp", "tags"}]
 * }
 *
 * Each trace carrying an anomaly signal becomes one "trace_event" hyperedge.
 * Anomalous signals that no trace accounts for are grouped into fixed time
 * buckets and become "orphaned_anomaly" hyperedges.
 *
 * The builder holds only configuration; one instance can be shared across
 * sessions and threads.
 */
class CTHBuilder {
public:
    explicit CTHBuilder(const BuilderConfig& config = BuilderConfig());

    /**
     * @brief Structural check of an input document
     * @return Every violation found (empty when the document is well formed)
     */
    std::vector<std::string> validate_input_data(const nlohmann::json& data) const;

    /**
     * @brief Build a new graph from an input document
     *
     * Malformed individual records are dropped, not reported. Call
     * validate_input_data() first: a document with the wrong shape
     * throws std::invalid_argument.
     */
    CTHGraph build_cth_from_json(const nlohmann::json& data, BuildStatistics* stats = nullptr) const;

    /**
     * @brief Append the hyperedges derived from `data` to an existing graph
     *
     * Edges whose id is already present are skipped and counted as duplicates.
     */
    void build_into(const nlohmann::json& data, CTHGraph& graph, BuildStatistics* stats = nullptr) const;

    /**
     * @brief Level in {error, critical, fatal, panic}, or message mentions
     *        one of the anomaly keywords
     */
    bool is_critical_log(const nlohmann::json& log) const;

    /**
     * @brief True for is_anomalous = true, a non-zero number, or "true"/"1"/"yes"
     */
    static bool is_anomalous_metric(const nlohmann::json& metric);

    static const std::set<std::string>& anomaly_keywords();

    const BuilderConfig& config() const { return config_; }

private:
    BuilderConfig config_;

    // Positions of metric/log records already folded into a trace hyperedge
    struct Correlated {
        std::set<size_t> metrics;
        std::set<size_t> logs;
    };

    std::optional<Hyperedge> create_hyperedge_from_trace(
        const nlohmann::json& trace,
        const nlohmann::json& metrics,
        const nlohmann::json& logs,
        Correlated& correlated,
        BuildStatistics& stats
    ) const;

    /**
     * @brief Anomalous signals outside every trace: neither correlated with a
     *        trace hyperedge nor carrying the id of one of the batch's traces
     */
    std::vector<Hyperedge> create_orphaned_hyperedges(
        const nlohmann::json& traces,
        const nlohmann::json& metrics,
        const nlohmann::json& logs,
        const Correlated& correlated,
        BuildStatistics& stats
    ) const;

    std::set<std::string> find_anomalous_metrics(
        const nlohmann::json& metrics,
        const std::set<std::string>& nodes,
        Timestamp start,
        Timestamp end,
        std::set<size_t>& matched
    ) const;

    std::set<std::string> find_critical_logs(
        const nlohmann::json& logs,
        const std::set<std::string>& nodes,
        Timestamp start,
        Timestamp end,
        std::set<size_t>& matched
    ) const;

    /**
     * @brief Highest applicable level: span status, then correlated log text,
     *        then presence of any signal
     */
    Severity determine_severity(
        const nlohmann::json& spans,
        const std::set<std::string>& metrics,
        const std::set<std::string>& logs
    ) const;

    /**
     * @brief Entity or one of the tag values is a substring of some node id
     */
    bool is_associated(const nlohmann::json& record, const std::set<std::string>& nodes) const;

    std::string truncate_message(const std::string& message) const;

    void log(const std::string& message) const;
};

} // namespace cth
