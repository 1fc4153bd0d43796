#pragma once

#include "analysis/transition_scorer.hpp"
#include "graph/cth_graph.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace cth {

// ============================================================================
// Configuration
// ============================================================================

struct AnalyzerConfig {
    int max_path_length = 10;           // Hyperedges per path
    double min_probability = 0.1;       // Paths below this are neither extended nor kept
    int default_max_paths = 5;
    int core_component_count = 5;
    bool verbose = false;
};

// ============================================================================
// Propagation Path
// ============================================================================

/**
 * @brief Time-ordered chain of hyperedges with a cumulative probability
 */
struct PropagationPath {
    std::vector<Hyperedge> hyperedges;
    double probability = 0.0;
    std::set<std::string> total_nodes;     // Union of every edge's nodes

    PropagationPath() = default;
    PropagationPath(std::vector<Hyperedge> edges, double prob);

    size_t length() const { return hyperedges.size(); }
    bool empty() const { return hyperedges.empty(); }

    // Seconds between the first and last hyperedge
    double duration_seconds() const;

    /**
     * @brief {path_length, start_time, end_time, total_duration, affected_nodes,
     *         node_count, probability, severity_progression, edge_ids}
     */
    nlohmann::json summary_json() const;

    // {"summary": ..., "hyperedges": [...]}
    nlohmann::json to_json() const;
};

// ============================================================================
// Scope Report
// ============================================================================

struct CoreComponent {
    std::string edge_id;
    double centrality_score = 0.0;
    std::set<std::string> nodes;
    Severity severity = Severity::NORMAL;
    Timestamp timestamp{};
    std::string event_type;

    nlohmann::json to_json() const;
};

struct TemporalAnalysis {
    Timestamp earliest_event{};
    Timestamp latest_event{};
    double total_time_span_seconds = 0.0;
    double average_path_duration = 0.0;
    double max_path_duration = 0.0;
    double min_path_duration = 0.0;

    nlohmann::json to_json() const;
};

/**
 * @brief Aggregate impact of a set of propagation paths
 */
struct ScopeReport {
    size_t total_affected_nodes = 0;
    std::map<std::string, std::set<std::string>> affected_nodes_by_type;  // type -> names
    std::map<std::string, size_t> node_type_counts;
    std::vector<CoreComponent> core_components;                           // Highest centrality first
    std::map<std::string, double> centrality_scores;                      // edge_id -> score
    std::optional<TemporalAnalysis> temporal_analysis;                    // Needs a multi-edge path
    Severity scope_severity = Severity::NORMAL;
    double propagation_velocity = 0.0;                                    // Nodes per second

    bool empty() const { return total_affected_nodes == 0; }

    nlohmann::json to_json() const;
};

// ============================================================================
// Search Control
// ============================================================================

/**
 * @brief Cooperative interruption of a path search
 *
 * Both conditions are polled between BFS expansions. When either trips the
 * search stops and the candidates collected so far are ranked and returned.
 */
struct SearchControl {
    const std::atomic<bool>* cancel = nullptr;
    std::optional<std::chrono::steady_clock::time_point> deadline;

    bool should_stop() const;

    static SearchControl with_timeout(std::chrono::milliseconds timeout);
};

// ============================================================================
// Propagation Analyzer
// ============================================================================

/**
 * @brief Fault propagation path search and impact quantification
 *
 * Holds configuration and a scorer only; the graph is passed per call, so
 * one analyzer can serve many graphs and threads.
 */
class PropagationAnalyzer {
public:
    explicit PropagationAnalyzer(
        const AnalyzerConfig& config = AnalyzerConfig(),
        std::shared_ptr<const TransitionScorer> scorer = nullptr
    );

    /**
     * @brief Most likely propagation paths starting at a node
     *
     * Every hyperedge containing `start_node` seeds a breadth-first search,
     * earliest seed first. A branch is extended only while its cumulative
     * probability stays >= min_probability and recorded when it has no
     * successors or reaches max_path_length.
     *
     * Result order: probability descending, then longer path, then earlier
     * start time, then discovery order. Truncated to `max_paths`.
     *
     * @param max_paths Result limit; negative means config().default_max_paths
     */
    std::vector<PropagationPath> find_propagation_paths(
        const CTHGraph& graph,
        const std::string& start_node,
        int max_paths = -1,
        const SearchControl& control = SearchControl()
    ) const;

    /**
     * @brief Probability of a fault moving from `from` to `to`, in [0, 1]
     */
    double transition_probability(const Hyperedge& from, const Hyperedge& to) const;

    /**
     * @brief Aggregate the affected entities and key hyperedges of `paths`
     */
    ScopeReport quantify_propagation_scope(const std::vector<PropagationPath>& paths) const;

    /**
     * @brief Actionable hints derived from a scope report, never empty
     */
    std::vector<std::string> generate_recommendations(const ScopeReport& scope) const;

    /**
     * @brief Paths, scope, graph statistics and recommendations for one start node
     */
    nlohmann::json generate_propagation_report(const CTHGraph& graph, const std::string& start_node) const;

    const AnalyzerConfig& config() const { return config_; }

private:
    AnalyzerConfig config_;
    std::shared_ptr<const TransitionScorer> scorer_;

    struct RankedCandidate {
        PropagationPath path;
        size_t discovery_index;
    };

    void bfs_from_seed(
        const CTHGraph& graph,
        const Hyperedge& seed,
        const SearchControl& control,
        std::vector<RankedCandidate>& found,
        bool& interrupted
    ) const;

    std::map<std::string, double> hyperedge_centrality(const std::vector<PropagationPath>& paths) const;
    std::vector<CoreComponent> core_components(
        const std::vector<PropagationPath>& paths,
        const std::map<std::string, double>& centrality
    ) const;
    std::optional<TemporalAnalysis> temporal_spread(const std::vector<PropagationPath>& paths) const;
    Severity scope_severity(const std::vector<PropagationPath>& paths) const;
    double propagation_velocity(const std::vector<PropagationPath>& paths) const;

    void log(const std::string& message) const;
};

} // namespace cth
