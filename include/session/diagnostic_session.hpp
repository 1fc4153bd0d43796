#pragma once

#include "analysis/propagation_analyzer.hpp"
#include "builder/cth_builder.hpp"
#include "config/engine_config.hpp"
#include "graph/cth_graph.hpp"
#include "session/query.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace cth {

/**
 * @brief Outcome of DiagnosticSession::build_from_data()
 */
struct BuildResult {
    bool success = false;
    std::vector<std::string> errors;       // Validation problems, or the construction failure
    nlohmann::json graph;                  // Serialized graph on success
    nlohmann::json statistics;             // Graph statistics on success
    BuildStatistics build_statistics;

    nlohmann::json to_json() const;
};

/**
 * @brief One diagnosis context: a builder, an analyzer and the current graph
 *
 * The session owns its graph exclusively. Failures at this boundary come
 * back as values ({"error": ...} or BuildResult::errors), never as
 * exceptions.
 */
class DiagnosticSession {
public:
    explicit DiagnosticSession(const EngineConfig& config = EngineConfig());

    DiagnosticSession(
        const EngineConfig& config,
        std::shared_ptr<const TransitionScorer> scorer
    );

    /**
     * @brief Validate and build; on success the result replaces the current graph
     */
    BuildResult build_from_data(const nlohmann::json& data);

    /**
     * @brief Replace the current graph with an existing one
     */
    void set_graph(CTHGraph graph);

    bool has_graph() const { return graph_ != nullptr; }

    /**
     * @throws std::logic_error if no graph has been built or loaded
     */
    const CTHGraph& graph() const;

    void clear();

    /**
     * @brief Run one query against the current graph
     * @return The query result, or {"error": "..."}
     */
    nlohmann::json query(const QueryRequest& request) const;

    /**
     * @brief Parse the wire form and run it
     */
    nlohmann::json query(const nlohmann::json& request) const;

    /**
     * @brief Candidate start nodes named in free-form alert text
     *
     * Looks for "service <name>", "pod <name>" and "node <name>" (also with
     * a colon, any case). If none appear, up to max_fallback_entities
     * hyphenated tokens longer than three characters become "entity:<token>".
     * Result is sorted and free of duplicates.
     */
    std::vector<std::string> extract_anomaly_nodes(const std::string& alert_text) const;

    /**
     * @brief Extracted nodes, merged propagation paths, scope and recommendations
     */
    nlohmann::json analyze_alert(const std::string& alert_text) const;

    const PropagationAnalyzer& analyzer() const { return analyzer_; }
    const CTHBuilder& builder() const { return builder_; }

private:
    EngineConfig config_;
    CTHBuilder builder_;
    PropagationAnalyzer analyzer_;
    std::unique_ptr<CTHGraph> graph_;

    nlohmann::json run(const QueryNodesByEntity& request) const;
    nlohmann::json run(const QueryAnomalousEvents& request) const;
    nlohmann::json run(const FindPropagationPaths& request) const;
    nlohmann::json run(const GetGraphStatistics& request) const;

    void log(const std::string& message) const;
};

} // namespace cth
