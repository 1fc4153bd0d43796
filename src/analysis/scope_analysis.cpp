#include "analysis/propagation_analyzer.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace cth {

// ==========================================
// Report Serialization
// ==========================================

nlohmann::json CoreComponent::to_json() const {
    nlohmann::json j;
    j["edge_id"] = edge_id;
    j["centrality_score"] = centrality_score;
    j["nodes"] = nodes;
    j["severity"] = severity_to_string(severity);
    j["timestamp"] = format_timestamp(timestamp);
    j["event_type"] = event_type;
    return j;
}

nlohmann::json TemporalAnalysis::to_json() const {
    nlohmann::json j;
    j["earliest_event"] = format_timestamp(earliest_event);
    j["latest_event"] = format_timestamp(latest_event);
    j["total_time_span_seconds"] = total_time_span_seconds;
    j["average_path_duration"] = average_path_duration;
    j["max_path_duration"] = max_path_duration;
    j["min_path_duration"] = min_path_duration;
    return j;
}

nlohmann::json ScopeReport::to_json() const {
    nlohmann::json j;
    j["total_affected_nodes"] = total_affected_nodes;

    if (empty()) {
        j["scope_summary"] = nlohmann::json::object();
        return j;
    }

    j["affected_nodes_by_type"] = nlohmann::json::object();
    for (const auto& [type, names] : affected_nodes_by_type) {
        j["affected_nodes_by_type"][type] = names;
    }
    j["node_type_counts"] = node_type_counts;

    j["core_components"] = nlohmann::json::array();
    for (const auto& component : core_components) {
        j["core_components"].push_back(component.to_json());
    }

    j["centrality_scores"] = centrality_scores;
    j["temporal_analysis"] = temporal_analysis ? temporal_analysis->to_json()
                                               : nlohmann::json::object();
    j["scope_severity"] = severity_to_string(scope_severity);
    j["propagation_velocity"] = propagation_velocity;
    return j;
}

// ==========================================
// Scope Quantification
// ==========================================

ScopeReport PropagationAnalyzer::quantify_propagation_scope(const std::vector<PropagationPath>& paths) const {
    ScopeReport report;
    if (paths.empty()) {
        return report;
    }

    std::set<std::string> affected;
    for (const auto& path : paths) {
        affected.insert(path.total_nodes.begin(), path.total_nodes.end());
    }
    report.total_affected_nodes = affected.size();

    for (const auto& node : affected) {
        auto pos = node.find(':');
        if (pos == std::string::npos) continue;
        report.affected_nodes_by_type[node.substr(0, pos)].insert(node.substr(pos + 1));
    }
    for (const auto& [type, names] : report.affected_nodes_by_type) {
        report.node_type_counts[type] = names.size();
    }

    report.centrality_scores = hyperedge_centrality(paths);
    report.core_components = core_components(paths, report.centrality_scores);
    report.temporal_analysis = temporal_spread(paths);
    report.scope_severity = scope_severity(paths);
    report.propagation_velocity = propagation_velocity(paths);

    return report;
}

std::map<std::string, double> PropagationAnalyzer::hyperedge_centrality(
    const std::vector<PropagationPath>& paths
) const {
    std::map<std::string, int> frequency;
    std::map<std::string, std::vector<double>> positions;

    for (const auto& path : paths) {
        const double length = static_cast<double>(path.length());
        for (size_t i = 0; i < path.hyperedges.size(); ++i) {
            const std::string& edge_id = path.hyperedges[i].edge_id;
            frequency[edge_id]++;
            positions[edge_id].push_back(static_cast<double>(i) / length);
        }
    }

    std::map<std::string, double> scores;
    const double total_paths = static_cast<double>(paths.size());

    for (const auto& [edge_id, count] : frequency) {
        const auto& edge_positions = positions[edge_id];
        double sum = 0.0;
        for (double p : edge_positions) {
            sum += p;
        }
        const double average = sum / static_cast<double>(edge_positions.size());

        // Peaks for edges sitting in the middle of their paths
        const double position_score = 1.0 - std::abs(average - 0.5) * 2.0;
        const double frequency_score = static_cast<double>(count) / total_paths;

        scores[edge_id] = frequency_score * 0.7 + position_score * 0.3;
    }

    return scores;
}

std::vector<CoreComponent> PropagationAnalyzer::core_components(
    const std::vector<PropagationPath>& paths,
    const std::map<std::string, double>& centrality
) const {
    // First occurrence of every edge, in path order; also breaks score ties
    std::vector<const Hyperedge*> first_seen;
    std::set<std::string> seen;
    for (const auto& path : paths) {
        for (const auto& edge : path.hyperedges) {
            if (seen.insert(edge.edge_id).second) {
                first_seen.push_back(&edge);
            }
        }
    }

    std::stable_sort(first_seen.begin(), first_seen.end(),
        [&centrality](const Hyperedge* a, const Hyperedge* b) {
            return centrality.at(a->edge_id) > centrality.at(b->edge_id);
        });

    const size_t limit = std::min(first_seen.size(),
                                  static_cast<size_t>(std::max(config_.core_component_count, 0)));

    std::vector<CoreComponent> components;
    components.reserve(limit);
    for (size_t i = 0; i < limit; ++i) {
        const Hyperedge& edge = *first_seen[i];

        CoreComponent component;
        component.edge_id = edge.edge_id;
        component.centrality_score = centrality.at(edge.edge_id);
        component.nodes = edge.nodes;
        component.severity = edge.severity;
        component.timestamp = edge.timestamp;
        component.event_type = edge.event_type;
        components.push_back(std::move(component));
    }

    return components;
}

std::optional<TemporalAnalysis> PropagationAnalyzer::temporal_spread(
    const std::vector<PropagationPath>& paths
) const {
    std::vector<double> durations;
    std::optional<Timestamp> earliest;
    std::optional<Timestamp> latest;

    for (const auto& path : paths) {
        if (path.length() < 2) continue;

        durations.push_back(path.duration_seconds());
        for (const auto& edge : path.hyperedges) {
            if (!earliest || edge.timestamp < *earliest) earliest = edge.timestamp;
            if (!latest || edge.timestamp > *latest) latest = edge.timestamp;
        }
    }

    if (durations.empty()) {
        return std::nullopt;
    }

    TemporalAnalysis analysis;
    analysis.earliest_event = *earliest;
    analysis.latest_event = *latest;
    analysis.total_time_span_seconds = seconds_between(*earliest, *latest);

    double sum = 0.0;
    for (double d : durations) {
        sum += d;
    }
    analysis.average_path_duration = sum / static_cast<double>(durations.size());
    analysis.max_path_duration = *std::max_element(durations.begin(), durations.end());
    analysis.min_path_duration = *std::min_element(durations.begin(), durations.end());

    return analysis;
}

Severity PropagationAnalyzer::scope_severity(const std::vector<PropagationPath>& paths) const {
    double weighted = 0.0;
    double total = 0.0;

    for (const auto& path : paths) {
        for (const auto& edge : path.hyperedges) {
            weighted += severity_weight(edge.severity) * path.probability;
            total += path.probability;
        }
    }

    if (total == 0.0) {
        return Severity::NORMAL;
    }
    return severity_from_weight(weighted / total);
}

double PropagationAnalyzer::propagation_velocity(const std::vector<PropagationPath>& paths) const {
    std::vector<double> velocities;

    for (const auto& path : paths) {
        if (path.length() < 2) continue;
        const double duration = path.duration_seconds();
        if (duration > 0.0) {
            velocities.push_back(static_cast<double>(path.total_nodes.size()) / duration);
        }
    }

    if (velocities.empty()) {
        return 0.0;
    }

    double sum = 0.0;
    for (double v : velocities) {
        sum += v;
    }
    return sum / static_cast<double>(velocities.size());
}

// ==========================================
// Recommendations and Reports
// ==========================================

std::vector<std::string> PropagationAnalyzer::generate_recommendations(const ScopeReport& scope) const {
    std::vector<std::string> recommendations;

    if (scope.scope_severity == Severity::CRITICAL) {
        recommendations.push_back("Start the incident response process immediately: this is a severe system-level failure");
        recommendations.push_back("Consider activating the disaster recovery plan");
    } else if (scope.scope_severity == Severity::ERROR) {
        recommendations.push_back("Urgent attention required: the fault is spreading quickly");
        recommendations.push_back("Check the health of core services");
    }

    auto count_of = [&scope](const std::string& type) -> size_t {
        auto it = scope.node_type_counts.find(type);
        return it == scope.node_type_counts.end() ? 0 : it->second;
    };

    if (count_of("service") > 3) {
        recommendations.push_back("Multiple services affected: check inter-service dependencies");
    }
    if (count_of("node") > 1) {
        recommendations.push_back("Multiple nodes affected: this may be an infrastructure issue");
    }

    if (scope.propagation_velocity > 1.0) {
        recommendations.push_back("Fault is propagating fast: isolate the affected components now");
    }

    if (!scope.core_components.empty()) {
        std::ostringstream nodes;
        bool first = true;
        for (const auto& node : scope.core_components.front().nodes) {
            if (!first) nodes << ", ";
            nodes << node;
            first = false;
        }
        recommendations.push_back("Focus on core component: " + nodes.str());
    }

    if (recommendations.empty()) {
        recommendations.push_back("Keep monitoring the system: the current impact is limited");
    }

    return recommendations;
}

nlohmann::json PropagationAnalyzer::generate_propagation_report(
    const CTHGraph& graph,
    const std::string& start_node
) const {
    std::vector<PropagationPath> paths = find_propagation_paths(graph, start_node);
    ScopeReport scope = quantify_propagation_scope(paths);

    nlohmann::json serialized_paths = nlohmann::json::array();
    for (const auto& path : paths) {
        serialized_paths.push_back(path.to_json());
    }

    nlohmann::json report;
    report["analysis_timestamp"] = format_timestamp(now_utc());
    report["anomaly_start_node"] = start_node;
    report["total_paths_found"] = paths.size();
    report["propagation_paths"] = serialized_paths;
    report["scope_analysis"] = scope.to_json();
    report["graph_statistics"] = graph.get_statistics().to_json();
    report["recommendations"] = generate_recommendations(scope);

    log("[report] " + std::to_string(paths.size()) + " paths from " + start_node);
    return report;
}

} // namespace cth
