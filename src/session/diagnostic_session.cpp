#include "session/diagnostic_session.hpp"
#include <algorithm>
#include <iostream>
#include <iterator>
#include <regex>
#include <set>
#include <stdexcept>

using json = nlohmann::json;

namespace cth {

namespace {

json error_value(const std::string& message) {
    return json{{"error", message}};
}

json edges_to_json(const std::vector<Hyperedge>& edges) {
    json result = json::array();
    for (const auto& edge : edges) {
        result.push_back(edge.to_json());
    }
    return result;
}

json paths_to_json(const std::vector<PropagationPath>& paths) {
    json result = json::array();
    for (const auto& path : paths) {
        result.push_back(path.to_json());
    }
    return result;
}

} // namespace

// ==========================================
// BuildResult
// ==========================================

json BuildResult::to_json() const {
    json j;
    j["success"] = success;
    j["errors"] = errors;
    j["cth_graph"] = success ? graph : json(nullptr);
    if (success) {
        j["statistics"] = statistics;
        j["build_statistics"] = build_statistics.to_json();
    }
    return j;
}

// ==========================================
// DiagnosticSession
// ==========================================

DiagnosticSession::DiagnosticSession(const EngineConfig& config)
    : DiagnosticSession(config, nullptr) {}

DiagnosticSession::DiagnosticSession(
    const EngineConfig& config,
    std::shared_ptr<const TransitionScorer> scorer
) : config_(config),
    builder_(config.builder_config()),
    analyzer_(config.analyzer_config(), std::move(scorer)) {}

BuildResult DiagnosticSession::build_from_data(const json& data) {
    BuildResult result;

    result.errors = builder_.validate_input_data(data);
    if (!result.errors.empty()) {
        log("[build] rejected input: " + std::to_string(result.errors.size()) + " validation errors");
        return result;
    }

    try {
        auto graph = std::make_unique<CTHGraph>(
            builder_.build_cth_from_json(data, &result.build_statistics));

        result.success = true;
        result.graph = graph->to_json();
        result.statistics = graph->get_statistics().to_json();
        graph_ = std::move(graph);
    } catch (const std::exception& e) {
        result.success = false;
        result.errors = {std::string("CTH construction failed: ") + e.what()};
        return result;
    }

    log("[build] graph ready with " + std::to_string(graph_->num_edges()) + " hyperedges");
    return result;
}

void DiagnosticSession::set_graph(CTHGraph graph) {
    graph_ = std::make_unique<CTHGraph>(std::move(graph));
}

const CTHGraph& DiagnosticSession::graph() const {
    if (!graph_) {
        throw std::logic_error("No CTH graph available");
    }
    return *graph_;
}

void DiagnosticSession::clear() {
    graph_.reset();
}

json DiagnosticSession::query(const QueryRequest& request) const {
    if (!graph_) {
        return error_value("No CTH graph available");
    }

    try {
        return std::visit([this](const auto& typed) { return run(typed); }, request);
    } catch (const std::exception& e) {
        return error_value(std::string("Query failed: ") + e.what());
    }
}

json DiagnosticSession::query(const json& request) const {
    std::string error;
    auto parsed = parse_query_request(request, error);
    if (!parsed) {
        return error_value(error);
    }
    return query(*parsed);
}

json DiagnosticSession::run(const QueryNodesByEntity& request) const {
    auto edges = graph_->get_hyperedges_containing(request.entity);

    json result;
    result["entity"] = request.entity;
    result["hyperedges_count"] = edges.size();
    result["hyperedges"] = edges_to_json(edges);
    return result;
}

json DiagnosticSession::run(const QueryAnomalousEvents& request) const {
    std::vector<Hyperedge> events;
    for (auto& edge : graph_->get_all_edges()) {
        if (request.severity && edge.severity != *request.severity) continue;
        if (!edge.metrics.empty() || !edge.logs.empty() || edge.severity != Severity::NORMAL) {
            events.push_back(std::move(edge));
        }
    }

    json result;
    result["anomalous_events_count"] = events.size();
    result["events"] = edges_to_json(events);
    return result;
}

json DiagnosticSession::run(const FindPropagationPaths& request) const {
    auto paths = analyzer_.find_propagation_paths(
        *graph_, request.start_node, request.max_paths.value_or(config_.max_paths));

    json result;
    result["start_node"] = request.start_node;
    result["paths_found"] = paths.size();
    result["paths"] = paths_to_json(paths);
    return result;
}

json DiagnosticSession::run(const GetGraphStatistics&) const {
    return graph_->get_statistics().to_json();
}

std::vector<std::string> DiagnosticSession::extract_anomaly_nodes(const std::string& alert_text) const {
    static const std::vector<std::pair<std::string, std::regex>> patterns = {
        {"service", std::regex(R"(service[:\s]+([\w-]+))", std::regex::icase)},
        {"pod", std::regex(R"(pod[:\s]+([\w-]+))", std::regex::icase)},
        {"node", std::regex(R"(node[:\s]+([\w-]+))", std::regex::icase)}
    };

    std::set<std::string> nodes;
    for (const auto& [type, pattern] : patterns) {
        for (std::sregex_iterator it(alert_text.begin(), alert_text.end(), pattern), end; it != end; ++it) {
            nodes.insert(type + ":" + (*it)[1].str());
        }
    }

    if (nodes.empty()) {
        // Resource names such as "checkout-7d9f" usually carry a hyphen
        static const std::regex token(R"([\w-]+)");
        int taken = 0;
        for (std::sregex_iterator it(alert_text.begin(), alert_text.end(), token), end;
             it != end && taken < config_.max_fallback_entities; ++it) {
            const std::string candidate = it->str();
            if (candidate.size() > 3 && candidate.find('-') != std::string::npos) {
                nodes.insert("entity:" + candidate);
                taken++;
            }
        }
    }

    return std::vector<std::string>(nodes.begin(), nodes.end());
}

json DiagnosticSession::analyze_alert(const std::string& alert_text) const {
    if (!graph_) {
        return error_value("No CTH graph available");
    }

    std::vector<std::string> nodes = extract_anomaly_nodes(alert_text);

    std::vector<PropagationPath> all_paths;
    for (const auto& node : nodes) {
        auto paths = analyzer_.find_propagation_paths(*graph_, node, config_.max_paths);
        log("[alert] " + std::to_string(paths.size()) + " paths from " + node);
        all_paths.insert(all_paths.end(),
                         std::make_move_iterator(paths.begin()),
                         std::make_move_iterator(paths.end()));
    }

    ScopeReport scope = analyzer_.quantify_propagation_scope(all_paths);

    json result;
    result["alert"] = alert_text;
    result["anomaly_nodes"] = nodes;
    result["total_paths_found"] = all_paths.size();
    result["propagation_paths"] = paths_to_json(all_paths);
    result["scope_analysis"] = scope.to_json();
    result["recommendations"] = analyzer_.generate_recommendations(scope);
    return result;
}

void DiagnosticSession::log(const std::string& message) const {
    if (config_.verbose) {
        std::cerr << message << "\n";
    }
}

} // namespace cth
