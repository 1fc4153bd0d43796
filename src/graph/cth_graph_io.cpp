#include "graph/cth_graph.hpp"
#include <fstream>
#include <mutex>

namespace cth {

namespace {

Timestamp require_timestamp(const nlohmann::json& j, const std::string& key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        throw std::invalid_argument("Missing timestamp field '" + key + "'");
    }
    const std::string text = it->get<std::string>();
    auto parsed = parse_timestamp(text);
    if (!parsed) {
        throw std::invalid_argument("Invalid timestamp for '" + key + "': " + text);
    }
    return *parsed;
}

} // namespace

// ==========================================
// Hyperedge Serialization
// ==========================================

nlohmann::json Hyperedge::to_json() const {
    nlohmann::json j;
    j["edge_id"] = edge_id;
    j["nodes"] = nodes;
    j["metrics"] = metrics;
    j["logs"] = logs;
    j["timestamp"] = format_timestamp(timestamp);
    j["trace_id"] = trace_id ? nlohmann::json(*trace_id) : nlohmann::json(nullptr);
    j["event_type"] = event_type;
    j["severity"] = severity_to_string(severity);
    j["duration"] = duration ? nlohmann::json(*duration) : nlohmann::json(nullptr);
    return j;
}

Hyperedge Hyperedge::from_json(const nlohmann::json& j) {
    Hyperedge edge;

    if (j.contains("nodes")) {
        edge.nodes = j["nodes"].get<std::set<std::string>>();
    }
    if (j.contains("metrics")) {
        edge.metrics = j["metrics"].get<std::set<std::string>>();
    }
    if (j.contains("logs")) {
        edge.logs = j["logs"].get<std::set<std::string>>();
    }

    edge.timestamp = require_timestamp(j, "timestamp");

    if (j.contains("trace_id") && j["trace_id"].is_string()) {
        edge.trace_id = j["trace_id"].get<std::string>();
    }
    edge.event_type = j.value("event_type", "unknown");
    edge.severity = string_to_severity(j.value("severity", "normal"));
    if (j.contains("duration") && j["duration"].is_number()) {
        edge.duration = j["duration"].get<double>();
    }
    edge.edge_id = j.value("edge_id", "");

    return edge;
}

// ==========================================
// Metadata / Statistics Serialization
// ==========================================

nlohmann::json GraphMetadata::to_json() const {
    nlohmann::json j;
    j["created_at"] = format_timestamp(created_at);
    j["version"] = version;
    j["total_events"] = total_events;
    if (last_updated) {
        j["last_updated"] = format_timestamp(*last_updated);
    }
    return j;
}

GraphMetadata GraphMetadata::from_json(const nlohmann::json& j) {
    GraphMetadata meta;
    meta.created_at = require_timestamp(j, "created_at");
    meta.version = j.value("version", "1.0");
    meta.total_events = j.value("total_events", static_cast<size_t>(0));
    if (j.contains("last_updated") && j["last_updated"].is_string()) {
        meta.last_updated = require_timestamp(j, "last_updated");
    }
    return meta;
}

nlohmann::json GraphStatistics::to_json() const {
    nlohmann::json j;
    j["total_edges"] = total_edges;
    j["total_nodes"] = total_nodes;
    j["time_span_seconds"] = time_span_seconds;
    j["earliest_event"] = earliest_event ? nlohmann::json(format_timestamp(*earliest_event))
                                         : nlohmann::json(nullptr);
    j["latest_event"] = latest_event ? nlohmann::json(format_timestamp(*latest_event))
                                     : nlohmann::json(nullptr);

    nlohmann::json meta = metadata.to_json();
    for (auto& [key, value] : meta.items()) {
        j[key] = value;
    }
    return j;
}

// ==========================================
// CTHGraph Import/Export
// ==========================================

nlohmann::json CTHGraph::to_json() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    nlohmann::json edges_json = nlohmann::json::object();
    for (const auto& [id, edge] : hyperedges_) {
        edges_json[id] = edge.to_json();
    }

    nlohmann::json j;
    j["hyperedges"] = edges_json;
    j["metadata"] = metadata_.to_json();
    j["statistics"] = compute_statistics().to_json();
    return j;
}

void CTHGraph::export_to_json(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }

    file << to_json().dump(2);
    file.close();
}

CTHGraph CTHGraph::from_json(const nlohmann::json& j) {
    CTHGraph graph;

    if (j.contains("hyperedges")) {
        for (const auto& [id, edge_json] : j["hyperedges"].items()) {
            Hyperedge edge = Hyperedge::from_json(edge_json);
            if (edge.edge_id.empty()) {
                edge.edge_id = id;
            }
            graph.add_hyperedge(edge);
        }
    }

    // Counters and timestamps come back exactly as they were saved
    if (j.contains("metadata")) {
        GraphMetadata restored = GraphMetadata::from_json(j["metadata"]);
        std::unique_lock<std::shared_mutex> lock(graph.mutex_);
        graph.metadata_ = restored;
    }

    return graph;
}

CTHGraph CTHGraph::load_from_json(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open graph file: " + filename);
    }

    nlohmann::json j;
    file >> j;
    return from_json(j);
}

} // namespace cth
