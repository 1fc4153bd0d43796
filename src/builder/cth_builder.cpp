#include "builder/cth_builder.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>

using json = nlohmann::json;

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool contains_any(const std::string& text, const std::vector<std::string>& words) {
    for (const auto& word : words) {
        if (text.find(word) != std::string::npos) return true;
    }
    return false;
}

// String field, or nullopt when absent / not a string
std::optional<std::string> string_field(const json& record, const char* key) {
    auto it = record.find(key);
    if (it == record.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

// Ids may arrive as strings or numbers
std::optional<std::string> id_field(const json& record, const char* key) {
    auto it = record.find(key);
    if (it == record.end()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number()) return it->dump();
    return std::nullopt;
}

std::optional<cth::Timestamp> timestamp_field(const json& record, const char* key) {
    auto text = string_field(record, key);
    if (!text) return std::nullopt;
    return cth::parse_timestamp(*text);
}

// Trace id of a metric/log: top level first, then tags.trace_id
std::optional<std::string> record_trace_id(const json& record) {
    if (auto id = id_field(record, "trace_id")) return id;
    auto tags = record.find("tags");
    if (tags != record.end() && tags->is_object()) {
        return id_field(*tags, "trace_id");
    }
    return std::nullopt;
}

const json& array_or_empty(const json& data, const char* key) {
    static const json empty = json::array();
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) return empty;
    if (!it->is_array()) {
        throw std::invalid_argument(std::string("Key '") + key + "' must be a list");
    }
    return *it;
}

const std::vector<std::string> kErrorSpanStatuses = {"error", "failed", "timeout"};
const std::vector<std::string> kCriticalLogLevels = {"error", "critical", "fatal", "panic"};
const std::vector<std::string> kCriticalWords = {"critical", "fatal", "panic"};
const std::vector<std::string> kErrorWords = {"error", "exception", "failed"};

} // namespace

namespace cth {

// ============================================================================
// BuildStatistics
// ============================================================================

void BuildStatistics::print_summary() const {
    std::cout << "\nCTH Build Summary:\n";
    std::cout << "  Traces processed: " << traces_processed << "\n";
    std::cout << "  Traces skipped: " << traces_skipped << "\n";
    std::cout << "  Traces without anomaly: " << traces_without_anomaly << "\n";
    std::cout << "  Trace hyperedges: " << trace_edges << "\n";
    std::cout << "  Orphaned hyperedges: " << orphaned_edges << "\n";
    std::cout << "  Duplicate hyperedges skipped: " << duplicate_edges << "\n";
    std::cout << "  Records dropped: " << records_dropped << "\n";
}

json BuildStatistics::to_json() const {
    json j;
    j["traces_processed"] = traces_processed;
    j["traces_skipped"] = traces_skipped;
    j["traces_without_anomaly"] = traces_without_anomaly;
    j["trace_edges"] = trace_edges;
    j["orphaned_edges"] = orphaned_edges;
    j["duplicate_edges"] = duplicate_edges;
    j["records_dropped"] = records_dropped;
    return j;
}

// ============================================================================
// CTHBuilder
// ============================================================================

CTHBuilder::CTHBuilder(const BuilderConfig& config) : config_(config) {}

const std::set<std::string>& CTHBuilder::anomaly_keywords() {
    static const std::set<std::string> keywords = {
        "error", "exception", "failed", "timeout", "refused", "denied",
        "unavailable", "unreachable", "critical", "fatal", "panic",
        "warning", "alert", "threshold", "limit", "exceeded"
    };
    return keywords;
}

std::vector<std::string> CTHBuilder::validate_input_data(const json& data) const {
    std::vector<std::string> errors;

    if (!data.is_object()) {
        errors.push_back("Input data must be a dictionary");
        return errors;
    }

    for (const char* key : {"traces", "metrics", "logs"}) {
        if (!data.contains(key)) {
            errors.push_back(std::string("Missing required key: ") + key);
        } else if (!data[key].is_array()) {
            errors.push_back(std::string("Key '") + key + "' must be a list");
        }
    }

    if (data.contains("traces") && data["traces"].is_array()) {
        const auto& traces = data["traces"];
        for (size_t i = 0; i < traces.size(); ++i) {
            const auto& trace = traces[i];
            if (!trace.is_object()) {
                errors.push_back("Trace " + std::to_string(i) + " must be a dictionary");
                continue;
            }
            if (!trace.contains("trace_id")) {
                errors.push_back("Trace " + std::to_string(i) + " missing trace_id");
            }
            if (!trace.contains("spans") || !trace["spans"].is_array()) {
                errors.push_back("Trace " + std::to_string(i) + " must have 'spans' as a list");
            }
        }
    }

    if (data.contains("metrics") && data["metrics"].is_array()) {
        const auto& metrics = data["metrics"];
        for (size_t i = 0; i < metrics.size(); ++i) {
            const auto& metric = metrics[i];
            if (!metric.is_object()) {
                errors.push_back("Metric " + std::to_string(i) + " must be a dictionary");
                continue;
            }
            for (const char* key : {"entity", "metric_name", "timestamp"}) {
                if (!metric.contains(key)) {
                    errors.push_back("Metric " + std::to_string(i) + " missing required key: " + key);
                }
            }
        }
    }

    if (data.contains("logs") && data["logs"].is_array()) {
        const auto& logs = data["logs"];
        for (size_t i = 0; i < logs.size(); ++i) {
            const auto& log_entry = logs[i];
            if (!log_entry.is_object()) {
                errors.push_back("Log " + std::to_string(i) + " must be a dictionary");
                continue;
            }
            for (const char* key : {"entity", "message", "timestamp"}) {
                if (!log_entry.contains(key)) {
                    errors.push_back("Log " + std::to_string(i) + " missing required key: " + key);
                }
            }
        }
    }

    return errors;
}

CTHGraph CTHBuilder::build_cth_from_json(const json& data, BuildStatistics* stats) const {
    CTHGraph graph;
    build_into(data, graph, stats);
    return graph;
}

void CTHBuilder::build_into(const json& data, CTHGraph& graph, BuildStatistics* stats) const {
    if (!data.is_object()) {
        throw std::invalid_argument("Input data must be a dictionary");
    }

    BuildStatistics local;
    BuildStatistics& counters = stats ? *stats : local;

    const json& traces = array_or_empty(data, "traces");
    const json& metrics = array_or_empty(data, "metrics");
    const json& logs = array_or_empty(data, "logs");

    auto append = [&](const Hyperedge& edge, int& counter) {
        std::string edge_id = edge.edge_id.empty()
            ? Hyperedge::compute_edge_id(edge.nodes, edge.timestamp, edge.trace_id)
            : edge.edge_id;
        if (graph.has_edge(edge_id)) {
            counters.duplicate_edges++;
            log("Skipping duplicate hyperedge " + edge_id);
            return;
        }
        graph.add_hyperedge(edge);
        counter++;
    };

    Correlated correlated;

    for (const auto& trace : traces) {
        if (!trace.is_object()) {
            counters.records_dropped++;
            continue;
        }
        counters.traces_processed++;

        auto edge = create_hyperedge_from_trace(trace, metrics, logs, correlated, counters);
        if (edge) {
            append(*edge, counters.trace_edges);
        }
    }

    for (const auto& edge : create_orphaned_hyperedges(traces, metrics, logs, correlated, counters)) {
        append(edge, counters.orphaned_edges);
    }

    log("[build] " + std::to_string(counters.trace_edges) + " trace hyperedges, " +
        std::to_string(counters.orphaned_edges) + " orphaned hyperedges");
}

std::optional<Hyperedge> CTHBuilder::create_hyperedge_from_trace(
    const json& trace,
    const json& metrics,
    const json& logs,
    Correlated& correlated,
    BuildStatistics& stats
) const {
    auto trace_id = id_field(trace, "trace_id");
    auto spans_it = trace.find("spans");
    if (spans_it == trace.end() || !spans_it->is_array() || spans_it->empty()) {
        stats.traces_skipped++;
        return std::nullopt;
    }
    const json& spans = *spans_it;

    std::set<std::string> nodes;
    std::optional<Timestamp> trace_start;
    std::optional<Timestamp> trace_end;
    bool has_errors = false;

    for (const auto& span : spans) {
        if (!span.is_object()) {
            stats.records_dropped++;
            continue;
        }

        if (auto service = string_field(span, "service"); service && !service->empty()) {
            nodes.insert("service:" + *service);
        }

        auto tags = span.find("tags");
        if (tags != span.end() && tags->is_object()) {
            for (const char* kind : {"pod", "container", "node"}) {
                auto value = string_field(*tags, kind);
                if (value && !value->empty()) {
                    nodes.insert(std::string(kind) + ":" + *value);
                }
            }
        }

        auto start = timestamp_field(span, "start_time");
        auto end = timestamp_field(span, "end_time");
        if (start && (!trace_start || *start < *trace_start)) {
            trace_start = start;
        }
        if (end && (!trace_end || *end > *trace_end)) {
            trace_end = end;
        }

        const std::string status = to_lower(string_field(span, "status").value_or(""));
        if (std::find(kErrorSpanStatuses.begin(), kErrorSpanStatuses.end(), status)
                != kErrorSpanStatuses.end()) {
            has_errors = true;
        }
    }

    if (nodes.empty() || !trace_start) {
        stats.traces_skipped++;
        log("Skipping trace " + trace_id.value_or("<none>") + ": no entities or start time");
        return std::nullopt;
    }

    const Timestamp window_end = trace_end.value_or(*trace_start);

    std::set<size_t> matched_metrics;
    std::set<size_t> matched_logs;
    auto anomalous_metrics = find_anomalous_metrics(metrics, nodes, *trace_start, window_end, matched_metrics);
    auto critical_logs = find_critical_logs(logs, nodes, *trace_start, window_end, matched_logs);

    if (anomalous_metrics.empty() && critical_logs.empty() && !has_errors) {
        stats.traces_without_anomaly++;
        return std::nullopt;
    }

    correlated.metrics.insert(matched_metrics.begin(), matched_metrics.end());
    correlated.logs.insert(matched_logs.begin(), matched_logs.end());

    Hyperedge edge;
    edge.nodes = std::move(nodes);
    edge.severity = determine_severity(spans, anomalous_metrics, critical_logs);
    edge.metrics = std::move(anomalous_metrics);
    edge.logs = std::move(critical_logs);
    edge.timestamp = *trace_start;
    edge.trace_id = trace_id;
    edge.event_type = "trace_event";
    if (trace_end) {
        edge.duration = seconds_between(*trace_start, *trace_end);
    }
    edge.edge_id = Hyperedge::compute_edge_id(edge.nodes, edge.timestamp, edge.trace_id);

    return edge;
}

std::vector<Hyperedge> CTHBuilder::create_orphaned_hyperedges(
    const json& traces,
    const json& metrics,
    const json& logs,
    const Correlated& correlated,
    BuildStatistics& stats
) const {
    std::set<std::string> trace_coverage;
    for (const auto& trace : traces) {
        if (!trace.is_object()) continue;
        if (auto id = id_field(trace, "trace_id")) {
            trace_coverage.insert(*id);
        }
    }

    auto is_covered = [&trace_coverage](const json& record) {
        auto id = record_trace_id(record);
        return id && trace_coverage.count(*id) > 0;
    };

    // Bucket start -> signals; std::map keeps buckets in time order
    struct Bucket {
        std::set<std::string> nodes;
        std::set<std::string> metrics;
        std::set<std::string> logs;
    };
    std::map<Timestamp, Bucket> buckets;

    auto node_for_entity = [](const std::string& entity) {
        const std::string lowered = to_lower(entity);
        if (lowered.find("service") != std::string::npos) return "service:" + entity;
        if (lowered.find("pod") != std::string::npos) return "pod:" + entity;
        return "entity:" + entity;
    };

    for (size_t i = 0; i < metrics.size(); ++i) {
        const json& metric = metrics[i];
        if (!metric.is_object()) {
            stats.records_dropped++;
            continue;
        }
        if (!is_anomalous_metric(metric) || is_covered(metric) || correlated.metrics.count(i)) continue;

        auto entity = string_field(metric, "entity");
        auto name = id_field(metric, "metric_name");
        auto timestamp = timestamp_field(metric, "timestamp");
        if (!entity || entity->empty() || !name || !timestamp) {
            stats.records_dropped++;
            continue;
        }

        Bucket& bucket = buckets[floor_to_minutes(*timestamp, config_.orphan_bucket_minutes)];
        bucket.nodes.insert(node_for_entity(*entity));
        bucket.metrics.insert(*entity + ":" + *name);
    }

    for (size_t i = 0; i < logs.size(); ++i) {
        const json& log_entry = logs[i];
        if (!log_entry.is_object()) {
            stats.records_dropped++;
            continue;
        }
        if (!is_critical_log(log_entry) || is_covered(log_entry) || correlated.logs.count(i)) continue;

        auto entity = string_field(log_entry, "entity");
        auto timestamp = timestamp_field(log_entry, "timestamp");
        if (!entity || entity->empty() || !timestamp) {
            stats.records_dropped++;
            continue;
        }

        Bucket& bucket = buckets[floor_to_minutes(*timestamp, config_.orphan_bucket_minutes)];
        bucket.nodes.insert(node_for_entity(*entity));
        bucket.logs.insert(truncate_message(string_field(log_entry, "message").value_or("")));
    }

    std::vector<Hyperedge> result;
    for (auto& [bucket_start, bucket] : buckets) {
        if (bucket.nodes.empty() || (bucket.metrics.empty() && bucket.logs.empty())) {
            continue;
        }

        Hyperedge edge;
        edge.nodes = std::move(bucket.nodes);
        edge.metrics = std::move(bucket.metrics);
        edge.logs = std::move(bucket.logs);
        edge.timestamp = bucket_start;
        edge.event_type = "orphaned_anomaly";
        edge.severity = Severity::WARNING;
        edge.edge_id = Hyperedge::compute_edge_id(edge.nodes, edge.timestamp);
        result.push_back(std::move(edge));
    }

    return result;
}

std::set<std::string> CTHBuilder::find_anomalous_metrics(
    const json& metrics,
    const std::set<std::string>& nodes,
    Timestamp start,
    Timestamp end,
    std::set<size_t>& matched
) const {
    std::set<std::string> anomalous;
    const Timestamp limit = end + std::chrono::seconds(config_.time_window_seconds);

    for (size_t i = 0; i < metrics.size(); ++i) {
        const json& metric = metrics[i];
        if (!metric.is_object() || !is_anomalous_metric(metric)) continue;

        auto timestamp = timestamp_field(metric, "timestamp");
        if (!timestamp || *timestamp < start || *timestamp > limit) continue;

        if (is_associated(metric, nodes)) {
            anomalous.insert(string_field(metric, "entity").value_or("") + ":" +
                             id_field(metric, "metric_name").value_or(""));
            matched.insert(i);
        }
    }

    return anomalous;
}

std::set<std::string> CTHBuilder::find_critical_logs(
    const json& logs,
    const std::set<std::string>& nodes,
    Timestamp start,
    Timestamp end,
    std::set<size_t>& matched
) const {
    std::set<std::string> critical;
    const Timestamp limit = end + std::chrono::seconds(config_.time_window_seconds);

    for (size_t i = 0; i < logs.size(); ++i) {
        const json& log_entry = logs[i];
        if (!log_entry.is_object() || !is_critical_log(log_entry)) continue;

        auto timestamp = timestamp_field(log_entry, "timestamp");
        if (!timestamp || *timestamp < start || *timestamp > limit) continue;

        if (is_associated(log_entry, nodes)) {
            critical.insert(truncate_message(string_field(log_entry, "message").value_or("")));
            matched.insert(i);
        }
    }

    return critical;
}

Severity CTHBuilder::determine_severity(
    const json& spans,
    const std::set<std::string>& metrics,
    const std::set<std::string>& logs
) const {
    bool span_critical = false;
    bool span_error = false;
    for (const auto& span : spans) {
        if (!span.is_object()) continue;
        const std::string status = to_lower(string_field(span, "status").value_or(""));
        if (status == "critical" || status == "fatal") span_critical = true;
        if (status == "error") span_error = true;
    }
    if (span_critical) return Severity::CRITICAL;
    if (span_error) return Severity::ERROR;

    bool log_critical = false;
    bool log_error = false;
    for (const auto& message : logs) {
        const std::string lowered = to_lower(message);
        if (contains_any(lowered, kCriticalWords)) log_critical = true;
        if (contains_any(lowered, kErrorWords)) log_error = true;
    }
    if (log_critical) return Severity::CRITICAL;
    if (log_error) return Severity::ERROR;

    if (!metrics.empty() || !logs.empty()) {
        return Severity::WARNING;
    }
    return Severity::NORMAL;
}

bool CTHBuilder::is_associated(const json& record, const std::set<std::string>& nodes) const {
    std::vector<std::string> needles;

    auto entity = string_field(record, "entity");
    if (entity && !entity->empty()) {
        needles.push_back(*entity);
    }

    auto tags = record.find("tags");
    if (tags != record.end() && tags->is_object()) {
        for (const auto& value : *tags) {
            if (value.is_string() && !value.get<std::string>().empty()) {
                needles.push_back(value.get<std::string>());
            }
        }
    }

    for (const auto& node : nodes) {
        if (contains_any(node, needles)) return true;
    }
    return false;
}

bool CTHBuilder::is_critical_log(const json& log_entry) const {
    const std::string level = to_lower(string_field(log_entry, "level").value_or(""));
    if (std::find(kCriticalLogLevels.begin(), kCriticalLogLevels.end(), level)
            != kCriticalLogLevels.end()) {
        return true;
    }

    const std::string message = to_lower(string_field(log_entry, "message").value_or(""));
    for (const auto& keyword : anomaly_keywords()) {
        if (message.find(keyword) != std::string::npos) return true;
    }
    return false;
}

bool CTHBuilder::is_anomalous_metric(const json& metric) {
    auto it = metric.find("is_anomalous");
    if (it == metric.end()) return false;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_number()) return it->get<double>() != 0.0;
    if (it->is_string()) {
        const std::string value = to_lower(it->get<std::string>());
        return value == "true" || value == "1" || value == "yes";
    }
    return false;
}

std::string CTHBuilder::truncate_message(const std::string& message) const {
    // Count characters, not bytes: never split a UTF-8 sequence
    size_t chars = 0;
    for (size_t i = 0; i < message.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(message[i]);
        if ((c & 0xC0) != 0x80) {
            if (chars == config_.max_log_length) {
                return message.substr(0, i);
            }
            ++chars;
        }
    }
    return message;
}

void CTHBuilder::log(const std::string& message) const {
    if (config_.verbose) {
        std::cerr << message << "\n";
    }
}

} // namespace cth
