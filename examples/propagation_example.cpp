#include "analysis/propagation_analyzer.hpp"
#include "builder/cth_builder.hpp"
#include "graph/cth_graph.hpp"
#include <iostream>
#include <iomanip>
#include <sys/stat.h>
#include <sys/types.h>

using namespace cth;
using json = nlohmann::json;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

json make_span(const std::string& service, const std::string& pod, const std::string& node,
               const std::string& start, const std::string& end, const std::string& status) {
    return {
        {"service", service},
        {"start_time", start},
        {"end_time", end},
        {"status", status},
        {"tags", {{"pod", pod}, {"node", node}}}
    };
}

// A database slowdown that spreads to the services depending on it
json make_incident_data() {
    json data;
    data["traces"] = json::array({
        {
            {"trace_id", "t-100"},
            {"spans", json::array({
                make_span("postgres", "postgres-0", "worker-1",
                          "2024-03-01T09:00:00Z", "2024-03-01T09:00:04Z", "timeout")
            })}
        },
        {
            {"trace_id", "t-101"},
            {"spans", json::array({
                make_span("orders", "orders-6f7c", "worker-1",
                          "2024-03-01T09:01:00Z", "2024-03-01T09:01:02Z", "ok"),
                make_span("postgres", "postgres-0", "worker-1",
                          "2024-03-01T09:01:00Z", "2024-03-01T09:01:02Z", "error")
            })}
        },
        {
            {"trace_id", "t-102"},
            {"spans", json::array({
                make_span("checkout", "checkout-5b9d", "worker-2",
                          "2024-03-01T09:02:30Z", "2024-03-01T09:02:31Z", "ok"),
                make_span("orders", "orders-6f7c", "worker-1",
                          "2024-03-01T09:02:30Z", "2024-03-01T09:02:31Z", "critical")
            })}
        }
    });

    data["metrics"] = json::array({
        {{"entity", "postgres-0"}, {"metric_name", "query_latency_p99"}, {"value", 2.4},
         {"timestamp", "2024-03-01T09:00:02Z"}, {"is_anomalous", true}},
        {{"entity", "orders-6f7c"}, {"metric_name", "error_rate"}, {"value", 0.31},
         {"timestamp", "2024-03-01T09:01:30Z"}, {"is_anomalous", true}},
        {{"entity", "cache-redis"}, {"metric_name", "evictions"}, {"value", 950},
         {"timestamp", "2024-03-01T09:03:10Z"}, {"is_anomalous", "yes"}}
    });

    data["logs"] = json::array({
        {{"entity", "postgres-0"}, {"message", "connection pool exhausted: too many clients"},
         {"level", "ERROR"}, {"timestamp", "2024-03-01T09:00:03Z"}},
        {{"entity", "checkout-5b9d"}, {"message", "upstream orders unavailable, request failed"},
         {"level", "WARN"}, {"timestamp", "2024-03-01T09:02:31Z"}}
    });

    return data;
}

int main() {
    print_separator("CTH Example - Fault Propagation Analysis");

    // Create output directory
    const std::string output_dir = "output_json";
    mkdir(output_dir.c_str(), 0755);

    json data = make_incident_data();

    // Step 1: validate
    CTHBuilder builder;
    auto errors = builder.validate_input_data(data);
    if (!errors.empty()) {
        for (const auto& error : errors) {
            std::cerr << "Validation error: " << error << "\n";
        }
        return 1;
    }
    std::cout << "1. Input validated: " << data["traces"].size() << " traces, "
              << data["metrics"].size() << " metrics, " << data["logs"].size() << " logs\n";

    // Step 2: build
    BuildStatistics build_stats;
    CTHGraph graph = builder.build_cth_from_json(data, &build_stats);
    build_stats.print_summary();

    std::cout << "\n2. Hyperedges in time order:\n";
    for (const auto& edge : graph.get_all_edges()) {
        std::cout << "   " << format_timestamp(edge.timestamp) << "  "
                  << std::setw(16) << std::left << edge.event_type
                  << std::setw(9) << severity_to_string(edge.severity) << " {";
        bool first = true;
        for (const auto& node : edge.nodes) {
            std::cout << (first ? "" : ", ") << node;
            first = false;
        }
        std::cout << "}\n";
    }

    // Step 3: propagation paths
    PropagationAnalyzer analyzer;
    const std::string start_node = "service:postgres";
    auto paths = analyzer.find_propagation_paths(graph, start_node);

    std::cout << "\n3. Propagation paths from " << start_node << ": " << paths.size() << "\n";
    for (size_t i = 0; i < paths.size(); ++i) {
        const auto& path = paths[i];
        std::cout << "   Path " << (i + 1) << " (p=" << std::fixed << std::setprecision(3)
                  << path.probability << ", " << path.length() << " hyperedges, "
                  << path.total_nodes.size() << " entities): ";
        for (size_t k = 0; k < path.hyperedges.size(); ++k) {
            std::cout << (k ? " -> " : "") << severity_to_string(path.hyperedges[k].severity);
        }
        std::cout << "\n";
    }

    // Step 4: scope
    ScopeReport scope = analyzer.quantify_propagation_scope(paths);
    std::cout << "\n4. Scope: " << scope.total_affected_nodes << " affected entities, severity "
              << severity_to_string(scope.scope_severity) << ", velocity "
              << scope.propagation_velocity << " entities/s\n";
    for (const auto& [type, count] : scope.node_type_counts) {
        std::cout << "   " << type << ": " << count << "\n";
    }

    std::cout << "\n5. Recommendations:\n";
    for (const auto& recommendation : analyzer.generate_recommendations(scope)) {
        std::cout << "   - " << recommendation << "\n";
    }

    // Step 5: export
    const std::string graph_path = output_dir + "/incident_cth.json";
    graph.export_to_json(graph_path);
    std::cout << "\nSaved graph to: " << graph_path << "\n";

    return 0;
}
