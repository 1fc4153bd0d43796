#include "cli/cli.hpp"
#include "config/engine_config.hpp"
#include "session/diagnostic_session.hpp"
#include <algorithm>
#include <iostream>
#include <fstream>

using namespace cth;

// ============== Helper Functions ==============

nlohmann::json load_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open input file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }
    return j;
}

void write_json_file(const std::string& path, const nlohmann::json& j, int indent) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << j.dump(indent);
}

EngineConfig load_checked_config(const Args& args) {
    EngineConfig config = load_engine_config(args.value("config"));

    std::string error;
    if (!config.validate(error)) {
        throw std::runtime_error("Invalid configuration: " + error);
    }
    return config;
}

// Session over a previously exported graph
DiagnosticSession open_graph(const std::string& graph_path, const EngineConfig& config) {
    DiagnosticSession session(config);
    session.set_graph(CTHGraph::load_from_json(graph_path));
    return session;
}

// ============== cth validate ==============
int cmd_validate(const Args& args) {
    std::string input_path = args.require("input");

    auto data = load_json_file(input_path);
    CTHBuilder builder;
    auto errors = builder.validate_input_data(data);

    if (errors.empty()) {
        std::cout << "Input is valid: " << input_path << "\n";
        return 0;
    }

    std::cerr << "Error: " << errors.size() << " validation error(s) in " << input_path << "\n";
    for (const auto& error : errors) {
        std::cerr << "  - " << error << "\n";
    }
    return 1;
}

// ============== cth build ==============
int cmd_build(const Args& args) {
    std::string input_path = args.require("input");
    std::string output_path = args.value("output");
    EngineConfig config = load_checked_config(args);

    std::cout << "Loading observability data from: " << input_path << "\n";
    auto data = load_json_file(input_path);

    DiagnosticSession session(config);
    BuildResult result = session.build_from_data(data);

    if (!result.success) {
        for (const auto& error : result.errors) {
            std::cerr << "Error: " << error << "\n";
        }
        return 1;
    }

    result.build_statistics.print_summary();

    const auto& graph = session.graph();
    std::cout << "\nCTH Statistics:\n";
    std::cout << "  Hyperedges: " << graph.num_edges() << "\n";
    std::cout << "  Nodes: " << graph.num_nodes() << "\n";

    if (!output_path.empty()) {
        write_json_file(output_path, result.graph, config.json_indent);
        std::cout << "\nSaved graph to: " << output_path << "\n";
    }

    return 0;
}

// ============== cth query ==============
int cmd_query(const Args& args) {
    std::string graph_path = args.require("graph");
    std::string type = args.require("type");
    EngineConfig config = load_checked_config(args);

    nlohmann::json request;
    request["query_type"] = type;
    if (args.has("entity")) request["entity_name"] = args.value("entity");
    if (args.has("start-node")) request["start_node"] = args.value("start-node");
    if (args.has("severity")) request["severity_level"] = args.value("severity");
    if (args.has("max-paths")) request["max_paths"] = args.int_value("max-paths");

    DiagnosticSession session = open_graph(graph_path, config);
    nlohmann::json result = session.query(request);

    if (result.contains("error")) {
        std::cerr << "Error: " << result["error"].get<std::string>() << "\n";
        return 1;
    }

    std::cout << result.dump(config.json_indent) << "\n";
    return 0;
}

// ============== cth analyze ==============
int cmd_analyze(const Args& args) {
    std::string graph_path = args.require("graph");
    std::string output_path = args.value("output");
    EngineConfig config = load_checked_config(args);

    const bool by_node = args.has("start-node");
    const bool by_alert = args.has("alert");
    if (by_node == by_alert) {
        throw std::runtime_error("Specify exactly one of --start-node or --alert");
    }
    if (args.has("max-paths")) {
        config.max_paths = args.int_value("max-paths");
        std::string error;
        if (!config.validate(error)) {
            throw std::runtime_error("Invalid configuration: " + error);
        }
    }

    DiagnosticSession session = open_graph(graph_path, config);

    nlohmann::json report;
    if (by_node) {
        report = session.analyzer().generate_propagation_report(session.graph(), args.value("start-node"));
    } else {
        report = session.analyze_alert(args.value("alert"));
    }

    if (report.contains("error")) {
        std::cerr << "Error: " << report["error"].get<std::string>() << "\n";
        return 1;
    }

    if (!output_path.empty()) {
        write_json_file(output_path, report, config.json_indent);
        std::cout << "Saved report to: " << output_path << "\n";
    } else {
        std::cout << report.dump(config.json_indent) << "\n";
    }

    return 0;
}

// ============== cth stats ==============
int cmd_stats(const Args& args) {
    std::string graph_path = args.require("graph");

    std::cout << "Loading CTH graph from: " << graph_path << "\n";
    CTHGraph graph = CTHGraph::load_from_json(graph_path);
    graph.check_invariants();

    auto stats = graph.get_statistics();

    std::cout << "\nCTH Statistics:\n";
    std::cout << "  Hyperedges: " << stats.total_edges << "\n";
    std::cout << "  Nodes: " << stats.total_nodes << "\n";
    std::cout << "  Time span: " << stats.time_span_seconds << "s\n";
    if (stats.earliest_event) {
        std::cout << "  Earliest event: " << format_timestamp(*stats.earliest_event) << "\n";
        std::cout << "  Latest event: " << format_timestamp(*stats.latest_event) << "\n";
    }
    std::cout << "  Total events recorded: " << stats.metadata.total_events << "\n";

    // Busiest entities
    auto index = graph.node_index();
    std::vector<std::pair<std::string, size_t>> degrees;
    for (const auto& [node, edge_ids] : index) {
        degrees.emplace_back(node, edge_ids.size());
    }
    std::stable_sort(degrees.begin(), degrees.end(),
        [](const auto& a, const auto& b) { return a.second > b.second; });

    std::cout << "\nTop 10 Entities:\n";
    for (size_t i = 0; i < degrees.size() && i < 10; ++i) {
        std::cout << "  " << degrees[i].first << " (" << degrees[i].second << " hyperedges)\n";
    }

    return 0;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CLI cli("cth", "1.0.0");

    // cth validate
    cli.register_command({
        "validate",
        "Check the structure of an observability data file",
        {
            {"input", "i", "Input JSON file with traces, metrics and logs", true}
        },
        cmd_validate
    });

    // cth build
    cli.register_command({
        "build",
        "Build a causal-temporal hypergraph from observability data",
        {
            {"input", "i", "Input JSON file with traces, metrics and logs", true},
            {"output", "o", "Output path for the graph JSON", false},
            {"config", "c", "Engine config file (default: CTH_* environment)", false}
        },
        cmd_build
    });

    // cth query
    cli.register_command({
        "query",
        "Run a query against a saved graph",
        {
            {"graph", "g", "Graph JSON file", true},
            {"type", "t", "Query type: query_nodes_by_entity, query_anomalous_events, find_propagation_paths, get_graph_statistics", true},
            {"entity", "e", "Node id for query_nodes_by_entity", false},
            {"start-node", "s", "Start node for find_propagation_paths", false},
            {"severity", "l", "Severity filter: normal, warning, error, critical", false},
            {"max-paths", "m", "Maximum number of paths", false},
            {"config", "c", "Engine config file (default: CTH_* environment)", false}
        },
        cmd_query
    });

    // cth analyze
    cli.register_command({
        "analyze",
        "Propagation report for a start node or an alert text",
        {
            {"graph", "g", "Graph JSON file", true},
            {"start-node", "s", "Start node id, e.g. service:checkout", false},
            {"alert", "a", "Free-form alert text", false},
            {"max-paths", "m", "Maximum number of paths per start node", false},
            {"output", "o", "Output path for the report JSON", false},
            {"config", "c", "Engine config file (default: CTH_* environment)", false}
        },
        cmd_analyze
    });

    // cth stats
    cli.register_command({
        "stats",
        "Print statistics about a saved graph",
        {
            {"graph", "g", "Graph JSON file", true}
        },
        cmd_stats
    });

    return cli.run(argc, argv);
}
