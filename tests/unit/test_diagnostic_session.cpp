#include <gtest/gtest.h>
#include "session/diagnostic_session.hpp"

using namespace cth;
using json = nlohmann::json;

namespace {

json incident_data() {
    return json::parse(R"({
        "traces": [
            {
                "trace_id": "t-1",
                "spans": [
                    {"service": "checkout", "start_time": "2024-01-15T10:00:00Z",
                     "end_time": "2024-01-15T10:00:01Z", "status": "error",
                     "tags": {"pod": "checkout-7d9f"}}
                ]
            },
            {
                "trace_id": "t-2",
                "spans": [
                    {"service": "checkout", "start_time": "2024-01-15T10:00:30Z",
                     "end_time": "2024-01-15T10:00:31Z", "status": "ok"},
                    {"service": "payments", "start_time": "2024-01-15T10:00:30Z",
                     "end_time": "2024-01-15T10:00:32Z", "status": "critical"}
                ]
            }
        ],
        "metrics": [
            {"entity": "payments", "metric_name": "error_rate", "value": 0.4,
             "timestamp": "2024-01-15T10:00:31Z", "is_anomalous": true}
        ],
        "logs": []
    })");
}

} // namespace

class DiagnosticSessionTest : public ::testing::Test {
protected:
    DiagnosticSession session;

    void SetUp() override {
        BuildResult result = session.build_from_data(incident_data());
        ASSERT_TRUE(result.success);
    }
};

// ==========================================
// Build Tests
// ==========================================

TEST(DiagnosticSessionBuildTest, NoGraphBeforeBuild) {
    DiagnosticSession session;
    EXPECT_FALSE(session.has_graph());
    EXPECT_THROW(session.graph(), std::logic_error);

    auto response = session.query(json{{"query_type", "get_graph_statistics"}});
    EXPECT_EQ(response["error"], "No CTH graph available");
    EXPECT_EQ(session.analyze_alert("service checkout down")["error"], "No CTH graph available");
}

TEST(DiagnosticSessionBuildTest, InvalidInputReportsErrors) {
    DiagnosticSession session;
    BuildResult result = session.build_from_data(json{{"traces", json::array()}});

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errors, (std::vector<std::string>{
        "Missing required key: metrics",
        "Missing required key: logs"
    }));
    EXPECT_FALSE(session.has_graph());

    auto j = result.to_json();
    EXPECT_FALSE(j["success"].get<bool>());
    EXPECT_TRUE(j["cth_graph"].is_null());
}

TEST(DiagnosticSessionBuildTest, FailedBuildKeepsPreviousGraph) {
    DiagnosticSession session;
    ASSERT_TRUE(session.build_from_data(incident_data()).success);
    const size_t edges = session.graph().num_edges();

    EXPECT_FALSE(session.build_from_data(json::array()).success);
    ASSERT_TRUE(session.has_graph());
    EXPECT_EQ(session.graph().num_edges(), edges);
}

TEST_F(DiagnosticSessionTest, BuildResultCarriesGraphAndStatistics) {
    BuildResult result = session.build_from_data(incident_data());
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(result.build_statistics.trace_edges, 2);

    auto j = result.to_json();
    EXPECT_EQ(j["cth_graph"]["hyperedges"].size(), 2);
    EXPECT_EQ(j["statistics"]["total_edges"], 2);
    EXPECT_EQ(j["build_statistics"]["traces_processed"], 2);
}

TEST_F(DiagnosticSessionTest, ClearDropsGraph) {
    session.clear();
    EXPECT_FALSE(session.has_graph());
}

TEST_F(DiagnosticSessionTest, SetGraphReplacesCurrent) {
    session.set_graph(CTHGraph());
    ASSERT_TRUE(session.has_graph());
    EXPECT_TRUE(session.graph().empty());
}

// ==========================================
// Query Tests
// ==========================================

TEST_F(DiagnosticSessionTest, QueryNodesByEntity) {
    auto response = session.query(json{{"query_type", "query_nodes_by_entity"},
                                       {"entity_name", "service:checkout"}});
    EXPECT_EQ(response["entity"], "service:checkout");
    EXPECT_EQ(response["hyperedges_count"], 2);
    EXPECT_EQ(response["hyperedges"].size(), 2);

    auto alias = session.query(json{{"query_type", "query_nodes_by_entity"},
                                    {"entity", "pod:checkout-7d9f"}});
    EXPECT_EQ(alias["hyperedges_count"], 1);
}

TEST_F(DiagnosticSessionTest, QueryAnomalousEventsBySeverity) {
    auto all = session.query(json{{"query_type", "query_anomalous_events"}});
    EXPECT_EQ(all["anomalous_events_count"], 2);

    auto critical = session.query(json{{"query_type", "query_anomalous_events"},
                                       {"severity_level", "critical"}});
    ASSERT_EQ(critical["anomalous_events_count"], 1);
    EXPECT_EQ(critical["events"][0]["severity"], "critical");

    auto warning = session.query(QueryRequest{QueryAnomalousEvents{Severity::WARNING}});
    EXPECT_EQ(warning["anomalous_events_count"], 0);
}

TEST_F(DiagnosticSessionTest, FindPropagationPathsQuery) {
    auto response = session.query(json{{"query_type", "find_propagation_paths"},
                                       {"start_node", "service:checkout"},
                                       {"max_paths", 1}});
    EXPECT_EQ(response["start_node"], "service:checkout");
    ASSERT_EQ(response["paths_found"], 1);
    // The lone critical edge (p = 1.0) outranks the error -> critical chain
    EXPECT_EQ(response["paths"][0]["summary"]["severity_progression"], json({"critical"}));

    auto all = session.query(json{{"query_type", "find_propagation_paths"},
                                  {"start_node", "service:checkout"}});
    ASSERT_EQ(all["paths_found"], 2);
    EXPECT_EQ(all["paths"][1]["summary"]["severity_progression"], json({"error", "critical"}));
}

TEST_F(DiagnosticSessionTest, GraphStatisticsQuery) {
    auto response = session.query(QueryRequest{GetGraphStatistics{}});
    EXPECT_EQ(response["total_edges"], 2);
    EXPECT_EQ(response["earliest_event"], "2024-01-15T10:00:00Z");
}

TEST_F(DiagnosticSessionTest, MalformedQueries) {
    EXPECT_EQ(session.query(json{{"query_type", "drop_tables"}})["error"],
              "Unknown query type: drop_tables");
    EXPECT_EQ(session.query(json{{"entity_name", "x"}})["error"], "Missing query_type");
    EXPECT_EQ(session.query(json::array())["error"], "Query request must be an object");
    EXPECT_EQ(session.query(json{{"query_type", "query_nodes_by_entity"}})["error"],
              "Missing parameter: entity_name");
    EXPECT_EQ(session.query(json{{"query_type", "find_propagation_paths"}})["error"],
              "Missing parameter: start_node");
    EXPECT_EQ(session.query(json{{"query_type", "query_anomalous_events"},
                                 {"severity_level", "bogus"}})["error"],
              "Invalid severity level: bogus");
    EXPECT_TRUE(session.query(json{{"query_type", "find_propagation_paths"},
                                   {"start_node", "service:checkout"},
                                   {"max_paths", -3}}).contains("error"));
    EXPECT_EQ(session.query(json{{"query_type", "find_propagation_paths"},
                                 {"start_node", "service:checkout"},
                                 {"max_paths", 4294967297ULL}})["error"],
              "Parameter 'max_paths' must be a non-negative integer");
}

TEST(QueryParsingTest, MaxPathsMustFitInInt) {
    std::string error;
    auto too_big = json::parse(
        R"({"query_type": "find_propagation_paths", "start_node": "service:a", "max_paths": 4294967297})");
    EXPECT_FALSE(parse_query_request(too_big, error).has_value());
    EXPECT_EQ(error, "Parameter 'max_paths' must be a non-negative integer");

    json just_over = {{"query_type", "find_propagation_paths"}, {"start_node", "service:a"},
                      {"max_paths", 2147483648LL}};
    EXPECT_FALSE(parse_query_request(just_over, error).has_value());

    json fractional = {{"query_type", "find_propagation_paths"}, {"start_node", "service:a"},
                       {"max_paths", 2.5}};
    EXPECT_FALSE(parse_query_request(fractional, error).has_value());

    json largest = {{"query_type", "find_propagation_paths"}, {"start_node", "service:a"},
                    {"max_paths", 2147483647}};
    auto parsed = parse_query_request(largest, error);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(std::get<FindPropagationPaths>(*parsed).max_paths, std::optional<int>(2147483647));
}

TEST(QueryParsingTest, TypeNamesMatchWireForm) {
    std::string error;
    for (const char* name : {"query_nodes_by_entity", "query_anomalous_events",
                             "find_propagation_paths", "get_graph_statistics"}) {
        json request = {{"query_type", name}, {"entity_name", "a"}, {"start_node", "b"}};
        auto parsed = parse_query_request(request, error);
        ASSERT_TRUE(parsed.has_value()) << error;
        EXPECT_EQ(query_type_name(*parsed), name);
    }
}

// ==========================================
// Alert Analysis Tests
// ==========================================

TEST_F(DiagnosticSessionTest, ExtractStructuredMentions) {
    auto nodes = session.extract_anomaly_nodes(
        "High latency on Service checkout, pod: checkout-7d9f restarting on node worker-3");
    EXPECT_EQ(nodes, (std::vector<std::string>{
        "node:worker-3", "pod:checkout-7d9f", "service:checkout"
    }));
}

TEST_F(DiagnosticSessionTest, ExtractFallsBackToHyphenatedTokens) {
    auto nodes = session.extract_anomaly_nodes(
        "Latency spike seen on web-01 then cart-api then db-primary then api-gw and x-y");
    EXPECT_EQ(nodes, (std::vector<std::string>{
        "entity:cart-api", "entity:db-primary", "entity:web-01"
    }));
}

TEST_F(DiagnosticSessionTest, ExtractNothing) {
    EXPECT_TRUE(session.extract_anomaly_nodes("everything is on fire").empty());
}

TEST_F(DiagnosticSessionTest, AnalyzeAlert) {
    auto report = session.analyze_alert("Error budget burn: service checkout failing");

    EXPECT_EQ(report["alert"], "Error budget burn: service checkout failing");
    EXPECT_EQ(report["anomaly_nodes"], json({"service:checkout"}));
    EXPECT_GE(report["total_paths_found"].get<int>(), 1);
    EXPECT_GT(report["scope_analysis"]["total_affected_nodes"].get<int>(), 0);
    EXPECT_FALSE(report["recommendations"].empty());
}

TEST_F(DiagnosticSessionTest, AnalyzeAlertWithoutMatches) {
    auto report = session.analyze_alert("nothing recognisable here");
    EXPECT_TRUE(report["anomaly_nodes"].empty());
    EXPECT_EQ(report["total_paths_found"], 0);
    EXPECT_EQ(report["scope_analysis"]["total_affected_nodes"], 0);
    EXPECT_EQ(report["recommendations"].size(), 1);
}

// ==========================================
// Configuration Tests
// ==========================================

TEST(DiagnosticSessionConfigTest, ConfigReachesComponents) {
    EngineConfig config;
    config.time_window_seconds = 60;
    config.max_path_length = 3;
    config.max_paths = 2;

    DiagnosticSession session(config);
    EXPECT_EQ(session.builder().config().time_window_seconds, 60);
    EXPECT_EQ(session.analyzer().config().max_path_length, 3);
    EXPECT_EQ(session.analyzer().config().default_max_paths, 2);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
