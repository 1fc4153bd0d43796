#include <gtest/gtest.h>
#include "analysis/propagation_analyzer.hpp"
#include <atomic>
#include <cmath>
#include <limits>

using namespace cth;

namespace {

Hyperedge make_edge(std::set<std::string> nodes, Timestamp ts, Severity severity) {
    Hyperedge edge;
    edge.nodes = std::move(nodes);
    edge.timestamp = ts;
    edge.severity = severity;
    edge.event_type = "trace_event";
    return edge;
}

Timestamp at(int minute, int second = 0) {
    return make_timestamp(2024, 1, 15, 10, minute, second);
}

// Always returns the same value, whatever the edges
class ConstantScorer : public TransitionScorer {
public:
    explicit ConstantScorer(double value) : value_(value) {}
    double score(const Hyperedge&, const Hyperedge&) const override { return value_; }

private:
    double value_;
};

} // namespace

// ==========================================
// Two-Edge Propagation Fixture
// ==========================================

class PropagationTest : public ::testing::Test {
protected:
    CTHGraph graph;
    PropagationAnalyzer analyzer;
    std::string first, second;

    void SetUp() override {
        first = graph.add_hyperedge(make_edge({"service:frontend"}, at(0, 0), Severity::WARNING));
        second = graph.add_hyperedge(make_edge({"service:frontend"}, at(0, 10), Severity::ERROR));
    }
};

TEST_F(PropagationTest, FindsEscalatingPath) {
    auto paths = analyzer.find_propagation_paths(graph, "service:frontend");
    ASSERT_FALSE(paths.empty());

    const auto& best = paths.front();
    ASSERT_EQ(best.length(), 2);
    EXPECT_EQ(best.hyperedges[0].edge_id, first);
    EXPECT_EQ(best.hyperedges[1].edge_id, second);
    EXPECT_GE(best.probability, 0.1);
    EXPECT_LE(best.probability, 1.0);

    auto summary = best.summary_json();
    EXPECT_EQ(summary["severity_progression"], nlohmann::json({"warning", "error"}));
    EXPECT_EQ(summary["path_length"], 2);
    EXPECT_DOUBLE_EQ(summary["total_duration"].get<double>(), 10.0);
    EXPECT_EQ(summary["edge_ids"], nlohmann::json({first, second}));
    EXPECT_EQ(summary["node_count"], 1);
}

TEST_F(PropagationTest, LongerPathWinsProbabilityTie) {
    // Both candidates have probability 1.0 (the transition caps out)
    auto paths = analyzer.find_propagation_paths(graph, "service:frontend");
    ASSERT_EQ(paths.size(), 2);
    EXPECT_DOUBLE_EQ(paths[0].probability, 1.0);
    EXPECT_DOUBLE_EQ(paths[1].probability, 1.0);
    EXPECT_EQ(paths[0].length(), 2);
    EXPECT_EQ(paths[1].length(), 1);
    EXPECT_EQ(paths[1].hyperedges[0].edge_id, second);
}

TEST_F(PropagationTest, PathsAreStrictlyTimeOrdered) {
    graph.add_hyperedge(make_edge({"service:frontend", "pod:fe-1"}, at(1), Severity::CRITICAL));
    graph.add_hyperedge(make_edge({"pod:fe-1", "node:worker-2"}, at(2), Severity::CRITICAL));

    for (const auto& path : analyzer.find_propagation_paths(graph, "service:frontend", 50)) {
        for (size_t i = 1; i < path.hyperedges.size(); ++i) {
            EXPECT_LT(path.hyperedges[i - 1].timestamp, path.hyperedges[i].timestamp);
            EXPECT_TRUE(path.hyperedges[i - 1].has_intersection(path.hyperedges[i]));
        }
        EXPECT_GE(path.probability, analyzer.config().min_probability);
    }
}

TEST_F(PropagationTest, MaxPathsTruncates) {
    EXPECT_EQ(analyzer.find_propagation_paths(graph, "service:frontend", 1).size(), 1);
    EXPECT_TRUE(analyzer.find_propagation_paths(graph, "service:frontend", 0).empty());
}

TEST_F(PropagationTest, UnknownStartNode) {
    EXPECT_TRUE(analyzer.find_propagation_paths(graph, "service:nobody").empty());
}

TEST_F(PropagationTest, MaxPathLengthOfOneGivesSingleEdges) {
    AnalyzerConfig config;
    config.max_path_length = 1;
    PropagationAnalyzer short_paths(config);

    auto paths = short_paths.find_propagation_paths(graph, "service:frontend");
    ASSERT_EQ(paths.size(), 2);
    for (const auto& path : paths) {
        EXPECT_EQ(path.length(), 1);
    }
    // Equal probability and length: earlier start first
    EXPECT_EQ(paths[0].hyperedges[0].edge_id, first);
}

TEST_F(PropagationTest, LowProbabilityBranchesPruned) {
    AnalyzerConfig config;
    config.min_probability = 0.5;
    PropagationAnalyzer strict(config, std::make_shared<ConstantScorer>(0.3));

    auto paths = strict.find_propagation_paths(graph, "service:frontend");
    ASSERT_EQ(paths.size(), 1);
    EXPECT_EQ(paths[0].length(), 1);
    EXPECT_EQ(paths[0].hyperedges[0].edge_id, second);
}

// ==========================================
// Cancellation Tests
// ==========================================

TEST_F(PropagationTest, CancelledSearchReturnsEmpty) {
    std::atomic<bool> cancel{true};
    SearchControl control;
    control.cancel = &cancel;

    EXPECT_TRUE(analyzer.find_propagation_paths(graph, "service:frontend", -1, control).empty());
}

TEST_F(PropagationTest, ExpiredDeadlineStopsSearch) {
    auto control = SearchControl::with_timeout(std::chrono::milliseconds(0));
    EXPECT_TRUE(control.should_stop());
    EXPECT_TRUE(analyzer.find_propagation_paths(graph, "service:frontend", -1, control).empty());
}

TEST_F(PropagationTest, UntriggeredControlDoesNotInterfere) {
    std::atomic<bool> cancel{false};
    auto control = SearchControl::with_timeout(std::chrono::minutes(5));
    control.cancel = &cancel;

    EXPECT_FALSE(control.should_stop());
    EXPECT_EQ(analyzer.find_propagation_paths(graph, "service:frontend", -1, control).size(), 2);
}

// ==========================================
// Scope Tests
// ==========================================

TEST_F(PropagationTest, ScopeOfEscalatingPath) {
    auto paths = analyzer.find_propagation_paths(graph, "service:frontend");
    ScopeReport scope = analyzer.quantify_propagation_scope(paths);

    EXPECT_EQ(scope.total_affected_nodes, 1);
    EXPECT_EQ(scope.node_type_counts.at("service"), 1);
    EXPECT_EQ(scope.affected_nodes_by_type.at("service"), (std::set<std::string>{"frontend"}));

    // (2 + 3 + 3) / 3 with all probabilities 1.0
    EXPECT_EQ(scope.scope_severity, Severity::ERROR);

    ASSERT_FALSE(scope.core_components.empty());
    EXPECT_EQ(scope.core_components.front().edge_id, second);
    EXPECT_NEAR(scope.centrality_scores.at(second), 0.85, 1e-9);
    EXPECT_NEAR(scope.centrality_scores.at(first), 0.35, 1e-9);

    ASSERT_TRUE(scope.temporal_analysis.has_value());
    EXPECT_DOUBLE_EQ(scope.temporal_analysis->total_time_span_seconds, 10.0);
    EXPECT_DOUBLE_EQ(scope.temporal_analysis->max_path_duration, 10.0);
    EXPECT_DOUBLE_EQ(scope.propagation_velocity, 0.1);
}

TEST_F(PropagationTest, ScopeJsonShape) {
    auto scope = analyzer.quantify_propagation_scope(
        analyzer.find_propagation_paths(graph, "service:frontend"));
    auto j = scope.to_json();

    EXPECT_EQ(j["total_affected_nodes"], 1);
    EXPECT_EQ(j["scope_severity"], "error");
    EXPECT_EQ(j["affected_nodes_by_type"]["service"], nlohmann::json({"frontend"}));
    EXPECT_TRUE(j["core_components"].is_array());
    EXPECT_TRUE(j["temporal_analysis"].contains("average_path_duration"));
    EXPECT_FALSE(j.contains("scope_summary"));
}

TEST(ScopeEdgeCaseTest, EmptyPathsGiveEmptyScope) {
    PropagationAnalyzer analyzer;
    ScopeReport scope = analyzer.quantify_propagation_scope({});

    EXPECT_TRUE(scope.empty());
    EXPECT_EQ(scope.to_json(), nlohmann::json::parse(R"({"total_affected_nodes":0,"scope_summary":{}})"));

    auto recommendations = analyzer.generate_recommendations(scope);
    ASSERT_EQ(recommendations.size(), 1);
    EXPECT_NE(recommendations[0].find("monitoring"), std::string::npos);
}

TEST(ScopeEdgeCaseTest, SingleEdgePathsHaveNoTemporalSpread) {
    PropagationAnalyzer analyzer;
    PropagationPath path({make_edge({"pod:a"}, at(0), Severity::WARNING)}, 1.0);

    auto scope = analyzer.quantify_propagation_scope({path});
    EXPECT_FALSE(scope.temporal_analysis.has_value());
    EXPECT_DOUBLE_EQ(scope.propagation_velocity, 0.0);
    EXPECT_EQ(scope.scope_severity, Severity::WARNING);
    EXPECT_TRUE(scope.to_json()["temporal_analysis"].empty());
}

// ==========================================
// Recommendation Tests
// ==========================================

TEST_F(PropagationTest, RecommendationsForErrorScope) {
    auto scope = analyzer.quantify_propagation_scope(
        analyzer.find_propagation_paths(graph, "service:frontend"));
    auto recommendations = analyzer.generate_recommendations(scope);

    ASSERT_EQ(recommendations.size(), 3);
    EXPECT_NE(recommendations[0].find("Urgent"), std::string::npos);
    EXPECT_EQ(recommendations.back(), "Focus on core component: service:frontend");
}

TEST(RecommendationTest, WideSpreadTriggersInfrastructureHints) {
    PropagationAnalyzer analyzer;
    ScopeReport scope;
    scope.total_affected_nodes = 6;
    scope.node_type_counts = {{"service", 4}, {"node", 2}};
    scope.scope_severity = Severity::CRITICAL;
    scope.propagation_velocity = 2.5;

    auto recommendations = analyzer.generate_recommendations(scope);
    ASSERT_EQ(recommendations.size(), 5);
    EXPECT_NE(recommendations[0].find("incident response"), std::string::npos);
    EXPECT_NE(recommendations[2].find("inter-service"), std::string::npos);
    EXPECT_NE(recommendations[3].find("infrastructure"), std::string::npos);
    EXPECT_NE(recommendations[4].find("isolate"), std::string::npos);
}

// ==========================================
// Report Tests
// ==========================================

TEST_F(PropagationTest, ReportContainsAllSections) {
    auto report = analyzer.generate_propagation_report(graph, "service:frontend");

    EXPECT_EQ(report["anomaly_start_node"], "service:frontend");
    EXPECT_EQ(report["total_paths_found"], 2);
    EXPECT_EQ(report["propagation_paths"].size(), 2);
    EXPECT_TRUE(report["propagation_paths"][0].contains("summary"));
    EXPECT_EQ(report["propagation_paths"][0]["hyperedges"].size(), 2);
    EXPECT_EQ(report["graph_statistics"]["total_edges"], 2);
    EXPECT_FALSE(report["recommendations"].empty());
    EXPECT_TRUE(parse_timestamp(report["analysis_timestamp"].get<std::string>()).has_value());
}

// ==========================================
// Transition Probability Tests
// ==========================================

TEST(TransitionTest, ZeroWhenNotStrictlyLater) {
    PropagationAnalyzer analyzer;
    auto a = make_edge({"service:a"}, at(5), Severity::ERROR);
    auto b = make_edge({"service:a"}, at(5), Severity::ERROR);
    auto earlier = make_edge({"service:a"}, at(1), Severity::ERROR);

    EXPECT_DOUBLE_EQ(analyzer.transition_probability(a, b), 0.0);
    EXPECT_DOUBLE_EQ(analyzer.transition_probability(a, earlier), 0.0);
}

TEST(TransitionTest, StaysWithinUnitInterval) {
    PropagationAnalyzer analyzer;
    auto from = make_edge({"service:a", "pod:a-1"}, at(0), Severity::NORMAL);

    for (int minutes : {0, 1, 10, 50}) {
        for (Severity s : {Severity::NORMAL, Severity::WARNING, Severity::ERROR, Severity::CRITICAL}) {
            auto to = make_edge({"pod:a-1", "node:n"}, at(minutes, 1), s);
            double p = analyzer.transition_probability(from, to);
            EXPECT_GE(p, 0.0);
            EXPECT_LE(p, 1.0);
        }
    }
}

TEST(TransitionTest, HeuristicWeights) {
    HeuristicTransitionScorer scorer;
    auto from = make_edge({"service:a", "pod:a-1"}, at(0), Severity::ERROR);
    auto to = make_edge({"pod:a-1", "node:n"}, at(5), Severity::WARNING);

    // overlap 1/3, severity drops, service/pod is the strongest pair
    double expected = 0.3 * std::exp(-300.0 / 300.0) + 0.4 / 3.0 + 0.2 * 0.8 + 0.1 * 0.9;
    EXPECT_NEAR(scorer.score(from, to), expected, 1e-12);
}

TEST(TransitionTest, SeverityFactor) {
    EXPECT_DOUBLE_EQ(HeuristicTransitionScorer::severity_factor(Severity::WARNING, Severity::WARNING), 1.0);
    EXPECT_DOUBLE_EQ(HeuristicTransitionScorer::severity_factor(Severity::NORMAL, Severity::CRITICAL), 1.6);
    EXPECT_DOUBLE_EQ(HeuristicTransitionScorer::severity_factor(Severity::CRITICAL, Severity::NORMAL), 0.8);
}

TEST(TransitionTest, EntityRelationshipTable) {
    using S = HeuristicTransitionScorer;
    EXPECT_DOUBLE_EQ(S::entity_relationship_factor({"service:a"}, {"pod:b"}), 0.9);
    EXPECT_DOUBLE_EQ(S::entity_relationship_factor({"pod:b"}, {"service:a"}), 0.9);
    EXPECT_DOUBLE_EQ(S::entity_relationship_factor({"node:x"}, {"pod:b"}), 0.8);
    EXPECT_DOUBLE_EQ(S::entity_relationship_factor({"service:a"}, {"service:b"}), 0.7);
    EXPECT_DOUBLE_EQ(S::entity_relationship_factor({"pod:a"}, {"pod:b"}), 0.6);
    EXPECT_DOUBLE_EQ(S::entity_relationship_factor({"container:c"}, {"service:a"}), 0.8);
    EXPECT_DOUBLE_EQ(S::entity_relationship_factor({"node:x"}, {"node:y"}), 0.0);
    EXPECT_DOUBLE_EQ(S::entity_relationship_factor({"entity:x"}, {"untyped"}), 0.0);
}

TEST(TransitionTest, NodeType) {
    EXPECT_EQ(node_type("service:cart"), "service");
    EXPECT_EQ(node_type("pod:a:b"), "pod");
    EXPECT_EQ(node_type("plain"), "");
}

TEST(TransitionTest, CustomScorerIsClamped) {
    auto from = make_edge({"service:a"}, at(0), Severity::ERROR);
    auto to = make_edge({"service:a"}, at(1), Severity::ERROR);

    EXPECT_DOUBLE_EQ(PropagationAnalyzer(AnalyzerConfig(), std::make_shared<ConstantScorer>(7.0))
                         .transition_probability(from, to), 1.0);
    EXPECT_DOUBLE_EQ(PropagationAnalyzer(AnalyzerConfig(), std::make_shared<ConstantScorer>(-2.0))
                         .transition_probability(from, to), 0.0);
    EXPECT_DOUBLE_EQ(PropagationAnalyzer(AnalyzerConfig(),
                         std::make_shared<ConstantScorer>(std::numeric_limits<double>::quiet_NaN()))
                         .transition_probability(from, to), 0.0);
    EXPECT_DOUBLE_EQ(PropagationAnalyzer(AnalyzerConfig(), std::make_shared<ConstantScorer>(0.42))
                         .transition_probability(from, to), 0.42);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
