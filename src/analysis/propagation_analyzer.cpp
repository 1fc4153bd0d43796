#include "analysis/propagation_analyzer.hpp"
#include <algorithm>
#include <deque>
#include <iostream>

namespace cth {

// ==========================================
// PropagationPath
// ==========================================

PropagationPath::PropagationPath(std::vector<Hyperedge> edges, double prob)
    : hyperedges(std::move(edges)), probability(prob) {
    for (const auto& edge : hyperedges) {
        total_nodes.insert(edge.nodes.begin(), edge.nodes.end());
    }
}

double PropagationPath::duration_seconds() const {
    if (hyperedges.size() < 2) {
        return 0.0;
    }
    return seconds_between(hyperedges.front().timestamp, hyperedges.back().timestamp);
}

nlohmann::json PropagationPath::summary_json() const {
    if (hyperedges.empty()) {
        return nlohmann::json::object();
    }

    nlohmann::json severities = nlohmann::json::array();
    nlohmann::json edge_ids = nlohmann::json::array();
    for (const auto& edge : hyperedges) {
        severities.push_back(severity_to_string(edge.severity));
        edge_ids.push_back(edge.edge_id);
    }

    nlohmann::json j;
    j["path_length"] = hyperedges.size();
    j["start_time"] = format_timestamp(hyperedges.front().timestamp);
    j["end_time"] = format_timestamp(hyperedges.back().timestamp);
    j["total_duration"] = duration_seconds();
    j["affected_nodes"] = total_nodes;
    j["node_count"] = total_nodes.size();
    j["probability"] = probability;
    j["severity_progression"] = severities;
    j["edge_ids"] = edge_ids;
    return j;
}

nlohmann::json PropagationPath::to_json() const {
    nlohmann::json edges = nlohmann::json::array();
    for (const auto& edge : hyperedges) {
        edges.push_back(edge.to_json());
    }

    nlohmann::json j;
    j["summary"] = summary_json();
    j["hyperedges"] = edges;
    return j;
}

// ==========================================
// SearchControl
// ==========================================

bool SearchControl::should_stop() const {
    if (cancel && cancel->load()) {
        return true;
    }
    if (deadline && std::chrono::steady_clock::now() >= *deadline) {
        return true;
    }
    return false;
}

SearchControl SearchControl::with_timeout(std::chrono::milliseconds timeout) {
    SearchControl control;
    control.deadline = std::chrono::steady_clock::now() + timeout;
    return control;
}

// ==========================================
// PropagationAnalyzer: path search
// ==========================================

PropagationAnalyzer::PropagationAnalyzer(
    const AnalyzerConfig& config,
    std::shared_ptr<const TransitionScorer> scorer
) : config_(config), scorer_(std::move(scorer)) {
    if (!scorer_) {
        scorer_ = std::make_shared<HeuristicTransitionScorer>();
    }
}

double PropagationAnalyzer::transition_probability(const Hyperedge& from, const Hyperedge& to) const {
    const double p = scorer_->score(from, to);
    if (!(p > 0.0)) {
        return 0.0;   // Also maps NaN to 0
    }
    return std::min(p, 1.0);
}

std::vector<PropagationPath> PropagationAnalyzer::find_propagation_paths(
    const CTHGraph& graph,
    const std::string& start_node,
    int max_paths,
    const SearchControl& control
) const {
    if (max_paths < 0) {
        max_paths = config_.default_max_paths;
    }

    // Already in time order; equal timestamps keep index order
    std::vector<Hyperedge> seeds = graph.get_hyperedges_containing(start_node);
    if (seeds.empty() || max_paths == 0) {
        return {};
    }

    log("[search] " + std::to_string(seeds.size()) + " seed hyperedges for " + start_node);

    std::vector<RankedCandidate> found;
    bool interrupted = false;

    for (const auto& seed : seeds) {
        if (interrupted) break;
        bfs_from_seed(graph, seed, control, found, interrupted);
    }

    if (interrupted) {
        log("[search] interrupted after " + std::to_string(found.size()) + " candidate paths");
    }

    std::stable_sort(found.begin(), found.end(),
        [](const RankedCandidate& a, const RankedCandidate& b) {
            if (a.path.probability != b.path.probability) {
                return a.path.probability > b.path.probability;
            }
            if (a.path.length() != b.path.length()) {
                return a.path.length() > b.path.length();
            }
            const Timestamp a_start = a.path.hyperedges.front().timestamp;
            const Timestamp b_start = b.path.hyperedges.front().timestamp;
            if (a_start != b_start) {
                return a_start < b_start;
            }
            return a.discovery_index < b.discovery_index;
        });

    std::vector<PropagationPath> result;
    const size_t limit = std::min(found.size(), static_cast<size_t>(max_paths));
    result.reserve(limit);
    for (size_t i = 0; i < limit; ++i) {
        result.push_back(std::move(found[i].path));
    }

    log("[search] returning " + std::to_string(result.size()) + " of " +
        std::to_string(found.size()) + " paths");
    return result;
}

void PropagationAnalyzer::bfs_from_seed(
    const CTHGraph& graph,
    const Hyperedge& seed,
    const SearchControl& control,
    std::vector<RankedCandidate>& found,
    bool& interrupted
) const {
    struct State {
        std::vector<Hyperedge> path;
        double probability;
        std::set<std::string> visited;
    };

    const size_t max_length = static_cast<size_t>(std::max(config_.max_path_length, 1));

    auto record = [&](std::vector<Hyperedge> path, double probability) {
        if (probability >= config_.min_probability) {
            found.push_back({PropagationPath(std::move(path), probability), found.size()});
        }
    };

    std::deque<State> queue;
    queue.push_back({{seed}, 1.0, {seed.edge_id}});

    while (!queue.empty()) {
        if (control.should_stop()) {
            interrupted = true;
            return;
        }

        State state = std::move(queue.front());
        queue.pop_front();

        if (state.path.size() >= max_length) {
            record(std::move(state.path), state.probability);
            continue;
        }

        const Hyperedge& current = state.path.back();
        std::vector<Hyperedge> next_edges = graph.find_next_hyperedges(current, state.visited);

        if (next_edges.empty()) {
            record(std::move(state.path), state.probability);
            continue;
        }

        std::vector<std::pair<double, size_t>> ranked;
        ranked.reserve(next_edges.size());
        for (size_t i = 0; i < next_edges.size(); ++i) {
            ranked.emplace_back(transition_probability(current, next_edges[i]), i);
        }
        std::stable_sort(ranked.begin(), ranked.end(),
            [](const auto& a, const auto& b) { return a.first > b.first; });

        for (const auto& [transition, index] : ranked) {
            const double cumulative = state.probability * transition;
            if (cumulative < config_.min_probability) {
                continue;
            }

            State next;
            next.path = state.path;
            next.path.push_back(next_edges[index]);
            next.probability = cumulative;
            next.visited = state.visited;
            next.visited.insert(next_edges[index].edge_id);
            queue.push_back(std::move(next));
        }
    }
}

void PropagationAnalyzer::log(const std::string& message) const {
    if (config_.verbose) {
        std::cerr << message << "\n";
    }
}

} // namespace cth
