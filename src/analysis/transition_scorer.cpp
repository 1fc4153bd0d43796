#include "analysis/transition_scorer.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <utility>

namespace cth {

namespace {

const std::map<std::pair<std::string, std::string>, double>& relationship_strengths() {
    static const std::map<std::pair<std::string, std::string>, double> strengths = {
        {{"service", "pod"}, 0.9},
        {{"pod", "node"}, 0.8},
        {{"service", "service"}, 0.7},
        {{"pod", "pod"}, 0.6},
        {{"container", "pod"}, 0.9},
        {{"service", "container"}, 0.8}
    };
    return strengths;
}

std::set<std::string> node_types(const std::set<std::string>& nodes) {
    std::set<std::string> types;
    for (const auto& node : nodes) {
        std::string type = node_type(node);
        if (!type.empty()) {
            types.insert(type);
        }
    }
    return types;
}

} // namespace

std::string node_type(const std::string& node_id) {
    auto pos = node_id.find(':');
    if (pos == std::string::npos) {
        return "";
    }
    return node_id.substr(0, pos);
}

double HeuristicTransitionScorer::score(const Hyperedge& from, const Hyperedge& to) const {
    const double delta = seconds_between(from.timestamp, to.timestamp);
    if (delta <= 0.0) {
        return 0.0;
    }

    const size_t shared = from.intersection(to).size();
    const size_t total = from.union_size(to);
    const double overlap = total > 0 ? static_cast<double>(shared) / static_cast<double>(total) : 0.0;

    double probability = 0.3 * time_factor(delta)
                       + 0.4 * overlap
                       + 0.2 * severity_factor(from.severity, to.severity)
                       + 0.1 * entity_relationship_factor(from.nodes, to.nodes);

    return std::min(probability, 1.0);
}

double HeuristicTransitionScorer::time_factor(double delta_seconds) {
    return std::exp(-delta_seconds / 300.0);
}

double HeuristicTransitionScorer::severity_factor(Severity from, Severity to) {
    const double s1 = severity_weight(from);
    const double s2 = severity_weight(to);
    if (s2 >= s1) {
        return 1.0 + (s2 - s1) * 0.2;
    }
    return 0.8;
}

double HeuristicTransitionScorer::entity_relationship_factor(
    const std::set<std::string>& from_nodes,
    const std::set<std::string>& to_nodes
) {
    const auto& strengths = relationship_strengths();
    double factor = 0.0;

    for (const auto& t1 : node_types(from_nodes)) {
        for (const auto& t2 : node_types(to_nodes)) {
            auto it = strengths.find({t1, t2});
            if (it == strengths.end()) {
                it = strengths.find({t2, t1});
            }
            if (it != strengths.end()) {
                factor = std::max(factor, it->second);
            }
        }
    }

    return factor;
}

} // namespace cth
