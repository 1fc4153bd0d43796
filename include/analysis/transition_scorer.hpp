#pragma once

#include "graph/cth_graph.hpp"
#include <set>
#include <string>

namespace cth {

/**
 * @brief Scores how likely a fault spreads from one hyperedge to a later one
 *
 * Implementations return a value in [0, 1]. The analyzer clamps whatever
 * comes back, so a learned model can be dropped in without extra checks.
 */
class TransitionScorer {
public:
    virtual ~TransitionScorer() = default;

    virtual double score(const Hyperedge& from, const Hyperedge& to) const = 0;
};

/**
 * @brief Hand-tuned weighted sum of four factors
 *
 *   p = 0.3 * exp(-dt / 300)      time proximity
 *     + 0.4 * |N1 & N2| / |N1 | N2|  node overlap
 *     + 0.2 * severity_factor      escalation preferred
 *     + 0.1 * entity_factor        known deployment relationships
 *
 * capped at 1.0, and 0 when `to` does not start strictly after `from`.
 */
class HeuristicTransitionScorer : public TransitionScorer {
public:
    double score(const Hyperedge& from, const Hyperedge& to) const override;

    static double time_factor(double delta_seconds);

    // 1 + 0.2 * (s2 - s1) when severity holds or rises, 0.8 when it drops
    static double severity_factor(Severity from, Severity to);

    // Strongest relationship between any pair of entity types, 0 if none
    static double entity_relationship_factor(
        const std::set<std::string>& from_nodes,
        const std::set<std::string>& to_nodes
    );
};

/**
 * @brief Type prefix of a node id ("service:cart" -> "service"), empty if none
 */
std::string node_type(const std::string& node_id);

} // namespace cth
