#include "graph/cth_graph.hpp"
#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <iterator>
#include <mutex>
#include <sstream>

namespace cth {

// ==========================================
// Hyperedge Implementation
// ==========================================

bool Hyperedge::contains_node(const std::string& node_id) const {
    return nodes.find(node_id) != nodes.end();
}

bool Hyperedge::has_intersection(const Hyperedge& other) const {
    // Both sets are sorted; walk them in lockstep
    auto a = nodes.begin();
    auto b = other.nodes.begin();
    while (a != nodes.end() && b != other.nodes.end()) {
        if (*a < *b) {
            ++a;
        } else if (*b < *a) {
            ++b;
        } else {
            return true;
        }
    }
    return false;
}

std::set<std::string> Hyperedge::intersection(const Hyperedge& other) const {
    std::set<std::string> result;
    std::set_intersection(
        nodes.begin(), nodes.end(),
        other.nodes.begin(), other.nodes.end(),
        std::inserter(result, result.begin())
    );
    return result;
}

size_t Hyperedge::union_size(const Hyperedge& other) const {
    return nodes.size() + other.nodes.size() - intersection(other).size();
}

std::string Hyperedge::compute_edge_id(
    const std::set<std::string>& nodes,
    Timestamp timestamp,
    const std::optional<std::string>& trace_id
) {
    // 64-bit FNV-1a over a canonical rendering of the content
    uint64_t hash = 14695981039346656037ULL;
    auto feed = [&hash](const std::string& text) {
        for (unsigned char c : text) {
            hash ^= c;
            hash *= 1099511628211ULL;
        }
        hash ^= 0x1f;
        hash *= 1099511628211ULL;
    };

    for (const auto& node : nodes) {
        feed(node);
    }
    feed("|" + format_timestamp(timestamp));
    if (trace_id) {
        feed("|" + *trace_id);
    }

    std::ostringstream out;
    out << "edge_" << std::hex << std::setw(16) << std::setfill('0') << hash;
    return out.str();
}

// ==========================================
// CTHGraph Implementation
// ==========================================

CTHGraph::CTHGraph() {
    metadata_.created_at = now_utc();
}

CTHGraph::CTHGraph(const CTHGraph& other) {
    std::shared_lock<std::shared_mutex> lock(other.mutex_);
    hyperedges_ = other.hyperedges_;
    node_to_edges_ = other.node_to_edges_;
    time_index_ = other.time_index_;
    metadata_ = other.metadata_;
}

CTHGraph::CTHGraph(CTHGraph&& other) {
    std::unique_lock<std::shared_mutex> lock(other.mutex_);
    hyperedges_ = std::move(other.hyperedges_);
    node_to_edges_ = std::move(other.node_to_edges_);
    time_index_ = std::move(other.time_index_);
    metadata_ = std::move(other.metadata_);
}

CTHGraph& CTHGraph::operator=(const CTHGraph& other) {
    if (this == &other) return *this;

    std::unique_lock<std::shared_mutex> mine(mutex_, std::defer_lock);
    std::shared_lock<std::shared_mutex> theirs(other.mutex_, std::defer_lock);
    std::lock(mine, theirs);

    hyperedges_ = other.hyperedges_;
    node_to_edges_ = other.node_to_edges_;
    time_index_ = other.time_index_;
    metadata_ = other.metadata_;
    return *this;
}

CTHGraph& CTHGraph::operator=(CTHGraph&& other) {
    if (this == &other) return *this;

    std::unique_lock<std::shared_mutex> mine(mutex_, std::defer_lock);
    std::unique_lock<std::shared_mutex> theirs(other.mutex_, std::defer_lock);
    std::lock(mine, theirs);

    hyperedges_ = std::move(other.hyperedges_);
    node_to_edges_ = std::move(other.node_to_edges_);
    time_index_ = std::move(other.time_index_);
    metadata_ = std::move(other.metadata_);
    return *this;
}

std::string CTHGraph::add_hyperedge(const Hyperedge& edge) {
    if (edge.nodes.empty()) {
        throw std::invalid_argument("Hyperedge must contain at least one node");
    }

    Hyperedge new_edge = edge;
    if (new_edge.edge_id.empty()) {
        new_edge.edge_id = Hyperedge::compute_edge_id(
            new_edge.nodes, new_edge.timestamp, new_edge.trace_id);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (hyperedges_.find(new_edge.edge_id) != hyperedges_.end()) {
        throw DuplicateEdgeError(new_edge.edge_id);
    }

    const std::string edge_id = new_edge.edge_id;
    const Timestamp timestamp = new_edge.timestamp;

    for (const auto& node : new_edge.nodes) {
        node_to_edges_[node].insert(edge_id);
    }

    // multimap::insert places the entry after every equal key already present
    time_index_.insert({timestamp, edge_id});

    hyperedges_.emplace(edge_id, std::move(new_edge));

    metadata_.total_events++;
    metadata_.last_updated = now_utc();

    return edge_id;
}

void CTHGraph::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    hyperedges_.clear();
    node_to_edges_.clear();
    time_index_.clear();
    metadata_ = GraphMetadata();
    metadata_.created_at = now_utc();
}

bool CTHGraph::has_edge(const std::string& edge_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return hyperedges_.find(edge_id) != hyperedges_.end();
}

std::optional<Hyperedge> CTHGraph::get_hyperedge(const std::string& edge_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = hyperedges_.find(edge_id);
    if (it == hyperedges_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Hyperedge> CTHGraph::get_hyperedges_containing(const std::string& node) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = node_to_edges_.find(node);
    if (it == node_to_edges_.end()) {
        return {};
    }
    return collect(it->second);
}

std::vector<Hyperedge> CTHGraph::get_hyperedges_in_timerange(Timestamp start, Timestamp end) const {
    std::vector<Hyperedge> result;
    if (end < start) {
        return result;
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto last = time_index_.upper_bound(end);
    for (auto it = time_index_.lower_bound(start); it != last; ++it) {
        result.push_back(hyperedges_.at(it->second));
    }
    return result;
}

std::vector<Hyperedge> CTHGraph::find_next_hyperedges(
    const Hyperedge& current,
    const std::set<std::string>& visited
) const {
    std::vector<Hyperedge> candidates;

    std::shared_lock<std::shared_mutex> lock(mutex_);

    // Everything before upper_bound is at or before current.timestamp
    for (auto it = time_index_.upper_bound(current.timestamp); it != time_index_.end(); ++it) {
        const std::string& edge_id = it->second;
        if (edge_id == current.edge_id || visited.find(edge_id) != visited.end()) {
            continue;
        }

        const Hyperedge& edge = hyperedges_.at(edge_id);
        if (current.has_intersection(edge)) {
            candidates.push_back(edge);
        }
    }

    return candidates;
}

std::vector<Hyperedge> CTHGraph::get_all_edges() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<Hyperedge> result;
    result.reserve(time_index_.size());
    for (const auto& [timestamp, edge_id] : time_index_) {
        result.push_back(hyperedges_.at(edge_id));
    }
    return result;
}

std::vector<std::string> CTHGraph::time_ordered_edge_ids() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<std::string> result;
    result.reserve(time_index_.size());
    for (const auto& [timestamp, edge_id] : time_index_) {
        result.push_back(edge_id);
    }
    return result;
}

std::map<std::string, std::set<std::string>> CTHGraph::node_index() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return node_to_edges_;
}

GraphStatistics CTHGraph::get_statistics() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return compute_statistics();
}

GraphMetadata CTHGraph::metadata() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return metadata_;
}

size_t CTHGraph::num_edges() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return hyperedges_.size();
}

size_t CTHGraph::num_nodes() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return node_to_edges_.size();
}

bool CTHGraph::empty() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return hyperedges_.empty();
}

void CTHGraph::check_invariants() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    // Index -> edges
    for (const auto& [node, edge_ids] : node_to_edges_) {
        if (edge_ids.empty()) {
            throw InvariantViolation("Node index entry without edges: " + node);
        }
        for (const auto& edge_id : edge_ids) {
            auto it = hyperedges_.find(edge_id);
            if (it == hyperedges_.end()) {
                throw InvariantViolation("Node index references unknown edge " + edge_id);
            }
            if (!it->second.contains_node(node)) {
                throw InvariantViolation("Edge " + edge_id + " indexed under " + node +
                                         " but does not contain it");
            }
        }
    }

    // Edges -> index
    for (const auto& [edge_id, edge] : hyperedges_) {
        for (const auto& node : edge.nodes) {
            auto it = node_to_edges_.find(node);
            if (it == node_to_edges_.end() || it->second.find(edge_id) == it->second.end()) {
                throw InvariantViolation("Edge " + edge_id + " missing from index of " + node);
            }
        }
    }

    // Temporal order
    if (time_index_.size() != hyperedges_.size()) {
        throw InvariantViolation("Time index holds " + std::to_string(time_index_.size()) +
                                 " entries for " + std::to_string(hyperedges_.size()) + " edges");
    }

    std::set<std::string> seen;
    std::optional<Timestamp> previous;
    for (const auto& [timestamp, edge_id] : time_index_) {
        auto it = hyperedges_.find(edge_id);
        if (it == hyperedges_.end()) {
            throw InvariantViolation("Time index references unknown edge " + edge_id);
        }
        if (it->second.timestamp != timestamp) {
            throw InvariantViolation("Time index key disagrees with edge " + edge_id);
        }
        if (previous && timestamp < *previous) {
            throw InvariantViolation("Time index out of order at edge " + edge_id);
        }
        if (!seen.insert(edge_id).second) {
            throw InvariantViolation("Edge " + edge_id + " appears twice in time index");
        }
        previous = timestamp;
    }
}

// ==========================================
// Helper Methods
// ==========================================

GraphStatistics CTHGraph::compute_statistics() const {
    GraphStatistics stats;
    stats.metadata = metadata_;

    if (hyperedges_.empty()) {
        return stats;
    }

    stats.total_edges = hyperedges_.size();
    stats.total_nodes = node_to_edges_.size();

    // time_index_ is ordered, so the extremes are its first and last keys
    stats.earliest_event = time_index_.begin()->first;
    stats.latest_event = time_index_.rbegin()->first;
    stats.time_span_seconds = seconds_between(*stats.earliest_event, *stats.latest_event);

    return stats;
}

std::vector<Hyperedge> CTHGraph::collect(const std::set<std::string>& edge_ids) const {
    std::vector<Hyperedge> result;
    result.reserve(edge_ids.size());
    for (const auto& edge_id : edge_ids) {
        auto it = hyperedges_.find(edge_id);
        if (it != hyperedges_.end()) {
            result.push_back(it->second);
        }
    }

    std::stable_sort(result.begin(), result.end(),
        [](const Hyperedge& a, const Hyperedge& b) { return a.timestamp < b.timestamp; });

    return result;
}

} // namespace cth
