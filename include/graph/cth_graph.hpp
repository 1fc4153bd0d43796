#ifndef CTH_GRAPH_HPP
#define CTH_GRAPH_HPP

#include "graph/severity.hpp"
#include "util/time_utils.hpp"
#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace cth {

/**
 * @brief One joint event observed across several entities
 *
 * A hyperedge h = (N, M, L, T) groups the entities N that took part in the
 * same event with the anomalous metrics M and critical log lines L seen
 * while it happened, stamped with the event start time T.
 *
 * Node ids have the form "<type>:<name>" where type is one of
 * service, pod, container, node or entity.
 */
struct Hyperedge {
    std::set<std::string> nodes;                       // Participating entities
    std::set<std::string> metrics;                     // "entity:metric_name"
    std::set<std::string> logs;                        // Truncated log excerpts
    Timestamp timestamp{};                             // Event start

    std::optional<std::string> trace_id;               // Correlation id, if any
    std::string event_type = "unknown";                // trace_event, orphaned_anomaly, ...
    Severity severity = Severity::NORMAL;
    std::optional<double> duration;                    // Seconds

    std::string edge_id;                               // Derived from content when empty

    /**
     * @brief Check if this hyperedge contains a specific node
     */
    bool contains_node(const std::string& node_id) const;

    /**
     * @brief True if the two node sets share at least one node
     */
    bool has_intersection(const Hyperedge& other) const;

    /**
     * @brief Nodes present in both hyperedges
     */
    std::set<std::string> intersection(const Hyperedge& other) const;

    /**
     * @brief Size of the union of both node sets
     */
    size_t union_size(const Hyperedge& other) const;

    size_t size() const { return nodes.size(); }

    /**
     * @brief Deterministic content id: "edge_" + 64-bit FNV-1a hash (hex)
     *        of the sorted node set, the timestamp and the trace id
     */
    static std::string compute_edge_id(
        const std::set<std::string>& nodes,
        Timestamp timestamp,
        const std::optional<std::string>& trace_id = std::nullopt
    );

    nlohmann::json to_json() const;

    // @throws std::invalid_argument if "timestamp" is missing or unparseable
    static Hyperedge from_json(const nlohmann::json& j);
};

/**
 * @brief Bookkeeping carried by every graph instance
 */
struct GraphMetadata {
    Timestamp created_at{};
    std::string version = "1.0";
    size_t total_events = 0;
    std::optional<Timestamp> last_updated;

    nlohmann::json to_json() const;

    // @throws std::invalid_argument if "created_at" is missing or unparseable
    static GraphMetadata from_json(const nlohmann::json& j);
};

/**
 * @brief Summary of graph contents
 */
struct GraphStatistics {
    size_t total_edges = 0;
    size_t total_nodes = 0;
    double time_span_seconds = 0.0;
    std::optional<Timestamp> earliest_event;
    std::optional<Timestamp> latest_event;
    GraphMetadata metadata;

    // Flat record: counters, then the metadata fields
    nlohmann::json to_json() const;
};

/**
 * @brief Raised when an edge id is already present in the graph
 */
class DuplicateEdgeError : public std::invalid_argument {
public:
    explicit DuplicateEdgeError(const std::string& edge_id)
        : std::invalid_argument("Duplicate hyperedge id: " + edge_id), edge_id_(edge_id) {}

    const std::string& edge_id() const { return edge_id_; }

private:
    std::string edge_id_;
};

/**
 * @brief Raised by check_invariants() when the derived indices disagree
 *        with the stored hyperedges
 */
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& what) : std::logic_error(what) {}
};

/**
 * @brief Causal-Temporal Hypergraph
 *
 * Append-only store of hyperedges with two derived indices:
 * - node -> edge ids (exact inverse of every edge's node set)
 * - timestamp -> edge ids, ordered; equal timestamps keep insertion order
 *
 * The propagation adjacency is never materialized. find_next_hyperedges()
 * recomputes it on every call: e2 follows e1 iff e2 is strictly later and
 * the node sets intersect.
 *
 * Thread safety: one writer, many readers. Mutation holds an exclusive
 * lock across all index updates, reads hold a shared lock and return
 * copies, so a reader sees the graph either before or after an insertion.
 */
class CTHGraph {
public:
    CTHGraph();
    CTHGraph(const CTHGraph& other);
    CTHGraph(CTHGraph&& other);
    CTHGraph& operator=(const CTHGraph& other);
    CTHGraph& operator=(CTHGraph&& other);
    ~CTHGraph() = default;

    // ==========================================
    // Mutation
    // ==========================================

    /**
     * @brief Add a hyperedge to the graph
     * @return ID of the added edge (derived if the edge had none)
     * @throws std::invalid_argument if the node set is empty
     * @throws DuplicateEdgeError if the id is already present; the graph is
     *         left unchanged
     */
    std::string add_hyperedge(const Hyperedge& edge);

    /**
     * @brief Remove everything and start over with fresh metadata
     */
    void clear();

    // ==========================================
    // Queries
    // ==========================================

    bool has_edge(const std::string& edge_id) const;

    std::optional<Hyperedge> get_hyperedge(const std::string& edge_id) const;

    /**
     * @brief All hyperedges containing a node (empty if the node is unseen)
     */
    std::vector<Hyperedge> get_hyperedges_containing(const std::string& node) const;

    /**
     * @brief Hyperedges with start <= timestamp <= end, in time order
     */
    std::vector<Hyperedge> get_hyperedges_in_timerange(Timestamp start, Timestamp end) const;

    /**
     * @brief Candidate successors of `current` in a propagation chain
     *
     * Returns, in time order, every edge e with e.timestamp > current.timestamp,
     * e.edge_id not in `visited` and not current's id, and at least one node
     * shared with `current`.
     */
    std::vector<Hyperedge> find_next_hyperedges(
        const Hyperedge& current,
        const std::set<std::string>& visited = {}
    ) const;

    /**
     * @brief Every hyperedge, in time order
     */
    std::vector<Hyperedge> get_all_edges() const;

    /**
     * @brief Snapshot of the time-ordered edge id sequence
     */
    std::vector<std::string> time_ordered_edge_ids() const;

    /**
     * @brief Snapshot of the node -> edge ids index
     */
    std::map<std::string, std::set<std::string>> node_index() const;

    GraphStatistics get_statistics() const;

    GraphMetadata metadata() const;

    size_t num_edges() const;
    size_t num_nodes() const;
    bool empty() const;

    /**
     * @brief Verify index consistency and temporal ordering
     * @throws InvariantViolation describing the first inconsistency found
     */
    void check_invariants() const;

    // ==========================================
    // Import/Export
    // ==========================================

    /**
     * @brief Record form: {"hyperedges": {id: edge}, "metadata": ..., "statistics": ...}
     */
    nlohmann::json to_json() const;

    void export_to_json(const std::string& filename) const;

    /**
     * @brief Rebuild a graph from its record form; metadata is restored as saved
     */
    static CTHGraph from_json(const nlohmann::json& j);

    static CTHGraph load_from_json(const std::string& filename);

private:
    friend class CTHGraphTestPeer;

    std::map<std::string, Hyperedge> hyperedges_;                   // edge_id -> hyperedge
    std::map<std::string, std::set<std::string>> node_to_edges_;    // node -> {edge_ids}
    std::multimap<Timestamp, std::string> time_index_;              // timestamp -> edge_id
    GraphMetadata metadata_;

    mutable std::shared_mutex mutex_;

    // Callers must hold mutex_
    GraphStatistics compute_statistics() const;
    std::vector<Hyperedge> collect(const std::set<std::string>& edge_ids) const;
};

} // namespace cth

#endif // CTH_GRAPH_HPP
