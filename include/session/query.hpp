#pragma once

#include "graph/severity.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace cth {

// Hyperedges containing one node id
struct QueryNodesByEntity {
    std::string entity;
};

// Edges with metrics, logs or a non-normal severity, optionally one level only
struct QueryAnomalousEvents {
    std::optional<Severity> severity;
};

struct FindPropagationPaths {
    std::string start_node;
    std::optional<int> max_paths;
};

struct GetGraphStatistics {};

using QueryRequest = std::variant<
    QueryNodesByEntity,
    QueryAnomalousEvents,
    FindPropagationPaths,
    GetGraphStatistics
>;

/**
 * @brief Wire name of a request ("query_nodes_by_entity", ...)
 */
std::string query_type_name(const QueryRequest& request);

/**
 * @brief Convert the wire form to a request
 *
 * Wire form: {"query_type": "<name>", ...parameters}
 *   query_nodes_by_entity   entity_name (or entity)
 *   query_anomalous_events  severity_level (or severity), optional
 *   find_propagation_paths  start_node, max_paths (optional)
 *   get_graph_statistics
 *
 * @param error Set when std::nullopt is returned
 */
std::optional<QueryRequest> parse_query_request(const nlohmann::json& j, std::string& error);

} // namespace cth
