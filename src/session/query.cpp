#include "session/query.hpp"
#include <cstdint>
#include <initializer_list>
#include <limits>

namespace cth {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

// First present key among `keys`; must be a string if present
bool read_string(const nlohmann::json& j, std::initializer_list<const char*> keys,
                 std::optional<std::string>& out, std::string& error) {
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) continue;
        if (!it->is_string()) {
            error = std::string("Parameter '") + key + "' must be a string";
            return false;
        }
        out = it->get<std::string>();
        return true;
    }
    return true;
}

} // namespace

std::string query_type_name(const QueryRequest& request) {
    return std::visit(overloaded{
        [](const QueryNodesByEntity&) { return std::string("query_nodes_by_entity"); },
        [](const QueryAnomalousEvents&) { return std::string("query_anomalous_events"); },
        [](const FindPropagationPaths&) { return std::string("find_propagation_paths"); },
        [](const GetGraphStatistics&) { return std::string("get_graph_statistics"); }
    }, request);
}

std::optional<QueryRequest> parse_query_request(const nlohmann::json& j, std::string& error) {
    if (!j.is_object()) {
        error = "Query request must be an object";
        return std::nullopt;
    }

    auto type_it = j.find("query_type");
    if (type_it == j.end() || !type_it->is_string()) {
        error = "Missing query_type";
        return std::nullopt;
    }
    const std::string type = type_it->get<std::string>();

    if (type == "query_nodes_by_entity") {
        std::optional<std::string> entity;
        if (!read_string(j, {"entity_name", "entity"}, entity, error)) {
            return std::nullopt;
        }
        if (!entity) {
            error = "Missing parameter: entity_name";
            return std::nullopt;
        }
        return QueryRequest{QueryNodesByEntity{*entity}};
    }

    if (type == "query_anomalous_events") {
        std::optional<std::string> level;
        if (!read_string(j, {"severity_level", "severity"}, level, error)) {
            return std::nullopt;
        }

        QueryAnomalousEvents request;
        if (level) {
            request.severity = parse_severity(*level);
            if (!request.severity) {
                error = "Invalid severity level: " + *level;
                return std::nullopt;
            }
        }
        return QueryRequest{request};
    }

    if (type == "find_propagation_paths") {
        std::optional<std::string> start_node;
        if (!read_string(j, {"start_node"}, start_node, error)) {
            return std::nullopt;
        }
        if (!start_node) {
            error = "Missing parameter: start_node";
            return std::nullopt;
        }

        FindPropagationPaths request;
        request.start_node = *start_node;

        auto max_it = j.find("max_paths");
        if (max_it != j.end() && !max_it->is_null()) {
            // Unsigned storage covers values past int64_t as well
            const bool in_range = max_it->is_number_unsigned()
                ? max_it->get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
                : max_it->is_number_integer() && max_it->get<int64_t>() >= 0 &&
                  max_it->get<int64_t>() <= std::numeric_limits<int>::max();
            if (!in_range) {
                error = "Parameter 'max_paths' must be a non-negative integer";
                return std::nullopt;
            }
            request.max_paths = static_cast<int>(max_it->get<int64_t>());
        }
        return QueryRequest{request};
    }

    if (type == "get_graph_statistics") {
        return QueryRequest{GetGraphStatistics{}};
    }

    error = "Unknown query type: " + type;
    return std::nullopt;
}

} // namespace cth
