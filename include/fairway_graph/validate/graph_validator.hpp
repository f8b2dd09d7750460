#pragma once

#include <fairway_graph/graph/graph.hpp>
#include <fairway_graph/schema/schema_harmonizer.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace fairway_graph {

enum class CheckStatus {
    Pass,
    Warning,
};

// "PASS" / "WARNING"
[[nodiscard]] std::string_view CheckStatusName(CheckStatus status);

// ---------------------------------------------------------------------------
// Report
// ---------------------------------------------------------------------------
struct ComponentSummary {
    std::size_t subgraph_id = 0;
    std::size_t nodes = 0;
    std::size_t edges = 0;
};

struct GraphStatistics {
    std::size_t total_nodes = 0;
    std::size_t total_edges = 0;
    std::map<std::string, std::size_t> nodes_by_source;
    std::map<std::string, std::size_t> edges_by_source;
    std::size_t connected_components = 0;
    std::size_t largest_component_size = 0;
    // Largest first: the ten largest plus every component above one node.
    std::vector<ComponentSummary> subgraphs;
    std::size_t unique_fairway_sections = 0;
};

struct BorderLink {
    NodeId u;
    NodeId v;
    double gap = 0.0;
};

struct BorderIntegrity {
    std::size_t total_connections = 0;
    std::size_t expected_connections = 0;
    CheckStatus status = CheckStatus::Warning;
    double min_gap_meters = 0.0;
    double max_gap_meters = 0.0;
    double avg_gap_meters = 0.0;
    std::vector<BorderLink> connections;
};

struct ElementCompliance {
    std::vector<std::string> non_standard_attributes;
    std::map<std::string, std::size_t> attribute_counts;
    std::map<std::string, std::size_t> missing_counts;
    std::vector<std::string> expected_attributes;
    std::map<std::string, std::string> attribute_docs;
};

struct SchemaCompliance {
    ElementCompliance nodes;
    ElementCompliance edges;
};

struct CriticalCheck {
    std::string name;
    CheckStatus status = CheckStatus::Warning;
    std::string details;
};

struct ValidationReport {
    GraphStatistics statistics;
    BorderIntegrity border_integrity;
    SchemaCompliance schema_compliance;
    std::vector<CriticalCheck> critical_connections;
};

// ---------------------------------------------------------------------------
// GraphValidator — read-only checks over a merged graph. Findings are
// reported as PASS/WARNING, never as errors.
// ---------------------------------------------------------------------------

// A location that must be reached by a border edge, e.g. a known crossing.
struct CriticalConnection {
    std::string name;
    NodeId node_id;
};

struct ValidationOptions {
    std::string border_tag = "BORDER";
    std::size_t expected_border_connections = 14;
    std::vector<CriticalConnection> critical_connections;
    SchemaMapping schema;
};

class GraphValidator {
public:
    GraphValidator(const Graph& graph, ValidationOptions options);

    [[nodiscard]] GraphStatistics CheckStatistics() const;
    [[nodiscard]] BorderIntegrity CheckBorderIntegrity() const;
    [[nodiscard]] SchemaCompliance CheckSchemaCompliance() const;
    [[nodiscard]] std::vector<CriticalCheck> CheckCriticalConnections() const;

    [[nodiscard]] ValidationReport Run() const;

private:
    [[nodiscard]] bool IsBorderEdge(const Edge& edge) const;

    const Graph& graph_;
    ValidationOptions options_;
};

// Nested statistics / border_integrity / schema_compliance /
// critical_connections document.
[[nodiscard]] nlohmann::json ToJson(const ValidationReport& report);

} // namespace fairway_graph
