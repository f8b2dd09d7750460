#pragma once

#include <fairway_graph/graph/graph.hpp>

#include <map>
#include <string>

namespace fairway_graph {

// Old attribute key -> harmonized key, per element type.
struct SchemaMapping {
    std::map<std::string, std::string> nodes;
    std::map<std::string, std::string> edges;

    [[nodiscard]] bool Empty() const noexcept { return nodes.empty() && edges.empty(); }
};

struct HarmonizeOutcome {
    Graph graph;
    std::size_t renamed_node_keys = 0;
    std::size_t renamed_edge_keys = 0;
};

// Move every mapped attribute to its new key, overwriting a value already
// stored there. Unmapped keys are left alone.
[[nodiscard]] HarmonizeOutcome ApplySchemaMapping(Graph graph, const SchemaMapping& mapping);

} // namespace fairway_graph
