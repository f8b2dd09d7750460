#include <fairway_graph/schema/schema_harmonizer.hpp>

#include <fairway_graph/core/log.hpp>

#include <utility>
#include <vector>

namespace fairway_graph {

namespace {

std::size_t RenameKeys(AttributeMap& attributes,
                       const std::map<std::string, std::string>& mapping) {
    // All renames read the original keys, so chained entries (a->b, b->c)
    // do not cascade.
    std::vector<std::pair<std::string, AttributeValue>> moved;
    for (auto it = attributes.begin(); it != attributes.end();) {
        auto target = mapping.find(it->first);
        if (target == mapping.end() || target->second == it->first) {
            ++it;
            continue;
        }
        moved.emplace_back(target->second, std::move(it->second));
        it = attributes.erase(it);
    }
    for (auto& [key, value] : moved) {
        attributes[key] = std::move(value);
    }
    return moved.size();
}

} // anonymous namespace

HarmonizeOutcome ApplySchemaMapping(Graph graph, const SchemaMapping& mapping) {
    HarmonizeOutcome outcome;

    LogInfo("SchemaHarmonizer", "Harmonizing node attributes");
    for (auto& [id, node] : graph.Nodes()) {
        outcome.renamed_node_keys += RenameKeys(node.attributes, mapping.nodes);
    }

    LogInfo("SchemaHarmonizer", "Harmonizing edge attributes");
    for (auto& [key, edge] : graph.Edges()) {
        outcome.renamed_edge_keys += RenameKeys(edge.attributes, mapping.edges);
    }

    LogInfo("SchemaHarmonizer",
            "Renamed " + std::to_string(outcome.renamed_node_keys) + " node and " +
                std::to_string(outcome.renamed_edge_keys) + " edge attributes");

    outcome.graph = std::move(graph);
    return outcome;
}

} // namespace fairway_graph
