#pragma once

#include <fairway_graph/core/result.hpp>
#include <fairway_graph/graph/graph.hpp>
#include <fairway_graph/integrate/border_stitcher.hpp>

#include <set>
#include <string>
#include <vector>

namespace fairway_graph {

struct MergeOptions {
    std::string primary_tag = "FIS";
    std::string secondary_tag = "EURIS";
    std::string border_tag = "BORDER";
    // Secondary nodes of this country are replaced by the primary network.
    std::string home_country = "NL";
    // Primary ids (canonical keys) to leave out, with every touching edge.
    std::set<std::string> excluded_node_ids;
    // Primary edges whose `edge_id_attribute` value is listed here are left out.
    std::set<std::string> excluded_edge_ids;
    std::string edge_id_attribute = "Id";
};

struct MergeOutcome {
    Graph graph;
    std::size_t pruned_primary_nodes = 0;
    std::size_t pruned_primary_edges = 0;
    std::size_t dropped_secondary_nodes = 0;
    std::size_t dropped_secondary_edges = 0;
    std::size_t border_edges = 0;
    std::size_t skipped_connections = 0;
    std::size_t components = 0;
};

// Combine both graphs under namespaced ids ("<TAG>_<id>"), each element
// tagged with `data_source`, and link them through `connections`. Fails
// when a tag is not a valid SourceTag or two tags are equal. A connection
// repeating an existing (primary, foreign) pair overwrites that edge and is
// counted once in `border_edges`.
[[nodiscard]] Result<MergeOutcome, Error> MergeGraphs(
    const Graph& primary, const Graph& secondary,
    const std::vector<BorderConnection>& connections,
    const MergeOptions& options = {});

} // namespace fairway_graph
