#include <fairway_graph/integrate/graph_merger.hpp>

#include <fairway_graph/core/log.hpp>
#include <fairway_graph/core/types.hpp>

#include <sstream>

namespace fairway_graph {

namespace {

constexpr const char* kComponent = "GraphMerger";

Result<SourceTag, Error> ParseTag(const std::string& tag, const char* role) {
    auto parsed = SourceTag::Create(tag);
    if (parsed.IsErr()) {
        return Result<SourceTag, Error>::Err(
            Error{"MergeGraphs", role, parsed.Error(), ErrorCategory::Config});
    }
    return Result<SourceTag, Error>::Ok(std::move(parsed).Value());
}

void CopyNode(Graph& target, const NodeId& id, const Node& source,
              const SourceTag& tag) {
    Node& node = target.AddNode(id);
    node.attributes = source.attributes;
    node.attributes[attr::kDataSource] = tag.Value();
    node.location = source.location;
}

AttributeMap TaggedAttributes(const AttributeMap& attributes, const SourceTag& tag) {
    AttributeMap out = attributes;
    out[attr::kDataSource] = tag.Value();
    return out;
}

} // anonymous namespace

Result<MergeOutcome, Error> MergeGraphs(const Graph& primary, const Graph& secondary,
                                        const std::vector<BorderConnection>& connections,
                                        const MergeOptions& options) {
    auto primary_tag = ParseTag(options.primary_tag, "primary_tag");
    if (primary_tag.IsErr()) {
        return Result<MergeOutcome, Error>::Err(std::move(primary_tag).Error());
    }
    auto secondary_tag = ParseTag(options.secondary_tag, "secondary_tag");
    if (secondary_tag.IsErr()) {
        return Result<MergeOutcome, Error>::Err(std::move(secondary_tag).Error());
    }
    auto border_tag = ParseTag(options.border_tag, "border_tag");
    if (border_tag.IsErr()) {
        return Result<MergeOutcome, Error>::Err(std::move(border_tag).Error());
    }
    const SourceTag& fis = primary_tag.Value();
    const SourceTag& euris = secondary_tag.Value();
    if (fis == euris || fis == border_tag.Value() || euris == border_tag.Value()) {
        return Result<MergeOutcome, Error>::Err(
            Error{"MergeGraphs", "tags",
                  "Source tags must be distinct, got " + fis.Value() + ", " +
                      euris.Value() + ", " + border_tag.Value().Value(),
                  ErrorCategory::Config});
    }

    MergeOutcome out;
    Graph& combined = out.graph;

    // Primary network.
    LogInfo(kComponent, "Adding " + fis.Value() + " nodes to combined graph");
    for (const auto& [id, node] : primary.Nodes()) {
        if (options.excluded_node_ids.count(id) > 0) {
            ++out.pruned_primary_nodes;
            LogInfo(kComponent, "Pruning " + fis.Value() + " node " + id + " (excluded)");
            continue;
        }
        CopyNode(combined, fis.Namespaced(id), node, fis);
    }

    for (const auto& [key, edge] : primary.Edges()) {
        if (const auto* id = FindNonNull(edge.attributes, options.edge_id_attribute)) {
            if (options.excluded_edge_ids.count(ToKey(*id)) > 0) {
                ++out.pruned_primary_edges;
                LogInfo(kComponent, "Pruning " + fis.Value() + " edge (" + key.first +
                                        ", " + key.second + ") " +
                                        options.edge_id_attribute + "=" + ToKey(*id) +
                                        " (excluded)");
                continue;
            }
        }
        if (options.excluded_node_ids.count(key.first) > 0 ||
            options.excluded_node_ids.count(key.second) > 0) {
            ++out.pruned_primary_edges;
            continue;
        }
        combined.AddEdge(fis.Namespaced(edge.source), fis.Namespaced(edge.target),
                         TaggedAttributes(edge.attributes, fis), edge.geometry);
    }

    // Secondary network, minus the home country.
    LogInfo(kComponent, "Adding " + euris.Value() + " nodes to combined graph (excluding " +
                            options.home_country + ")");
    for (const auto& [id, node] : secondary.Nodes()) {
        if (node.CountryCode() == options.home_country) {
            ++out.dropped_secondary_nodes;
            continue;
        }
        CopyNode(combined, euris.Namespaced(id), node, euris);
    }

    for (const auto& [key, edge] : secondary.Edges()) {
        const Node* u = secondary.FindNode(key.first);
        const Node* v = secondary.FindNode(key.second);
        if ((u != nullptr && u->CountryCode() == options.home_country) ||
            (v != nullptr && v->CountryCode() == options.home_country)) {
            ++out.dropped_secondary_edges;
            continue;
        }
        combined.AddEdge(euris.Namespaced(edge.source), euris.Namespaced(edge.target),
                         TaggedAttributes(edge.attributes, euris), edge.geometry);
    }

    // Border connections: primary node <-> foreign secondary node.
    LogInfo(kComponent, "Adding " + std::to_string(connections.size()) +
                            " border connections");
    for (const auto& connection : connections) {
        const auto u = fis.Namespaced(connection.primary_node);
        const auto v = euris.Namespaced(connection.foreign_node);
        if (!combined.HasNode(u) || !combined.HasNode(v)) {
            ++out.skipped_connections;
            LogWarn(kComponent, "Skipping border connection " + u + " - " + v +
                                    ": endpoint not in combined graph");
            continue;
        }

        AttributeMap attributes = connection.edge_attributes;
        attributes[attr::kDataSource] = border_tag.Value().Value();
        attributes[attr::kBridgehead] = connection.bridgehead_node;
        attributes[attr::kDistanceGap] = connection.distance;
        attributes[attr::kConnectionType] = connection.type;
        const bool is_new = !combined.HasEdge(u, v);
        combined.AddEdge(u, v, std::move(attributes), connection.edge_geometry);
        if (is_new) {
            ++out.border_edges;
        }
    }

    out.components = combined.ComponentCount();

    std::ostringstream msg;
    msg << "Combined graph: " << combined.NodeCount() << " nodes, "
        << combined.EdgeCount() << " edges, " << out.components << " components";
    LogInfo(kComponent, msg.str());

    return Result<MergeOutcome, Error>::Ok(std::move(out));
}

} // namespace fairway_graph
