#pragma once

#include <fairway_graph/core/attribute.hpp>
#include <fairway_graph/geo/geometry.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace fairway_graph {

using NodeId = std::string;

// Attribute keys the pipeline itself reads or writes.
namespace attr {
inline constexpr const char* kCountryCode = "countrycode";
inline constexpr const char* kDataSource = "data_source";
inline constexpr const char* kSubgraph = "subgraph";
inline constexpr const char* kLengthM = "length_m";
inline constexpr const char* kIsBorder = "is_border";
inline constexpr const char* kGeometryWkt = "geometry_wkt";
inline constexpr const char* kSectionRef = "sectionref";
inline constexpr const char* kRouteId = "RouteId";
inline constexpr const char* kRouteKmBegin = "RouteKmBegin";
inline constexpr const char* kRouteKmEnd = "RouteKmEnd";
inline constexpr const char* kBridgehead = "bridgehead";
inline constexpr const char* kDistanceGap = "distance_gap";
inline constexpr const char* kConnectionType = "connection_type";
inline constexpr const char* kFairwayId = "fairway_id";
}  // namespace attr

struct Node {
    NodeId id;
    std::optional<GeoPoint> location;
    AttributeMap attributes;

    // Empty when the node carries no country code.
    [[nodiscard]] std::string CountryCode() const;
    [[nodiscard]] std::optional<std::int64_t> Component() const;
};

struct Edge {
    NodeId source;
    NodeId target;
    std::optional<GeoLineString> geometry;
    AttributeMap attributes;

    [[nodiscard]] std::optional<std::string> RouteId() const;
    [[nodiscard]] std::optional<double> RouteKmBegin() const;
    [[nodiscard]] std::optional<double> RouteKmEnd() const;
    [[nodiscard]] bool IsBorder() const;
    // Empty when untagged.
    [[nodiscard]] std::string DataSource() const;
    [[nodiscard]] std::optional<double> LengthM() const;
};

// ---------------------------------------------------------------------------
// Graph — undirected, attributed, at most one edge per unordered node pair.
//
// Nodes and edges are kept in id order so iteration (and therefore every
// derived result) is independent of insertion order.
// ---------------------------------------------------------------------------
class Graph {
public:
    // Unordered pair stored as (min, max).
    using EdgeKey = std::pair<NodeId, NodeId>;
    [[nodiscard]] static EdgeKey MakeEdgeKey(const NodeId& u, const NodeId& v);

    // Get or create the node.
    Node& AddNode(const NodeId& id);

    // Get or create the edge; missing endpoints are created. On an existing
    // edge `attributes` overwrite per key and a given geometry replaces the
    // stored one.
    Edge& AddEdge(const NodeId& u, const NodeId& v, AttributeMap attributes = {},
                  std::optional<GeoLineString> geometry = std::nullopt);

    [[nodiscard]] bool HasNode(const NodeId& id) const;
    [[nodiscard]] bool HasEdge(const NodeId& u, const NodeId& v) const;

    [[nodiscard]] const Node* FindNode(const NodeId& id) const;
    [[nodiscard]] Node* FindNode(const NodeId& id);
    [[nodiscard]] const Edge* FindEdge(const NodeId& u, const NodeId& v) const;
    [[nodiscard]] Edge* FindEdge(const NodeId& u, const NodeId& v);

    [[nodiscard]] std::size_t NodeCount() const noexcept { return nodes_.size(); }
    [[nodiscard]] std::size_t EdgeCount() const noexcept { return edges_.size(); }

    [[nodiscard]] const std::map<NodeId, Node>& Nodes() const noexcept { return nodes_; }
    [[nodiscard]] std::map<NodeId, Node>& Nodes() noexcept { return nodes_; }
    [[nodiscard]] const std::map<EdgeKey, Edge>& Edges() const noexcept { return edges_; }
    [[nodiscard]] std::map<EdgeKey, Edge>& Edges() noexcept { return edges_; }

    [[nodiscard]] const std::set<NodeId>& Neighbors(const NodeId& id) const;

    // Components in discovery order, starting each search from the smallest
    // unvisited node id. Component i therefore has the i-th smallest minimum
    // node id.
    [[nodiscard]] std::vector<std::vector<NodeId>> ConnectedComponents() const;
    [[nodiscard]] std::size_t ComponentCount() const;

    // Stamp attr::kSubgraph on every node and edge. Returns component count.
    std::size_t AssignComponents();

private:
    std::map<NodeId, Node> nodes_;
    std::map<EdgeKey, Edge> edges_;
    std::map<NodeId, std::set<NodeId>> adjacency_;
};

} // namespace fairway_graph
