#pragma once

#include <fairway_graph/geo/projector.hpp>
#include <fairway_graph/graph/graph.hpp>

#include <optional>
#include <string>
#include <vector>

namespace fairway_graph {

inline constexpr const char* kGeometricConnection = "geometric";

// A cross-border link replacing the secondary source's bridgehead with the
// nearest primary node.
struct BorderConnection {
    NodeId foreign_node;
    std::string foreign_country;
    NodeId bridgehead_node;
    NodeId primary_node;
    double distance = 0.0;
    std::string type = kGeometricConnection;
    // Attributes and geometry of the secondary edge foreign -- bridgehead.
    AttributeMap edge_attributes;
    std::optional<GeoLineString> edge_geometry;
};

struct StitchOptions {
    std::string home_country = "NL";
    // Metres in the projected system; a match must be strictly closer.
    double distance_threshold = 100.0;
};

// Node position from its location, or from numeric x/y attributes.
[[nodiscard]] std::optional<GeoPoint> NodePosition(const Node& node);

// Match every home-country bridgehead of `secondary` to the nearest node of
// `primary` and emit one connection per crossing edge whose bridgehead
// matched. Nodes that cannot be projected are left out with a warning.
[[nodiscard]] std::vector<BorderConnection> FindBorderConnections(
    const Graph& primary, const Graph& secondary,
    const IGeometryProjector& projector, const StitchOptions& options = {});

} // namespace fairway_graph
