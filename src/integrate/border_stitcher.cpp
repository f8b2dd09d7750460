#include <fairway_graph/integrate/border_stitcher.hpp>

#include <fairway_graph/core/log.hpp>

#include <boost/geometry/index/rtree.hpp>

#include <iomanip>
#include <iterator>
#include <map>
#include <set>
#include <sstream>

namespace fairway_graph {

namespace bgi = boost::geometry::index;

namespace {

constexpr const char* kComponent = "BorderStitcher";

using IndexedPoint = std::pair<PlanarPoint, NodeId>;
using PointIndex = bgi::rtree<IndexedPoint, bgi::rstar<16>>;

struct Crossing {
    NodeId foreign;
    NodeId bridgehead;
    std::string foreign_country;
};

struct Match {
    NodeId primary_node;
    double distance = 0.0;
};

PointIndex BuildPrimaryIndex(const Graph& primary, const IGeometryProjector& projector) {
    std::vector<IndexedPoint> points;
    std::size_t failed = 0;
    for (const auto& [id, node] : primary.Nodes()) {
        auto position = NodePosition(node);
        if (!position.has_value()) {
            continue;
        }
        auto projected = projector.Forward(*position);
        if (projected.IsErr()) {
            ++failed;
            LogWarn(kComponent, "Primary node " + id + ": " + projected.Error().ToString());
            continue;
        }
        points.emplace_back(projected.Value(), id);
    }
    if (failed > 0) {
        LogWarn(kComponent, "Excluded " + std::to_string(failed) +
                                " primary nodes that failed to project");
    }
    // Range construction uses the packing algorithm.
    return PointIndex(points.begin(), points.end());
}

std::vector<Crossing> FindCrossings(const Graph& secondary, const std::string& home) {
    std::vector<Crossing> crossings;
    for (const auto& [key, edge] : secondary.Edges()) {
        const Node* u = secondary.FindNode(edge.source);
        const Node* v = secondary.FindNode(edge.target);
        if (u == nullptr || v == nullptr) {
            continue;
        }
        const auto u_country = u->CountryCode();
        const auto v_country = v->CountryCode();
        if (u_country == home && !v_country.empty() && v_country != home) {
            crossings.push_back(Crossing{v->id, u->id, v_country});
        } else if (v_country == home && !u_country.empty() && u_country != home) {
            crossings.push_back(Crossing{u->id, v->id, u_country});
        }
    }
    return crossings;
}

} // anonymous namespace

std::optional<GeoPoint> NodePosition(const Node& node) {
    if (node.location.has_value()) {
        return node.location;
    }
    const auto* x = FindNonNull(node.attributes, "x");
    const auto* y = FindNonNull(node.attributes, "y");
    if (x == nullptr || y == nullptr) {
        return std::nullopt;
    }
    auto lon = AsDouble(*x);
    auto lat = AsDouble(*y);
    if (!lon.has_value() || !lat.has_value()) {
        return std::nullopt;
    }
    return MakePoint(*lon, *lat);
}

std::vector<BorderConnection> FindBorderConnections(const Graph& primary,
                                                    const Graph& secondary,
                                                    const IGeometryProjector& projector,
                                                    const StitchOptions& options) {
    std::vector<BorderConnection> connections;

    const auto index = BuildPrimaryIndex(primary, projector);
    if (index.empty()) {
        LogWarn(kComponent, "No valid geometry found in primary graph nodes");
        return connections;
    }

    const auto crossings = FindCrossings(secondary, options.home_country);
    std::set<NodeId> bridgeheads;
    for (const auto& crossing : crossings) {
        bridgeheads.insert(crossing.bridgehead);
    }
    {
        std::ostringstream msg;
        msg << "Found " << crossings.size() << " cross-border edges with "
            << bridgeheads.size() << " unique " << options.home_country << " bridgeheads";
        LogInfo(kComponent, msg.str());
    }

    std::map<NodeId, Match> matches;
    for (const auto& bridgehead : bridgeheads) {
        auto position = NodePosition(*secondary.FindNode(bridgehead));
        if (!position.has_value()) {
            continue;
        }
        auto projected = projector.Forward(*position);
        if (projected.IsErr()) {
            LogWarn(kComponent, "Bridgehead " + bridgehead + ": " +
                                    projected.Error().ToString());
            continue;
        }

        std::vector<IndexedPoint> nearest;
        index.query(bgi::nearest(projected.Value(), 1), std::back_inserter(nearest));
        if (nearest.empty()) {
            continue;
        }
        const double distance = bg::distance(projected.Value(), nearest.front().first);
        if (distance < options.distance_threshold) {
            matches[bridgehead] = Match{nearest.front().second, distance};
            std::ostringstream msg;
            msg << "Matched " << bridgehead << " -> " << nearest.front().second << " ("
                << std::fixed << std::setprecision(1) << distance << "m)";
            LogDebug(kComponent, msg.str());
        }
    }

    for (const auto& crossing : crossings) {
        auto match = matches.find(crossing.bridgehead);
        if (match == matches.end()) {
            continue;
        }
        BorderConnection connection;
        connection.foreign_node = crossing.foreign;
        connection.foreign_country = crossing.foreign_country;
        connection.bridgehead_node = crossing.bridgehead;
        connection.primary_node = match->second.primary_node;
        connection.distance = match->second.distance;
        if (const Edge* edge = secondary.FindEdge(crossing.foreign, crossing.bridgehead)) {
            connection.edge_attributes = edge->attributes;
            connection.edge_geometry = edge->geometry;
        }
        connections.push_back(std::move(connection));
    }

    LogInfo(kComponent, "Established " + std::to_string(connections.size()) +
                            " geometric border connections");
    return connections;
}

} // namespace fairway_graph
