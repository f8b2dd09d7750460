#include <fairway_graph/graph/graph.hpp>

#include <queue>

namespace fairway_graph {

namespace {

const std::set<NodeId> kNoNeighbors;

} // anonymous namespace

// ---------------------------------------------------------------------------
// Node / Edge accessors
// ---------------------------------------------------------------------------
std::string Node::CountryCode() const {
    if (const auto* v = FindNonNull(attributes, attr::kCountryCode)) {
        return ToKey(*v);
    }
    return "";
}

std::optional<std::int64_t> Node::Component() const {
    if (const auto* v = FindNonNull(attributes, attr::kSubgraph)) {
        if (const auto* i = std::get_if<std::int64_t>(v)) {
            return *i;
        }
    }
    return std::nullopt;
}

std::optional<std::string> Edge::RouteId() const {
    if (const auto* v = FindNonNull(attributes, attr::kRouteId)) {
        return ToKey(*v);
    }
    return std::nullopt;
}

std::optional<double> Edge::RouteKmBegin() const {
    if (const auto* v = FindNonNull(attributes, attr::kRouteKmBegin)) {
        return AsDouble(*v);
    }
    return std::nullopt;
}

std::optional<double> Edge::RouteKmEnd() const {
    if (const auto* v = FindNonNull(attributes, attr::kRouteKmEnd)) {
        return AsDouble(*v);
    }
    return std::nullopt;
}

bool Edge::IsBorder() const {
    if (const auto* v = FindNonNull(attributes, attr::kIsBorder)) {
        return AsBool(*v).value_or(false);
    }
    return false;
}

std::string Edge::DataSource() const {
    if (const auto* v = FindNonNull(attributes, attr::kDataSource)) {
        return ToKey(*v);
    }
    return "";
}

std::optional<double> Edge::LengthM() const {
    if (const auto* v = FindNonNull(attributes, attr::kLengthM)) {
        return AsDouble(*v);
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Graph
// ---------------------------------------------------------------------------
Graph::EdgeKey Graph::MakeEdgeKey(const NodeId& u, const NodeId& v) {
    return u < v ? EdgeKey{u, v} : EdgeKey{v, u};
}

Node& Graph::AddNode(const NodeId& id) {
    auto it = nodes_.find(id);
    if (it != nodes_.end()) {
        return it->second;
    }
    adjacency_[id];
    Node node;
    node.id = id;
    return nodes_.emplace(id, std::move(node)).first->second;
}

Edge& Graph::AddEdge(const NodeId& u, const NodeId& v, AttributeMap attributes,
                     std::optional<GeoLineString> geometry) {
    AddNode(u);
    AddNode(v);

    auto key = MakeEdgeKey(u, v);
    auto it = edges_.find(key);
    if (it == edges_.end()) {
        adjacency_[u].insert(v);
        adjacency_[v].insert(u);
        Edge edge;
        edge.source = u;
        edge.target = v;
        edge.attributes = std::move(attributes);
        edge.geometry = std::move(geometry);
        return edges_.emplace(std::move(key), std::move(edge)).first->second;
    }

    Edge& edge = it->second;
    for (auto& [k, value] : attributes) {
        edge.attributes[k] = std::move(value);
    }
    if (geometry.has_value()) {
        edge.geometry = std::move(geometry);
    }
    return edge;
}

bool Graph::HasNode(const NodeId& id) const {
    return nodes_.count(id) > 0;
}

bool Graph::HasEdge(const NodeId& u, const NodeId& v) const {
    return edges_.count(MakeEdgeKey(u, v)) > 0;
}

const Node* Graph::FindNode(const NodeId& id) const {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

Node* Graph::FindNode(const NodeId& id) {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

const Edge* Graph::FindEdge(const NodeId& u, const NodeId& v) const {
    auto it = edges_.find(MakeEdgeKey(u, v));
    return it == edges_.end() ? nullptr : &it->second;
}

Edge* Graph::FindEdge(const NodeId& u, const NodeId& v) {
    auto it = edges_.find(MakeEdgeKey(u, v));
    return it == edges_.end() ? nullptr : &it->second;
}

const std::set<NodeId>& Graph::Neighbors(const NodeId& id) const {
    auto it = adjacency_.find(id);
    return it == adjacency_.end() ? kNoNeighbors : it->second;
}

std::vector<std::vector<NodeId>> Graph::ConnectedComponents() const {
    std::vector<std::vector<NodeId>> components;
    std::set<NodeId> visited;

    for (const auto& entry : nodes_) {
        const auto& start = entry.first;
        if (visited.count(start) > 0) {
            continue;
        }
        std::vector<NodeId> component;
        std::queue<NodeId> frontier;
        frontier.push(start);
        visited.insert(start);
        while (!frontier.empty()) {
            auto current = frontier.front();
            frontier.pop();
            for (const auto& next : Neighbors(current)) {
                if (visited.insert(next).second) {
                    frontier.push(next);
                }
            }
            component.push_back(std::move(current));
        }
        components.push_back(std::move(component));
    }
    return components;
}

std::size_t Graph::ComponentCount() const {
    return ConnectedComponents().size();
}

std::size_t Graph::AssignComponents() {
    const auto components = ConnectedComponents();
    for (std::size_t i = 0; i < components.size(); ++i) {
        const auto index = static_cast<std::int64_t>(i);
        for (const auto& id : components[i]) {
            nodes_[id].attributes[attr::kSubgraph] = index;
        }
    }
    for (auto& [key, edge] : edges_) {
        edge.attributes[attr::kSubgraph] =
            nodes_[key.first].attributes[attr::kSubgraph];
    }
    return components.size();
}

} // namespace fairway_graph
