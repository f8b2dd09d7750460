#include <fairway_graph/validate/graph_validator.hpp>

#include <fairway_graph/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <limits>
#include <set>
#include <sstream>
#include <unordered_map>

namespace fairway_graph {

namespace {

constexpr const char* kComponent = "GraphValidator";
constexpr const char* kUnknownSource = "unknown";
constexpr const char* kGeometryKey = "geometry";

const std::set<std::string> kBaseNodeAttributes = {
    attr::kDataSource, kGeometryKey, "node_id", attr::kCountryCode};
const std::set<std::string> kBaseEdgeAttributes = {
    attr::kDataSource, kGeometryKey,     "id", attr::kBridgehead,
    attr::kDistanceGap, attr::kConnectionType};

// One graph element as seen by the schema check.
struct ElementView {
    const AttributeMap* attributes;
    bool has_typed_geometry;
};

std::string SourceOf(const AttributeMap& attributes) {
    if (const auto* v = FindNonNull(attributes, attr::kDataSource)) {
        return ToKey(*v);
    }
    return kUnknownSource;
}

bool HasUppercase(const std::string& key) {
    return std::any_of(key.begin(), key.end(),
                       [](unsigned char c) { return std::isupper(c) != 0; });
}

bool IsMissing(const AttributeMap& attributes, const std::string& key) {
    auto it = attributes.find(key);
    if (it == attributes.end() || IsNull(it->second)) {
        return true;
    }
    const auto* text = std::get_if<std::string>(&it->second);
    return text != nullptr && text->empty();
}

std::string DescribeMapping(const std::map<std::string, std::string>& mapping,
                            const std::string& target) {
    std::ostringstream oss;
    oss << "Mapped from [";
    bool first = true;
    for (const auto& [old_key, new_key] : mapping) {
        if (new_key != target) {
            continue;
        }
        oss << (first ? "" : ", ") << "'" << old_key << "'";
        first = false;
    }
    oss << "]";
    return oss.str();
}

ElementCompliance CheckElements(const std::vector<ElementView>& elements,
                                const std::map<std::string, std::string>& mapping,
                                const std::set<std::string>& base) {
    std::set<std::string> canonical = base;
    std::set<std::string> mapped_targets;
    for (const auto& [old_key, new_key] : mapping) {
        canonical.insert(new_key);
        mapped_targets.insert(new_key);
    }

    ElementCompliance out;
    for (const auto& key : canonical) {
        out.expected_attributes.push_back(key);
        out.missing_counts[key] = 0;
        out.attribute_docs[key] = mapped_targets.count(key) > 0
                                      ? DescribeMapping(mapping, key)
                                      : "Standard/Base Attribute";
    }

    for (const auto& element : elements) {
        for (const auto& entry : *element.attributes) {
            const auto& key = entry.first;
            if (canonical.count(key) > 0 || mapping.count(key) > 0 || key == kGeometryKey) {
                continue;
            }
            if (HasUppercase(key)) {
                ++out.attribute_counts[key];
            }
        }
        for (const auto& key : canonical) {
            if (key == kGeometryKey && element.has_typed_geometry) {
                continue;
            }
            if (IsMissing(*element.attributes, key)) {
                ++out.missing_counts[key];
            }
        }
    }

    for (const auto& entry : out.attribute_counts) {
        out.non_standard_attributes.push_back(entry.first);
    }
    return out;
}

nlohmann::json ToJson(const ElementCompliance& compliance) {
    nlohmann::json j;
    j["non_standard_attributes_detected"] = compliance.non_standard_attributes;
    j["attribute_counts"] = compliance.attribute_counts;
    j["missing_counts"] = compliance.missing_counts;
    j["expected_attributes"] = compliance.expected_attributes;
    j["attribute_docs"] = compliance.attribute_docs;
    return j;
}

} // anonymous namespace

std::string_view CheckStatusName(CheckStatus status) {
    switch (status) {
        case CheckStatus::Pass:    return "PASS";
        case CheckStatus::Warning: return "WARNING";
    }
    return "WARNING";
}

GraphValidator::GraphValidator(const Graph& graph, ValidationOptions options)
    : graph_(graph), options_(std::move(options)) {}

bool GraphValidator::IsBorderEdge(const Edge& edge) const {
    return edge.DataSource() == options_.border_tag;
}

// ---------------------------------------------------------------------------
// Statistics
// ---------------------------------------------------------------------------
GraphStatistics GraphValidator::CheckStatistics() const {
    LogInfo(kComponent, "Running statistical checks...");

    GraphStatistics stats;
    stats.total_nodes = graph_.NodeCount();
    stats.total_edges = graph_.EdgeCount();

    for (const auto& [id, node] : graph_.Nodes()) {
        ++stats.nodes_by_source[SourceOf(node.attributes)];
    }

    std::set<std::string> fairway_ids;
    for (const auto& [key, edge] : graph_.Edges()) {
        ++stats.edges_by_source[SourceOf(edge.attributes)];
        if (const auto* fairway = FindNonNull(edge.attributes, attr::kFairwayId)) {
            auto text = ToKey(*fairway);
            if (!text.empty()) {
                fairway_ids.insert(std::move(text));
            }
        }
    }
    stats.unique_fairway_sections = fairway_ids.size();

    auto components = graph_.ConnectedComponents();
    std::stable_sort(components.begin(), components.end(),
                     [](const auto& a, const auto& b) { return a.size() > b.size(); });

    std::unordered_map<NodeId, std::size_t> component_of;
    for (std::size_t i = 0; i < components.size(); ++i) {
        for (const auto& id : components[i]) {
            component_of[id] = i;
        }
    }
    std::vector<std::size_t> edges_per_component(components.size(), 0);
    for (const auto& [key, edge] : graph_.Edges()) {
        ++edges_per_component[component_of.at(key.first)];
    }

    stats.connected_components = components.size();
    stats.largest_component_size = components.empty() ? 0 : components.front().size();
    for (std::size_t i = 0; i < components.size(); ++i) {
        if (i < 10 || components[i].size() > 1) {
            stats.subgraphs.push_back(
                ComponentSummary{i, components[i].size(), edges_per_component[i]});
        }
    }
    return stats;
}

// ---------------------------------------------------------------------------
// Border integrity
// ---------------------------------------------------------------------------
BorderIntegrity GraphValidator::CheckBorderIntegrity() const {
    LogInfo(kComponent, "Checking border integrity...");

    BorderIntegrity integrity;
    integrity.expected_connections = options_.expected_border_connections;

    double sum = 0.0;
    double min_gap = std::numeric_limits<double>::infinity();
    for (const auto& [key, edge] : graph_.Edges()) {
        if (!IsBorderEdge(edge)) {
            continue;
        }
        double gap = 0.0;
        if (const auto* v = FindNonNull(edge.attributes, attr::kDistanceGap)) {
            gap = AsDouble(*v).value_or(0.0);
        }
        integrity.connections.push_back(BorderLink{edge.source, edge.target, gap});
        sum += gap;
        min_gap = std::min(min_gap, gap);
        integrity.max_gap_meters = std::max(integrity.max_gap_meters, gap);
    }

    integrity.total_connections = integrity.connections.size();
    if (!integrity.connections.empty()) {
        integrity.min_gap_meters = min_gap;
        integrity.avg_gap_meters = sum / static_cast<double>(integrity.total_connections);
    }
    integrity.status = integrity.total_connections >= integrity.expected_connections
                           ? CheckStatus::Pass
                           : CheckStatus::Warning;

    if (integrity.status == CheckStatus::Warning) {
        std::ostringstream msg;
        msg << "Only " << integrity.total_connections << " border connections, expected "
            << integrity.expected_connections;
        LogWarn(kComponent, msg.str());
    }
    return integrity;
}

// ---------------------------------------------------------------------------
// Schema compliance
// ---------------------------------------------------------------------------
SchemaCompliance GraphValidator::CheckSchemaCompliance() const {
    LogInfo(kComponent, "Checking schema compliance...");

    std::vector<ElementView> nodes;
    nodes.reserve(graph_.NodeCount());
    for (const auto& [id, node] : graph_.Nodes()) {
        nodes.push_back(ElementView{&node.attributes, node.location.has_value()});
    }
    std::vector<ElementView> edges;
    edges.reserve(graph_.EdgeCount());
    for (const auto& [key, edge] : graph_.Edges()) {
        edges.push_back(ElementView{&edge.attributes, edge.geometry.has_value()});
    }

    SchemaCompliance compliance;
    compliance.nodes = CheckElements(nodes, options_.schema.nodes, kBaseNodeAttributes);
    compliance.edges = CheckElements(edges, options_.schema.edges, kBaseEdgeAttributes);
    return compliance;
}

// ---------------------------------------------------------------------------
// Critical connections
// ---------------------------------------------------------------------------
std::vector<CriticalCheck> GraphValidator::CheckCriticalConnections() const {
    LogInfo(kComponent, "Checking critical connections...");

    std::vector<CriticalCheck> checks;
    for (const auto& critical : options_.critical_connections) {
        CriticalCheck check;
        check.name = critical.name;
        for (const auto& [key, edge] : graph_.Edges()) {
            if (!IsBorderEdge(edge)) {
                continue;
            }
            if (key.first == critical.node_id || key.second == critical.node_id) {
                check.status = CheckStatus::Pass;
                check.details = edge.source + " <-> " + edge.target;
                break;
            }
        }
        if (check.status != CheckStatus::Pass) {
            check.details = critical.node_id + " not found in border connections";
            LogWarn(kComponent, critical.name + ": " + check.details);
        }
        checks.push_back(std::move(check));
    }
    return checks;
}

ValidationReport GraphValidator::Run() const {
    ValidationReport report;
    report.statistics = CheckStatistics();
    report.border_integrity = CheckBorderIntegrity();
    report.schema_compliance = CheckSchemaCompliance();
    report.critical_connections = CheckCriticalConnections();
    return report;
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------
nlohmann::json ToJson(const ValidationReport& report) {
    const auto& stats = report.statistics;
    nlohmann::json statistics;
    statistics["total_nodes"] = stats.total_nodes;
    statistics["total_edges"] = stats.total_edges;
    statistics["nodes_by_source"] = stats.nodes_by_source;
    statistics["edges_by_source"] = stats.edges_by_source;
    statistics["connected_components"] = stats.connected_components;
    statistics["largest_component_size"] = stats.largest_component_size;
    nlohmann::json subgraphs = nlohmann::json::array();
    for (const auto& s : stats.subgraphs) {
        subgraphs.push_back({{"subgraph_id", s.subgraph_id},
                             {"nodes", s.nodes},
                             {"edges", s.edges}});
    }
    statistics["subgraphs"] = subgraphs;
    statistics["unique_fairway_sections"] = stats.unique_fairway_sections;

    const auto& border = report.border_integrity;
    nlohmann::json border_integrity;
    border_integrity["total_connections"] = border.total_connections;
    border_integrity["expected_connections"] = border.expected_connections;
    border_integrity["status"] = std::string(CheckStatusName(border.status));
    border_integrity["min_gap_meters"] = border.min_gap_meters;
    border_integrity["max_gap_meters"] = border.max_gap_meters;
    border_integrity["avg_gap_meters"] = border.avg_gap_meters;
    nlohmann::json connections = nlohmann::json::array();
    for (const auto& c : border.connections) {
        connections.push_back({{"u", c.u}, {"v", c.v}, {"gap", c.gap}});
    }
    border_integrity["connections"] = connections;

    nlohmann::json schema_compliance;
    schema_compliance["nodes"] = ToJson(report.schema_compliance.nodes);
    schema_compliance["edges"] = ToJson(report.schema_compliance.edges);

    nlohmann::json checks = nlohmann::json::array();
    for (const auto& check : report.critical_connections) {
        checks.push_back({{"name", check.name},
                          {"status", std::string(CheckStatusName(check.status))},
                          {"details", check.details}});
    }

    nlohmann::json j;
    j["statistics"] = statistics;
    j["border_integrity"] = border_integrity;
    j["schema_compliance"] = schema_compliance;
    j["critical_connections"] = {{"checks", checks}};
    return j;
}

} // namespace fairway_graph
