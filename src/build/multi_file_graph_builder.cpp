#include <fairway_graph/build/multi_file_graph_builder.hpp>

#include <fairway_graph/core/log.hpp>

#include <regex>
#include <set>
#include <sstream>
#include <unordered_map>

namespace fairway_graph {

namespace {

constexpr const char* kComponent = "MultiFileGraphBuilder";

// Region tables are named after their export file, e.g. "Node_DE_3.geojson".
std::string CountryCodeFromRegionName(const std::string& name) {
    static const std::regex kNodePath(R"(^Node_([A-Z]+)_\d+)");
    std::smatch match;
    if (std::regex_search(name, match, kNodePath)) {
        return match[1].str();
    }
    return "";
}

Error MissingInputError(const std::string& operation, const std::string& what) {
    return Error{operation, what, "No " + what + " tables given",
                 ErrorCategory::MissingInput};
}

void AddNodeAttributes(Node& node, const Row& row) {
    for (const auto& [column, value] : row.values) {
        node.attributes[column] = value;
    }
    if (const auto* point = std::get_if<GeoPoint>(&row.geometry)) {
        node.location = *point;
        node.attributes[attr::kGeometryWkt] = CanonicalWkt(*point);
    }
}

std::size_t AddSectionEdges(Graph& graph, const Table& nodes, const Table& sections,
                            const MultiFileColumns& columns,
                            SectionReferenceStats& stats) {
    // sectionref -> node ids, in node table order.
    std::unordered_map<std::string, std::vector<NodeId>> referencing;
    for (const auto& row : nodes.rows) {
        const auto& ref = Cell(row, columns.section_ref);
        if (IsNull(ref)) {
            continue;
        }
        referencing[ToKey(ref)].push_back(ToKey(Cell(row, columns.node_id)));
    }

    std::set<std::string> counted;
    std::size_t added = 0;
    for (const auto& row : sections.rows) {
        const auto& code_value = Cell(row, columns.section_code);
        if (IsNull(code_value)) {
            continue;
        }
        const auto code = ToKey(code_value);
        auto it = referencing.find(code);
        const std::size_t count = it == referencing.end() ? 0 : it->second.size();

        if (counted.insert(code).second) {
            if (count == 0) {
                ++stats.sections_without_nodes;
            } else if (count == 1) {
                ++stats.sections_with_single_node;
            } else if (count > 2) {
                ++stats.sections_with_extra_nodes;
            }
        }
        if (count < 2) {
            continue;
        }

        const auto& source = it->second.front();
        const auto& target = it->second.back();

        AttributeMap attributes = row.values;
        attributes[columns.section_ref] = code;
        attributes[attr::kIsBorder] = false;

        std::optional<GeoLineString> geometry;
        if (const auto* line = std::get_if<GeoLineString>(&row.geometry)) {
            geometry = *line;
            attributes[attr::kGeometryWkt] = CanonicalWkt(*line);
        }
        graph.AddEdge(source, target, std::move(attributes), std::move(geometry));
        ++added;
    }
    return added;
}

std::size_t AddBorderEdges(Graph& graph, const Table& nodes,
                           const MultiFileColumns& columns) {
    if (!nodes.HasColumn(columns.border_point)) {
        return 0;
    }

    std::unordered_map<std::string, std::vector<NodeId>> by_locode;
    for (const auto& row : nodes.rows) {
        by_locode[ToKey(Cell(row, columns.locode))].push_back(
            ToKey(Cell(row, columns.node_id)));
    }

    std::size_t found = 0;
    std::size_t added = 0;
    for (const auto& row : nodes.rows) {
        const auto& border_point = Cell(row, columns.border_point);
        if (IsNull(border_point)) {
            continue;
        }
        const auto key = ToKey(border_point);
        auto it = by_locode.find(key);
        if (it == by_locode.end()) {
            continue;
        }
        const auto source = ToKey(Cell(row, columns.node_id));
        for (const auto& target : it->second) {
            ++found;
            const Node* u = graph.FindNode(source);
            const Node* v = graph.FindNode(target);
            if (u == nullptr || v == nullptr || source == target) {
                continue;
            }

            AttributeMap attributes;
            attributes[columns.border_point] = key;
            attributes[columns.locode] = key;
            attributes[attr::kIsBorder] = true;

            std::optional<GeoLineString> geometry;
            if (u->location.has_value() && v->location.has_value()) {
                GeoLineString line;
                line.push_back(*u->location);
                line.push_back(*v->location);
                attributes[attr::kGeometryWkt] = CanonicalWkt(line);
                geometry = std::move(line);
            }
            graph.AddEdge(source, target, std::move(attributes), std::move(geometry));
            ++added;
        }
    }

    LogInfo(kComponent, "Found " + std::to_string(found) + " border connections");
    return added;
}

std::size_t ComputeEdgeLengths(Graph& graph) {
    std::size_t skipped = 0;
    for (auto& [key, edge] : graph.Edges()) {
        if (!edge.geometry.has_value()) {
            ++skipped;
            continue;
        }
        auto length = GeodesicLength(*edge.geometry);
        if (length.IsErr()) {
            ++skipped;
            LogWarn(kComponent, "Edge " + key.first + "-" + key.second + ": " +
                                    length.Error().ToString());
            continue;
        }
        edge.attributes[attr::kLengthM] = length.Value();
    }
    if (skipped > 0) {
        LogWarn(kComponent, "No length for " + std::to_string(skipped) +
                                " edges without usable geometry");
    }
    return skipped;
}

} // anonymous namespace

Result<CanonicalNodes, Error> ConcatNodeTables(const std::vector<Table>& node_tables,
                                               const MultiFileColumns& columns) {
    if (node_tables.empty()) {
        return Result<CanonicalNodes, Error>::Err(
            MissingInputError("ConcatNodeTables", "node"));
    }
    LogInfo(kComponent, "Found " + std::to_string(node_tables.size()) + " node files");

    auto concatenated = ConcatTables(node_tables, "nodes");
    auto required = RequireColumns(concatenated, {columns.locode, columns.object_code},
                                   "ConcatNodeTables");
    if (required.IsErr()) {
        return Result<CanonicalNodes, Error>::Err(std::move(required).Error());
    }

    auto deduplicated = DropDuplicateRows(std::move(concatenated), {kSourceFileColumn});

    CanonicalNodes out;
    out.duplicates_removed = deduplicated.removed;
    out.table.name = deduplicated.table.name;
    out.table.columns = deduplicated.table.columns;
    for (const auto* derived : {&columns.country_code_locode,
                                &columns.country_code_path, &columns.node_id}) {
        if (!out.table.HasColumn(*derived)) {
            out.table.columns.push_back(*derived);
        }
    }
    if (!out.table.HasColumn(attr::kCountryCode)) {
        out.table.columns.push_back(attr::kCountryCode);
    }

    for (auto& row : deduplicated.table.rows) {
        const auto locode = ToKey(Cell(row, columns.locode));
        if (locode.size() < 2) {
            ++out.skipped_without_locode;
            continue;
        }
        const auto country = locode.substr(0, 2);
        const auto path_country =
            CountryCodeFromRegionName(ToKey(Cell(row, kSourceFileColumn)));

        row.values[columns.country_code_locode] = country;
        row.values[columns.country_code_path] =
            path_country.empty() ? AttributeValue{} : AttributeValue{path_country};
        row.values[attr::kCountryCode] = country;
        row.values[columns.node_id] =
            country + "_" + ToKey(Cell(row, columns.object_code));
        out.table.rows.push_back(std::move(row));
    }

    std::ostringstream msg;
    msg << "Removed " << out.duplicates_removed << " duplicated nodes, kept "
        << out.table.Size();
    LogInfo(kComponent, msg.str());
    if (out.skipped_without_locode > 0) {
        LogWarn(kComponent, "Skipped " + std::to_string(out.skipped_without_locode) +
                                " nodes without a usable location code");
    }

    return Result<CanonicalNodes, Error>::Ok(std::move(out));
}

Result<CanonicalSections, Error> ConcatSectionTables(
    const std::vector<Table>& section_tables) {
    if (section_tables.empty()) {
        return Result<CanonicalSections, Error>::Err(
            MissingInputError("ConcatSectionTables", "section"));
    }
    LogInfo(kComponent, "Found " + std::to_string(section_tables.size()) + " section files");

    auto deduplicated = DropDuplicateRows(ConcatTables(section_tables, "sections"),
                                          {kSourceFileColumn});
    CanonicalSections out;
    out.table = std::move(deduplicated.table);
    out.duplicates_removed = deduplicated.removed;

    std::ostringstream msg;
    msg << "Removed " << out.duplicates_removed << " duplicated sections, kept "
        << out.table.Size();
    LogInfo(kComponent, msg.str());

    return Result<CanonicalSections, Error>::Ok(std::move(out));
}

Result<MultiFileGraph, Error> BuildMultiFileGraph(const CanonicalNodes& nodes,
                                                  const CanonicalSections& sections,
                                                  const MultiFileColumns& columns) {
    MultiFileGraph out;

    LogInfo(kComponent, "Building node-section administration...");
    if (!sections.table.HasColumn(columns.section_code) ||
        !nodes.table.HasColumn(columns.section_ref)) {
        LogWarn(kComponent, "Missing '" + columns.section_code + "' or '" +
                                columns.section_ref +
                                "' column; no section edges can be built");
    } else {
        const auto added = AddSectionEdges(out.graph, nodes.table, sections.table,
                                           columns, out.reference_stats);
        LogInfo(kComponent, "Built " + std::to_string(added) + " section edges from " +
                                std::to_string(sections.table.Size()) + " sections");
    }

    const auto& stats = out.reference_stats;
    if (stats.sections_without_nodes > 0 || stats.sections_with_single_node > 0 ||
        stats.sections_with_extra_nodes > 0) {
        std::ostringstream msg;
        msg << "Section references not exactly two nodes: "
            << stats.sections_without_nodes << " without nodes, "
            << stats.sections_with_single_node << " with one node (skipped), "
            << stats.sections_with_extra_nodes << " with more than two (first/last used)";
        LogWarn(kComponent, msg.str());
    }

    LogInfo(kComponent, "Updating node information for " +
                            std::to_string(nodes.table.Size()) + " nodes...");
    for (const auto& row : nodes.table.rows) {
        Node* node = out.graph.FindNode(ToKey(Cell(row, columns.node_id)));
        if (node != nullptr) {
            AddNodeAttributes(*node, row);
        }
    }

    LogInfo(kComponent, "Connecting border nodes...");
    out.border_links = AddBorderEdges(out.graph, nodes.table, columns);

    LogInfo(kComponent, "Computing subgraphs...");
    out.components = out.graph.AssignComponents();

    LogInfo(kComponent, "Computing edge lengths...");
    out.lengths_skipped = ComputeEdgeLengths(out.graph);

    std::ostringstream msg;
    msg << "Built EURIS graph: " << out.graph.NodeCount() << " nodes, "
        << out.graph.EdgeCount() << " edges, " << out.components << " components";
    LogInfo(kComponent, msg.str());

    return Result<MultiFileGraph, Error>::Ok(std::move(out));
}

Result<MultiFileGraph, Error> BuildMultiFileGraphFromRegions(
    const std::vector<Table>& node_tables,
    const std::vector<Table>& section_tables,
    const MultiFileColumns& columns) {
    auto nodes = ConcatNodeTables(node_tables, columns);
    if (nodes.IsErr()) {
        return Result<MultiFileGraph, Error>::Err(std::move(nodes).Error());
    }
    auto sections = ConcatSectionTables(section_tables);
    if (sections.IsErr()) {
        return Result<MultiFileGraph, Error>::Err(std::move(sections).Error());
    }
    return BuildMultiFileGraph(nodes.Value(), sections.Value(), columns);
}

} // namespace fairway_graph
