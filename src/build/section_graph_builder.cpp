#include <fairway_graph/build/section_graph_builder.hpp>

#include <fairway_graph/core/log.hpp>

#include <cmath>
#include <set>
#include <sstream>

namespace fairway_graph {

namespace {

constexpr const char* kComponent = "SectionGraphBuilder";

} // anonymous namespace

AttributeValue NormalizeJunctionId(const AttributeValue& value) {
    if (std::holds_alternative<std::int64_t>(value)) {
        return value;
    }
    auto number = AsDouble(value);
    if (number.has_value() && std::isfinite(*number) && std::floor(*number) == *number) {
        return static_cast<std::int64_t>(*number);
    }
    return value;
}

Result<SectionFilterOutcome, Error> FilterSections(const Table& sections,
                                                   const SectionGraphColumns& columns) {
    auto required = RequireColumns(
        sections, {columns.section_start, columns.section_end}, "FilterSections");
    if (required.IsErr()) {
        return Result<SectionFilterOutcome, Error>::Err(std::move(required).Error());
    }

    SectionFilterOutcome outcome;
    outcome.table.name = sections.name;
    outcome.table.columns = sections.columns;
    for (const auto& row : sections.rows) {
        const auto& start = Cell(row, columns.section_start);
        const auto& end = Cell(row, columns.section_end);
        if (IsNull(start) || IsNull(end)) {
            ++outcome.removed;
            continue;
        }
        Row kept = row;
        kept.values[columns.section_start] = NormalizeJunctionId(start);
        kept.values[columns.section_end] = NormalizeJunctionId(end);
        outcome.table.rows.push_back(std::move(kept));
    }

    std::ostringstream msg;
    msg << "Filtered sections: " << sections.Size() << " -> "
        << outcome.table.Size() << " (removed " << outcome.removed
        << " without junction IDs)";
    LogInfo(kComponent, msg.str());

    return Result<SectionFilterOutcome, Error>::Ok(std::move(outcome));
}

Result<SectionFilterOutcome, Error> FilterJunctions(const Table& junctions,
                                                    const Table& filtered_sections,
                                                    const SectionGraphColumns& columns) {
    auto required = RequireColumns(junctions, {columns.junction_id}, "FilterJunctions");
    if (required.IsErr()) {
        return Result<SectionFilterOutcome, Error>::Err(std::move(required).Error());
    }

    std::set<std::string> referenced;
    for (const auto& row : filtered_sections.rows) {
        referenced.insert(ToKey(Cell(row, columns.section_start)));
        referenced.insert(ToKey(Cell(row, columns.section_end)));
    }

    SectionFilterOutcome outcome;
    outcome.table.name = junctions.name;
    outcome.table.columns = junctions.columns;
    for (const auto& row : junctions.rows) {
        const auto& id = Cell(row, columns.junction_id);
        if (IsNull(id) || referenced.count(ToKey(NormalizeJunctionId(id))) == 0) {
            ++outcome.removed;
            continue;
        }
        outcome.table.rows.push_back(row);
    }

    std::ostringstream msg;
    msg << "Filtered junctions: " << junctions.Size() << " -> "
        << outcome.table.Size() << " (keeping only referenced)";
    LogInfo(kComponent, msg.str());

    return Result<SectionFilterOutcome, Error>::Ok(std::move(outcome));
}

Result<SectionGraph, Error> BuildSectionGraph(const Table& sections,
                                              const Table& junctions,
                                              const SectionGraphColumns& columns) {
    auto section_result = FilterSections(sections, columns);
    if (section_result.IsErr()) {
        return Result<SectionGraph, Error>::Err(std::move(section_result).Error());
    }
    auto junction_result = FilterJunctions(junctions, section_result.Value().table, columns);
    if (junction_result.IsErr()) {
        return Result<SectionGraph, Error>::Err(std::move(junction_result).Error());
    }

    SectionGraph out;
    out.sections = std::move(section_result.Value().table);
    out.sections_removed = section_result.Value().removed;
    out.junctions = std::move(junction_result.Value().table);
    out.junctions_removed = junction_result.Value().removed;

    {
        std::ostringstream msg;
        msg << "Building graph from " << out.sections.Size() << " edges";
        LogInfo(kComponent, msg.str());
    }

    std::size_t skipped_lengths = 0;
    for (const auto& row : out.sections.rows) {
        const auto u = ToKey(Cell(row, columns.section_start));
        const auto v = ToKey(Cell(row, columns.section_end));

        AttributeMap attributes;
        for (const auto& [column, value] : row.values) {
            if (column == columns.section_start || column == columns.section_end) {
                continue;
            }
            attributes[column] = value;
        }

        std::optional<GeoLineString> geometry;
        if (const auto* line = std::get_if<GeoLineString>(&row.geometry)) {
            geometry = *line;
        }
        if (HasGeometry(row.geometry)) {
            attributes[attr::kGeometryWkt] = CanonicalWkt(row.geometry);
        }
        if (geometry.has_value()) {
            auto length = GeodesicLength(*geometry);
            if (length.IsOk()) {
                attributes[attr::kLengthM] = length.Value();
            } else {
                ++skipped_lengths;
                LogWarn(kComponent, "Section " + u + "-" + v + ": " +
                                        length.Error().ToString());
            }
        }
        out.graph.AddEdge(u, v, std::move(attributes), std::move(geometry));
    }

    if (skipped_lengths > 0) {
        LogWarn(kComponent, "Skipped length for " + std::to_string(skipped_lengths) +
                                " sections with malformed geometry");
    }

    {
        std::ostringstream msg;
        msg << "Adding node attributes from " << out.junctions.Size() << " junctions";
        LogInfo(kComponent, msg.str());
    }

    for (const auto& row : out.junctions.rows) {
        const auto id = ToKey(NormalizeJunctionId(Cell(row, columns.junction_id)));
        Node* node = out.graph.FindNode(id);
        if (node == nullptr) {
            continue;
        }
        for (const auto& [column, value] : row.values) {
            if (column == columns.junction_id) {
                continue;
            }
            node->attributes[column] = value;
        }
        if (const auto* point = std::get_if<GeoPoint>(&row.geometry)) {
            node->location = *point;
            node->attributes[attr::kGeometryWkt] = CanonicalWkt(*point);
            node->attributes["x"] = Lon(*point);
            node->attributes["y"] = Lat(*point);
        }
    }

    std::ostringstream msg;
    msg << "Graph built: " << out.graph.NodeCount() << " nodes, "
        << out.graph.EdgeCount() << " edges, " << out.graph.ComponentCount()
        << " connected components";
    LogInfo(kComponent, msg.str());

    return Result<SectionGraph, Error>::Ok(std::move(out));
}

} // namespace fairway_graph
