#pragma once

#include <fairway_graph/core/result.hpp>
#include <fairway_graph/graph/graph.hpp>
#include <fairway_graph/table/table.hpp>

#include <string>

namespace fairway_graph {

// Column names of a single-source section/junction export (FIS layout).
struct SectionGraphColumns {
    std::string section_start = "StartJunctionId";
    std::string section_end = "EndJunctionId";
    std::string junction_id = "Id";
};

// Integral numbers become int64 so that 1001 and 1001.0 name the same node.
[[nodiscard]] AttributeValue NormalizeJunctionId(const AttributeValue& value);

struct SectionFilterOutcome {
    Table table;
    std::size_t removed = 0;
};

// Keep sections with both junction ids; ids normalized (12.0 -> 12).
// Fails when either junction id column is missing.
[[nodiscard]] Result<SectionFilterOutcome, Error> FilterSections(
    const Table& sections, const SectionGraphColumns& columns = {});

// Keep junctions referenced by at least one of `filtered_sections`.
[[nodiscard]] Result<SectionFilterOutcome, Error> FilterJunctions(
    const Table& junctions, const Table& filtered_sections,
    const SectionGraphColumns& columns = {});

// Graph plus the filtered tables it was built from. The filtered section
// table is what AttributeEnricher maps edges back to sections with.
struct SectionGraph {
    Graph graph;
    Table sections;
    Table junctions;
    std::size_t sections_removed = 0;
    std::size_t junctions_removed = 0;
};

// One undirected edge per retained section (last write wins on a repeated
// junction pair), carrying every section column and its geometry. Junction
// columns land on the matching node. Empty input gives an empty graph.
[[nodiscard]] Result<SectionGraph, Error> BuildSectionGraph(
    const Table& sections, const Table& junctions,
    const SectionGraphColumns& columns = {});

} // namespace fairway_graph
