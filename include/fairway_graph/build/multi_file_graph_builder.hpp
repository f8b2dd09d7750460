#pragma once

#include <fairway_graph/core/result.hpp>
#include <fairway_graph/graph/graph.hpp>
#include <fairway_graph/table/table.hpp>

#include <string>
#include <vector>

namespace fairway_graph {

// Column names of a multi-region export (EURIS layout).
struct MultiFileColumns {
    std::string locode = "locode";
    std::string object_code = "objectcode";
    std::string section_ref = "sectionref";
    std::string section_code = "code";
    std::string border_point = "borderpoint";
    // Derived columns added to the canonical node table.
    std::string node_id = "node_id";
    std::string country_code_locode = "countrycode_locode";
    std::string country_code_path = "countrycode_path";
};

struct CanonicalNodes {
    Table table;
    std::size_t duplicates_removed = 0;
    std::size_t skipped_without_locode = 0;
};

struct CanonicalSections {
    Table table;
    std::size_t duplicates_removed = 0;
};

// Concatenate per-region node tables, drop exact duplicates (ignoring the
// region name) and derive `node_id` = "<CC>_<objectcode>" where CC is the
// first two characters of the location code.
[[nodiscard]] Result<CanonicalNodes, Error> ConcatNodeTables(
    const std::vector<Table>& node_tables, const MultiFileColumns& columns = {});

[[nodiscard]] Result<CanonicalSections, Error> ConcatSectionTables(
    const std::vector<Table>& section_tables);

// How many section codes deviate from "exactly two referencing nodes".
struct SectionReferenceStats {
    std::size_t sections_without_nodes = 0;
    std::size_t sections_with_single_node = 0;
    std::size_t sections_with_extra_nodes = 0;
};

struct MultiFileGraph {
    Graph graph;
    SectionReferenceStats reference_stats;
    std::size_t border_links = 0;
    std::size_t components = 0;
    std::size_t lengths_skipped = 0;
};

// Edges from section-to-node references, border links from
// borderpoint -> locode, component stamps and `length_m` on every edge.
[[nodiscard]] Result<MultiFileGraph, Error> BuildMultiFileGraph(
    const CanonicalNodes& nodes, const CanonicalSections& sections,
    const MultiFileColumns& columns = {});

// ConcatNodeTables + ConcatSectionTables + BuildMultiFileGraph.
[[nodiscard]] Result<MultiFileGraph, Error> BuildMultiFileGraphFromRegions(
    const std::vector<Table>& node_tables,
    const std::vector<Table>& section_tables,
    const MultiFileColumns& columns = {});

} // namespace fairway_graph
