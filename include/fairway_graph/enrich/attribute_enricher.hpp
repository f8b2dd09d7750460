#pragma once

#include <fairway_graph/build/section_graph_builder.hpp>
#include <fairway_graph/core/attribute.hpp>
#include <fairway_graph/core/result.hpp>
#include <fairway_graph/graph/graph.hpp>
#include <fairway_graph/table/table.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fairway_graph {

// Section id (canonical key) -> prefixed enrichment fields. Only sections
// with at least one match appear.
using EnrichmentTable = std::map<std::string, AttributeMap>;

inline constexpr const char* kSectionIdColumn = "Id";

// ---------------------------------------------------------------------------
// Matching
// ---------------------------------------------------------------------------

// Join `data` onto `sections` by identical canonical geometry WKT. When several
// data rows share a geometry the first one is used. Empty result when `data`
// is empty or carries none of `columns`.
[[nodiscard]] EnrichmentTable MatchByGeometry(
    const Table& sections, const Table& data,
    const std::vector<std::string>& columns, const std::string& prefix,
    const std::string& section_id_column = kSectionIdColumn);

// Join `data` onto `sections` sharing RouteId whose [RouteKmBegin,
// RouteKmEnd] intervals overlap (endpoints may come in either order). First
// overlapping data row per section wins. Empty result (with a warning) when
// either table lacks a route column.
[[nodiscard]] EnrichmentTable MatchByRouteKm(
    const Table& sections, const Table& data,
    const std::vector<std::string>& columns, const std::string& prefix,
    const std::string& section_id_column = kSectionIdColumn);

// ---------------------------------------------------------------------------
// Section enrichment (primary source)
// ---------------------------------------------------------------------------

struct EnrichmentDatasets {
    // Required.
    std::optional<Table> sections;
    std::optional<Table> maximum_dimensions;
    std::optional<Table> navigability;
    // Optional.
    std::optional<Table> navigation_speed;
    std::optional<Table> fairway_depth;
    std::optional<Table> fairway_type;
    std::optional<Table> tidal_area;
};

// Combine every dataset into one per-section table: dim_*, nav_*, speed_*,
// depth_*, type_* columns plus the `cemt_class` and `is_tidal` aliases.
[[nodiscard]] Result<EnrichmentTable, Error> BuildSectionEnrichment(
    const EnrichmentDatasets& datasets,
    const std::string& section_id_column = kSectionIdColumn);

struct EnrichmentOutcome {
    Graph graph;
    std::size_t enriched_edges = 0;
};

// Resolve each edge to its section through the unordered junction pair and
// merge that section's non-null fields onto the edge.
[[nodiscard]] Result<EnrichmentOutcome, Error> ApplySectionEnrichment(
    Graph graph, const Table& sections, const EnrichmentTable& enrichment,
    const SectionGraphColumns& columns = {},
    const std::string& section_id_column = kSectionIdColumn);

// ---------------------------------------------------------------------------
// Section-reference enrichment (secondary source)
// ---------------------------------------------------------------------------

struct SectionRefEnrichment {
    std::vector<std::string> columns;
    std::string prefix;
    std::string ref_column = attr::kSectionRef;
};

// Sailing speed of the multi-region export.
[[nodiscard]] SectionRefEnrichment SailingSpeedEnrichment();

// Key `data` by its reference column (first row wins) and merge the
// prefixed non-null fields onto edges whose `sectionref` matches.
[[nodiscard]] EnrichmentOutcome EnrichBySectionRef(
    Graph graph, const Table& data, const SectionRefEnrichment& options);

} // namespace fairway_graph
