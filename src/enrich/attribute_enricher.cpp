#include <fairway_graph/enrich/attribute_enricher.hpp>

#include <fairway_graph/core/log.hpp>

#include <algorithm>
#include <set>
#include <sstream>
#include <tuple>
#include <unordered_map>

namespace fairway_graph {

namespace {

constexpr const char* kComponent = "AttributeEnricher";

const std::vector<std::string> kDimensionColumns = {
    "GeneralDepth",    "GeneralLength",    "GeneralWidth",    "GeneralHeight",
    "SeaFairingDepth", "SeaFairingLength", "SeaFairingWidth", "SeaFairingHeight",
    "PushedDepth",     "PushedLength",     "PushedWidth",
    "CoupledDepth",    "CoupledLength",    "CoupledWidth",
};
const std::vector<std::string> kNavigabilityColumns = {"Classification", "Code",
                                                       "Description"};
const std::vector<std::string> kSpeedColumns = {
    "Speed", "MaxSpeedUp", "MaxSpeedDown", "CalibratedSpeedUp", "CalibratedSpeedDown"};
const std::vector<std::string> kDepthColumns = {
    "MinimalDepthLowerLimit", "MinimalDepthUpperLimit", "ReferenceLevel"};
const std::vector<std::string> kTypeColumns = {"CharacterTypeCode"};

std::vector<std::string> AvailableColumns(const Table& data,
                                          const std::vector<std::string>& columns) {
    std::vector<std::string> available;
    for (const auto& column : columns) {
        if (data.HasColumn(column)) {
            available.push_back(column);
        }
    }
    return available;
}

AttributeMap PrefixedFields(const Row& row, const std::vector<std::string>& columns,
                            const std::string& prefix) {
    AttributeMap fields;
    for (const auto& column : columns) {
        fields[prefix + column] = Cell(row, column);
    }
    return fields;
}

bool AnyNonNull(const AttributeMap& fields) {
    return std::any_of(fields.begin(), fields.end(),
                       [](const auto& entry) { return !IsNull(entry.second); });
}

std::size_t CountMatched(const EnrichmentTable& table) {
    return static_cast<std::size_t>(std::count_if(
        table.begin(), table.end(),
        [](const auto& entry) { return AnyNonNull(entry.second); }));
}

// Route position of a row normalized to begin <= end; nullopt when any of
// the three route fields is missing.
struct RouteSpan {
    std::string route;
    double begin = 0.0;
    double end = 0.0;
};

std::optional<RouteSpan> ReadRouteSpan(const Row& row) {
    const auto& route = Cell(row, attr::kRouteId);
    auto begin = AsDouble(Cell(row, attr::kRouteKmBegin));
    auto end = AsDouble(Cell(row, attr::kRouteKmEnd));
    if (IsNull(route) || !begin.has_value() || !end.has_value()) {
        return std::nullopt;
    }
    return RouteSpan{ToKey(route), std::min(*begin, *end), std::max(*begin, *end)};
}

bool HasRouteColumns(const Table& table) {
    return table.HasColumn(attr::kRouteId) && table.HasColumn(attr::kRouteKmBegin) &&
           table.HasColumn(attr::kRouteKmEnd);
}

void Combine(EnrichmentTable& target, const EnrichmentTable& source) {
    for (const auto& [section_id, fields] : source) {
        auto& entry = target[section_id];
        for (const auto& [key, value] : fields) {
            entry[key] = value;
        }
    }
}

void LogCoverage(const EnrichmentTable& enrichment, const std::string& prefix,
                 const std::string& description) {
    std::size_t count = 0;
    for (const auto& [section_id, fields] : enrichment) {
        for (const auto& [key, value] : fields) {
            if (key.compare(0, prefix.size(), prefix) == 0 && !IsNull(value)) {
                ++count;
                break;
            }
        }
    }
    if (count > 0) {
        LogInfo(kComponent, "Total sections with " + description + ": " +
                                std::to_string(count));
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Matching
// ---------------------------------------------------------------------------
EnrichmentTable MatchByGeometry(const Table& sections, const Table& data,
                                const std::vector<std::string>& columns,
                                const std::string& prefix,
                                const std::string& section_id_column) {
    EnrichmentTable result;
    if (data.Empty()) {
        return result;
    }
    const auto available = AvailableColumns(data, columns);
    if (available.empty()) {
        return result;
    }

    std::unordered_map<std::string, const Row*> by_geometry;
    for (const auto& row : data.rows) {
        if (!HasGeometry(row.geometry)) {
            continue;
        }
        by_geometry.emplace(CanonicalWkt(row.geometry), &row);
    }

    for (const auto& section : sections.rows) {
        if (!HasGeometry(section.geometry)) {
            continue;
        }
        auto it = by_geometry.find(CanonicalWkt(section.geometry));
        if (it == by_geometry.end()) {
            continue;
        }
        auto fields = PrefixedFields(*it->second, available, prefix);
        if (AnyNonNull(fields)) {
            result.emplace(ToKey(Cell(section, section_id_column)), std::move(fields));
        }
    }

    LogInfo(kComponent, "Matched " + std::to_string(result.size()) +
                            " sections by geometry for " + prefix);
    return result;
}

EnrichmentTable MatchByRouteKm(const Table& sections, const Table& data,
                               const std::vector<std::string>& columns,
                               const std::string& prefix,
                               const std::string& section_id_column) {
    EnrichmentTable result;
    if (data.Empty()) {
        return result;
    }
    if (!HasRouteColumns(sections) || !HasRouteColumns(data)) {
        LogWarn(kComponent, "Missing route columns for route/km matching of " +
                                (data.name.empty() ? prefix : data.name));
        return result;
    }
    const auto available = AvailableColumns(data, columns);
    if (available.empty()) {
        return result;
    }

    // route id -> (span, row) in data order
    std::unordered_map<std::string, std::vector<std::pair<RouteSpan, const Row*>>> by_route;
    for (const auto& row : data.rows) {
        if (auto span = ReadRouteSpan(row)) {
            by_route[span->route].emplace_back(*span, &row);
        }
    }

    for (const auto& section : sections.rows) {
        auto span = ReadRouteSpan(section);
        if (!span.has_value()) {
            continue;
        }
        const auto id = ToKey(Cell(section, section_id_column));
        if (result.count(id) > 0) {
            continue;
        }
        auto it = by_route.find(span->route);
        if (it == by_route.end()) {
            continue;
        }
        for (const auto& [data_span, row] : it->second) {
            if (span->end < data_span.begin || data_span.end < span->begin) {
                continue;
            }
            auto fields = PrefixedFields(*row, available, prefix);
            if (AnyNonNull(fields)) {
                result.emplace(id, std::move(fields));
            }
            break;
        }
    }

    LogInfo(kComponent, "Matched " + std::to_string(result.size()) +
                            " sections by route/km for " + prefix);
    return result;
}

// ---------------------------------------------------------------------------
// Section enrichment
// ---------------------------------------------------------------------------
Result<EnrichmentTable, Error> BuildSectionEnrichment(const EnrichmentDatasets& datasets,
                                                      const std::string& section_id_column) {
    const std::pair<const std::optional<Table>*, const char*> required[] = {
        {&datasets.sections, "section"},
        {&datasets.maximum_dimensions, "maximumdimensions"},
        {&datasets.navigability, "navigability"},
    };
    for (const auto& [table, name] : required) {
        if (!table->has_value()) {
            return Result<EnrichmentTable, Error>::Err(
                Error{"BuildSectionEnrichment", name,
                      std::string("Required dataset not loaded: ") + name,
                      ErrorCategory::MissingInput});
        }
    }

    const Table& sections = *datasets.sections;
    auto id_column = RequireColumns(sections, {section_id_column}, "BuildSectionEnrichment");
    if (id_column.IsErr()) {
        return Result<EnrichmentTable, Error>::Err(std::move(id_column).Error());
    }

    EnrichmentTable enrichment;

    Combine(enrichment, MatchByGeometry(sections, *datasets.maximum_dimensions,
                                        kDimensionColumns, "dim_", section_id_column));

    auto navigability = MatchByGeometry(sections, *datasets.navigability,
                                        kNavigabilityColumns, "nav_", section_id_column);
    for (auto& [section_id, fields] : navigability) {
        if (const auto* code = FindNonNull(fields, "nav_Code")) {
            fields["cemt_class"] = *code;
        }
    }
    Combine(enrichment, navigability);

    const std::tuple<const std::optional<Table>*, const std::vector<std::string>*,
                     const char*> route_matched[] = {
        {&datasets.navigation_speed, &kSpeedColumns, "speed_"},
        {&datasets.fairway_depth, &kDepthColumns, "depth_"},
        {&datasets.fairway_type, &kTypeColumns, "type_"},
    };
    for (const auto& [table, columns, prefix] : route_matched) {
        if (table->has_value()) {
            Combine(enrichment, MatchByRouteKm(sections, **table, *columns, prefix,
                                               section_id_column));
        }
    }

    // Tidal areas contribute a flag only. Once any section lies in one,
    // every section with a route position is marked true or false.
    if (datasets.tidal_area.has_value()) {
        auto tidal = MatchByRouteKm(sections, *datasets.tidal_area, {"Name"}, "tidal_",
                                    section_id_column);
        if (!tidal.empty()) {
            for (const auto& section : sections.rows) {
                if (!ReadRouteSpan(section).has_value()) {
                    continue;
                }
                const auto id = ToKey(Cell(section, section_id_column));
                enrichment[id]["is_tidal"] = tidal.count(id) > 0;
            }
        }
    }

    LogCoverage(enrichment, "dim_", "dimensions");
    LogCoverage(enrichment, "cemt_", "CEMT");
    LogCoverage(enrichment, "speed_", "speed");
    LogCoverage(enrichment, "depth_", "depth");
    LogCoverage(enrichment, "type_", "type");
    LogCoverage(enrichment, "is_tidal", "tidal");

    LogInfo(kComponent, "Built enrichment for " + std::to_string(CountMatched(enrichment)) +
                            " of " + std::to_string(sections.Size()) + " sections");

    return Result<EnrichmentTable, Error>::Ok(std::move(enrichment));
}

Result<EnrichmentOutcome, Error> ApplySectionEnrichment(Graph graph, const Table& sections,
                                                        const EnrichmentTable& enrichment,
                                                        const SectionGraphColumns& columns,
                                                        const std::string& section_id_column) {
    auto required = RequireColumns(
        sections, {section_id_column, columns.section_start, columns.section_end},
        "ApplySectionEnrichment");
    if (required.IsErr()) {
        return Result<EnrichmentOutcome, Error>::Err(std::move(required).Error());
    }

    // Later sections win on a repeated junction pair, as in the graph build.
    std::map<Graph::EdgeKey, std::string> edge_to_section;
    for (const auto& row : sections.rows) {
        const auto& start = Cell(row, columns.section_start);
        const auto& end = Cell(row, columns.section_end);
        if (IsNull(start) || IsNull(end)) {
            continue;
        }
        edge_to_section[Graph::MakeEdgeKey(ToKey(NormalizeJunctionId(start)),
                                           ToKey(NormalizeJunctionId(end)))] =
            ToKey(Cell(row, section_id_column));
    }
    LogInfo(kComponent, "Built edge-to-section mapping with " +
                            std::to_string(edge_to_section.size()) + " entries");

    EnrichmentOutcome outcome;
    for (auto& [key, edge] : graph.Edges()) {
        auto section = edge_to_section.find(key);
        if (section == edge_to_section.end()) {
            continue;
        }
        auto fields = enrichment.find(section->second);
        if (fields == enrichment.end()) {
            continue;
        }
        if (MergeNonNull(edge.attributes, fields->second) > 0) {
            ++outcome.enriched_edges;
        }
    }

    std::ostringstream msg;
    msg << "Enriched " << outcome.enriched_edges << " / " << graph.EdgeCount() << " edges";
    LogInfo(kComponent, msg.str());

    outcome.graph = std::move(graph);
    return Result<EnrichmentOutcome, Error>::Ok(std::move(outcome));
}

// ---------------------------------------------------------------------------
// Section-reference enrichment
// ---------------------------------------------------------------------------
SectionRefEnrichment SailingSpeedEnrichment() {
    SectionRefEnrichment options;
    options.columns = {"maxspeed", "calspeed", "direction", "shipcategory"};
    options.prefix = "speed_";
    return options;
}

EnrichmentOutcome EnrichBySectionRef(Graph graph, const Table& data,
                                     const SectionRefEnrichment& options) {
    EnrichmentOutcome outcome;
    if (data.Empty() || !data.HasColumn(options.ref_column)) {
        LogWarn(kComponent, "No data or missing '" + options.ref_column +
                                "' column for section-reference enrichment");
        outcome.graph = std::move(graph);
        return outcome;
    }

    const auto available = AvailableColumns(data, options.columns);
    std::unordered_map<std::string, AttributeMap> lookup;
    for (const auto& row : data.rows) {
        const auto& ref = Cell(row, options.ref_column);
        if (IsNull(ref)) {
            continue;
        }
        lookup.emplace(ToKey(ref), PrefixedFields(row, available, options.prefix));
    }
    LogInfo(kComponent, "Built lookup with " + std::to_string(lookup.size()) + " " +
                            options.ref_column + " entries");

    for (auto& [key, edge] : graph.Edges()) {
        const auto* ref = FindNonNull(edge.attributes, options.ref_column);
        if (ref == nullptr) {
            continue;
        }
        auto it = lookup.find(ToKey(*ref));
        if (it == lookup.end()) {
            continue;
        }
        if (MergeNonNull(edge.attributes, it->second) > 0) {
            ++outcome.enriched_edges;
        }
    }

    LogInfo(kComponent, "Enriched " + std::to_string(outcome.enriched_edges) +
                            " edges by " + options.ref_column);
    outcome.graph = std::move(graph);
    return outcome;
}

} // namespace fairway_graph
