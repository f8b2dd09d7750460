#include <fairway_graph/workflow/integration_workflow.hpp>

#include <fairway_graph/config/config_loader.hpp>
#include <fairway_graph/core/log.hpp>
#include <fairway_graph/integrate/graph_merger.hpp>
#include <fairway_graph/schema/schema_harmonizer.hpp>

#include <chrono>
#include <sstream>
#include <string>

namespace fairway_graph {

namespace {

constexpr const char* kComponent = "IntegrationWorkflow";

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds Elapsed(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

std::string GraphSummary(const Graph& graph) {
    std::ostringstream oss;
    oss << graph.NodeCount() << " nodes, " << graph.EdgeCount() << " edges";
    return oss.str();
}

void Record(IntegrationResult& result, StepResult step) {
    if (step.outcome == StepOutcome::Failed) {
        LogError(kComponent, step.step_name + " failed: " + step.message);
    } else {
        LogInfo(kComponent, step.step_name + ": " + step.message);
    }
    result.steps.push_back(std::move(step));
}

} // anonymous namespace

IntegrationWorkflow::IntegrationWorkflow(const PipelineConfig& config,
                                         std::shared_ptr<const IGeometryProjector> projector)
    : config_(config), projector_(std::move(projector)) {}

Result<std::shared_ptr<const IGeometryProjector>, Error>
IntegrationWorkflow::ResolveProjector() const {
    if (projector_) {
        return Result<std::shared_ptr<const IGeometryProjector>, Error>::Ok(projector_);
    }
    auto created = SrsProjector::Create(config_.stitching.epsg_code);
    if (created.IsErr()) {
        return Result<std::shared_ptr<const IGeometryProjector>, Error>::Err(
            std::move(created).Error());
    }
    return Result<std::shared_ptr<const IGeometryProjector>, Error>::Ok(
        std::move(created).Value());
}

Result<IntegrationResult, Error> IntegrationWorkflow::Run(const WorkflowInputs& inputs) {
    auto total_start = Clock::now();
    IntegrationResult result;

    auto fail = [&](const char* step_name, Clock::time_point start, Error error) {
        Record(result, StepResult{step_name, StepOutcome::Failed, error.ToString(),
                                  Elapsed(start)});
        return Result<IntegrationResult, Error>::Err(std::move(error));
    };

    auto valid = ValidateConfig(config_);
    if (valid.IsErr()) {
        return fail("configure", Clock::now(), std::move(valid).Error());
    }

    auto projector = ResolveProjector();
    if (projector.IsErr()) {
        return fail("stitch", Clock::now(), std::move(projector).Error());
    }

    // Step 1: Primary graph.
    auto start = Clock::now();
    auto primary = BuildSectionGraph(inputs.primary_sections, inputs.primary_junctions);
    if (primary.IsErr()) {
        return fail("build_primary", start, std::move(primary).Error());
    }
    SectionGraph primary_graph = std::move(primary).Value();
    Record(result, StepResult{"build_primary", StepOutcome::Completed,
                              GraphSummary(primary_graph.graph), Elapsed(start)});

    // Step 2: Secondary graph.
    start = Clock::now();
    auto secondary = BuildMultiFileGraphFromRegions(inputs.secondary_node_tables,
                                                    inputs.secondary_section_tables);
    if (secondary.IsErr()) {
        return fail("build_secondary", start, std::move(secondary).Error());
    }
    result.secondary = std::move(secondary).Value().graph;
    Record(result, StepResult{"build_secondary", StepOutcome::Completed,
                              GraphSummary(result.secondary), Elapsed(start)});

    // Step 3: Primary enrichment.
    start = Clock::now();
    if (!inputs.primary_enrichment.has_value()) {
        result.primary = std::move(primary_graph.graph);
        Record(result, StepResult{"enrich_primary", StepOutcome::Skipped,
                                  "No enrichment datasets", Elapsed(start)});
    } else {
        EnrichmentDatasets datasets = *inputs.primary_enrichment;
        if (!datasets.sections.has_value()) {
            datasets.sections = inputs.primary_sections;
        }
        auto enrichment = BuildSectionEnrichment(datasets);
        if (enrichment.IsErr()) {
            return fail("enrich_primary", start, std::move(enrichment).Error());
        }
        auto applied = ApplySectionEnrichment(std::move(primary_graph.graph),
                                              primary_graph.sections, enrichment.Value());
        if (applied.IsErr()) {
            return fail("enrich_primary", start, std::move(applied).Error());
        }
        auto outcome = std::move(applied).Value();
        result.primary = std::move(outcome.graph);
        Record(result, StepResult{"enrich_primary", StepOutcome::Completed,
                                  "Enriched " + std::to_string(outcome.enriched_edges) +
                                      " edges",
                                  Elapsed(start)});
    }

    // Step 4: Secondary enrichment.
    start = Clock::now();
    if (!inputs.secondary_sailing_speed.has_value()) {
        Record(result, StepResult{"enrich_secondary", StepOutcome::Skipped,
                                  "No sailing speed data", Elapsed(start)});
    } else {
        auto outcome = EnrichBySectionRef(std::move(result.secondary),
                                          *inputs.secondary_sailing_speed,
                                          SailingSpeedEnrichment());
        result.secondary = std::move(outcome.graph);
        Record(result, StepResult{"enrich_secondary", StepOutcome::Completed,
                                  "Enriched " + std::to_string(outcome.enriched_edges) +
                                      " edges",
                                  Elapsed(start)});
    }

    // Step 5: Border stitching.
    start = Clock::now();
    StitchOptions stitch;
    stitch.home_country = config_.stitching.home_country;
    stitch.distance_threshold = config_.stitching.distance_threshold;
    result.connections = FindBorderConnections(result.primary, result.secondary,
                                               *projector.Value(), stitch);
    Record(result, StepResult{"stitch", StepOutcome::Completed,
                              std::to_string(result.connections.size()) +
                                  " border connections",
                              Elapsed(start)});

    // Step 6: Merge.
    start = Clock::now();
    MergeOptions merge;
    merge.primary_tag = config_.sources.primary_tag;
    merge.secondary_tag = config_.sources.secondary_tag;
    merge.border_tag = config_.sources.border_tag;
    merge.home_country = config_.stitching.home_country;
    merge.excluded_node_ids = config_.merge.excluded_node_ids;
    merge.excluded_edge_ids = config_.merge.excluded_edge_ids;
    merge.edge_id_attribute = config_.merge.edge_id_attribute;
    auto merged = MergeGraphs(result.primary, result.secondary, result.connections, merge);
    if (merged.IsErr()) {
        return fail("merge", start, std::move(merged).Error());
    }
    result.merged = std::move(merged).Value().graph;
    Record(result, StepResult{"merge", StepOutcome::Completed,
                              GraphSummary(result.merged), Elapsed(start)});

    // Step 7: Schema harmonization.
    start = Clock::now();
    if (config_.schema.Empty()) {
        Record(result, StepResult{"harmonize", StepOutcome::Skipped,
                                  "No schema mapping configured", Elapsed(start)});
    } else {
        auto harmonized = ApplySchemaMapping(std::move(result.merged), config_.schema);
        result.merged = std::move(harmonized.graph);
        Record(result, StepResult{"harmonize", StepOutcome::Completed,
                                  "Renamed " +
                                      std::to_string(harmonized.renamed_node_keys +
                                                     harmonized.renamed_edge_keys) +
                                      " attributes",
                                  Elapsed(start)});
    }

    // Step 8: Validation.
    start = Clock::now();
    ValidationOptions validation;
    validation.border_tag = config_.sources.border_tag;
    validation.expected_border_connections =
        config_.validation.expected_border_connections;
    validation.critical_connections = config_.validation.critical_connections;
    validation.schema = config_.schema;
    result.report = GraphValidator(result.merged, std::move(validation)).Run();
    Record(result, StepResult{"validate", StepOutcome::Completed,
                              "Border integrity " +
                                  std::string(CheckStatusName(result.report.border_integrity.status)),
                              Elapsed(start)});

    result.total_duration = Elapsed(total_start);
    return Result<IntegrationResult, Error>::Ok(std::move(result));
}

} // namespace fairway_graph
