#pragma once

#include <fairway_graph/build/multi_file_graph_builder.hpp>
#include <fairway_graph/build/section_graph_builder.hpp>
#include <fairway_graph/config/pipeline_config.hpp>
#include <fairway_graph/core/result.hpp>
#include <fairway_graph/enrich/attribute_enricher.hpp>
#include <fairway_graph/geo/projector.hpp>
#include <fairway_graph/graph/graph.hpp>
#include <fairway_graph/integrate/border_stitcher.hpp>
#include <fairway_graph/table/table.hpp>
#include <fairway_graph/validate/graph_validator.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fairway_graph {

// ---------------------------------------------------------------------------
// StepOutcome — outcome for each stage of the pipeline.
// ---------------------------------------------------------------------------
enum class StepOutcome {
    Completed,
    Skipped,
    Failed,
};

// ---------------------------------------------------------------------------
// StepResult — outcome + timing for a single pipeline stage.
// ---------------------------------------------------------------------------
struct StepResult {
    std::string step_name;
    StepOutcome outcome = StepOutcome::Failed;
    std::string message;
    std::chrono::milliseconds duration{0};
};

// Tables already loaded by the caller.
struct WorkflowInputs {
    Table primary_sections;
    Table primary_junctions;
    // Section enrichment is skipped when absent. Its `sections` default to
    // `primary_sections`.
    std::optional<EnrichmentDatasets> primary_enrichment;

    std::vector<Table> secondary_node_tables;
    std::vector<Table> secondary_section_tables;
    // Sailing speed keyed by sectionref; skipped when absent.
    std::optional<Table> secondary_sailing_speed;
};

struct IntegrationResult {
    Graph primary;
    Graph secondary;
    std::vector<BorderConnection> connections;
    Graph merged;
    ValidationReport report;
    std::vector<StepResult> steps;
    std::chrono::milliseconds total_duration{0};
};

// ---------------------------------------------------------------------------
// IntegrationWorkflow — build primary -> build secondary -> enrich ->
//                       stitch -> merge -> harmonize -> validate.
//
// The config reference must outlive this object. A projector may be
// injected; otherwise one is created from the configured EPSG code.
// ---------------------------------------------------------------------------
class IntegrationWorkflow {
public:
    explicit IntegrationWorkflow(const PipelineConfig& config,
                                 std::shared_ptr<const IGeometryProjector> projector = nullptr);

    // Non-copyable, non-movable.
    IntegrationWorkflow(const IntegrationWorkflow&) = delete;
    IntegrationWorkflow& operator=(const IntegrationWorkflow&) = delete;
    IntegrationWorkflow(IntegrationWorkflow&&) = delete;
    IntegrationWorkflow& operator=(IntegrationWorkflow&&) = delete;

    // Fails on an invalid config before any step runs, then with the first
    // build, enrichment or merge error. The steps run so far are logged.
    [[nodiscard]] Result<IntegrationResult, Error> Run(const WorkflowInputs& inputs);

private:
    const PipelineConfig& config_;
    std::shared_ptr<const IGeometryProjector> projector_;

    Result<std::shared_ptr<const IGeometryProjector>, Error> ResolveProjector() const;
};

} // namespace fairway_graph
