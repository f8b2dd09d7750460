#pragma once

#include <fairway_graph/core/log.hpp>
#include <fairway_graph/geo/projector.hpp>
#include <fairway_graph/schema/schema_harmonizer.hpp>
#include <fairway_graph/validate/graph_validator.hpp>

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace fairway_graph {

struct SourcesConfig {
    std::string primary_tag = "FIS";
    std::string secondary_tag = "EURIS";
    std::string border_tag = "BORDER";
};

struct StitchingConfig {
    std::string home_country = "NL";
    int epsg_code = SrsProjector::kDefaultEpsg;
    double distance_threshold = 100.0;
};

struct MergeConfig {
    std::set<std::string> excluded_node_ids;
    std::set<std::string> excluded_edge_ids;
    std::string edge_id_attribute = "Id";
};

struct ValidationConfig {
    std::size_t expected_border_connections = 14;
    std::vector<CriticalConnection> critical_connections;
};

struct LoggingConfig {
    LogLevel level = LogLevel::Info;
    bool json = false;
};

struct PipelineConfig {
    SourcesConfig sources;
    StitchingConfig stitching;
    MergeConfig merge;
    SchemaMapping schema;
    ValidationConfig validation;
    LoggingConfig logging;
};

} // namespace fairway_graph
