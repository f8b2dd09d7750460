#pragma once

#include <fairway_graph/config/pipeline_config.hpp>
#include <fairway_graph/core/result.hpp>

#include <string_view>

namespace fairway_graph {

// Parse a YAML config file into a PipelineConfig. Absent keys keep defaults.
Result<PipelineConfig, Error> LoadFromYaml(std::string_view file_path);

// Same, from YAML text already in memory.
Result<PipelineConfig, Error> LoadFromYamlString(std::string_view yaml);

// Validate that values are sane: distinct valid source tags, a two-letter
// home country, a positive EPSG code and a positive distance threshold.
Result<void, Error> ValidateConfig(const PipelineConfig& config);

// Install the global logger described by `logging`: JSON lines or plain
// timestamped lines on stderr, at the configured level.
void ApplyLoggingConfig(const LoggingConfig& logging);

} // namespace fairway_graph
