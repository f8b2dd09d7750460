#include <fairway_graph/config/config_loader.hpp>

#include <fairway_graph/core/types.hpp>

#include <yaml-cpp/yaml.h>

#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <string>

namespace fairway_graph {

namespace {

Error MakeConfigError(const std::string& subject, const std::string& message) {
    return Error{"ConfigLoader", subject, message, ErrorCategory::Config};
}

std::set<std::string> ReadIdSet(const YAML::Node& node) {
    std::set<std::string> ids;
    for (const auto& id : node) {
        ids.insert(id.as<std::string>());
    }
    return ids;
}

std::map<std::string, std::string> ReadMapping(const YAML::Node& node) {
    std::map<std::string, std::string> mapping;
    for (const auto& entry : node) {
        mapping[entry.first.as<std::string>()] = entry.second.as<std::string>();
    }
    return mapping;
}

Result<CriticalConnection, Error> ParseCriticalConnection(const YAML::Node& node) {
    if (!node["name"]) {
        return Result<CriticalConnection, Error>::Err(MakeConfigError(
            "validation.critical_connections", "Entry missing 'name' field"));
    }
    if (!node["node_id"]) {
        return Result<CriticalConnection, Error>::Err(MakeConfigError(
            "validation.critical_connections", "Entry missing 'node_id' field"));
    }
    return Result<CriticalConnection, Error>::Ok(CriticalConnection{
        node["name"].as<std::string>(),
        node["node_id"].as<std::string>(),
    });
}

// yaml-cpp conversions throw; the caller turns that into an Error.
Result<PipelineConfig, Error> ParseRoot(const YAML::Node& root) {
    PipelineConfig config;

    // -- Sources --
    if (const auto sources = root["sources"]) {
        if (sources["primary"]) {
            config.sources.primary_tag = sources["primary"].as<std::string>();
        }
        if (sources["secondary"]) {
            config.sources.secondary_tag = sources["secondary"].as<std::string>();
        }
        if (sources["border"]) {
            config.sources.border_tag = sources["border"].as<std::string>();
        }
    }

    // -- Stitching --
    if (const auto stitching = root["stitching"]) {
        if (stitching["home_country"]) {
            config.stitching.home_country = stitching["home_country"].as<std::string>();
        }
        if (stitching["epsg"]) {
            config.stitching.epsg_code = stitching["epsg"].as<int>();
        }
        if (stitching["distance_threshold"]) {
            config.stitching.distance_threshold =
                stitching["distance_threshold"].as<double>();
        }
    }

    // -- Merge --
    if (const auto merge = root["merge"]) {
        if (merge["excluded_node_ids"]) {
            config.merge.excluded_node_ids = ReadIdSet(merge["excluded_node_ids"]);
        }
        if (merge["excluded_edge_ids"]) {
            config.merge.excluded_edge_ids = ReadIdSet(merge["excluded_edge_ids"]);
        }
        if (merge["edge_id_attribute"]) {
            config.merge.edge_id_attribute = merge["edge_id_attribute"].as<std::string>();
        }
    }

    // -- Schema --
    if (const auto schema = root["schema"]) {
        if (schema["nodes"]) {
            config.schema.nodes = ReadMapping(schema["nodes"]);
        }
        if (schema["edges"]) {
            config.schema.edges = ReadMapping(schema["edges"]);
        }
    }

    // -- Validation --
    if (const auto validation = root["validation"]) {
        if (validation["expected_border_connections"]) {
            const int expected = validation["expected_border_connections"].as<int>();
            if (expected < 0) {
                return Result<PipelineConfig, Error>::Err(
                    MakeConfigError("validation.expected_border_connections",
                                    "Must not be negative"));
            }
            config.validation.expected_border_connections =
                static_cast<std::size_t>(expected);
        }
        if (validation["critical_connections"]) {
            for (const auto& entry : validation["critical_connections"]) {
                auto critical = ParseCriticalConnection(entry);
                if (critical.IsErr()) {
                    return Result<PipelineConfig, Error>::Err(std::move(critical).Error());
                }
                config.validation.critical_connections.push_back(
                    std::move(critical).Value());
            }
        }
    }

    // -- Logging --
    if (const auto logging = root["logging"]) {
        if (logging["level"]) {
            const auto level = logging["level"].as<std::string>();
            if (!ParseLogLevel(level, config.logging.level)) {
                return Result<PipelineConfig, Error>::Err(
                    MakeConfigError("logging.level", "Unknown log level '" + level + "'"));
            }
        }
        if (logging["json"]) {
            config.logging.json = logging["json"].as<bool>();
        }
    }

    return Result<PipelineConfig, Error>::Ok(std::move(config));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<PipelineConfig, Error> LoadFromYaml(std::string_view file_path) {
    try {
        return ParseRoot(YAML::LoadFile(std::string(file_path)));
    } catch (const YAML::Exception& e) {
        return Result<PipelineConfig, Error>::Err(MakeConfigError(
            std::string(file_path), "Failed to parse YAML file: " + std::string(e.what())));
    }
}

Result<PipelineConfig, Error> LoadFromYamlString(std::string_view yaml) {
    try {
        return ParseRoot(YAML::Load(std::string(yaml)));
    } catch (const YAML::Exception& e) {
        return Result<PipelineConfig, Error>::Err(
            MakeConfigError("", "Failed to parse YAML: " + std::string(e.what())));
    }
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const PipelineConfig& config) {
    const std::pair<const std::string*, const char*> tags[] = {
        {&config.sources.primary_tag, "sources.primary"},
        {&config.sources.secondary_tag, "sources.secondary"},
        {&config.sources.border_tag, "sources.border"},
    };
    std::set<std::string> seen;
    for (const auto& [tag, key] : tags) {
        auto parsed = SourceTag::Create(*tag);
        if (parsed.IsErr()) {
            return Result<void, Error>::Err(MakeConfigError(key, parsed.Error()));
        }
        if (!seen.insert(*tag).second) {
            return Result<void, Error>::Err(
                MakeConfigError(key, "Source tag '" + *tag + "' is used twice"));
        }
    }

    auto country = CountryCode::Create(config.stitching.home_country);
    if (country.IsErr()) {
        return Result<void, Error>::Err(
            MakeConfigError("stitching.home_country", country.Error()));
    }
    if (config.stitching.epsg_code <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "stitching.epsg", "EPSG code must be positive, got " +
                                  std::to_string(config.stitching.epsg_code)));
    }
    if (!(config.stitching.distance_threshold > 0.0)) {
        return Result<void, Error>::Err(MakeConfigError(
            "stitching.distance_threshold", "Distance threshold must be positive"));
    }
    if (config.merge.edge_id_attribute.empty()) {
        return Result<void, Error>::Err(MakeConfigError(
            "merge.edge_id_attribute", "Edge id attribute must not be empty"));
    }
    for (const auto& critical : config.validation.critical_connections) {
        if (critical.node_id.empty()) {
            return Result<void, Error>::Err(MakeConfigError(
                "validation.critical_connections",
                "Critical connection '" + critical.name + "' has an empty node_id"));
        }
    }

    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// ApplyLoggingConfig
// ---------------------------------------------------------------------------
void ApplyLoggingConfig(const LoggingConfig& logging) {
    if (logging.json) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), logging.level);
    } else {
        InitGlobalLogger(std::make_unique<ConsoleSink>(), logging.level);
    }
}

} // namespace fairway_graph
