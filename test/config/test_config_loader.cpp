#include <catch2/catch.hpp>

#include <fairway_graph/config/config_loader.hpp>

#include <string>

using namespace fairway_graph;

// Tests run from the build directory; derive the testdata path from this
// source file instead.
namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.sources.primary_tag == "FIS");
    CHECK(config.sources.secondary_tag == "EURIS");
    CHECK(config.sources.border_tag == "BORDER");

    CHECK(config.stitching.home_country == "NL");
    CHECK(config.stitching.epsg_code == 32631);
    CHECK(config.stitching.distance_threshold == 150.5);

    CHECK(config.merge.excluded_node_ids == std::set<std::string>{"8863", "22638"});
    CHECK(config.merge.excluded_edge_ids == std::set<std::string>{"41"});
    CHECK(config.merge.edge_id_attribute == "Id");

    CHECK(config.schema.nodes.at("Name") == "name");
    CHECK(config.schema.edges.size() == 3);
    CHECK(config.schema.edges.at("MaxDepth") == "depth_m");

    CHECK(config.validation.expected_border_connections == 12);
    REQUIRE(config.validation.critical_connections.size() == 2);
    CHECK(config.validation.critical_connections[0].name == "Lobith / Emmerich");
    CHECK(config.validation.critical_connections[0].node_id == "EURIS_DE_12345");
    CHECK(config.validation.critical_connections[1].node_id == "EURIS_BE_20001");

    CHECK(config.logging.level == LogLevel::Debug);
    CHECK(config.logging.json);

    CHECK(ValidateConfig(config).IsOk());
}

TEST_CASE("LoadFromYaml: absent keys keep defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.stitching.distance_threshold == 50.0);
    CHECK(config.stitching.epsg_code == SrsProjector::kDefaultEpsg);
    CHECK(config.stitching.home_country == "NL");
    CHECK(config.sources.primary_tag == "FIS");
    CHECK(config.validation.expected_border_connections == 14);
    CHECK(config.schema.Empty());
    CHECK(config.logging.level == LogLevel::Info);
    CHECK_FALSE(config.logging.json);
}

TEST_CASE("LoadFromYaml: nonexistent file", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("does_not_exist.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().message.find("Failed to parse YAML file") != std::string::npos);
}

TEST_CASE("LoadFromYaml: malformed YAML", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("malformed_config.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromYaml: critical connection without node_id", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("invalid_critical_config.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().subject == "validation.critical_connections");
    CHECK(result.Error().message.find("node_id") != std::string::npos);
}

// ===========================================================================
// LoadFromYamlString
// ===========================================================================

TEST_CASE("LoadFromYamlString: unknown log level", "[config][yaml]") {
    auto result = LoadFromYamlString("logging:\n  level: chatty\n");
    REQUIRE(result.IsErr());
    CHECK(result.Error().subject == "logging.level");
}

TEST_CASE("LoadFromYamlString: negative border expectation", "[config][yaml]") {
    auto result = LoadFromYamlString("validation:\n  expected_border_connections: -1\n");
    REQUIRE(result.IsErr());
    CHECK(result.Error().subject == "validation.expected_border_connections");
}

TEST_CASE("LoadFromYamlString: wrong value type", "[config][yaml]") {
    auto result = LoadFromYamlString("stitching:\n  epsg: utm\n");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromYamlString: empty document gives defaults", "[config][yaml]") {
    auto result = LoadFromYamlString("");
    REQUIRE(result.IsOk());
    CHECK(result.Value().sources.secondary_tag == "EURIS");
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: defaults are valid", "[config][validate]") {
    CHECK(ValidateConfig(PipelineConfig{}).IsOk());
}

TEST_CASE("ValidateConfig: rejects bad values", "[config][validate]") {
    PipelineConfig config;

    SECTION("invalid source tag") {
        config.sources.primary_tag = "fis";
        auto r = ValidateConfig(config);
        REQUIRE(r.IsErr());
        CHECK(r.Error().subject == "sources.primary");
    }
    SECTION("tag containing the id separator") {
        config.sources.primary_tag = "FIS_NL";
        config.sources.secondary_tag = "FIS_NL_NL";
        auto r = ValidateConfig(config);
        REQUIRE(r.IsErr());
        CHECK(r.Error().subject == "sources.primary");
    }
    SECTION("duplicate source tags") {
        config.sources.border_tag = "FIS";
        auto r = ValidateConfig(config);
        REQUIRE(r.IsErr());
        CHECK(r.Error().subject == "sources.border");
        CHECK(r.Error().message.find("twice") != std::string::npos);
    }
    SECTION("home country") {
        config.stitching.home_country = "NLD";
        auto r = ValidateConfig(config);
        REQUIRE(r.IsErr());
        CHECK(r.Error().subject == "stitching.home_country");
    }
    SECTION("EPSG code") {
        config.stitching.epsg_code = 0;
        auto r = ValidateConfig(config);
        REQUIRE(r.IsErr());
        CHECK(r.Error().subject == "stitching.epsg");
    }
    SECTION("distance threshold") {
        config.stitching.distance_threshold = 0.0;
        auto r = ValidateConfig(config);
        REQUIRE(r.IsErr());
        CHECK(r.Error().subject == "stitching.distance_threshold");
    }
    SECTION("edge id attribute") {
        config.merge.edge_id_attribute.clear();
        auto r = ValidateConfig(config);
        REQUIRE(r.IsErr());
        CHECK(r.Error().subject == "merge.edge_id_attribute");
    }
    SECTION("critical connection node id") {
        config.validation.critical_connections.push_back({"Empty", ""});
        auto r = ValidateConfig(config);
        REQUIRE(r.IsErr());
        CHECK(r.Error().subject == "validation.critical_connections");
    }
}
