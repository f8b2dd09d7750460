#include <catch2/catch.hpp>

#include <fairway_graph/schema/schema_harmonizer.hpp>

#include <cstdint>
#include <string>

using namespace fairway_graph;

TEST_CASE("ApplySchemaMapping: renames mapped node and edge keys", "[schema]") {
    Graph graph;
    graph.AddNode("FIS_1").attributes = {{"Name", std::string("Lock")}, {"x", 4.0}};
    graph.AddEdge("FIS_1", "FIS_2", {{"GeneralDepth", 3.5}, {"Id", std::int64_t{7}}});

    SchemaMapping mapping;
    mapping.nodes = {{"Name", "name"}};
    mapping.edges = {{"GeneralDepth", "depth_m"}, {"Id", "section_id"}};

    auto outcome = ApplySchemaMapping(std::move(graph), mapping);

    CHECK(outcome.renamed_node_keys == 1);
    CHECK(outcome.renamed_edge_keys == 2);

    const auto* node = outcome.graph.FindNode("FIS_1");
    REQUIRE(node != nullptr);
    CHECK(node->attributes.count("Name") == 0);
    CHECK(ToKey(node->attributes.at("name")) == "Lock");
    CHECK(ToKey(node->attributes.at("x")) == "4");

    const auto* edge = outcome.graph.FindEdge("FIS_1", "FIS_2");
    REQUIRE(edge != nullptr);
    CHECK(ToKey(edge->attributes.at("depth_m")) == "3.5");
    CHECK(ToKey(edge->attributes.at("section_id")) == "7");
    CHECK(edge->attributes.count("GeneralDepth") == 0);
}

TEST_CASE("ApplySchemaMapping: mapped value overwrites an existing target", "[schema]") {
    Graph graph;
    graph.AddEdge("a", "b", {{"Width", 12.0}, {"width_m", 1.0}});

    SchemaMapping mapping;
    mapping.edges = {{"Width", "width_m"}};

    auto outcome = ApplySchemaMapping(std::move(graph), mapping);
    const auto& attrs = outcome.graph.FindEdge("a", "b")->attributes;
    CHECK(attrs.size() == 1);
    CHECK(ToKey(attrs.at("width_m")) == "12");
}

TEST_CASE("ApplySchemaMapping: chained entries do not cascade", "[schema]") {
    Graph graph;
    graph.AddNode("n").attributes = {{"a", std::string("A")}, {"b", std::string("B")}};

    SchemaMapping mapping;
    mapping.nodes = {{"a", "b"}, {"b", "c"}};

    auto outcome = ApplySchemaMapping(std::move(graph), mapping);
    const auto& attrs = outcome.graph.FindNode("n")->attributes;
    CHECK(attrs.count("a") == 0);
    CHECK(ToKey(attrs.at("b")) == "A");
    CHECK(ToKey(attrs.at("c")) == "B");
}

TEST_CASE("ApplySchemaMapping: empty mapping leaves the graph unchanged", "[schema]") {
    Graph graph;
    graph.AddEdge("a", "b", {{"Name", std::string("x")}});

    SchemaMapping mapping;
    CHECK(mapping.Empty());

    auto outcome = ApplySchemaMapping(std::move(graph), mapping);
    CHECK(outcome.renamed_edge_keys == 0);
    CHECK(outcome.graph.FindEdge("a", "b")->attributes.count("Name") == 1);
}
