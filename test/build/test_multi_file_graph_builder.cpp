#include <catch2/catch.hpp>

#include <fairway_graph/build/multi_file_graph_builder.hpp>

#include "../mocks/capture_log_sink.hpp"

#include <string>

using namespace fairway_graph;

namespace {

Row NodeRow(const std::string& locode, const std::string& objectcode,
            const std::string& sectionref, double lon, double lat,
            const std::string& borderpoint = "") {
    Row row;
    row.values["locode"] = locode;
    row.values["objectcode"] = objectcode;
    row.values["sectionref"] = sectionref;
    if (!borderpoint.empty()) {
        row.values["borderpoint"] = borderpoint;
    }
    row.geometry = MakePoint(lon, lat);
    return row;
}

Row SectionRow(const std::string& code, double lon0, double lon1) {
    Row row;
    row.values["code"] = code;
    row.values["name"] = "Section " + code;
    row.geometry = MakeLineString({{lon0, 52.0}, {lon1, 52.0}});
    return row;
}

Table MakeTable(const std::string& name, std::vector<Row> rows) {
    Table t;
    t.name = name;
    for (auto& row : rows) {
        t.AddRow(std::move(row));
    }
    return t;
}

std::vector<Table> DutchAndGermanNodes() {
    return {
        MakeTable("Node_NL_1", {
            NodeRow("NLAAA00001", "1", "S1", 4.0, 52.0),
            NodeRow("NLAAA00002", "2", "S1", 4.1, 52.0),
            NodeRow("NLAAA00002", "2", "S2", 4.1, 52.0),
            NodeRow("NLAAA00003", "3", "S2", 6.0, 52.0, "DEBBB00001"),
        }),
        MakeTable("Node_DE_1", {
            NodeRow("DEBBB00001", "1", "S3", 6.0005, 52.0),
            NodeRow("DEBBB00002", "2", "S3", 6.1, 52.0),
            NodeRow("DEBBB00002", "2", "S3", 6.1, 52.0),
            NodeRow("DEBBB00003", "3", "S4", 6.2, 52.0),
        }),
    };
}

std::vector<Table> DutchAndGermanSections() {
    return {
        MakeTable("Section_NL_1", {
            SectionRow("S1", 4.0, 4.1),
            SectionRow("S2", 4.1, 6.0),
            SectionRow("S9", 5.0, 5.1),
        }),
        MakeTable("Section_DE_1", {
            SectionRow("S3", 6.0005, 6.1),
            SectionRow("S4", 6.2, 6.3),
        }),
    };
}

} // anonymous namespace

TEST_CASE("ConcatNodeTables: composite ids and derived country codes", "[build][multi]") {
    auto r = ConcatNodeTables(DutchAndGermanNodes());
    REQUIRE(r.IsOk());
    const auto& nodes = r.Value();
    CHECK(nodes.duplicates_removed == 1);
    REQUIRE(nodes.table.Size() == 7);

    const auto& first = nodes.table.rows.front();
    CHECK(ToKey(Cell(first, "node_id")) == "NL_1");
    CHECK(ToKey(Cell(first, "countrycode")) == "NL");
    CHECK(ToKey(Cell(first, "countrycode_locode")) == "NL");
    CHECK(ToKey(Cell(first, "countrycode_path")) == "NL");
    CHECK(ToKey(Cell(nodes.table.rows.back(), "node_id")) == "DE_3");
}

TEST_CASE("ConcatNodeTables: rows without a usable location code are skipped",
          "[build][multi]") {
    auto tables = std::vector<Table>{MakeTable("Node_NL_1", {
        NodeRow("NLAAA00001", "1", "S1", 4.0, 52.0),
        NodeRow("N", "2", "S1", 4.1, 52.0),
    })};
    auto r = ConcatNodeTables(tables);
    REQUIRE(r.IsOk());
    CHECK(r.Value().skipped_without_locode == 1);
    CHECK(r.Value().table.Size() == 1);
}

TEST_CASE("ConcatNodeTables: empty input and missing columns", "[build][multi]") {
    SECTION("no tables") {
        auto r = ConcatNodeTables({});
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::MissingInput);
    }
    SECTION("no objectcode column") {
        Row row;
        row.values["locode"] = std::string("NLAAA00001");
        auto r = ConcatNodeTables({MakeTable("Node_NL_1", {row})});
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::MissingColumn);
        CHECK(r.Error().subject == "nodes.objectcode");
    }
}

TEST_CASE("ConcatSectionTables: empty input is an error", "[build][multi]") {
    auto r = ConcatSectionTables({});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::MissingInput);
}

TEST_CASE("BuildMultiFileGraphFromRegions: sections, border link and lengths",
          "[build][multi]") {
    testing::ScopedCaptureLogger capture;
    auto r = BuildMultiFileGraphFromRegions(DutchAndGermanNodes(), DutchAndGermanSections());
    REQUIRE(r.IsOk());
    const auto& built = r.Value();
    const auto& g = built.graph;

    CHECK(g.NodeCount() == 5);
    CHECK(g.EdgeCount() == 4);
    CHECK(g.HasEdge("NL_1", "NL_2"));
    CHECK(g.HasEdge("NL_2", "NL_3"));
    CHECK(g.HasEdge("DE_1", "DE_2"));
    CHECK_FALSE(g.HasNode("DE_3"));

    SECTION("border link joins the two countries") {
        CHECK(built.border_links == 1);
        const auto* border = g.FindEdge("NL_3", "DE_1");
        REQUIRE(border != nullptr);
        CHECK(border->IsBorder());
        CHECK(ToKey(border->attributes.at("borderpoint")) == "DEBBB00001");
        CHECK(border->LengthM().has_value());
        CHECK(built.components == 1);
    }

    SECTION("section edges carry their row and a length") {
        const auto* edge = g.FindEdge("NL_1", "NL_2");
        REQUIRE(edge != nullptr);
        CHECK_FALSE(edge->IsBorder());
        CHECK(ToKey(edge->attributes.at("sectionref")) == "S1");
        CHECK(ToKey(edge->attributes.at("name")) == "Section S1");
        REQUIRE(edge->LengthM().has_value());
        CHECK(*edge->LengthM() > 6000.0);
        CHECK(built.lengths_skipped == 0);
    }

    SECTION("nodes carry location and country") {
        const auto* node = g.FindNode("DE_2");
        REQUIRE(node != nullptr);
        CHECK(node->CountryCode() == "DE");
        CHECK(node->location.has_value());
        CHECK(node->Component() == std::optional<std::int64_t>(0));
    }

    SECTION("reference anomalies are counted and reported") {
        CHECK(built.reference_stats.sections_without_nodes == 1);
        CHECK(built.reference_stats.sections_with_single_node == 1);
        CHECK(built.reference_stats.sections_with_extra_nodes == 0);
        CHECK(capture.Sink().Contains(LogLevel::Warn, "not exactly two nodes"));
    }
}

TEST_CASE("BuildMultiFileGraph: more than two referencing nodes uses first and last",
          "[build][multi]") {
    auto nodes = ConcatNodeTables({MakeTable("Node_NL_1", {
        NodeRow("NLAAA00001", "1", "S1", 4.0, 52.0),
        NodeRow("NLAAA00002", "2", "S1", 4.1, 52.0),
        NodeRow("NLAAA00003", "3", "S1", 4.2, 52.0),
    })});
    auto sections = ConcatSectionTables({MakeTable("Section_NL_1", {
        SectionRow("S1", 4.0, 4.2),
    })});
    REQUIRE(nodes.IsOk());
    REQUIRE(sections.IsOk());

    auto r = BuildMultiFileGraph(nodes.Value(), sections.Value());
    REQUIRE(r.IsOk());
    CHECK(r.Value().reference_stats.sections_with_extra_nodes == 1);
    CHECK(r.Value().graph.HasEdge("NL_1", "NL_3"));
    CHECK(r.Value().graph.EdgeCount() == 1);
}

TEST_CASE("BuildMultiFileGraph: component index independent of table order",
          "[build][multi]") {
    auto nodes = DutchAndGermanNodes();
    // Drop the border link so the two countries stay separate components.
    nodes[0].rows.back().values.erase("borderpoint");
    auto sections = DutchAndGermanSections();

    auto forward = BuildMultiFileGraphFromRegions(nodes, sections);
    auto reversed = BuildMultiFileGraphFromRegions({nodes[1], nodes[0]},
                                                   {sections[1], sections[0]});
    REQUIRE(forward.IsOk());
    REQUIRE(reversed.IsOk());
    CHECK(forward.Value().components == 2);
    CHECK(reversed.Value().components == 2);

    for (const auto& [id, node] : forward.Value().graph.Nodes()) {
        const auto* other = reversed.Value().graph.FindNode(id);
        REQUIRE(other != nullptr);
        CHECK(node.Component() == other->Component());
    }
    // "DE_..." sorts before "NL_...".
    CHECK(forward.Value().graph.FindNode("DE_1")->Component() ==
          std::optional<std::int64_t>(0));
}
