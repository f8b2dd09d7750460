#include <catch2/catch.hpp>

#include <fairway_graph/build/section_graph_builder.hpp>

#include "../mocks/capture_log_sink.hpp"

#include <cstdint>
#include <string>

using namespace fairway_graph;

namespace {

Table MakeSections(std::vector<Row> rows) {
    Table t;
    t.name = "section";
    t.columns = {"Id", "StartJunctionId", "EndJunctionId", "Name"};
    for (auto& row : rows) {
        t.AddRow(std::move(row));
    }
    return t;
}

Table MakeJunctions(std::vector<Row> rows) {
    Table t;
    t.name = "sectionjunction";
    t.columns = {"Id", "Name"};
    for (auto& row : rows) {
        t.AddRow(std::move(row));
    }
    return t;
}

Row Section(std::int64_t id, AttributeValue start, AttributeValue end,
            Geometry geometry = {}) {
    return Row{{{"Id", id},
                {"StartJunctionId", std::move(start)},
                {"EndJunctionId", std::move(end)},
                {"Name", std::string("Section ") + std::to_string(id)}},
               std::move(geometry)};
}

Row Junction(AttributeValue id, double lon, double lat) {
    return Row{{{"Id", std::move(id)}, {"Name", std::string("J")}},
               Geometry{MakePoint(lon, lat)}};
}

} // anonymous namespace

TEST_CASE("BuildSectionGraph: two junctions and one section", "[build][section]") {
    testing::ScopedCaptureLogger capture;
    auto line = MakeLineString({{4.0, 52.0}, {4.01, 52.0}});
    auto sections = MakeSections({Section(10, std::int64_t{1}, std::int64_t{2}, Geometry{line})});
    auto junctions = MakeJunctions({Junction(std::int64_t{1}, 4.0, 52.0),
                                    Junction(std::int64_t{2}, 4.01, 52.0)});

    auto r = BuildSectionGraph(sections, junctions);
    REQUIRE(r.IsOk());
    const auto& g = r.Value().graph;
    CHECK(g.NodeCount() == 2);
    CHECK(g.EdgeCount() == 1);

    const auto* edge = g.FindEdge("1", "2");
    REQUIRE(edge != nullptr);
    auto expected = GeodesicLength(line);
    REQUIRE(expected.IsOk());
    REQUIRE(edge->LengthM().has_value());
    CHECK(*edge->LengthM() == Catch::Detail::Approx(expected.Value()).epsilon(1e-9));
    CHECK(ToKey(edge->attributes.at("Id")) == "10");
    CHECK(edge->attributes.count("StartJunctionId") == 0);

    const auto* node = g.FindNode("2");
    REQUIRE(node != nullptr);
    REQUIRE(node->location.has_value());
    CHECK(Lon(*node->location) == 4.01);
    CHECK(ToKey(node->attributes.at("x")) == "4.01");
    CHECK(capture.Sink().Contains(LogLevel::Info, "Graph built: 2 nodes, 1 edges"));
}

TEST_CASE("BuildSectionGraph: float and integer ids name the same node", "[build][section]") {
    auto sections = MakeSections({
        Section(1, 1001.0, std::int64_t{1002}),
        Section(2, std::int64_t{1002}, 1003.0),
    });
    auto junctions = MakeJunctions({Junction(1001.0, 4.0, 52.0),
                                    Junction(std::int64_t{1002}, 4.1, 52.0),
                                    Junction(std::int64_t{1003}, 4.2, 52.0)});

    auto r = BuildSectionGraph(sections, junctions);
    REQUIRE(r.IsOk());
    const auto& g = r.Value().graph;
    CHECK(g.NodeCount() == 3);
    CHECK(g.HasEdge("1001", "1002"));
    CHECK(g.HasEdge("1002", "1003"));
    REQUIRE(g.FindNode("1001") != nullptr);
    CHECK(g.FindNode("1001")->location.has_value());
}

TEST_CASE("BuildSectionGraph: drops sections without both junction ids", "[build][section]") {
    auto sections = MakeSections({
        Section(1, std::int64_t{1}, std::int64_t{2}),
        Section(2, std::int64_t{2}, AttributeValue{}),
        Section(3, AttributeValue{}, std::int64_t{3}),
    });
    auto junctions = MakeJunctions({Junction(std::int64_t{1}, 4.0, 52.0),
                                    Junction(std::int64_t{2}, 4.1, 52.0),
                                    Junction(std::int64_t{3}, 4.2, 52.0)});

    auto r = BuildSectionGraph(sections, junctions);
    REQUIRE(r.IsOk());
    CHECK(r.Value().sections_removed == 2);
    CHECK(r.Value().sections.Size() == 1);
    // Junction 3 is referenced only by a dropped section.
    CHECK(r.Value().junctions_removed == 1);
    CHECK(r.Value().graph.NodeCount() == 2);
    CHECK_FALSE(r.Value().graph.HasNode("3"));
}

TEST_CASE("BuildSectionGraph: missing junction column is an error", "[build][section]") {
    Table sections;
    sections.name = "section";
    sections.AddRow(Row{{{"Id", std::int64_t{1}}, {"StartJunctionId", std::int64_t{1}}}, {}});

    auto r = BuildSectionGraph(sections, MakeJunctions({}));
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::MissingColumn);
    CHECK(r.Error().subject == "section.EndJunctionId");
}

TEST_CASE("BuildSectionGraph: empty input gives an empty graph", "[build][section]") {
    auto r = BuildSectionGraph(MakeSections({}), MakeJunctions({}));
    REQUIRE(r.IsOk());
    CHECK(r.Value().graph.NodeCount() == 0);
    CHECK(r.Value().graph.EdgeCount() == 0);
}

TEST_CASE("BuildSectionGraph: rebuilding from its own filtered tables is stable",
          "[build][section]") {
    auto sections = MakeSections({
        Section(1, std::int64_t{1}, std::int64_t{2},
                Geometry{MakeLineString({{4.0, 52.0}, {4.1, 52.0}})}),
        Section(2, std::int64_t{2}, std::int64_t{3}),
        Section(3, std::int64_t{3}, AttributeValue{}),
    });
    auto junctions = MakeJunctions({Junction(std::int64_t{1}, 4.0, 52.0),
                                    Junction(std::int64_t{2}, 4.1, 52.0),
                                    Junction(std::int64_t{3}, 4.2, 52.0),
                                    Junction(std::int64_t{9}, 5.0, 52.0)});

    auto first = BuildSectionGraph(sections, junctions);
    REQUIRE(first.IsOk());
    CHECK(first.Value().sections_removed == 1);
    CHECK(first.Value().junctions_removed == 1);

    auto second = BuildSectionGraph(first.Value().sections, first.Value().junctions);
    REQUIRE(second.IsOk());
    CHECK(second.Value().sections_removed == 0);
    CHECK(second.Value().junctions_removed == 0);
    CHECK(second.Value().sections.Size() == first.Value().sections.Size());
    CHECK(second.Value().junctions.Size() == first.Value().junctions.Size());
    CHECK(second.Value().graph.NodeCount() == first.Value().graph.NodeCount());
    CHECK(second.Value().graph.EdgeCount() == first.Value().graph.EdgeCount());
    CHECK(second.Value().graph.FindEdge("1", "2")->attributes ==
          first.Value().graph.FindEdge("1", "2")->attributes);
}

TEST_CASE("BuildSectionGraph: malformed geometry skips length with a warning",
          "[build][section]") {
    testing::ScopedCaptureLogger capture;
    auto sections = MakeSections({
        Section(1, std::int64_t{1}, std::int64_t{2}, Geometry{MakeLineString({{4.0, 52.0}})}),
    });

    auto r = BuildSectionGraph(sections, MakeJunctions({}));
    REQUIRE(r.IsOk());
    const auto* edge = r.Value().graph.FindEdge("1", "2");
    REQUIRE(edge != nullptr);
    CHECK_FALSE(edge->LengthM().has_value());
    CHECK(capture.Sink().Contains(LogLevel::Warn, "malformed geometry"));
}

TEST_CASE("NormalizeJunctionId: integral numbers become int64", "[build][section]") {
    CHECK(std::holds_alternative<std::int64_t>(NormalizeJunctionId(12.0)));
    CHECK(std::holds_alternative<double>(NormalizeJunctionId(12.5)));
    CHECK(std::holds_alternative<std::int64_t>(NormalizeJunctionId(std::string("7"))));
    CHECK(std::holds_alternative<std::string>(NormalizeJunctionId(std::string("J7"))));
}
