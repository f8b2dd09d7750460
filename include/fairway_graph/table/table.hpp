#pragma once

#include <fairway_graph/core/attribute.hpp>
#include <fairway_graph/core/result.hpp>
#include <fairway_graph/geo/geometry.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace fairway_graph {

// One tabular record: named cells plus an optional geometry column.
struct Row {
    AttributeMap values;
    Geometry geometry;
};

// ---------------------------------------------------------------------------
// Table — an already-loaded tabular export (one file, one region, or the
// concatenation of many). `columns` lists the schema; a row may omit a
// column, which reads as null.
// ---------------------------------------------------------------------------
struct Table {
    std::string name;
    std::vector<std::string> columns;
    std::vector<Row> rows;

    [[nodiscard]] bool HasColumn(std::string_view column) const;
    [[nodiscard]] bool Empty() const noexcept { return rows.empty(); }
    [[nodiscard]] std::size_t Size() const noexcept { return rows.size(); }

    // Appends the row and registers any column not yet in `columns`.
    void AddRow(Row row);
};

// Name of the column that records which region table a row came from.
inline constexpr const char* kSourceFileColumn = "source_file";

// Fails with MissingColumn naming the first absent column.
[[nodiscard]] Result<void, Error> RequireColumns(
    const Table& table, const std::vector<std::string>& columns,
    std::string_view operation);

// Value of `column` in `row`, or a shared null when absent.
[[nodiscard]] const AttributeValue& Cell(const Row& row, std::string_view column);

// Concatenate tables that share one schema. Each row gets the originating
// table's name in kSourceFileColumn. Column order: first appearance.
[[nodiscard]] Table ConcatTables(const std::vector<Table>& tables,
                                 std::string name);

struct DeduplicateOutcome {
    Table table;
    std::size_t removed = 0;
};

// Drop rows identical to an earlier row in every cell and in geometry,
// ignoring the columns listed in `ignore`. First occurrence is kept.
[[nodiscard]] DeduplicateOutcome DropDuplicateRows(
    Table table, const std::vector<std::string>& ignore);

} // namespace fairway_graph
