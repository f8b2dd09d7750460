#include <fairway_graph/table/table.hpp>

#include <algorithm>
#include <set>
#include <unordered_set>

namespace fairway_graph {

namespace {

const AttributeValue kNullValue{};

// Type-tagged so that the string "1" and the integer 1 stay distinct.
std::string CellKey(const AttributeValue& value) {
    if (IsNull(value)) {
        return "n:";
    }
    return std::to_string(value.index()) + ":" + ToKey(value);
}

std::string RowKey(const Row& row, const std::set<std::string>& ignore) {
    std::string key;
    for (const auto& [column, value] : row.values) {
        if (ignore.count(column) > 0 || IsNull(value)) {
            continue;
        }
        key += column;
        key += '=';
        key += CellKey(value);
        key += '\x1f';
    }
    key += "geometry=";
    key += CanonicalWkt(row.geometry);
    return key;
}

} // anonymous namespace

bool Table::HasColumn(std::string_view column) const {
    return std::find(columns.begin(), columns.end(), column) != columns.end();
}

void Table::AddRow(Row row) {
    for (const auto& entry : row.values) {
        if (!HasColumn(entry.first)) {
            columns.push_back(entry.first);
        }
    }
    rows.push_back(std::move(row));
}

Result<void, Error> RequireColumns(const Table& table,
                                   const std::vector<std::string>& columns,
                                   std::string_view operation) {
    for (const auto& column : columns) {
        if (!table.HasColumn(column)) {
            return Result<void, Error>::Err(Error{
                std::string(operation),
                table.name + "." + column,
                "Required column '" + column + "' missing from table '" +
                    table.name + "'",
                ErrorCategory::MissingColumn});
        }
    }
    return Result<void, Error>::Ok();
}

const AttributeValue& Cell(const Row& row, std::string_view column) {
    auto it = row.values.find(std::string(column));
    if (it == row.values.end()) {
        return kNullValue;
    }
    return it->second;
}

Table ConcatTables(const std::vector<Table>& tables, std::string name) {
    Table out;
    out.name = std::move(name);
    std::size_t total = 0;
    for (const auto& t : tables) {
        total += t.rows.size();
    }
    out.rows.reserve(total);

    for (const auto& t : tables) {
        for (const auto& column : t.columns) {
            if (!out.HasColumn(column)) {
                out.columns.push_back(column);
            }
        }
        for (const auto& row : t.rows) {
            Row copy = row;
            copy.values[kSourceFileColumn] = t.name;
            out.rows.push_back(std::move(copy));
        }
    }
    if (!out.HasColumn(kSourceFileColumn)) {
        out.columns.push_back(kSourceFileColumn);
    }
    return out;
}

DeduplicateOutcome DropDuplicateRows(Table table,
                                     const std::vector<std::string>& ignore) {
    const std::set<std::string> ignored(ignore.begin(), ignore.end());
    std::unordered_set<std::string> seen;
    seen.reserve(table.rows.size());

    DeduplicateOutcome outcome;
    outcome.table.name = table.name;
    outcome.table.columns = table.columns;
    outcome.table.rows.reserve(table.rows.size());

    for (auto& row : table.rows) {
        if (!seen.insert(RowKey(row, ignored)).second) {
            ++outcome.removed;
            continue;
        }
        outcome.table.rows.push_back(std::move(row));
    }
    return outcome;
}

} // namespace fairway_graph
