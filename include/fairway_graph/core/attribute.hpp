#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace fairway_graph {

// ---------------------------------------------------------------------------
// AttributeValue — one cell of a tabular record or one graph attribute.
//
// std::monostate is the null value. A NaN double is treated as null as well,
// since upstream tabular readers use it for missing numeric cells.
// ---------------------------------------------------------------------------
using AttributeValue =
    std::variant<std::monostate, bool, std::int64_t, double, std::string>;

// Open-ended, key-ordered attribute set of a node, edge or record.
using AttributeMap = std::map<std::string, AttributeValue>;

[[nodiscard]] bool IsNull(const AttributeValue& value);

// Canonical text used for joins and ids: integers and integral doubles print
// without a fractional part (12.0 -> "12"), other doubles with round-trip
// precision, booleans as "true"/"false", null as "".
[[nodiscard]] std::string ToKey(const AttributeValue& value);

// Numeric view of a value; strings are parsed. nullopt for null/unparseable.
[[nodiscard]] std::optional<double> AsDouble(const AttributeValue& value);

// String alternative only; no conversion.
[[nodiscard]] std::optional<std::string> AsString(const AttributeValue& value);

[[nodiscard]] std::optional<bool> AsBool(const AttributeValue& value);

// Returns nullptr when the key is absent or its value is null.
[[nodiscard]] const AttributeValue* FindNonNull(const AttributeMap& attributes,
                                                std::string_view key);

// Copy every non-null entry of `source` over `target`. Returns the number of
// keys written. Existing keys are never overwritten with null.
std::size_t MergeNonNull(AttributeMap& target, const AttributeMap& source);

} // namespace fairway_graph
