#include <fairway_graph/core/attribute.hpp>

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

namespace fairway_graph {

namespace {

std::string FormatDouble(double value) {
    if (std::isfinite(value) && std::floor(value) == value &&
        std::fabs(value) < 9.0e15) {
        return std::to_string(static_cast<std::int64_t>(value));
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.15g", value);
    if (std::strtod(buf, nullptr) != value) {
        std::snprintf(buf, sizeof(buf), "%.17g", value);
    }
    return buf;
}

} // anonymous namespace

bool IsNull(const AttributeValue& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        return true;
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return std::isnan(*d);
    }
    return false;
}

std::string ToKey(const AttributeValue& value) {
    if (IsNull(value)) {
        return "";
    }
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? "true" : "false";
    }
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return std::to_string(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return FormatDouble(*d);
    }
    return std::get<std::string>(value);
}

std::optional<double> AsDouble(const AttributeValue& value) {
    if (IsNull(value)) {
        return std::nullopt;
    }
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return *d;
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        if (s->empty()) {
            return std::nullopt;
        }
        char* end = nullptr;
        const double parsed = std::strtod(s->c_str(), &end);
        if (end == s->c_str() || *end != '\0' || std::isnan(parsed)) {
            return std::nullopt;
        }
        return parsed;
    }
    return std::nullopt;
}

std::optional<std::string> AsString(const AttributeValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) {
        return *s;
    }
    return std::nullopt;
}

std::optional<bool> AsBool(const AttributeValue& value) {
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b;
    }
    return std::nullopt;
}

const AttributeValue* FindNonNull(const AttributeMap& attributes,
                                  std::string_view key) {
    auto it = attributes.find(std::string(key));
    if (it == attributes.end() || IsNull(it->second)) {
        return nullptr;
    }
    return &it->second;
}

std::size_t MergeNonNull(AttributeMap& target, const AttributeMap& source) {
    std::size_t written = 0;
    for (const auto& [key, value] : source) {
        if (IsNull(value)) {
            continue;
        }
        target[key] = value;
        ++written;
    }
    return written;
}

} // namespace fairway_graph
