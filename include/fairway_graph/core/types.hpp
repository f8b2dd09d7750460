#pragma once

#include <fairway_graph/core/result.hpp>

#include <string>
#include <string_view>

namespace fairway_graph {

// ---------------------------------------------------------------------------
// CountryCode — ISO 3166 alpha-2 style code, exactly two uppercase letters
// (e.g. "NL", "DE"). EURIS location codes start with one.
// ---------------------------------------------------------------------------
class CountryCode {
public:
    static Result<CountryCode, std::string> Create(std::string_view code);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const CountryCode& other) const { return value_ == other.value_; }
    bool operator!=(const CountryCode& other) const { return value_ != other.value_; }

    CountryCode(const CountryCode&) = default;
    CountryCode& operator=(const CountryCode&) = default;
    CountryCode(CountryCode&&) noexcept = default;
    CountryCode& operator=(CountryCode&&) noexcept = default;

private:
    explicit CountryCode(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// SourceTag — name of a data source used to namespace merged ids.
//
// Rules:
//   - Non-empty, max 16 characters
//   - Uppercase ASCII letters and digits
//   - Starts with a letter
//   - No '_', which separates the tag from the id in Namespaced()
// ---------------------------------------------------------------------------
class SourceTag {
public:
    static Result<SourceTag, std::string> Create(std::string_view tag);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    // "<TAG>_<id>"
    [[nodiscard]] std::string Namespaced(std::string_view id) const;

    bool operator==(const SourceTag& other) const { return value_ == other.value_; }
    bool operator!=(const SourceTag& other) const { return value_ != other.value_; }

    SourceTag(const SourceTag&) = default;
    SourceTag& operator=(const SourceTag&) = default;
    SourceTag(SourceTag&&) noexcept = default;
    SourceTag& operator=(SourceTag&&) noexcept = default;

private:
    explicit SourceTag(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

} // namespace fairway_graph
