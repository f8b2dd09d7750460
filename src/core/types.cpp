#include <fairway_graph/core/types.hpp>

#include <algorithm>

namespace fairway_graph {

namespace {

bool IsUpperAlpha(char c) {
    return c >= 'A' && c <= 'Z';
}

bool IsUpperAlphaOrDigit(char c) {
    return IsUpperAlpha(c) || (c >= '0' && c <= '9');
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// CountryCode
// ---------------------------------------------------------------------------
Result<CountryCode, std::string> CountryCode::Create(std::string_view code) {
    if (code.size() != 2) {
        return Result<CountryCode, std::string>::Err(
            "Country code must be exactly 2 characters, got '" +
            std::string(code) + "'");
    }
    if (!IsUpperAlpha(code[0]) || !IsUpperAlpha(code[1])) {
        return Result<CountryCode, std::string>::Err(
            "Country code must consist of uppercase letters, got '" +
            std::string(code) + "'");
    }
    return Result<CountryCode, std::string>::Ok(CountryCode(std::string(code)));
}

// ---------------------------------------------------------------------------
// SourceTag
// ---------------------------------------------------------------------------
Result<SourceTag, std::string> SourceTag::Create(std::string_view tag) {
    if (tag.empty()) {
        return Result<SourceTag, std::string>::Err("Source tag must not be empty");
    }
    if (tag.size() > 16) {
        return Result<SourceTag, std::string>::Err(
            "Source tag must be at most 16 characters, got " +
            std::to_string(tag.size()));
    }
    if (!IsUpperAlpha(tag[0])) {
        return Result<SourceTag, std::string>::Err(
            "Source tag must start with an uppercase letter");
    }
    if (!std::all_of(tag.begin(), tag.end(), IsUpperAlphaOrDigit)) {
        return Result<SourceTag, std::string>::Err(
            "Source tag must contain only uppercase letters and digits, got '" +
            std::string(tag) + "'");
    }
    return Result<SourceTag, std::string>::Ok(SourceTag(std::string(tag)));
}

std::string SourceTag::Namespaced(std::string_view id) const {
    std::string out = value_;
    out += '_';
    out += id;
    return out;
}

} // namespace fairway_graph
