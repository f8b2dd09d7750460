#include <fairway_graph/geo/geometry.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace fairway_graph {

namespace {

constexpr int kWktPrecision = 17;

bool IsFinite(const GeoPoint& p) {
    return std::isfinite(Lon(p)) && std::isfinite(Lat(p));
}

std::string UpperPrefix(std::string_view text) {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return "";
    }
    auto stop = text.find('(', start);
    std::string out(text.substr(start, stop == std::string_view::npos
                                           ? std::string_view::npos
                                           : stop - start));
    out.erase(std::remove_if(out.begin(), out.end(),
                             [](unsigned char c) { return std::isspace(c); }),
              out.end());
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

Error WktError(std::string_view wkt, const std::string& message) {
    return Error{"ParseWkt", std::string(wkt.substr(0, 64)), message,
                 ErrorCategory::InvalidGeometry};
}

} // anonymous namespace

GeoPoint MakePoint(double lon, double lat) {
    return GeoPoint(lon, lat);
}

GeoLineString MakeLineString(const std::vector<std::pair<double, double>>& lon_lat) {
    GeoLineString line;
    line.reserve(lon_lat.size());
    for (const auto& [lon, lat] : lon_lat) {
        line.push_back(GeoPoint(lon, lat));
    }
    return line;
}

bool HasGeometry(const Geometry& geometry) {
    return !std::holds_alternative<std::monostate>(geometry);
}

std::string CanonicalWkt(const GeoPoint& point) {
    std::ostringstream oss;
    oss << std::setprecision(kWktPrecision) << bg::wkt(point);
    return oss.str();
}

std::string CanonicalWkt(const GeoLineString& line) {
    std::ostringstream oss;
    oss << std::setprecision(kWktPrecision) << bg::wkt(line);
    return oss.str();
}

std::string CanonicalWkt(const Geometry& geometry) {
    if (const auto* p = std::get_if<GeoPoint>(&geometry)) {
        return CanonicalWkt(*p);
    }
    if (const auto* l = std::get_if<GeoLineString>(&geometry)) {
        return CanonicalWkt(*l);
    }
    return "";
}

Result<Geometry, Error> ParseWkt(std::string_view wkt) {
    const auto kind = UpperPrefix(wkt);
    try {
        if (kind == "POINT") {
            GeoPoint point;
            bg::read_wkt(std::string(wkt), point);
            return Result<Geometry, Error>::Ok(Geometry{point});
        }
        if (kind == "LINESTRING") {
            GeoLineString line;
            bg::read_wkt(std::string(wkt), line);
            return Result<Geometry, Error>::Ok(Geometry{std::move(line)});
        }
    } catch (const bg::read_wkt_exception& e) {
        return Result<Geometry, Error>::Err(WktError(wkt, e.what()));
    }
    return Result<Geometry, Error>::Err(
        WktError(wkt, "Unsupported geometry type '" + kind + "'"));
}

Result<double, Error> GeodesicLength(const GeoLineString& line) {
    if (line.size() < 2) {
        return Result<double, Error>::Err(Error{
            "GeodesicLength", CanonicalWkt(line),
            "Line string needs at least two points",
            ErrorCategory::InvalidGeometry});
    }
    if (!std::all_of(line.begin(), line.end(), IsFinite)) {
        return Result<double, Error>::Err(Error{
            "GeodesicLength", "", "Line string has non-finite coordinates",
            ErrorCategory::InvalidGeometry});
    }
    bg::strategy::distance::vincenty<bg::srs::spheroid<double>> strategy;
    return Result<double, Error>::Ok(bg::length(line, strategy));
}

} // namespace fairway_graph
