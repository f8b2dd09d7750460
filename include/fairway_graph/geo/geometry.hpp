#pragma once

#include <fairway_graph/core/result.hpp>

#include <boost/geometry.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace fairway_graph {

namespace bg = boost::geometry;

// Longitude/latitude in degrees on the WGS84 ellipsoid.
using GeoPoint = bg::model::point<double, 2, bg::cs::geographic<bg::degree>>;
using GeoLineString = bg::model::linestring<GeoPoint>;

// Metric x/y in a projected coordinate system.
using PlanarPoint = bg::model::point<double, 2, bg::cs::cartesian>;
using PlanarLineString = bg::model::linestring<PlanarPoint>;

// Geometry carried by a tabular record: none, a point or a polyline.
using Geometry = std::variant<std::monostate, GeoPoint, GeoLineString>;

[[nodiscard]] GeoPoint MakePoint(double lon, double lat);
[[nodiscard]] GeoLineString MakeLineString(
    const std::vector<std::pair<double, double>>& lon_lat);

[[nodiscard]] inline double Lon(const GeoPoint& p) { return bg::get<0>(p); }
[[nodiscard]] inline double Lat(const GeoPoint& p) { return bg::get<1>(p); }

[[nodiscard]] bool HasGeometry(const Geometry& geometry);

// Exact textual form used as a join key. Coordinates are written with
// round-trip precision, so two geometries share a key iff every coordinate
// is bit-identical. Empty string for no geometry.
[[nodiscard]] std::string CanonicalWkt(const Geometry& geometry);
[[nodiscard]] std::string CanonicalWkt(const GeoPoint& point);
[[nodiscard]] std::string CanonicalWkt(const GeoLineString& line);

// Parse POINT or LINESTRING well-known text.
[[nodiscard]] Result<Geometry, Error> ParseWkt(std::string_view wkt);

// Ellipsoidal (WGS84) length in metres. Fails for fewer than two points or
// non-finite coordinates.
[[nodiscard]] Result<double, Error> GeodesicLength(const GeoLineString& line);

} // namespace fairway_graph
