#pragma once

#include <fairway_graph/core/result.hpp>
#include <fairway_graph/geo/geometry.hpp>

#include <boost/geometry/srs/projection.hpp>

#include <memory>

namespace fairway_graph {

// ---------------------------------------------------------------------------
// IGeometryProjector — reprojects between geographic lon/lat and a metric
// coordinate system, so that Euclidean distance approximates true distance.
// ---------------------------------------------------------------------------
class IGeometryProjector {
public:
    virtual ~IGeometryProjector() = default;

    [[nodiscard]] virtual Result<PlanarPoint, Error> Forward(
        const GeoPoint& point) const = 0;

    [[nodiscard]] virtual Result<GeoPoint, Error> Inverse(
        const PlanarPoint& point) const = 0;
};

// Project every vertex; fails on the first vertex that does not project.
[[nodiscard]] Result<PlanarLineString, Error> ProjectLineString(
    const IGeometryProjector& projector, const GeoLineString& line);

// ---------------------------------------------------------------------------
// SrsProjector — Boost.Geometry SRS projection selected by EPSG code
// (e.g. 32631, UTM zone 31N, which covers the Netherlands).
// ---------------------------------------------------------------------------
class SrsProjector : public IGeometryProjector {
    using Projection = bg::srs::projection<>;
    struct CreateKey {
        explicit CreateKey() = default;
    };

public:
    static constexpr int kDefaultEpsg = 32631;

    // Fails for EPSG codes Boost.Geometry does not know.
    static Result<std::shared_ptr<SrsProjector>, Error> Create(int epsg_code);

    [[nodiscard]] Result<PlanarPoint, Error> Forward(
        const GeoPoint& point) const override;
    [[nodiscard]] Result<GeoPoint, Error> Inverse(
        const PlanarPoint& point) const override;

    // Only reachable through Create().
    SrsProjector(CreateKey, int epsg_code, std::unique_ptr<Projection> projection);

    [[nodiscard]] int EpsgCode() const noexcept { return epsg_code_; }

private:
    int epsg_code_;
    std::unique_ptr<Projection> projection_;
};

} // namespace fairway_graph
