#include <fairway_graph/geo/projector.hpp>

#include <boost/geometry/srs/epsg.hpp>

#include <cmath>
#include <string>

namespace fairway_graph {

namespace {

Error ProjectionError(const std::string& operation, const std::string& subject,
                      const std::string& message) {
    return Error{operation, subject, message, ErrorCategory::Projection};
}

} // anonymous namespace

Result<PlanarLineString, Error> ProjectLineString(
    const IGeometryProjector& projector, const GeoLineString& line) {
    PlanarLineString out;
    out.reserve(line.size());
    for (const auto& vertex : line) {
        auto projected = projector.Forward(vertex);
        if (projected.IsErr()) {
            return Result<PlanarLineString, Error>::Err(std::move(projected).Error());
        }
        out.push_back(projected.Value());
    }
    return Result<PlanarLineString, Error>::Ok(std::move(out));
}

// ---------------------------------------------------------------------------
// SrsProjector
// ---------------------------------------------------------------------------
SrsProjector::SrsProjector(CreateKey, int epsg_code,
                           std::unique_ptr<Projection> projection)
    : epsg_code_(epsg_code), projection_(std::move(projection)) {}

Result<std::shared_ptr<SrsProjector>, Error> SrsProjector::Create(int epsg_code) {
    const auto subject = "EPSG:" + std::to_string(epsg_code);
    try {
        auto projection = std::make_unique<Projection>(bg::srs::epsg(epsg_code));
        return Result<std::shared_ptr<SrsProjector>, Error>::Ok(
            std::make_shared<SrsProjector>(CreateKey{}, epsg_code,
                                           std::move(projection)));
    } catch (const bg::projection_exception& e) {
        return Result<std::shared_ptr<SrsProjector>, Error>::Err(
            ProjectionError("SrsProjector::Create", subject, e.what()));
    } catch (const std::exception& e) {
        return Result<std::shared_ptr<SrsProjector>, Error>::Err(
            ProjectionError("SrsProjector::Create", subject,
                            std::string("Unsupported EPSG code: ") + e.what()));
    }
}

Result<PlanarPoint, Error> SrsProjector::Forward(const GeoPoint& point) const {
    const auto subject = CanonicalWkt(point);
    if (!std::isfinite(Lon(point)) || !std::isfinite(Lat(point))) {
        return Result<PlanarPoint, Error>::Err(
            ProjectionError("SrsProjector::Forward", subject,
                            "Non-finite coordinate"));
    }
    PlanarPoint xy;
    try {
        if (!projection_->forward(point, xy)) {
            return Result<PlanarPoint, Error>::Err(
                ProjectionError("SrsProjector::Forward", subject,
                                "Point outside projection domain"));
        }
    } catch (const bg::projection_exception& e) {
        return Result<PlanarPoint, Error>::Err(
            ProjectionError("SrsProjector::Forward", subject, e.what()));
    }
    return Result<PlanarPoint, Error>::Ok(xy);
}

Result<GeoPoint, Error> SrsProjector::Inverse(const PlanarPoint& point) const {
    GeoPoint ll;
    try {
        if (!projection_->inverse(point, ll)) {
            return Result<GeoPoint, Error>::Err(
                ProjectionError("SrsProjector::Inverse", "",
                                "Point outside projection domain"));
        }
    } catch (const bg::projection_exception& e) {
        return Result<GeoPoint, Error>::Err(
            ProjectionError("SrsProjector::Inverse", "", e.what()));
    }
    return Result<GeoPoint, Error>::Ok(ll);
}

} // namespace fairway_graph
