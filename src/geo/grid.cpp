#include "pan_series/geo/grid.hpp"
#include "pan_series/core/errors.hpp"

#include <ogr_spatialref.h>

#include <algorithm>
#include <cmath>
#include <memory>

namespace pan_series::geo {

namespace {

constexpr double kPi = 3.14159265358979323846;

int grid_dim(double span, double resolution, const char* axis) {
    const double n = std::round(span / resolution);
    if (n > static_cast<double>(kMaxGridDim)) {
        throw ValidationError(std::string("grid ") + axis + " size " + std::to_string(static_cast<long long>(n)) +
                              " exceeds " + std::to_string(kMaxGridDim) + " pixels; lower the resolution");
    }
    return std::max(1, static_cast<int>(n));
}

BBox project_bbox(const BBox& bbox, const std::string& crs) {
    OGRSpatialReference src;
    src.SetWellKnownGeogCS("WGS84");
    src.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

    OGRSpatialReference dst;
    if (dst.SetFromUserInput(crs.c_str()) != OGRERR_NONE) {
        throw ValidationError("unsupported crs '" + crs + "'");
    }
    dst.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

    std::unique_ptr<OGRCoordinateTransformation> ct(OGRCreateCoordinateTransformation(&src, &dst));
    if (!ct) {
        throw ValidationError("cannot transform WGS84 to '" + crs + "'");
    }

    // Corners plus edge midpoints bound the projected footprint
    double xs[8] = {bbox.min_lon, bbox.max_lon, bbox.min_lon, bbox.max_lon,
                    (bbox.min_lon + bbox.max_lon) / 2, (bbox.min_lon + bbox.max_lon) / 2,
                    bbox.min_lon, bbox.max_lon};
    double ys[8] = {bbox.min_lat, bbox.min_lat, bbox.max_lat, bbox.max_lat,
                    bbox.min_lat, bbox.max_lat,
                    (bbox.min_lat + bbox.max_lat) / 2, (bbox.min_lat + bbox.max_lat) / 2};
    if (!ct->Transform(8, xs, ys)) {
        throw ValidationError("bbox " + describe_bbox(bbox) + " cannot be projected to '" + crs + "'");
    }

    BBox out{xs[0], ys[0], xs[0], ys[0]};
    for (int i = 1; i < 8; ++i) {
        out.min_lon = std::min(out.min_lon, xs[i]);
        out.max_lon = std::max(out.max_lon, xs[i]);
        out.min_lat = std::min(out.min_lat, ys[i]);
        out.max_lat = std::max(out.max_lat, ys[i]);
    }
    return out;
}

} // namespace

Grid make_target_grid(const model::GeoQuery& query) {
    const BBox& bbox = query.bbox();
    Grid grid;
    grid.crs = query.crs();

    if (query.is_geographic()) {
        const double centre_lat = 0.5 * (bbox.min_lat + bbox.max_lat);
        const double cos_lat = std::max(1e-6, std::cos(centre_lat * kPi / 180.0));
        const double res_lat = query.resolution() / kMetresPerDegree;
        const double res_lon = query.resolution() / (kMetresPerDegree * cos_lat);

        grid.cols = grid_dim(bbox.max_lon - bbox.min_lon, res_lon, "width");
        grid.rows = grid_dim(bbox.max_lat - bbox.min_lat, res_lat, "height");
        grid.transform = {bbox.min_lon, (bbox.max_lon - bbox.min_lon) / grid.cols, 0.0,
                          bbox.max_lat, 0.0, -(bbox.max_lat - bbox.min_lat) / grid.rows};
        return grid;
    }

    const BBox projected = project_bbox(bbox, query.crs());
    grid.cols = grid_dim(projected.max_lon - projected.min_lon, query.resolution(), "width");
    grid.rows = grid_dim(projected.max_lat - projected.min_lat, query.resolution(), "height");
    grid.transform = {projected.min_lon, query.resolution(), 0.0,
                      projected.max_lat, 0.0, -query.resolution()};
    return grid;
}

BBox grid_bounds(const Grid& grid) {
    const double x0 = grid.transform[0];
    const double y0 = grid.transform[3];
    const double x1 = x0 + grid.cols * grid.transform[1] + grid.rows * grid.transform[2];
    const double y1 = y0 + grid.cols * grid.transform[4] + grid.rows * grid.transform[5];
    return {std::min(x0, x1), std::min(y0, y1), std::max(x0, x1), std::max(y0, y1)};
}

} // namespace pan_series::geo
