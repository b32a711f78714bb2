#include "pan_series/model/geo_query.hpp"
#include "pan_series/core/errors.hpp"
#include "pan_series/core/utils.hpp"

#include <cmath>
#include <set>

namespace pan_series::model {

GeoQuery::GeoQuery(const BBox& bbox, const TimeRange& time, double resolution,
                   Resampling resampling, std::vector<std::string> bands,
                   std::optional<double> max_cloud_coverage, std::string crs)
    : bbox_(bbox), time_(time), resolution_(resolution), resampling_(resampling),
      bands_(std::move(bands)), max_cloud_coverage_(max_cloud_coverage), crs_(std::move(crs)) {
    if (!std::isfinite(bbox_.min_lon) || !std::isfinite(bbox_.max_lon) ||
        !std::isfinite(bbox_.min_lat) || !std::isfinite(bbox_.max_lat)) {
        throw ValidationError("bbox coordinates must be finite");
    }
    if (bbox_.min_lon >= bbox_.max_lon || bbox_.min_lat >= bbox_.max_lat) {
        throw ValidationError("bbox must satisfy min < max on both axes, got " + describe_bbox(bbox_));
    }
    if (bbox_.min_lon < -180.0 || bbox_.max_lon > 180.0) {
        throw ValidationError("bbox longitude must be in [-180, 180]");
    }
    if (bbox_.min_lat < -90.0 || bbox_.max_lat > 90.0) {
        throw ValidationError("bbox latitude must be in [-90, 90]");
    }
    if (time_.start > time_.end) {
        throw ValidationError("time range start " + format_iso8601(time_.start) +
                              " is after end " + format_iso8601(time_.end));
    }
    if (!(resolution_ > 0.0) || !std::isfinite(resolution_)) {
        throw ValidationError("resolution must be > 0");
    }
    if (max_cloud_coverage_ && (*max_cloud_coverage_ < 0.0 || *max_cloud_coverage_ > 1.0)) {
        throw ValidationError("max cloud coverage must be a fraction in [0, 1]");
    }
    if (core::trim(crs_).empty()) {
        throw ValidationError("crs must not be empty");
    }
    std::set<std::string> seen;
    for (const auto& b : bands_) {
        if (b.empty()) {
            throw ValidationError("band names must not be empty");
        }
        if (!seen.insert(b).second) {
            throw ValidationError("band '" + b + "' requested twice");
        }
    }
}

bool GeoQuery::is_geographic() const {
    const std::string c = core::to_upper(core::trim(crs_));
    return c == "EPSG:4326" || c == "CRS84" || c == "OGC:CRS84" || c == "WGS84";
}

} // namespace pan_series::model
