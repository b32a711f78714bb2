#pragma once

#include "pan_series/core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pan_series::model {

// Immutable description of one load request. The constructor validates every
// field and throws ValidationError on the first violation.
class GeoQuery {
public:
    GeoQuery(const BBox& bbox, const TimeRange& time, double resolution,
             Resampling resampling = Resampling::NEAREST,
             std::vector<std::string> bands = {},
             std::optional<double> max_cloud_coverage = std::nullopt,
             std::string crs = "EPSG:4326");

    const BBox& bbox() const { return bbox_; }
    const TimeRange& time() const { return time_; }
    double resolution() const { return resolution_; }
    Resampling resampling() const { return resampling_; }
    // Empty means "every band of the product"
    const std::vector<std::string>& bands() const { return bands_; }
    const std::optional<double>& max_cloud_coverage() const { return max_cloud_coverage_; }
    const std::string& crs() const { return crs_; }

    bool is_geographic() const;

private:
    BBox bbox_;
    TimeRange time_;
    double resolution_;
    Resampling resampling_;
    std::vector<std::string> bands_;
    std::optional<double> max_cloud_coverage_;
    std::string crs_;
};

} // namespace pan_series::model
