#pragma once

#include "pan_series/core/types.hpp"
#include "pan_series/model/geo_query.hpp"

namespace pan_series::geo {

// Largest grid side accepted for one band
constexpr int kMaxGridDim = 20000;

// Metres per degree of latitude on the WGS84 mean sphere
constexpr double kMetresPerDegree = 111320.0;

// Output pixel grid of a query. For geographic CRSs the resolution is read as
// metres and converted to degrees at the bbox centre latitude; any other CRS
// has the bbox corners transformed into it and the resolution read in CRS units.
Grid make_target_grid(const model::GeoQuery& query);

// Bounds of a grid in its own CRS
BBox grid_bounds(const Grid& grid);

} // namespace pan_series::geo
