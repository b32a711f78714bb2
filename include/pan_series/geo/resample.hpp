#pragma once

#include "pan_series/core/types.hpp"

#include <optional>

namespace pan_series::geo {

// Interpolate `src` onto a rows x cols grid covering the same extent.
// Returns a copy when the shape already matches.
// With a `nodata` value, BILINEAR and BICUBIC interpolate a validity mask
// alongside the values: output pixels touched by a nodata (or non-finite)
// source pixel become `nodata`. BICUBIC results are clamped to the range of
// the valid source values.
Matrix2Df resample(const Matrix2Df& src, int rows, int cols, Resampling method,
                   std::optional<float> nodata = std::nullopt);

} // namespace pan_series::geo
