#pragma once

#include "pan_series/model/raster_stack.hpp"

#include <string>

namespace pan_series::fusion {

struct PanSharpenParams {
    std::string red = "B2";
    std::string green = "B1";
    std::string blue = "B0";
    std::string pan = "PAN";
    struct Weights {
        float r = 1.0f;
        float g = 1.0f;
        float b = 0.4f;
    } weights;
    float scale = 10000.0f; // divisor turning digital numbers into reflectance
};

// Brovey-style fusion of the colour bands with the panchromatic band:
//   weight = (w_r*R + w_g*G + w_b*B) / (w_r + w_g + w_b)
//   ratio  = PAN / weight
//   out_c  = (C / scale) * ratio   for C in {R, G, B}
// Pixels with weight <= 0, a non-finite input, or an input equal to its
// band's nodata value receive the output band's nodata value.
// The result holds the three colour bands only, in red, green, blue order.
// Throws FusionError when a band is missing, the grids disagree, or the
// parameters are degenerate.
model::RasterStack sharpen(const model::RasterStack& stack, const PanSharpenParams& params,
                           int workers = 1);

} // namespace pan_series::fusion
