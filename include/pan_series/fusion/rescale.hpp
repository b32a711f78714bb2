#pragma once

#include "pan_series/model/raster_stack.hpp"

#include <cstdint>

namespace pan_series::fusion {

// Maps one value into [0, out_max]: round(min(v, domain_max) * out_max / domain_max),
// clamped. Non-finite values map to 0.
uint16_t rescale_value(float v, float domain_max, int out_max);

// Element type wide enough for out_max
DataType rescaled_type(int out_max);

// Pure per-pixel rescale of every band of every scene. Throws ValidationError
// for domain_max <= 0 or out_max outside [1, 65535].
model::IntStack rescale(const model::RasterStack& stack, float domain_max, int out_max = 255);

} // namespace pan_series::fusion
