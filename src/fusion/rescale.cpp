#include "pan_series/fusion/rescale.hpp"
#include "pan_series/core/errors.hpp"

#include <algorithm>
#include <cmath>

namespace pan_series::fusion {

uint16_t rescale_value(float v, float domain_max, int out_max) {
    if (!std::isfinite(v)) {
        return 0;
    }
    const double clipped = std::min(static_cast<double>(v), static_cast<double>(domain_max));
    const double scaled = std::round(clipped * out_max / domain_max);
    return static_cast<uint16_t>(std::clamp(scaled, 0.0, static_cast<double>(out_max)));
}

DataType rescaled_type(int out_max) {
    return out_max <= 255 ? DataType::UINT8 : DataType::UINT16;
}

model::IntStack rescale(const model::RasterStack& stack, float domain_max, int out_max) {
    if (!(domain_max > 0.0f) || !std::isfinite(domain_max)) {
        throw ValidationError("rescale domain_max must be a positive number");
    }
    if (out_max < 1 || out_max > 65535) {
        throw ValidationError("rescale out_max must be in [1, 65535]");
    }

    std::vector<model::IntScene> scenes;
    scenes.reserve(stack.size());
    for (const auto& scene : stack.scenes()) {
        model::IntScene out;
        out.timestamp = scene.timestamp;
        for (const auto& [name, values] : scene.bands) {
            Matrix2Du16 m(values.rows(), values.cols());
            for (Eigen::Index i = 0; i < values.size(); ++i) {
                m.data()[i] = rescale_value(values.data()[i], domain_max, out_max);
            }
            out.bands.emplace(name, std::move(m));
        }
        scenes.push_back(std::move(out));
    }

    return model::IntStack(std::move(scenes), stack.grid(), stack.band_names(),
                           rescaled_type(out_max), out_max);
}

} // namespace pan_series::fusion
