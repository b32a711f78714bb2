#include "pan_series/model/product.hpp"

namespace pan_series::model {

const Band* Product::find_band(const std::string& band_name) const {
    for (const auto& b : bands) {
        if (b.name == band_name) {
            return &b;
        }
    }
    return nullptr;
}

std::vector<std::string> Product::band_names() const {
    std::vector<std::string> names;
    names.reserve(bands.size());
    for (const auto& b : bands) {
        names.push_back(b.name);
    }
    return names;
}

} // namespace pan_series::model
