#pragma once

#include "pan_series/core/types.hpp"

#include <string>
#include <vector>

namespace pan_series::model {

struct Band {
    std::string name;
    std::string unit = "DN";
    DataType type = DataType::UINT16;
    float nodata = 0.0f;
};

// Catalog entry as returned by a search
struct Collection {
    std::string id;
    std::string provider;
    std::string name;
    Timestamp created;
};

// A collection bound to its band metadata. Resolved once, reused across loads.
struct Product {
    std::string collection_id;
    std::string name;
    std::vector<Band> bands;
    BBox extent;
    TimeRange temporal_extent;

    // nullptr when the product has no band of that name
    const Band* find_band(const std::string& band_name) const;
    std::vector<std::string> band_names() const;
};

} // namespace pan_series::model
