#pragma once

#include "pan_series/core/types.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace pan_series::model {

enum class Provider {
    AIRBUS,
    PLANET,
    MAXAR
};

inline std::string provider_to_string(Provider provider) {
    switch (provider) {
        case Provider::AIRBUS: return "AIRBUS";
        case Provider::PLANET: return "PLANET";
        case Provider::MAXAR: return "MAXAR";
        default: return "UNKNOWN";
    }
}

Provider string_to_provider(const std::string& s);

// One key/value restriction on collection data, e.g. constellation=PHR
struct AttributeConstraint {
    std::string key;
    std::string value;
};

// Validated catalog search filter
class CatalogFilter {
public:
    CatalogFilter(Provider provider, const BBox& bbox, std::vector<AttributeConstraint> constraints = {});

    Provider provider() const { return provider_; }
    const BBox& bbox() const { return bbox_; }
    const std::vector<AttributeConstraint>& constraints() const { return constraints_; }

    // {"provider": ..., "bounds": {"bbox": [minLon, minLat, maxLon, maxLat]}, "data": [{key: value}, ...]}
    nlohmann::json to_request_json() const;

private:
    Provider provider_;
    BBox bbox_;
    std::vector<AttributeConstraint> constraints_;
};

} // namespace pan_series::model
