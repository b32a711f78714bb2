#include "pan_series/model/catalog_filter.hpp"
#include "pan_series/core/errors.hpp"
#include "pan_series/core/utils.hpp"

namespace pan_series::model {

Provider string_to_provider(const std::string& s) {
    const std::string norm = core::to_upper(core::trim(s));
    if (norm == "AIRBUS") return Provider::AIRBUS;
    if (norm == "PLANET") return Provider::PLANET;
    if (norm == "MAXAR") return Provider::MAXAR;
    throw ValidationError("unknown provider '" + s + "'");
}

CatalogFilter::CatalogFilter(Provider provider, const BBox& bbox, std::vector<AttributeConstraint> constraints)
    : provider_(provider), bbox_(bbox), constraints_(std::move(constraints)) {
    if (bbox_.min_lon >= bbox_.max_lon || bbox_.min_lat >= bbox_.max_lat) {
        throw ValidationError("catalog filter bbox must satisfy min < max, got " + describe_bbox(bbox_));
    }
    for (const auto& c : constraints_) {
        if (c.key.empty() || c.value.empty()) {
            throw ValidationError("catalog attribute constraints need a key and a value");
        }
    }
}

nlohmann::json CatalogFilter::to_request_json() const {
    nlohmann::json data = nlohmann::json::array();
    for (const auto& c : constraints_) {
        data.push_back({{c.key, c.value}});
    }
    return {
        {"provider", provider_to_string(provider_)},
        {"bounds", {{"bbox", {bbox_.min_lon, bbox_.min_lat, bbox_.max_lon, bbox_.max_lat}}}},
        {"data", data}
    };
}

} // namespace pan_series::model
