#pragma once

#include "pan_series/core/types.hpp"
#include "pan_series/model/catalog_filter.hpp"
#include "pan_series/model/geo_query.hpp"
#include "pan_series/model/product.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pan_series::service {

struct CatalogPage {
    std::vector<model::Collection> collections;
    std::string next_token; // empty on the last page
};

struct CollectionDescriptor {
    model::Collection collection;
    std::vector<model::Band> bands;
    BBox extent;
    TimeRange temporal_extent;
};

struct Acquisition {
    std::string id;
    Timestamp timestamp;
    std::optional<double> cloud_coverage; // fraction in [0,1]
};

struct BandRequest {
    std::string collection_id;
    std::string band;
    DataType type = DataType::FLOAT32;
    Timestamp timestamp;
    BBox bbox;
    Grid target_grid;
    Resampling resampling = Resampling::NEAREST;
};

// A band as delivered by the service; its grid may differ from the request.
struct BandRaster {
    Matrix2Df values;
    GeoTransform transform{0.0, 1.0, 0.0, 0.0, 0.0, -1.0};
};

// Network boundary for catalog search and tile fetch. Implementations throw
// TransportError (transient or not) and AuthError; they must be safe to call
// from several loader workers at once.
class ImageryService {
public:
    virtual ~ImageryService() = default;

    virtual CatalogPage search_collections(const model::CatalogFilter& filter,
                                           const std::string& page_token) = 0;

    // std::nullopt when the id is unknown to the catalog
    virtual std::optional<CollectionDescriptor> describe_collection(const std::string& collection_id) = 0;

    virtual std::vector<Acquisition> search_acquisitions(const std::string& collection_id,
                                                         const model::GeoQuery& query) = 0;

    virtual BandRaster fetch_band(const BandRequest& request) = 0;
};

} // namespace pan_series::service
