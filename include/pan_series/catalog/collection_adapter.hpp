#pragma once

#include "pan_series/model/product.hpp"
#include "pan_series/service/imagery_service.hpp"
#include "pan_series/service/retry.hpp"

#include <memory>
#include <string>

namespace pan_series::catalog {

// Binds a collection id to its typed Product descriptor.
class CollectionAdapter {
public:
    CollectionAdapter(std::shared_ptr<service::ImageryService> service, service::RetryPolicy retry);

    // Throws CollectionNotFoundError for ids unknown to the catalog or
    // collections without band metadata.
    model::Product resolve(const std::string& collection_id) const;

private:
    std::shared_ptr<service::ImageryService> service_;
    service::RetryPolicy retry_;
};

} // namespace pan_series::catalog
