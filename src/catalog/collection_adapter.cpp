#include "pan_series/catalog/collection_adapter.hpp"
#include "pan_series/core/errors.hpp"

#include <set>

namespace pan_series::catalog {

CollectionAdapter::CollectionAdapter(std::shared_ptr<service::ImageryService> service,
                                     service::RetryPolicy retry)
    : service_(std::move(service)), retry_(retry) {
    if (!service_) {
        throw ValidationError("collection adapter needs an imagery service");
    }
}

model::Product CollectionAdapter::resolve(const std::string& collection_id) const {
    RequestContext ctx;
    ctx.collection_id = collection_id;

    if (collection_id.empty()) {
        throw CollectionNotFoundError("empty collection id", ctx);
    }

    std::optional<service::CollectionDescriptor> desc;
    try {
        desc = service::with_retry(retry_, [&]() {
            return service_->describe_collection(collection_id);
        });
    } catch (const AuthError& e) {
        throw AuthError(e, ctx);
    } catch (const TransportError& e) {
        throw CatalogUnavailableError(e.what(), ctx);
    }

    if (!desc) {
        throw CollectionNotFoundError("id is unknown to the catalog", ctx);
    }
    if (desc->bands.empty()) {
        throw CollectionNotFoundError("collection has no band metadata", ctx);
    }

    std::set<std::string> names;
    for (const auto& b : desc->bands) {
        if (!names.insert(b.name).second) {
            throw CollectionNotFoundError("band '" + b.name + "' is declared twice", ctx);
        }
    }

    model::Product product;
    product.collection_id = desc->collection.id.empty() ? collection_id : desc->collection.id;
    product.name = desc->collection.name;
    product.bands = std::move(desc->bands);
    product.extent = desc->extent;
    product.temporal_extent = desc->temporal_extent;
    return product;
}

} // namespace pan_series::catalog
