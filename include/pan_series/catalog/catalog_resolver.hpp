#pragma once

#include "pan_series/model/catalog_filter.hpp"
#include "pan_series/model/product.hpp"
#include "pan_series/service/imagery_service.hpp"
#include "pan_series/service/retry.hpp"

#include <memory>
#include <string>
#include <vector>

namespace pan_series::catalog {

// Resolves a catalog filter to the collections it matches. Read-only and
// idempotent: every call performs a fresh search.
class CatalogResolver {
public:
    CatalogResolver(std::shared_ptr<service::ImageryService> service,
                    service::RetryPolicy retry, int max_pages = 50);

    // Pages through the search until exhausted, de-duplicating by id in
    // first-seen order. No match is an empty list. Throws AuthError when the
    // credentials are rejected and CatalogUnavailableError once transient
    // failures use up the retry budget.
    std::vector<model::Collection> resolve(const model::CatalogFilter& filter) const;

private:
    std::shared_ptr<service::ImageryService> service_;
    service::RetryPolicy retry_;
    int max_pages_;
};

// Picks a collection by display name (exact, then case-insensitive); an empty
// name selects the first entry. Throws CollectionNotFoundError on no match.
const model::Collection& select_collection(const std::vector<model::Collection>& collections,
                                           const std::string& name);

} // namespace pan_series::catalog
