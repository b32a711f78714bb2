#include "pan_series/catalog/catalog_resolver.hpp"
#include "pan_series/core/errors.hpp"
#include "pan_series/core/utils.hpp"

#include <iostream>
#include <set>

namespace pan_series::catalog {

CatalogResolver::CatalogResolver(std::shared_ptr<service::ImageryService> service,
                                 service::RetryPolicy retry, int max_pages)
    : service_(std::move(service)), retry_(retry), max_pages_(max_pages) {
    if (!service_) {
        throw ValidationError("catalog resolver needs an imagery service");
    }
    if (max_pages_ < 1) {
        throw ValidationError("catalog resolver max_pages must be >= 1");
    }
}

std::vector<model::Collection> CatalogResolver::resolve(const model::CatalogFilter& filter) const {
    RequestContext ctx;
    ctx.bbox = filter.bbox();

    std::vector<model::Collection> out;
    std::set<std::string> seen_ids;
    std::set<std::string> seen_tokens;
    std::string token;

    for (int page = 0; page < max_pages_; ++page) {
        service::CatalogPage result;
        try {
            result = service::with_retry(retry_, [&]() {
                return service_->search_collections(filter, token);
            });
        } catch (const AuthError& e) {
            throw AuthError(e, ctx);
        } catch (const TransportError& e) {
            throw CatalogUnavailableError(e.what(), ctx);
        }

        for (auto& c : result.collections) {
            if (seen_ids.insert(c.id).second) {
                out.push_back(std::move(c));
            }
        }

        if (result.next_token.empty()) {
            return out;
        }
        if (!seen_tokens.insert(result.next_token).second) {
            std::cerr << "[CATALOG] page token repeated, stopping pagination" << std::endl;
            return out;
        }
        token = result.next_token;
    }

    std::cerr << "[CATALOG] stopped after " << max_pages_ << " pages" << std::endl;
    return out;
}

const model::Collection& select_collection(const std::vector<model::Collection>& collections,
                                           const std::string& name) {
    if (collections.empty()) {
        throw CollectionNotFoundError("catalog search returned no collections", {});
    }
    if (name.empty()) {
        return collections.front();
    }
    for (const auto& c : collections) {
        if (c.name == name) return c;
    }
    const std::string wanted = core::to_lower(name);
    for (const auto& c : collections) {
        if (core::to_lower(c.name) == wanted) return c;
    }
    throw CollectionNotFoundError("no collection named '" + name + "'", {});
}

} // namespace pan_series::catalog
