#pragma once

#include "pan_series/config/configuration.hpp"
#include "pan_series/service/imagery_service.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace pan_series::service {

// Sentinel Hub style REST client: OAuth2 client credentials, third-party data
// search, BYOC collection metadata, STAC catalog and the Process API.
// Thread safe; each request uses its own curl handle.
class HttpImageryService : public ImageryService {
public:
    // Throws ConfigurationError when either credential is empty
    HttpImageryService(config::Credentials credentials, config::ServiceConfig service);

    CatalogPage search_collections(const model::CatalogFilter& filter,
                                   const std::string& page_token) override;
    std::optional<CollectionDescriptor> describe_collection(const std::string& collection_id) override;
    std::vector<Acquisition> search_acquisitions(const std::string& collection_id,
                                                 const model::GeoQuery& query) override;
    BandRaster fetch_band(const BandRequest& request) override;

private:
    struct Response {
        long status = 0;
        std::string body;
    };

    Response perform(const std::string& method, const std::string& url, const std::string& body,
                     const std::string& content_type, bool authorized);
    Response request_json(const std::string& method, const std::string& url,
                          const nlohmann::json& body);
    std::string access_token();
    void invalidate_token();

    config::Credentials credentials_;
    config::ServiceConfig service_;

    std::mutex token_mutex_;
    std::string token_;
    std::chrono::steady_clock::time_point token_expiry_;
};

// Maps an HTTP status to the error taxonomy; 2xx returns normally.
// 401/403 -> AuthError, 408/429/5xx -> transient TransportError, else permanent.
void check_http_status(long status, const std::string& body, const std::string& what);

// {"data":[{"id","name","created"}], "links":{"nextToken"}}
CatalogPage parse_collection_page(const std::string& body, const std::string& provider);

// BYOC collection document; std::nullopt when it carries no data object
std::optional<CollectionDescriptor> parse_collection_descriptor(const std::string& body);

struct AcquisitionPage {
    std::vector<Acquisition> acquisitions;
    std::optional<long> next; // STAC context.next
};

// STAC FeatureCollection; eo:cloud_cover (percent) becomes a fraction
AcquisitionPage parse_acquisitions(const std::string& body);

// Single-band FLOAT32 evalscript for the Process API
std::string build_evalscript(const std::string& band);

nlohmann::json build_process_request(const BandRequest& request);

// "EPSG:32633" -> "http://www.opengis.net/def/crs/EPSG/0/32633"
std::string crs_to_uri(const std::string& crs);

} // namespace pan_series::service
