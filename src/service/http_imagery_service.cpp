#include "pan_series/service/http_imagery_service.hpp"
#include "pan_series/core/errors.hpp"
#include "pan_series/core/utils.hpp"
#include "pan_series/geo/grid.hpp"
#include "pan_series/io/geotiff_io.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <iostream>
#include <memory>
#include <mutex>

namespace pan_series::service {

using json = nlohmann::json;

namespace {

constexpr const char* kSearchPath = "/api/v1/dataimport/search";
constexpr const char* kByocPath = "/api/v1/byoc/collections/";
constexpr const char* kStacSearchPath = "/api/v1/catalog/1.0.0/search";
constexpr const char* kProcessPath = "/api/v1/process";
constexpr int kStacPageLimit = 100;
constexpr int kMaxStacPages = 100;
// Refresh a token this long before the server-side expiry
constexpr std::chrono::seconds kTokenSlack{60};

void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t write_to_string(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};

struct SlistDeleter {
    void operator()(curl_slist* s) const { curl_slist_free_all(s); }
};

std::string url_escape(CURL* curl, const std::string& s) {
    char* escaped = curl_easy_escape(curl, s.c_str(), static_cast<int>(s.size()));
    if (!escaped) {
        throw TransportError("cannot url-encode request parameter", 0, false);
    }
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

std::string snippet(const std::string& body) {
    constexpr size_t kMax = 200;
    return body.size() <= kMax ? body : body.substr(0, kMax) + "...";
}

json parse_body(const std::string& body, const std::string& what) {
    try {
        return json::parse(body);
    } catch (const json::parse_error& e) {
        throw TransportError("malformed " + what + " response: " + e.what(), 0, false);
    }
}

Timestamp parse_time_field(const json& j, const std::string& key, const std::string& what) {
    try {
        return parse_timestamp(j.at(key).get<std::string>());
    } catch (const json::exception&) {
        throw TransportError("malformed " + what + " response: missing '" + key + "'", 0, false);
    } catch (const ValidationError& e) {
        throw TransportError("malformed " + what + " response: " + e.what(), 0, false);
    }
}

// Widens `box` by every [lon, lat] pair nested anywhere in `coords`
void extend_bbox(const json& coords, BBox& box, bool& any) {
    if (!coords.is_array()) {
        return;
    }
    if (coords.size() >= 2 && coords[0].is_number() && coords[1].is_number()) {
        const double lon = coords[0].get<double>();
        const double lat = coords[1].get<double>();
        if (!any) {
            box = BBox{lon, lat, lon, lat};
            any = true;
        } else {
            box.min_lon = std::min(box.min_lon, lon);
            box.min_lat = std::min(box.min_lat, lat);
            box.max_lon = std::max(box.max_lon, lon);
            box.max_lat = std::max(box.max_lat, lat);
        }
        return;
    }
    for (const auto& c : coords) {
        extend_bbox(c, box, any);
    }
}

DataType band_type(const json& band) {
    const std::string format = core::to_upper(band.value("sampleFormat", std::string("UINT")));
    if (format == "FLOAT") {
        return DataType::FLOAT32;
    }
    const int bits = band.value("bitDepth", 16);
    return bits <= 8 ? DataType::UINT8 : DataType::UINT16;
}

std::string upsampling_name(Resampling r) {
    return resampling_to_string(r);
}

} // namespace

void check_http_status(long status, const std::string& body, const std::string& what) {
    if (status >= 200 && status < 300) {
        return;
    }
    const std::string msg = what + " failed with HTTP " + std::to_string(status) + ": " + snippet(body);
    if (status == 401 || status == 403) {
        throw AuthError(msg);
    }
    const bool transient = status == 408 || status == 429 || status >= 500;
    throw TransportError(msg, status, transient);
}

CatalogPage parse_collection_page(const std::string& body, const std::string& provider) {
    const json j = parse_body(body, "catalog search");
    CatalogPage page;
    if (j.contains("data") && j["data"].is_array()) {
        for (const auto& item : j["data"]) {
            model::Collection c;
            c.id = item.value("id", std::string());
            if (c.id.empty()) {
                throw TransportError("malformed catalog search response: collection without id", 0, false);
            }
            c.name = item.value("name", c.id);
            c.provider = provider;
            if (item.contains("created")) {
                c.created = parse_time_field(item, "created", "catalog search");
            }
            page.collections.push_back(std::move(c));
        }
    }
    if (j.contains("links") && j["links"].is_object()) {
        page.next_token = j["links"].value("nextToken", std::string());
    }
    return page;
}

std::optional<CollectionDescriptor> parse_collection_descriptor(const std::string& body) {
    const json j = parse_body(body, "collection");
    if (!j.contains("data") || !j["data"].is_object()) {
        return std::nullopt;
    }
    const json& data = j["data"];

    CollectionDescriptor desc;
    desc.collection.id = data.value("id", std::string());
    desc.collection.name = data.value("name", desc.collection.id);
    desc.collection.provider = data.value("s3Bucket", std::string());
    if (data.contains("created")) {
        desc.collection.created = parse_time_field(data, "created", "collection");
    }

    const json additional = data.value("additionalData", json::object());
    if (additional.contains("bands") && additional["bands"].is_object()) {
        for (const auto& [name, meta] : additional["bands"].items()) {
            model::Band band;
            band.name = name;
            band.type = band_type(meta);
            band.unit = meta.value("unit", std::string("DN"));
            if (meta.contains("noData") && meta["noData"].is_number()) {
                band.nodata = meta["noData"].get<float>();
            }
            desc.bands.push_back(std::move(band));
        }
    }

    bool any = false;
    if (additional.contains("extent") && additional["extent"].is_object()) {
        extend_bbox(additional["extent"].value("coordinates", json::array()), desc.extent, any);
    }
    if (!any) {
        desc.extent = BBox{-180.0, -90.0, 180.0, 90.0};
    }

    desc.temporal_extent.start = additional.contains("fromSensingTime")
        ? parse_time_field(additional, "fromSensingTime", "collection")
        : Timestamp{};
    desc.temporal_extent.end = additional.contains("toSensingTime")
        ? parse_time_field(additional, "toSensingTime", "collection")
        : desc.temporal_extent.start;
    return desc;
}

AcquisitionPage parse_acquisitions(const std::string& body) {
    const json j = parse_body(body, "catalog");
    AcquisitionPage page;
    if (j.contains("features") && j["features"].is_array()) {
        for (const auto& f : j["features"]) {
            const json props = f.value("properties", json::object());
            Acquisition a;
            a.id = f.value("id", std::string());
            a.timestamp = parse_time_field(props, "datetime", "catalog");
            if (props.contains("eo:cloud_cover") && props["eo:cloud_cover"].is_number()) {
                a.cloud_coverage = props["eo:cloud_cover"].get<double>() / 100.0;
            }
            page.acquisitions.push_back(std::move(a));
        }
    }
    if (j.contains("context") && j["context"].is_object()) {
        const json& ctx = j["context"];
        if (ctx.contains("next") && ctx["next"].is_number_integer()) {
            page.next = ctx["next"].get<long>();
        }
    }
    return page;
}

std::string build_evalscript(const std::string& band) {
    return "//VERSION=3\n"
           "function setup() {\n"
           "  return {\n"
           "    input: [{ bands: [\"" + band + "\", \"dataMask\"] }],\n"
           "    output: { bands: 1, sampleType: \"FLOAT32\" }\n"
           "  };\n"
           "}\n"
           "function evaluatePixel(s) {\n"
           "  return [s.dataMask === 1 ? s." + band + " : 0];\n"
           "}\n";
}

std::string crs_to_uri(const std::string& crs) {
    const std::string upper = core::to_upper(crs);
    if (upper == "CRS84" || upper == "OGC:CRS84" || upper == "WGS84") {
        return "http://www.opengis.net/def/crs/OGC/1.3/CRS84";
    }
    if (core::starts_with(upper, "EPSG:")) {
        return "http://www.opengis.net/def/crs/EPSG/0/" + crs.substr(5);
    }
    return crs;
}

json build_process_request(const BandRequest& request) {
    const BBox b = geo::grid_bounds(request.target_grid);
    const std::string from = format_iso8601(request.timestamp);
    const std::string to = format_iso8601(request.timestamp + std::chrono::seconds(1));
    return {
        {"input", {
            {"bounds", {
                {"bbox", {b.min_lon, b.min_lat, b.max_lon, b.max_lat}},
                {"properties", {{"crs", crs_to_uri(request.target_grid.crs)}}}
            }},
            {"data", json::array({{
                {"type", "byoc-" + request.collection_id},
                {"dataFilter", {{"timeRange", {{"from", from}, {"to", to}}}}},
                {"processing", {
                    {"upsampling", upsampling_name(request.resampling)},
                    {"downsampling", upsampling_name(request.resampling)}
                }}
            }})}
        }},
        {"output", {
            {"width", request.target_grid.cols},
            {"height", request.target_grid.rows},
            {"responses", json::array({{
                {"identifier", "default"},
                {"format", {{"type", "image/tiff"}}}
            }})}
        }},
        {"evalscript", build_evalscript(request.band)}
    };
}

HttpImageryService::HttpImageryService(config::Credentials credentials, config::ServiceConfig service)
    : credentials_(std::move(credentials)), service_(std::move(service)) {
    if (credentials_.client_id.empty() || credentials_.client_secret.empty()) {
        throw ConfigurationError("client id and client secret are required");
    }
    if (service_.base_url.empty() || service_.auth_url.empty()) {
        throw ConfigurationError("service.base_url and service.auth_url are required");
    }
    ensure_curl_initialized();
}

HttpImageryService::Response HttpImageryService::perform(const std::string& method,
                                                         const std::string& url,
                                                         const std::string& body,
                                                         const std::string& content_type,
                                                         bool authorized) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw TransportError("curl_easy_init failed", 0, true);
    }

    curl_slist* raw_headers = nullptr;
    if (!content_type.empty()) {
        raw_headers = curl_slist_append(raw_headers, ("Content-Type: " + content_type).c_str());
    }
    if (authorized) {
        raw_headers = curl_slist_append(raw_headers, ("Authorization: Bearer " + access_token()).c_str());
    }
    std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);

    Response resp;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(service_.timeout_ms));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(service_.connect_timeout_ms));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    if (method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw TransportError(method + " " + url + ": " + curl_easy_strerror(res), 0, true);
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &resp.status);

    // A rejected bearer token is re-fetched on the next call
    if (authorized && resp.status == 401) {
        invalidate_token();
    }
    return resp;
}

HttpImageryService::Response HttpImageryService::request_json(const std::string& method,
                                                              const std::string& url,
                                                              const json& body) {
    return perform(method, url, method == "POST" ? body.dump() : std::string(),
                   method == "POST" ? "application/json" : "", true);
}

std::string HttpImageryService::access_token() {
    std::lock_guard<std::mutex> lock(token_mutex_);
    if (!token_.empty() && std::chrono::steady_clock::now() < token_expiry_) {
        return token_;
    }

    std::unique_ptr<CURL, CurlDeleter> esc(curl_easy_init());
    if (!esc) {
        throw TransportError("curl_easy_init failed", 0, true);
    }
    const std::string form = "grant_type=client_credentials&client_id=" +
                             url_escape(esc.get(), credentials_.client_id) +
                             "&client_secret=" + url_escape(esc.get(), credentials_.client_secret);

    const Response resp = perform("POST", service_.auth_url, form,
                                  "application/x-www-form-urlencoded", false);
    if (resp.status == 400 || resp.status == 401 || resp.status == 403) {
        throw AuthError("client credentials rejected (HTTP " + std::to_string(resp.status) + ")");
    }
    check_http_status(resp.status, resp.body, "token request");

    const json j = parse_body(resp.body, "token");
    if (!j.contains("access_token") || !j["access_token"].is_string()) {
        throw AuthError("token response carries no access_token");
    }
    token_ = j["access_token"].get<std::string>();
    const auto ttl = std::chrono::seconds(j.value("expires_in", 3600L));
    token_expiry_ = std::chrono::steady_clock::now() + std::max(std::chrono::seconds(0), ttl - kTokenSlack);
    return token_;
}

void HttpImageryService::invalidate_token() {
    std::lock_guard<std::mutex> lock(token_mutex_);
    token_.clear();
}

CatalogPage HttpImageryService::search_collections(const model::CatalogFilter& filter,
                                                   const std::string& page_token) {
    std::string url = service_.base_url + kSearchPath;
    if (!page_token.empty()) {
        std::unique_ptr<CURL, CurlDeleter> esc(curl_easy_init());
        if (!esc) {
            throw TransportError("curl_easy_init failed", 0, true);
        }
        url += "?viewtoken=" + url_escape(esc.get(), page_token);
    }
    const Response resp = request_json("POST", url, filter.to_request_json());
    check_http_status(resp.status, resp.body, "catalog search");
    return parse_collection_page(resp.body, model::provider_to_string(filter.provider()));
}

std::optional<CollectionDescriptor> HttpImageryService::describe_collection(const std::string& collection_id) {
    const Response resp = request_json("GET", service_.base_url + kByocPath + collection_id, json());
    if (resp.status == 404) {
        return std::nullopt;
    }
    check_http_status(resp.status, resp.body, "collection lookup");
    return parse_collection_descriptor(resp.body);
}

std::vector<Acquisition> HttpImageryService::search_acquisitions(const std::string& collection_id,
                                                                 const model::GeoQuery& query) {
    const BBox& b = query.bbox();
    json body = {
        {"bbox", {b.min_lon, b.min_lat, b.max_lon, b.max_lat}},
        {"datetime", format_iso8601(query.time().start) + "/" + format_iso8601(query.time().end)},
        {"collections", json::array({"byoc-" + collection_id})},
        {"limit", kStacPageLimit}
    };

    std::vector<Acquisition> out;
    for (int page = 0; page < kMaxStacPages; ++page) {
        const Response resp = request_json("POST", service_.base_url + kStacSearchPath, body);
        check_http_status(resp.status, resp.body, "acquisition search");
        AcquisitionPage parsed = parse_acquisitions(resp.body);
        out.insert(out.end(), parsed.acquisitions.begin(), parsed.acquisitions.end());
        if (!parsed.next) {
            return out;
        }
        body["next"] = *parsed.next;
    }
    std::cerr << "[CATALOG] acquisition search truncated after " << kMaxStacPages << " pages" << std::endl;
    return out;
}

BandRaster HttpImageryService::fetch_band(const BandRequest& request) {
    const Response resp = request_json("POST", service_.base_url + kProcessPath,
                                       build_process_request(request));
    check_http_status(resp.status, resp.body, "band " + request.band + " fetch");

    io::GeoTiffImage img;
    try {
        img = io::decode_geotiff(resp.body);
    } catch (const IOError& e) {
        throw TransportError(std::string("band ") + request.band + ": " + e.what(), resp.status, false);
    }

    if (img.bands.empty()) {
        throw TransportError("band " + request.band + ": response raster has no bands", resp.status, false);
    }

    BandRaster raster;
    raster.values = std::move(img.bands.front());
    raster.transform = img.grid.transform;
    return raster;
}

} // namespace pan_series::service
