#include "pan_series/config/configuration.hpp"
#include "pan_series/core/errors.hpp"
#include "pan_series/core/types.hpp"
#include "pan_series/core/utils.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <set>

namespace pan_series::config {

static void read_string_list(const YAML::Node& n, std::vector<std::string>& out) {
    if (n && n.IsSequence()) {
        out.clear();
        for (const auto& item : n) {
            out.push_back(item.as<std::string>());
        }
    }
}

static void read_bbox(const YAML::Node& n, std::array<double, 4>& out) {
    if (!n || !n.IsSequence() || n.size() != 4) {
        throw ConfigurationError("regions[].bbox must be [min_lon, min_lat, max_lon, max_lat]");
    }
    for (size_t i = 0; i < 4; ++i) {
        out[i] = n[i].as<double>();
    }
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigurationError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["credentials"]) {
            auto c = node["credentials"];
            if (c["client_id"]) cfg.credentials.client_id = c["client_id"].as<std::string>();
            if (c["client_secret"]) cfg.credentials.client_secret = c["client_secret"].as<std::string>();
        }

        if (node["service"]) {
            auto s = node["service"];
            if (s["base_url"]) cfg.service.base_url = s["base_url"].as<std::string>();
            if (s["auth_url"]) cfg.service.auth_url = s["auth_url"].as<std::string>();
            if (s["timeout_ms"]) cfg.service.timeout_ms = s["timeout_ms"].as<int>();
            if (s["connect_timeout_ms"]) cfg.service.connect_timeout_ms = s["connect_timeout_ms"].as<int>();
        }

        if (node["retry"]) {
            auto r = node["retry"];
            if (r["max_attempts"]) cfg.retry.max_attempts = r["max_attempts"].as<int>();
            if (r["initial_backoff_ms"]) cfg.retry.initial_backoff_ms = r["initial_backoff_ms"].as<int>();
            if (r["max_backoff_ms"]) cfg.retry.max_backoff_ms = r["max_backoff_ms"].as<int>();
            if (r["multiplier"]) cfg.retry.multiplier = r["multiplier"].as<float>();
        }

        if (node["catalog"]) {
            auto c = node["catalog"];
            if (c["provider"]) cfg.catalog.provider = c["provider"].as<std::string>();
            read_string_list(c["constellations"], cfg.catalog.constellations);
            if (c["collection_id"]) cfg.catalog.collection_id = c["collection_id"].as<std::string>();
            if (c["collection_name"]) cfg.catalog.collection_name = c["collection_name"].as<std::string>();
            if (c["max_pages"]) cfg.catalog.max_pages = c["max_pages"].as<int>();
        }

        if (node["query"]) {
            auto q = node["query"];
            if (q["crs"]) cfg.query.crs = q["crs"].as<std::string>();
            if (q["time_from"]) cfg.query.time_from = q["time_from"].as<std::string>();
            if (q["time_to"]) cfg.query.time_to = q["time_to"].as<std::string>();
            if (q["resolution"]) cfg.query.resolution = q["resolution"].as<double>();
            if (q["resampling"]) cfg.query.resampling = q["resampling"].as<std::string>();
            read_string_list(q["bands"], cfg.query.bands);
            if (q["max_cloud_coverage"]) cfg.query.max_cloud_coverage = q["max_cloud_coverage"].as<double>();
        }

        if (node["regions"]) {
            auto rs = node["regions"];
            if (!rs.IsSequence()) {
                throw ConfigurationError("regions must be a list");
            }
            for (const auto& r : rs) {
                RegionConfig region;
                if (r["name"]) region.name = r["name"].as<std::string>();
                read_bbox(r["bbox"], region.bbox);
                cfg.regions.push_back(region);
            }
        }

        if (node["loader"]) {
            auto l = node["loader"];
            if (l["parallel_workers"]) cfg.loader.parallel_workers = l["parallel_workers"].as<int>();
        }

        if (node["pansharpen"]) {
            auto p = node["pansharpen"];
            if (p["enabled"]) cfg.pansharpen.enabled = p["enabled"].as<bool>();
            if (p["red"]) cfg.pansharpen.red = p["red"].as<std::string>();
            if (p["green"]) cfg.pansharpen.green = p["green"].as<std::string>();
            if (p["blue"]) cfg.pansharpen.blue = p["blue"].as<std::string>();
            if (p["pan"]) cfg.pansharpen.pan = p["pan"].as<std::string>();
            if (p["weights"]) {
                auto w = p["weights"];
                if (w["r"]) cfg.pansharpen.weights.r = w["r"].as<float>();
                if (w["g"]) cfg.pansharpen.weights.g = w["g"].as<float>();
                if (w["b"]) cfg.pansharpen.weights.b = w["b"].as<float>();
            }
            if (p["scale"]) cfg.pansharpen.scale = p["scale"].as<float>();
        }

        if (node["rescale"]) {
            auto r = node["rescale"];
            if (r["domain_max"]) cfg.rescale.domain_max = r["domain_max"].as<float>();
            if (r["out_max"]) cfg.rescale.out_max = r["out_max"].as<int>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["dir"]) cfg.output.dir = o["dir"].as<std::string>();
            if (o["overwrite"]) cfg.output.overwrite = o["overwrite"].as<bool>();
            if (o["write_analysis"]) cfg.output.write_analysis = o["write_analysis"].as<bool>();
            if (o["write_display"]) cfg.output.write_display = o["write_display"].as<bool>();
            read_string_list(o["analysis_bands"], cfg.output.analysis_bands);
            if (o["tile_size"]) cfg.output.tile_size = o["tile_size"].as<int>();
            if (o["compression"]) cfg.output.compression = o["compression"].as<std::string>();
            if (o["write_manifest"]) cfg.output.write_manifest = o["write_manifest"].as<bool>();
            if (o["parallel_exports"]) cfg.output.parallel_exports = o["parallel_exports"].as<int>();
        }

        if (node["pipeline"]) {
            auto p = node["pipeline"];
            if (p["allow_partial"]) cfg.pipeline.allow_partial = p["allow_partial"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream ofs(path);
    if (!ofs) {
        throw ConfigurationError("Cannot write config file: " + path.string());
    }
    ofs << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    // Secrets are never written back
    node["credentials"]["client_id"] = credentials.client_id;

    node["service"]["base_url"] = service.base_url;
    node["service"]["auth_url"] = service.auth_url;
    node["service"]["timeout_ms"] = service.timeout_ms;
    node["service"]["connect_timeout_ms"] = service.connect_timeout_ms;

    node["retry"]["max_attempts"] = retry.max_attempts;
    node["retry"]["initial_backoff_ms"] = retry.initial_backoff_ms;
    node["retry"]["max_backoff_ms"] = retry.max_backoff_ms;
    node["retry"]["multiplier"] = retry.multiplier;

    node["catalog"]["provider"] = catalog.provider;
    node["catalog"]["constellations"] = catalog.constellations;
    node["catalog"]["collection_id"] = catalog.collection_id;
    node["catalog"]["collection_name"] = catalog.collection_name;
    node["catalog"]["max_pages"] = catalog.max_pages;

    node["query"]["crs"] = query.crs;
    node["query"]["time_from"] = query.time_from;
    node["query"]["time_to"] = query.time_to;
    node["query"]["resolution"] = query.resolution;
    node["query"]["resampling"] = query.resampling;
    node["query"]["bands"] = query.bands;
    node["query"]["max_cloud_coverage"] = query.max_cloud_coverage;

    for (const auto& r : regions) {
        YAML::Node rn;
        rn["name"] = r.name;
        rn["bbox"].push_back(r.bbox[0]);
        rn["bbox"].push_back(r.bbox[1]);
        rn["bbox"].push_back(r.bbox[2]);
        rn["bbox"].push_back(r.bbox[3]);
        node["regions"].push_back(rn);
    }

    node["loader"]["parallel_workers"] = loader.parallel_workers;

    node["pansharpen"]["enabled"] = pansharpen.enabled;
    node["pansharpen"]["red"] = pansharpen.red;
    node["pansharpen"]["green"] = pansharpen.green;
    node["pansharpen"]["blue"] = pansharpen.blue;
    node["pansharpen"]["pan"] = pansharpen.pan;
    node["pansharpen"]["weights"]["r"] = pansharpen.weights.r;
    node["pansharpen"]["weights"]["g"] = pansharpen.weights.g;
    node["pansharpen"]["weights"]["b"] = pansharpen.weights.b;
    node["pansharpen"]["scale"] = pansharpen.scale;

    node["rescale"]["domain_max"] = rescale.domain_max;
    node["rescale"]["out_max"] = rescale.out_max;

    node["output"]["dir"] = output.dir;
    node["output"]["overwrite"] = output.overwrite;
    node["output"]["write_analysis"] = output.write_analysis;
    node["output"]["write_display"] = output.write_display;
    node["output"]["analysis_bands"] = output.analysis_bands;
    node["output"]["tile_size"] = output.tile_size;
    node["output"]["compression"] = output.compression;
    node["output"]["write_manifest"] = output.write_manifest;
    node["output"]["parallel_exports"] = output.parallel_exports;

    node["pipeline"]["allow_partial"] = pipeline.allow_partial;

    return node;
}

void Config::validate() const {
    if (service.base_url.empty()) {
        throw ConfigurationError("service.base_url must not be empty");
    }
    if (service.auth_url.empty()) {
        throw ConfigurationError("service.auth_url must not be empty");
    }
    if (service.timeout_ms < 1 || service.connect_timeout_ms < 1) {
        throw ConfigurationError("service.timeout_ms and service.connect_timeout_ms must be >= 1");
    }

    if (retry.max_attempts < 1 || retry.max_attempts > 10) {
        throw ConfigurationError("retry.max_attempts must be in [1,10]");
    }
    if (retry.initial_backoff_ms < 0 || retry.max_backoff_ms < retry.initial_backoff_ms) {
        throw ConfigurationError("retry backoff must satisfy 0 <= initial_backoff_ms <= max_backoff_ms");
    }
    if (retry.multiplier < 1.0f) {
        throw ConfigurationError("retry.multiplier must be >= 1");
    }

    {
        const std::string p = core::to_upper(catalog.provider);
        if (p != "AIRBUS" && p != "PLANET" && p != "MAXAR") {
            throw ConfigurationError("catalog.provider must be 'AIRBUS', 'PLANET' or 'MAXAR'");
        }
    }
    if (catalog.max_pages < 1) {
        throw ConfigurationError("catalog.max_pages must be >= 1");
    }

    if (query.crs.empty()) {
        throw ConfigurationError("query.crs must not be empty");
    }
    if (query.time_from.empty() || query.time_to.empty()) {
        throw ConfigurationError("query.time_from and query.time_to are required");
    }
    try {
        if (parse_timestamp(query.time_from) > parse_timestamp(query.time_to)) {
            throw ConfigurationError("query.time_from must not be after query.time_to");
        }
        string_to_resampling(query.resampling);
    } catch (const ValidationError& e) {
        throw ConfigurationError(std::string("query: ") + e.what());
    }
    if (!(query.resolution > 0.0)) {
        throw ConfigurationError("query.resolution must be > 0");
    }
    if (query.max_cloud_coverage > 1.0) {
        throw ConfigurationError("query.max_cloud_coverage must be a fraction <= 1 (negative disables)");
    }

    if (regions.empty()) {
        throw ConfigurationError("at least one entry in regions is required");
    }
    {
        std::set<std::string> names;
        for (const auto& r : regions) {
            if (core::sanitize_name(r.name).empty()) {
                throw ConfigurationError("regions[].name must not be empty");
            }
            if (!names.insert(core::sanitize_name(r.name)).second) {
                throw ConfigurationError("region '" + r.name + "' is listed twice");
            }
            if (r.bbox[0] >= r.bbox[2] || r.bbox[1] >= r.bbox[3]) {
                throw ConfigurationError("region '" + r.name + "' bbox must satisfy min < max");
            }
        }
    }

    if (loader.parallel_workers < 1 || loader.parallel_workers > 32) {
        throw ConfigurationError("loader.parallel_workers must be in [1,32]");
    }

    if (pansharpen.enabled) {
        if (pansharpen.red.empty() || pansharpen.green.empty() || pansharpen.blue.empty() ||
            pansharpen.pan.empty()) {
            throw ConfigurationError("pansharpen band names must not be empty");
        }
        if (pansharpen.weights.r < 0.0f || pansharpen.weights.g < 0.0f || pansharpen.weights.b < 0.0f) {
            throw ConfigurationError("pansharpen.weights.* must be >= 0");
        }
        if (!(pansharpen.weights.r + pansharpen.weights.g + pansharpen.weights.b > 0.0f)) {
            throw ConfigurationError("pansharpen.weights.* must not all be zero");
        }
        if (!(pansharpen.scale > 0.0f)) {
            throw ConfigurationError("pansharpen.scale must be > 0");
        }
    }

    if (!(rescale.domain_max > 0.0f)) {
        throw ConfigurationError("rescale.domain_max must be > 0");
    }
    if (rescale.out_max < 1 || rescale.out_max > 65535) {
        throw ConfigurationError("rescale.out_max must be in [1,65535]");
    }

    if (output.dir.empty()) {
        throw ConfigurationError("output.dir must not be empty");
    }
    if (output.tile_size < 16 || output.tile_size > 4096 || (output.tile_size & (output.tile_size - 1)) != 0) {
        throw ConfigurationError("output.tile_size must be a power of two in [16,4096]");
    }
    {
        const std::string c = core::to_upper(output.compression);
        if (c != "NONE" && c != "LZW" && c != "DEFLATE") {
            throw ConfigurationError("output.compression must be 'NONE', 'LZW' or 'DEFLATE'");
        }
    }
    if (output.parallel_exports < 1 || output.parallel_exports > 32) {
        throw ConfigurationError("output.parallel_exports must be in [1,32]");
    }
}

Credentials resolve_credentials(const Config& cfg) {
    Credentials creds{cfg.credentials.client_id, cfg.credentials.client_secret};

    if (const char* env_id = std::getenv("PAN_SERIES_CLIENT_ID"); env_id && *env_id) {
        creds.client_id = env_id;
    }
    if (const char* env_secret = std::getenv("PAN_SERIES_CLIENT_SECRET"); env_secret && *env_secret) {
        creds.client_secret = env_secret;
    }

    if (core::trim(creds.client_id).empty()) {
        throw ConfigurationError("client id is missing (credentials.client_id or PAN_SERIES_CLIENT_ID)");
    }
    if (core::trim(creds.client_secret).empty()) {
        throw ConfigurationError(
            "client secret is missing (credentials.client_secret or PAN_SERIES_CLIENT_SECRET)");
    }
    return creds;
}

} // namespace pan_series::config
