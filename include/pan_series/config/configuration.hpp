#pragma once

#include <array>
#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace pan_series::config {

namespace fs = std::filesystem;

struct CredentialsConfig {
  std::string client_id;
  std::string client_secret;
};

struct ServiceConfig {
  std::string base_url = "https://services.sentinel-hub.com";
  std::string auth_url =
      "https://services.sentinel-hub.com/auth/realms/main/protocol/openid-connect/token";
  int timeout_ms = 60000;         // per attempt
  int connect_timeout_ms = 10000;
};

struct RetryConfig {
  int max_attempts = 4;
  int initial_backoff_ms = 500;
  int max_backoff_ms = 8000;
  float multiplier = 2.0f;
};

struct CatalogConfig {
  std::string provider = "AIRBUS";               // AIRBUS | PLANET | MAXAR
  std::vector<std::string> constellations{"PHR"};
  std::string collection_id;   // takes precedence over collection_name
  std::string collection_name; // empty = first collection returned by the search
  int max_pages = 50;
};

struct QueryConfig {
  std::string crs = "EPSG:4326";
  std::string time_from;
  std::string time_to;
  double resolution = 1.5;          // metres for geographic CRS, CRS units otherwise
  std::string resampling = "NEAREST";
  std::vector<std::string> bands;   // empty = every band of the product
  double max_cloud_coverage = -1.0; // < 0 disables the filter
};

struct RegionConfig {
  std::string name;
  std::array<double, 4> bbox{0.0, 0.0, 0.0, 0.0}; // min_lon, min_lat, max_lon, max_lat
};

struct LoaderConfig {
  int parallel_workers = 4;
};

struct PanSharpenConfig {
  bool enabled = true;
  std::string red = "B2";
  std::string green = "B1";
  std::string blue = "B0";
  std::string pan = "PAN";
  struct Weights {
    float r = 1.0f;
    float g = 1.0f;
    float b = 0.4f;
  } weights;
  float scale = 10000.0f; // full-scale digital number
};

struct RescaleConfig {
  float domain_max = 0.3f;
  int out_max = 255;
};

struct OutputConfig {
  std::string dir = "outputs";
  bool overwrite = false;
  bool write_analysis = true;
  bool write_display = true;
  std::vector<std::string> analysis_bands; // unsharpened export; empty = every loaded band
  int tile_size = 512;
  std::string compression = "DEFLATE";      // NONE | LZW | DEFLATE
  bool write_manifest = true;
  int parallel_exports = 4;
};

struct PipelineConfig {
  bool allow_partial = true; // accept stacks with some failed scenes
};

struct Config {
  CredentialsConfig credentials;
  ServiceConfig service;
  RetryConfig retry;
  CatalogConfig catalog;
  QueryConfig query;
  std::vector<RegionConfig> regions;
  LoaderConfig loader;
  PanSharpenConfig pansharpen;
  RescaleConfig rescale;
  OutputConfig output;
  PipelineConfig pipeline;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

struct Credentials {
  std::string client_id;
  std::string client_secret;
};

// Config values, overridden by PAN_SERIES_CLIENT_ID / PAN_SERIES_CLIENT_SECRET.
// Throws ConfigurationError when either ends up empty.
Credentials resolve_credentials(const Config &cfg);

} // namespace pan_series::config
