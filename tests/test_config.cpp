#include "pan_series/config/configuration.hpp"
#include "pan_series/core/errors.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>

#include <catch2/catch_test_macros.hpp>

using namespace pan_series;

namespace {

const char* kYaml = R"(
credentials:
  client_id: my-client
  client_secret: s3cret
catalog:
  provider: AIRBUS
  constellations: [PHR]
  collection_name: Pleiades Mozambique
query:
  time_from: "2021-01-01"
  time_to: "2021-12-30"
  resolution: 1.5
  resampling: BICUBIC
  bands: [B0, B1, B2, B3, PAN]
regions:
  - name: Mozambique
    bbox: [36.83, -17.7, 36.90, -17.6]
loader:
  parallel_workers: 6
pansharpen:
  weights: {r: 1.0, g: 1.0, b: 0.4}
  scale: 10000
rescale:
  domain_max: 0.3
  out_max: 255
output:
  dir: out
  tile_size: 256
)";

config::Config valid_config() {
    return config::Config::from_yaml(YAML::Load(kYaml));
}

struct EnvGuard {
    ~EnvGuard() {
        unsetenv("PAN_SERIES_CLIENT_ID");
        unsetenv("PAN_SERIES_CLIENT_SECRET");
    }
};

} // namespace

TEST_CASE("config_from_yaml_reads_all_sections") {
    const config::Config cfg = valid_config();
    REQUIRE(cfg.credentials.client_id == "my-client");
    REQUIRE(cfg.catalog.collection_name == "Pleiades Mozambique");
    REQUIRE(cfg.query.resampling == "BICUBIC");
    REQUIRE(cfg.query.bands.size() == 5);
    REQUIRE(cfg.regions.size() == 1);
    REQUIRE(cfg.regions[0].bbox[1] == -17.7);
    REQUIRE(cfg.loader.parallel_workers == 6);
    REQUIRE(cfg.pansharpen.weights.b == 0.4f);
    REQUIRE(cfg.output.tile_size == 256);
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("config_defaults_are_valid_apart_from_required_keys") {
    config::Config cfg;
    REQUIRE(cfg.pansharpen.red == "B2");
    REQUIRE(cfg.pansharpen.scale == 10000.0f);
    REQUIRE(cfg.rescale.out_max == 255);
    REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError); // no time window, no regions
}

TEST_CASE("config_validate_names_the_offending_key") {
    config::Config cfg = valid_config();
    cfg.retry.max_attempts = 0;
    try {
        cfg.validate();
        FAIL("expected ConfigurationError");
    } catch (const ConfigurationError& e) {
        REQUIRE(std::string(e.what()).find("retry.max_attempts") != std::string::npos);
    }

    cfg = valid_config();
    cfg.query.resampling = "LANCZOS";
    REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);

    cfg = valid_config();
    cfg.regions.push_back(cfg.regions.front());
    REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);

    cfg = valid_config();
    cfg.output.tile_size = 500;
    REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);

    cfg = valid_config();
    cfg.pansharpen.weights = {0.0f, 0.0f, 0.0f};
    REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);
}

TEST_CASE("config_rejects_malformed_yaml_values") {
    REQUIRE_THROWS_AS(config::Config::from_yaml(YAML::Load("loader: {parallel_workers: many}")),
                      ConfigurationError);
    REQUIRE_THROWS_AS(config::Config::from_yaml(YAML::Load("regions: [{name: a, bbox: [1, 2]}]")),
                      ConfigurationError);
    REQUIRE_THROWS_AS(config::Config::load("/nonexistent/pan_series.yaml"), ConfigurationError);
}

TEST_CASE("config_save_round_trips_without_the_secret") {
    const config::Config cfg = valid_config();
    const fs::path path = fs::temp_directory_path() / "pan_series_config_roundtrip.yaml";
    cfg.save(path);

    const config::Config loaded = config::Config::load(path);
    fs::remove(path);

    REQUIRE(loaded.credentials.client_id == "my-client");
    REQUIRE(loaded.credentials.client_secret.empty());
    REQUIRE(loaded.query.bands == cfg.query.bands);
    REQUIRE(loaded.regions[0].name == "Mozambique");
    REQUIRE(loaded.pansharpen.weights.b == cfg.pansharpen.weights.b);
    REQUIRE(loaded.output.tile_size == 256);
}

TEST_CASE("resolve_credentials_prefers_environment") {
    EnvGuard guard;
    config::Config cfg = valid_config();

    unsetenv("PAN_SERIES_CLIENT_ID");
    unsetenv("PAN_SERIES_CLIENT_SECRET");
    auto creds = config::resolve_credentials(cfg);
    REQUIRE(creds.client_id == "my-client");
    REQUIRE(creds.client_secret == "s3cret");

    setenv("PAN_SERIES_CLIENT_ID", "env-client", 1);
    creds = config::resolve_credentials(cfg);
    REQUIRE(creds.client_id == "env-client");
    REQUIRE(creds.client_secret == "s3cret");
}

TEST_CASE("resolve_credentials_fails_when_missing") {
    EnvGuard guard;
    unsetenv("PAN_SERIES_CLIENT_ID");
    unsetenv("PAN_SERIES_CLIENT_SECRET");
    config::Config cfg = valid_config();
    cfg.credentials.client_secret.clear();
    REQUIRE_THROWS_AS(config::resolve_credentials(cfg), ConfigurationError);
}
