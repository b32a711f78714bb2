#include "fake_imagery_service.hpp"

#include "pan_series/geo/grid.hpp"
#include "pan_series/loader/time_series_loader.hpp"

#include <atomic>
#include <memory>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace pan_series;
using pan_series::testing::FakeImageryService;
using pan_series::testing::acquisition;
using pan_series::testing::fast_retry;
using pan_series::testing::make_product;

namespace {

const std::vector<std::string> kBands{"B0", "B1", "B2", "B3", "PAN"};

// Scenario geometry at a coarse resolution to keep the grids small
model::GeoQuery mozambique_query(std::optional<double> max_cloud = std::nullopt) {
    return model::GeoQuery(BBox{36.83, -17.7, 36.90, -17.6},
                           TimeRange{make_date(2021, 1, 1), make_date(2021, 12, 30)}, 150.0,
                           Resampling::BICUBIC, kBands, max_cloud);
}

std::shared_ptr<FakeImageryService> mozambique_service() {
    auto fake = std::make_shared<FakeImageryService>();
    fake->acquisitions = {acquisition(2021, 6, 29), acquisition(2022, 1, 5), acquisition(2021, 2, 26)};
    return fake;
}

} // namespace

TEST_CASE("loader_returns_aligned_time_ordered_scenes") {
    auto fake = mozambique_service();
    fake->native_factor = 2; // bands arrive at half resolution

    loader::TimeSeriesLoader loader(fake, fast_retry(), 4);
    const auto product = make_product("pleiades", kBands);
    const auto result = loader.load(product, mozambique_query());

    REQUIRE(result.failures.empty());
    REQUIRE(result.stack.size() == 2);
    REQUIRE(format_date(result.stack.scenes()[0].timestamp) == "2021-02-26");
    REQUIRE(format_date(result.stack.scenes()[1].timestamp) == "2021-06-29");
    REQUIRE(result.stack.band_names() == kBands);

    const Grid& grid = result.stack.grid();
    REQUIRE(grid == geo::make_target_grid(mozambique_query()));
    for (const auto& scene : result.stack.scenes()) {
        REQUIRE(scene.bands.size() == 5);
        for (const auto& [name, values] : scene.bands) {
            REQUIRE(values.rows() == grid.rows);
            REQUIRE(values.cols() == grid.cols);
            REQUIRE(values(0, 0) == Catch::Approx(1000.0f).epsilon(1e-4));
        }
    }
    REQUIRE(fake->fetch_calls.load() == 10);
}

TEST_CASE("loader_isolates_failed_scenes") {
    auto fake = mozambique_service();
    fake->failing_bands = {{"2021-06-29", "B3"}};

    loader::TimeSeriesLoader loader(fake, fast_retry(), 4);
    const auto result = loader.load(make_product("pleiades", kBands), mozambique_query());

    REQUIRE(result.stack.size() == 1);
    REQUIRE(format_date(result.stack.scenes()[0].timestamp) == "2021-02-26");
    REQUIRE(result.failures.size() == 1);
    const SceneFailure& f = result.failures[0];
    REQUIRE(format_date(f.timestamp) == "2021-06-29");
    REQUIRE(f.failed_bands == std::vector<std::string>{"B3"});
    REQUIRE(f.reason.find("B3") != std::string::npos);
    REQUIRE(f.attempts == 1); // permanent errors are not retried
}

TEST_CASE("loader_retries_transient_band_failures") {
    auto fake = mozambique_service();
    fake->transient_once_dates = {"2021-02-26"};

    loader::TimeSeriesLoader loader(fake, fast_retry(3), 2);
    const auto result = loader.load(make_product("pleiades", kBands), mozambique_query());
    REQUIRE(result.failures.empty());
    REQUIRE(result.stack.size() == 2);
    REQUIRE(fake->fetch_calls.load() == 15);
}

TEST_CASE("loader_fails_when_no_acquisitions_match") {
    auto fake = std::make_shared<FakeImageryService>();
    fake->acquisitions = {acquisition(2019, 5, 1)};

    loader::TimeSeriesLoader loader(fake, fast_retry());
    try {
        loader.load(make_product("pleiades", kBands), mozambique_query());
        FAIL("expected LoadError");
    } catch (const LoadError& e) {
        REQUIRE(e.failures().empty());
        REQUIRE(e.context().collection_id == "pleiades");
        REQUIRE(e.context().time_range.has_value());
    }
    REQUIRE(fake->fetch_calls.load() == 0);
}

TEST_CASE("loader_fails_when_every_scene_fails") {
    auto fake = mozambique_service();
    fake->failing_bands = {{"2021-02-26", "PAN"}, {"2021-06-29", "B0"}};

    loader::TimeSeriesLoader loader(fake, fast_retry());
    try {
        loader.load(make_product("pleiades", kBands), mozambique_query());
        FAIL("expected LoadError");
    } catch (const LoadError& e) {
        REQUIRE(e.failures().size() == 2);
    }
}

TEST_CASE("loader_filters_by_cloud_coverage_and_merges_duplicates") {
    auto fake = std::make_shared<FakeImageryService>();
    fake->acquisitions = {acquisition(2021, 2, 26, 0.1), acquisition(2021, 3, 10, 0.5),
                          acquisition(2021, 4, 2), acquisition(2021, 2, 26, 0.05)};

    loader::TimeSeriesLoader loader(fake, fast_retry());
    const auto result = loader.load(make_product("pleiades", kBands), mozambique_query(0.3));

    REQUIRE(result.stack.size() == 2);
    REQUIRE(format_date(result.stack.scenes()[0].timestamp) == "2021-02-26");
    REQUIRE(*result.stack.scenes()[0].cloud_coverage == 0.1);
    REQUIRE(format_date(result.stack.scenes()[1].timestamp) == "2021-04-02");
    REQUIRE_FALSE(result.stack.scenes()[1].cloud_coverage.has_value());
}

TEST_CASE("loader_plan_is_lazy_and_restartable") {
    auto fake = mozambique_service();
    loader::TimeSeriesLoader loader(fake, fast_retry());

    const loader::LoadPlan plan = loader.plan(make_product("pleiades", kBands), mozambique_query());
    REQUIRE(fake->acquisition_calls.load() == 0);
    REQUIRE(fake->fetch_calls.load() == 0);
    REQUIRE(plan.bands() == kBands);

    const auto first = plan.materialize();
    const auto second = plan.materialize();
    REQUIRE(fake->acquisition_calls.load() == 2);
    REQUIRE(first.stack.size() == second.stack.size());
    REQUIRE(first.stack.scenes()[1].band("PAN") == second.stack.scenes()[1].band("PAN"));
}

TEST_CASE("loader_defaults_to_every_product_band") {
    auto fake = mozambique_service();
    loader::TimeSeriesLoader loader(fake, fast_retry());
    model::GeoQuery q(BBox{36.83, -17.7, 36.90, -17.6},
                      TimeRange{make_date(2021, 1, 1), make_date(2021, 12, 30)}, 150.0);
    const auto plan = loader.plan(make_product("pleiades", {"B0", "PAN"}), q);
    REQUIRE(plan.bands() == std::vector<std::string>{"B0", "PAN"});
}

TEST_CASE("loader_rejects_bands_the_product_lacks") {
    auto fake = mozambique_service();
    loader::TimeSeriesLoader loader(fake, fast_retry());
    REQUIRE_THROWS_AS(loader.plan(make_product("pleiades", {"B0", "PAN"}), mozambique_query()), LoadError);
}

TEST_CASE("loader_propagates_rejected_credentials") {
    auto fake = mozambique_service();
    fake->reject_credentials = true;
    loader::TimeSeriesLoader loader(fake, fast_retry());
    REQUIRE_THROWS_AS(loader.load(make_product("pleiades", kBands), mozambique_query()), AuthError);
}

TEST_CASE("loader_honours_cancellation") {
    auto fake = mozambique_service();
    loader::TimeSeriesLoader loader(fake, fast_retry(), 2);
    const auto product = make_product("pleiades", kBands);

    std::atomic<bool> stop{true};
    REQUIRE_THROWS_AS(loader.load(product, mozambique_query(), &stop), StopRequested);
    REQUIRE(fake->acquisition_calls.load() == 0);

    stop = false;
    fake->on_fetch = [&stop]() { stop = true; };
    REQUIRE_THROWS_AS(loader.load(product, mozambique_query(), &stop), StopRequested);
    REQUIRE(fake->fetch_calls.load() < 10);
}

TEST_CASE("loader_attaches_request_context_to_rejected_band_fetches") {
    auto fake = mozambique_service();
    fake->reject_fetch_token = true;
    loader::TimeSeriesLoader loader(fake, fast_retry(), 2);

    try {
        loader.load(make_product("pleiades", kBands), mozambique_query());
        FAIL("expected AuthError");
    } catch (const AuthError& e) {
        REQUIRE_FALSE(e.context().empty());
        REQUIRE(e.context().collection_id == "pleiades");
        REQUIRE(e.context().bbox.has_value());
        REQUIRE(e.context().time_range.has_value());
        REQUIRE(e.context().timestamp.has_value());
        const std::string msg = e.what();
        REQUIRE(msg.find("token rejected") != std::string::npos);
        REQUIRE(msg.find("Auth error: Auth error") == std::string::npos);
    }
}

TEST_CASE("loader_runs_band_fetches_concurrently_up_to_the_worker_limit") {
    auto fake = mozambique_service();
    fake->fetch_delay = std::chrono::milliseconds(20);
    loader::TimeSeriesLoader loader(fake, fast_retry(), 3);

    const auto result = loader.load(make_product("pleiades", kBands), mozambique_query());
    REQUIRE(result.stack.size() == 2);
    REQUIRE(fake->max_fetches_in_flight.load() >= 2);
    REQUIRE(fake->max_fetches_in_flight.load() <= 3);
}
