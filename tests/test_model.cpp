#include "pan_series/core/errors.hpp"
#include "pan_series/model/catalog_filter.hpp"
#include "pan_series/model/geo_query.hpp"
#include "pan_series/model/product.hpp"
#include "pan_series/model/raster_stack.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace pan_series;

namespace {

const BBox kMozambique{36.83, -17.7, 36.90, -17.6};

TimeRange year_2021() {
    return TimeRange{make_date(2021, 1, 1), make_date(2021, 12, 30)};
}

Grid small_grid(int rows, int cols) {
    Grid g;
    g.rows = rows;
    g.cols = cols;
    return g;
}

model::Scene scene_on(const Timestamp& ts, int rows, int cols, const std::vector<std::string>& bands) {
    model::Scene s;
    s.timestamp = ts;
    for (const auto& b : bands) {
        s.bands.emplace(b, Matrix2Df::Zero(rows, cols));
    }
    return s;
}

} // namespace

TEST_CASE("geo_query_keeps_its_parameters") {
    model::GeoQuery q(kMozambique, year_2021(), 1.5, Resampling::BICUBIC, {"B0", "PAN"}, 0.2);
    REQUIRE(q.resolution() == 1.5);
    REQUIRE(q.resampling() == Resampling::BICUBIC);
    REQUIRE(q.bands().size() == 2);
    REQUIRE(*q.max_cloud_coverage() == 0.2);
    REQUIRE(q.crs() == "EPSG:4326");
    REQUIRE(q.is_geographic());
    REQUIRE_FALSE(model::GeoQuery(kMozambique, year_2021(), 10.0, Resampling::NEAREST, {}, std::nullopt,
                                  "EPSG:32737")
                      .is_geographic());
}

TEST_CASE("geo_query_rejects_invalid_input") {
    REQUIRE_THROWS_AS(model::GeoQuery(BBox{36.9, -17.7, 36.83, -17.6}, year_2021(), 1.5), ValidationError);
    REQUIRE_THROWS_AS(model::GeoQuery(kMozambique, TimeRange{make_date(2022, 1, 1), make_date(2021, 1, 1)}, 1.5),
                      ValidationError);
    REQUIRE_THROWS_AS(model::GeoQuery(kMozambique, year_2021(), 0.0), ValidationError);
    REQUIRE_THROWS_AS(model::GeoQuery(kMozambique, year_2021(), 1.5, Resampling::NEAREST, {}, 1.5),
                      ValidationError);
    REQUIRE_THROWS_AS(model::GeoQuery(kMozambique, year_2021(), 1.5, Resampling::NEAREST, {"B0", "B0"}),
                      ValidationError);
    REQUIRE_THROWS_AS(model::GeoQuery(BBox{170.0, 0.0, 190.0, 1.0}, year_2021(), 1.5), ValidationError);
}

TEST_CASE("time_range_is_inclusive") {
    const TimeRange r = year_2021();
    REQUIRE(r.contains(make_date(2021, 1, 1)));
    REQUIRE(r.contains(make_date(2021, 12, 30)));
    REQUIRE_FALSE(r.contains(make_date(2021, 12, 31)));
}

TEST_CASE("raster_stack_accepts_ordered_aligned_scenes") {
    const std::vector<std::string> bands{"B0", "PAN"};
    model::RasterStack stack({scene_on(make_date(2021, 2, 26), 3, 4, bands),
                              scene_on(make_date(2021, 6, 29), 3, 4, bands)},
                             small_grid(3, 4), bands, {{"B0", 0.0f}, {"PAN", 65535.0f}});
    REQUIRE(stack.size() == 2);
    REQUIRE(stack.has_band("PAN"));
    REQUIRE_FALSE(stack.has_band("B3"));
    REQUIRE(stack.nodata_for("PAN") == 65535.0f);
    REQUIRE(stack.nodata_for("unknown") == 0.0f);
}

TEST_CASE("raster_stack_rejects_unordered_or_duplicate_timestamps") {
    const std::vector<std::string> bands{"B0"};
    REQUIRE_THROWS_AS(model::RasterStack({scene_on(make_date(2021, 6, 29), 2, 2, bands),
                                          scene_on(make_date(2021, 2, 26), 2, 2, bands)},
                                         small_grid(2, 2), bands, {}),
                      ValidationError);
    REQUIRE_THROWS_AS(model::RasterStack({scene_on(make_date(2021, 2, 26), 2, 2, bands),
                                          scene_on(make_date(2021, 2, 26), 2, 2, bands)},
                                         small_grid(2, 2), bands, {}),
                      ValidationError);
}

TEST_CASE("raster_stack_rejects_bands_off_the_grid") {
    const std::vector<std::string> bands{"B0", "PAN"};
    model::Scene s = scene_on(make_date(2021, 2, 26), 2, 2, bands);
    s.bands["PAN"] = Matrix2Df::Zero(4, 4);
    REQUIRE_THROWS_AS(model::RasterStack({s}, small_grid(2, 2), bands, {}), ValidationError);

    model::Scene missing = scene_on(make_date(2021, 2, 26), 2, 2, {"B0"});
    REQUIRE_THROWS_AS(model::RasterStack({missing}, small_grid(2, 2), bands, {}), ValidationError);
}

TEST_CASE("int_stack_checks_element_width") {
    REQUIRE_THROWS_AS(model::IntStack({}, small_grid(1, 1), {"R"}, DataType::UINT8, 1000), ValidationError);
    REQUIRE_THROWS_AS(model::IntStack({}, small_grid(1, 1), {"R"}, DataType::FLOAT32, 255), ValidationError);
    REQUIRE(model::IntStack({}, small_grid(1, 1), {"R"}, DataType::UINT16, 4095).out_max() == 4095);
}

TEST_CASE("catalog_filter_request_shape") {
    model::CatalogFilter filter(model::Provider::AIRBUS, kMozambique, {{"constellation", "PHR"}});
    const auto j = filter.to_request_json();
    REQUIRE(j["provider"] == "AIRBUS");
    REQUIRE(j["bounds"]["bbox"].size() == 4);
    REQUIRE(j["bounds"]["bbox"][0] == 36.83);
    REQUIRE(j["bounds"]["bbox"][3] == -17.6);
    REQUIRE(j["data"][0]["constellation"] == "PHR");
}

TEST_CASE("catalog_filter_validates_input") {
    REQUIRE(model::string_to_provider("airbus") == model::Provider::AIRBUS);
    REQUIRE_THROWS_AS(model::string_to_provider("acme"), ValidationError);
    REQUIRE_THROWS_AS(model::CatalogFilter(model::Provider::PLANET, BBox{1, 1, 0, 0}, {}), ValidationError);
    REQUIRE_THROWS_AS(model::CatalogFilter(model::Provider::MAXAR, kMozambique, {{"", "PHR"}}), ValidationError);
}

TEST_CASE("product_band_lookup") {
    model::Product p;
    p.bands = {{"B0", "DN", DataType::UINT16, 0.0f}, {"PAN", "DN", DataType::UINT16, 0.0f}};
    REQUIRE(p.find_band("PAN") != nullptr);
    REQUIRE(p.find_band("B9") == nullptr);
    REQUIRE(p.band_names() == std::vector<std::string>{"B0", "PAN"});
}
