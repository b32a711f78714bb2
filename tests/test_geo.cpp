#include "pan_series/core/errors.hpp"
#include "pan_series/geo/grid.hpp"
#include "pan_series/geo/resample.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace pan_series;

namespace {

const BBox kMozambique{36.83, -17.7, 36.90, -17.6};
const TimeRange kYear{make_date(2021, 1, 1), make_date(2021, 12, 30)};

} // namespace

TEST_CASE("geographic_grid_converts_metres_to_degrees") {
    model::GeoQuery q(kMozambique, kYear, 150.0);
    const Grid g = geo::make_target_grid(q);

    REQUIRE(g.crs == "EPSG:4326");
    REQUIRE(g.rows == 74); // 0.1 deg * 111320 m / 150 m
    REQUIRE(g.cols >= 49);
    REQUIRE(g.cols <= 51);
    REQUIRE(g.transform[0] == Catch::Approx(36.83));
    REQUIRE(g.transform[3] == Catch::Approx(-17.6));
    REQUIRE(g.transform[1] * g.cols == Catch::Approx(0.07));
    REQUIRE(g.transform[5] * g.rows == Catch::Approx(-0.1));
}

TEST_CASE("grid_bounds_recovers_the_query_bbox") {
    const Grid g = geo::make_target_grid(model::GeoQuery(kMozambique, kYear, 150.0));
    const BBox b = geo::grid_bounds(g);
    REQUIRE(b.min_lon == Catch::Approx(kMozambique.min_lon));
    REQUIRE(b.min_lat == Catch::Approx(kMozambique.min_lat));
    REQUIRE(b.max_lon == Catch::Approx(kMozambique.max_lon));
    REQUIRE(b.max_lat == Catch::Approx(kMozambique.max_lat));
}

TEST_CASE("tiny_bbox_still_yields_one_pixel") {
    const Grid g = geo::make_target_grid(model::GeoQuery(BBox{10.0, 10.0, 10.00001, 10.00001}, kYear, 500.0));
    REQUIRE(g.rows == 1);
    REQUIRE(g.cols == 1);
}

TEST_CASE("oversized_grid_is_rejected") {
    REQUIRE_THROWS_AS(geo::make_target_grid(model::GeoQuery(kMozambique, kYear, 0.01)), ValidationError);
}

TEST_CASE("projected_grid_uses_crs_units") {
    model::GeoQuery q(kMozambique, kYear, 10.0, Resampling::NEAREST, {}, std::nullopt, "EPSG:32737");
    const Grid g = geo::make_target_grid(q);
    REQUIRE(g.crs == "EPSG:32737");
    REQUIRE(g.transform[1] == 10.0);
    REQUIRE(g.transform[5] == -10.0);
    // roughly 7.4 km x 11.1 km
    REQUIRE(g.cols > 700);
    REQUIRE(g.cols < 800);
    REQUIRE(g.rows > 1050);
    REQUIRE(g.rows < 1180);
}

TEST_CASE("resample_nearest_replicates_pixels") {
    Matrix2Df src(2, 2);
    src << 1.0f, 2.0f,
           3.0f, 4.0f;
    const Matrix2Df out = geo::resample(src, 4, 4, Resampling::NEAREST);
    REQUIRE(out.rows() == 4);
    REQUIRE(out.cols() == 4);
    REQUIRE(out(0, 0) == 1.0f);
    REQUIRE(out(1, 1) == 1.0f);
    REQUIRE(out(0, 3) == 2.0f);
    REQUIRE(out(3, 0) == 3.0f);
    REQUIRE(out(3, 3) == 4.0f);
}

TEST_CASE("resample_preserves_constant_fields") {
    const Matrix2Df src = Matrix2Df::Constant(5, 7, 1234.0f);
    for (Resampling m : {Resampling::NEAREST, Resampling::BILINEAR, Resampling::BICUBIC}) {
        const Matrix2Df out = geo::resample(src, 10, 14, m);
        REQUIRE(out.rows() == 10);
        REQUIRE(out.cols() == 14);
        REQUIRE(out.minCoeff() == Catch::Approx(1234.0f).epsilon(1e-4));
        REQUIRE(out.maxCoeff() == Catch::Approx(1234.0f).epsilon(1e-4));
    }
}

TEST_CASE("resample_same_shape_is_a_copy_and_bad_targets_throw") {
    Matrix2Df src = Matrix2Df::Random(3, 3);
    REQUIRE(geo::resample(src, 3, 3, Resampling::BICUBIC) == src);
    REQUIRE_THROWS_AS(geo::resample(src, 0, 3, Resampling::NEAREST), ValidationError);
    REQUIRE_THROWS_AS(geo::resample(Matrix2Df(), 3, 3, Resampling::NEAREST), ValidationError);
}

TEST_CASE("resample_keeps_nodata_out_of_interpolated_pixels") {
    Matrix2Df src = Matrix2Df::Constant(4, 4, 100.0f);
    src(0, 0) = 0.0f; // nodata
    for (Resampling m : {Resampling::BILINEAR, Resampling::BICUBIC}) {
        const Matrix2Df out = geo::resample(src, 8, 8, m, 0.0f);
        REQUIRE(out(0, 0) == 0.0f);
        REQUIRE(out(7, 7) == Catch::Approx(100.0f).epsilon(1e-4));
        for (Eigen::Index i = 0; i < out.size(); ++i) {
            const float v = out.data()[i];
            const bool is_nodata = v == 0.0f;
            const bool is_valid = v == Catch::Approx(100.0f).epsilon(1e-4);
            REQUIRE((is_nodata || is_valid));
        }
    }
}

TEST_CASE("resample_bicubic_stays_within_source_range") {
    Matrix2Df src(4, 8);
    src.leftCols(4).setConstant(10.0f);
    src.rightCols(4).setConstant(100.0f);
    const Matrix2Df out = geo::resample(src, 8, 16, Resampling::BICUBIC);
    REQUIRE(out.minCoeff() >= 10.0f);
    REQUIRE(out.maxCoeff() <= 100.0f);
}
