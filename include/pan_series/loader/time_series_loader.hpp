#pragma once

#include "pan_series/core/errors.hpp"
#include "pan_series/model/geo_query.hpp"
#include "pan_series/model/product.hpp"
#include "pan_series/model/raster_stack.hpp"
#include "pan_series/service/imagery_service.hpp"
#include "pan_series/service/retry.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace pan_series::loader {

struct LoadResult {
    model::RasterStack stack;
    std::vector<SceneFailure> failures; // empty when every scene loaded
};

// What to load, separated from when it is fetched. Building a plan performs
// no network call; materialize() does, and may be called again to re-run the
// same load.
class LoadPlan {
public:
    const model::Product& product() const { return product_; }
    const model::GeoQuery& query() const { return query_; }
    const Grid& grid() const { return grid_; }
    const std::vector<std::string>& bands() const { return bands_; }

    // Enumerates acquisitions and fetches every (timestamp, band) pair on the
    // worker pool. Scenes with a failed band become SceneFailure entries.
    // Throws LoadError when no scene survives, AuthError when credentials are
    // rejected, and StopRequested when *stop_flag is raised (partial results
    // are discarded).
    LoadResult materialize(std::atomic<bool>* stop_flag = nullptr) const;

private:
    friend class TimeSeriesLoader;

    LoadPlan(std::shared_ptr<service::ImageryService> service, service::RetryPolicy retry,
             int workers, model::Product product, model::GeoQuery query, Grid grid,
             std::vector<std::string> bands);

    std::vector<service::Acquisition> enumerate(const RequestContext& ctx) const;
    RequestContext context() const;

    std::shared_ptr<service::ImageryService> service_;
    service::RetryPolicy retry_;
    int workers_;
    model::Product product_;
    model::GeoQuery query_;
    Grid grid_;
    std::vector<std::string> bands_;
};

class TimeSeriesLoader {
public:
    TimeSeriesLoader(std::shared_ptr<service::ImageryService> service, service::RetryPolicy retry,
                     int parallel_workers = 4);

    // Validates the band selection against the product and fixes the output
    // grid. Throws LoadError for band names the product does not carry.
    LoadPlan plan(const model::Product& product, const model::GeoQuery& query) const;

    LoadResult load(const model::Product& product, const model::GeoQuery& query,
                    std::atomic<bool>* stop_flag = nullptr) const;

private:
    std::shared_ptr<service::ImageryService> service_;
    service::RetryPolicy retry_;
    int workers_;
};

} // namespace pan_series::loader
