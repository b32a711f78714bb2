#include "pan_series/loader/time_series_loader.hpp"
#include "pan_series/core/parallel.hpp"
#include "pan_series/core/utils.hpp"
#include "pan_series/geo/grid.hpp"
#include "pan_series/geo/resample.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>
#include <optional>

namespace pan_series::loader {

namespace {

// Result of one (timestamp, band) fetch; each slot has a single writer
struct BandSlot {
    std::optional<Matrix2Df> values;
    std::string error;
    int attempts = 0;
    bool skipped = false;
};

} // namespace

LoadPlan::LoadPlan(std::shared_ptr<service::ImageryService> service, service::RetryPolicy retry,
                   int workers, model::Product product, model::GeoQuery query, Grid grid,
                   std::vector<std::string> bands)
    : service_(std::move(service)), retry_(retry), workers_(workers), product_(std::move(product)),
      query_(std::move(query)), grid_(std::move(grid)), bands_(std::move(bands)) {}

RequestContext LoadPlan::context() const {
    RequestContext ctx;
    ctx.bbox = query_.bbox();
    ctx.time_range = query_.time();
    ctx.collection_id = product_.collection_id;
    return ctx;
}

std::vector<service::Acquisition> LoadPlan::enumerate(const RequestContext& ctx) const {
    std::vector<service::Acquisition> found;
    try {
        found = service::with_retry(retry_, [&]() {
            return service_->search_acquisitions(product_.collection_id, query_);
        });
    } catch (const AuthError& e) {
        throw AuthError(e, ctx);
    } catch (const TransportError& e) {
        throw LoadError(std::string("acquisition search failed: ") + e.what(), ctx);
    }

    std::vector<service::Acquisition> kept;
    kept.reserve(found.size());
    for (auto& acq : found) {
        if (!query_.time().contains(acq.timestamp)) {
            continue;
        }
        if (query_.max_cloud_coverage() && acq.cloud_coverage &&
            *acq.cloud_coverage > *query_.max_cloud_coverage()) {
            continue;
        }
        kept.push_back(std::move(acq));
    }

    std::stable_sort(kept.begin(), kept.end(),
                     [](const service::Acquisition& a, const service::Acquisition& b) {
                         return a.timestamp < b.timestamp;
                     });
    // Several tiles of one pass share a timestamp; the first one stands for it
    kept.erase(std::unique(kept.begin(), kept.end(),
                           [](const service::Acquisition& a, const service::Acquisition& b) {
                               return a.timestamp == b.timestamp;
                           }),
               kept.end());
    return kept;
}

LoadResult LoadPlan::materialize(std::atomic<bool>* stop_flag) const {
    const RequestContext ctx = context();
    auto stop_requested = [&]() { return stop_flag && stop_flag->load(); };

    if (stop_requested()) {
        throw StopRequested();
    }

    const std::vector<service::Acquisition> acquisitions = enumerate(ctx);
    if (acquisitions.empty()) {
        throw LoadError("no acquisitions in the requested window", ctx);
    }

    const size_t n_bands = bands_.size();
    const size_t n_tasks = acquisitions.size() * n_bands;
    std::vector<BandSlot> slots(n_tasks);
    std::mutex log_mutex;

    // Fetches wait on the network, so the pool is not tied to the core count
    const int workers = core::compute_io_worker_count(workers_, n_tasks);
    std::cerr << "[LOAD] " << acquisitions.size() << " acquisitions x " << n_bands
              << " bands on a " << grid_.rows << "x" << grid_.cols << " grid, "
              << workers << " workers" << std::endl;

    core::run_parallel(n_tasks, workers, [&](size_t task) {
        BandSlot& slot = slots[task];
        if (stop_requested()) {
            slot.skipped = true;
            return;
        }

        const service::Acquisition& acq = acquisitions[task / n_bands];
        const std::string& band_name = bands_[task % n_bands];
        const model::Band* band = product_.find_band(band_name);

        service::BandRequest req;
        req.collection_id = product_.collection_id;
        req.band = band_name;
        req.type = band ? band->type : DataType::FLOAT32;
        req.timestamp = acq.timestamp;
        req.bbox = query_.bbox();
        req.target_grid = grid_;
        req.resampling = query_.resampling();

        try {
            service::BandRaster raster = service::with_retry(
                retry_, [&]() { return service_->fetch_band(req); }, stop_flag, &slot.attempts);

            if (raster.values.size() == 0) {
                throw IOError("service returned an empty raster");
            }
            if (!grid_.same_shape(static_cast<int>(raster.values.rows()),
                                  static_cast<int>(raster.values.cols()))) {
                slot.values = geo::resample(raster.values, grid_.rows, grid_.cols, query_.resampling(),
                                            band ? band->nodata : 0.0f);
            } else {
                slot.values = std::move(raster.values);
            }
        } catch (const AuthError& e) {
            RequestContext fetch_ctx = ctx;
            fetch_ctx.timestamp = acq.timestamp;
            throw AuthError(e, std::move(fetch_ctx));
        } catch (const std::exception& e) {
            slot.error = e.what();
            std::lock_guard<std::mutex> lock(log_mutex);
            std::cerr << "[LOAD] " << format_iso8601(acq.timestamp) << " band " << band_name
                      << " failed after " << slot.attempts << " attempt(s): " << e.what() << std::endl;
        }
    });

    if (stop_requested()) {
        throw StopRequested();
    }

    std::vector<model::Scene> scenes;
    std::vector<SceneFailure> failures;
    for (size_t a = 0; a < acquisitions.size(); ++a) {
        const service::Acquisition& acq = acquisitions[a];
        model::Scene scene;
        scene.timestamp = acq.timestamp;
        scene.cloud_coverage = acq.cloud_coverage;

        SceneFailure failure;
        failure.timestamp = acq.timestamp;
        std::vector<std::string> reasons;

        for (size_t b = 0; b < n_bands; ++b) {
            BandSlot& slot = slots[a * n_bands + b];
            failure.attempts = std::max(failure.attempts, slot.attempts);
            if (slot.values) {
                scene.bands.emplace(bands_[b], std::move(*slot.values));
            } else {
                failure.failed_bands.push_back(bands_[b]);
                reasons.push_back(bands_[b] + ": " + (slot.skipped ? "not fetched" : slot.error));
            }
        }

        if (failure.failed_bands.empty()) {
            scenes.push_back(std::move(scene));
        } else {
            failure.reason = core::join(reasons, "; ");
            failures.push_back(std::move(failure));
        }
    }

    if (scenes.empty()) {
        throw LoadError("all " + std::to_string(acquisitions.size()) + " scenes failed", ctx,
                        std::move(failures));
    }

    std::map<std::string, float> nodata;
    for (const auto& name : bands_) {
        const model::Band* band = product_.find_band(name);
        nodata[name] = band ? band->nodata : 0.0f;
    }

    std::cerr << "[LOAD] " << scenes.size() << " scenes loaded, " << failures.size()
              << " failed" << std::endl;

    return LoadResult{model::RasterStack(std::move(scenes), grid_, bands_, std::move(nodata)),
                      std::move(failures)};
}

TimeSeriesLoader::TimeSeriesLoader(std::shared_ptr<service::ImageryService> service,
                                   service::RetryPolicy retry, int parallel_workers)
    : service_(std::move(service)), retry_(retry), workers_(parallel_workers) {
    if (!service_) {
        throw ValidationError("loader needs an imagery service");
    }
    if (workers_ < 1) {
        throw ValidationError("loader needs at least one worker");
    }
}

LoadPlan TimeSeriesLoader::plan(const model::Product& product, const model::GeoQuery& query) const {
    RequestContext ctx;
    ctx.bbox = query.bbox();
    ctx.time_range = query.time();
    ctx.collection_id = product.collection_id;

    std::vector<std::string> bands = query.bands().empty() ? product.band_names() : query.bands();
    if (bands.empty()) {
        throw LoadError("product declares no bands", ctx);
    }
    for (const auto& name : bands) {
        if (!product.find_band(name)) {
            throw LoadError("band '" + name + "' is not part of the product", ctx);
        }
    }

    Grid grid = geo::make_target_grid(query);
    return LoadPlan(service_, retry_, workers_, product, query, std::move(grid), std::move(bands));
}

LoadResult TimeSeriesLoader::load(const model::Product& product, const model::GeoQuery& query,
                                  std::atomic<bool>* stop_flag) const {
    return plan(product, query).materialize(stop_flag);
}

} // namespace pan_series::loader
