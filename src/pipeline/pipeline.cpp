#include "pan_series/pipeline/pipeline.hpp"
#include "pan_series/catalog/catalog_resolver.hpp"
#include "pan_series/catalog/collection_adapter.hpp"
#include "pan_series/core/parallel.hpp"
#include "pan_series/core/utils.hpp"
#include "pan_series/fusion/pan_sharpen.hpp"
#include "pan_series/fusion/rescale.hpp"
#include "pan_series/io/raster_exporter.hpp"
#include "pan_series/loader/time_series_loader.hpp"
#include "pan_series/service/http_imagery_service.hpp"

#include <algorithm>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <system_error>

namespace pan_series::pipeline {

using core::json;

namespace {

service::RetryPolicy to_retry_policy(const config::RetryConfig& r) {
    service::RetryPolicy policy;
    policy.max_attempts = r.max_attempts;
    policy.initial_backoff = std::chrono::milliseconds(r.initial_backoff_ms);
    policy.max_backoff = std::chrono::milliseconds(r.max_backoff_ms);
    policy.multiplier = r.multiplier;
    return policy;
}

BBox region_bbox(const config::RegionConfig& region) {
    return BBox{region.bbox[0], region.bbox[1], region.bbox[2], region.bbox[3]};
}

// A date-only upper bound covers the whole day
Timestamp query_end(const std::string& s) {
    Timestamp t = parse_timestamp(s);
    if (core::trim(s).size() == 10) {
        t += std::chrono::hours(24) - std::chrono::seconds(1);
    }
    return t;
}

model::GeoQuery build_query(const config::Config& cfg, const config::RegionConfig& region) {
    std::optional<double> max_cloud;
    if (cfg.query.max_cloud_coverage >= 0.0) {
        max_cloud = cfg.query.max_cloud_coverage;
    }
    return model::GeoQuery(region_bbox(region),
                           TimeRange{parse_timestamp(cfg.query.time_from), query_end(cfg.query.time_to)},
                           cfg.query.resolution, string_to_resampling(cfg.query.resampling),
                           cfg.query.bands, max_cloud, cfg.query.crs);
}

model::CatalogFilter build_filter(const config::Config& cfg, const config::RegionConfig& region) {
    std::vector<model::AttributeConstraint> constraints;
    for (const auto& c : cfg.catalog.constellations) {
        constraints.push_back({"constellation", c});
    }
    return model::CatalogFilter(model::string_to_provider(cfg.catalog.provider), region_bbox(region),
                                std::move(constraints));
}

fusion::PanSharpenParams sharpen_params(const config::PanSharpenConfig& p) {
    fusion::PanSharpenParams params;
    params.red = p.red;
    params.green = p.green;
    params.blue = p.blue;
    params.pan = p.pan;
    params.weights.r = p.weights.r;
    params.weights.g = p.weights.g;
    params.weights.b = p.weights.b;
    params.scale = p.scale;
    return params;
}

void check_stop(const std::atomic<bool>* stop_flag) {
    if (stop_flag && stop_flag->load()) {
        throw StopRequested();
    }
}

json failure_to_json(const SceneFailure& f) {
    return {
        {"timestamp", format_iso8601(f.timestamp)},
        {"reason", f.reason},
        {"failed_bands", f.failed_bands},
        {"attempts", f.attempts}
    };
}

} // namespace

bool PipelineReport::success() const {
    return std::none_of(regions.begin(), regions.end(),
                        [](const RegionReport& r) { return r.status == "error"; });
}

size_t PipelineReport::file_count() const {
    size_t n = 0;
    for (const auto& r : regions) {
        n += r.files.size();
    }
    return n;
}

PipelineRunner::PipelineRunner(config::Config cfg, std::ostream& event_stream)
    : cfg_(std::move(cfg)), events_(event_stream) {
    cfg_.validate();
    service_ = std::make_shared<service::HttpImageryService>(config::resolve_credentials(cfg_),
                                                             cfg_.service);
}

PipelineRunner::PipelineRunner(config::Config cfg, std::shared_ptr<service::ImageryService> service,
                               std::ostream& event_stream)
    : cfg_(std::move(cfg)), service_(std::move(service)), events_(event_stream) {
    cfg_.validate();
    if (!service_) {
        throw ConfigurationError("an imagery service is required");
    }
}

PipelineReport PipelineRunner::run(std::atomic<bool>* stop_flag) {
    PipelineReport report;
    report.run_id = core::get_run_id();
    report.output_dir = cfg_.output.dir;
    products_.clear();

    events_.run_start(report.run_id, {
        {"regions", cfg_.regions.size()},
        {"output_dir", report.output_dir.string()},
        {"pansharpen", cfg_.pansharpen.enabled}
    });

    std::error_code ec;
    fs::create_directories(report.output_dir, ec);
    if (ec) {
        events_.error(report.run_id, "cannot create output directory: " + ec.message());
        events_.run_end(report.run_id, false, "error");
        throw ExportError("cannot create output directory " + report.output_dir.string() + ": " +
                          ec.message());
    }

    for (const auto& region : cfg_.regions) {
        report.regions.emplace_back();
        RegionReport& rr = report.regions.back();
        rr.name = region.name;
        try {
            run_region(report.run_id, region, rr, stop_flag);
        } catch (const StopRequested&) {
            rr.status = "error";
            rr.error = "stopped";
            events_.run_end(report.run_id, false, "stopped");
            throw;
        } catch (const AuthError& e) {
            rr.status = "error";
            rr.error = e.what();
            events_.error(report.run_id, e.what());
            events_.run_end(report.run_id, false, "auth_error");
            throw;
        } catch (const std::exception& e) {
            rr.status = "error";
            rr.error = e.what();
            events_.error(report.run_id, region.name + ": " + e.what());
            std::cerr << "[PIPELINE] region " << region.name << " failed: " << e.what() << std::endl;
        }
    }

    bool manifest_ok = true;
    if (cfg_.output.write_manifest) {
        try {
            write_manifest(report);
        } catch (const PanSeriesError& e) {
            manifest_ok = false;
            events_.error(report.run_id, e.what());
        }
    }

    const bool ok = report.success() && manifest_ok;
    const bool partial = std::any_of(report.regions.begin(), report.regions.end(),
                                     [](const RegionReport& r) { return r.status != "ok"; });
    events_.run_end(report.run_id, ok, !ok ? "error" : (partial ? "partial" : "ok"));
    return report;
}

void PipelineRunner::run_region(const std::string& run_id, const config::RegionConfig& region,
                                RegionReport& rr, std::atomic<bool>* stop_flag) {
    const service::RetryPolicy retry = to_retry_policy(cfg_.retry);
    const std::string name = core::sanitize_name(region.name);
    const fs::path out_dir(cfg_.output.dir);
    Phase phase = Phase::RESOLVE_CATALOG;

    try {
        check_stop(stop_flag);
        events_.phase_start(run_id, Phase::RESOLVE_CATALOG, region.name);
        const model::GeoQuery query = build_query(cfg_, region);
        std::string collection_id = cfg_.catalog.collection_id;
        if (collection_id.empty()) {
            catalog::CatalogResolver resolver(service_, retry, cfg_.catalog.max_pages);
            const auto collections = resolver.resolve(build_filter(cfg_, region));
            if (collections.empty()) {
                RequestContext ctx;
                ctx.bbox = query.bbox();
                throw CollectionNotFoundError("no collection matches the catalog filter", ctx);
            }
            collection_id = catalog::select_collection(collections, cfg_.catalog.collection_name).id;
            events_.phase_end(run_id, Phase::RESOLVE_CATALOG, region.name, "ok",
                              {{"collections", collections.size()}, {"collection_id", collection_id}});
        } else {
            events_.phase_end(run_id, Phase::RESOLVE_CATALOG, region.name, "skipped");
        }
        rr.collection_id = collection_id;

        check_stop(stop_flag);
        phase = Phase::RESOLVE_COLLECTION;
        events_.phase_start(run_id, phase, region.name);
        auto cached = products_.find(collection_id);
        if (cached == products_.end()) {
            catalog::CollectionAdapter adapter(service_, retry);
            cached = products_.emplace(collection_id, adapter.resolve(collection_id)).first;
        }
        const model::Product& product = cached->second;
        events_.phase_end(run_id, phase, region.name, "ok", {{"bands", product.band_names()}});

        phase = Phase::LOAD;
        events_.phase_start(run_id, phase, region.name);
        loader::TimeSeriesLoader loader(service_, retry, cfg_.loader.parallel_workers);
        const loader::LoadResult loaded = loader.load(product, query, stop_flag);
        rr.scenes_loaded = loaded.stack.size();
        rr.scene_failures = loaded.failures;
        for (const auto& f : loaded.failures) {
            events_.scene_failure(run_id, region.name, f.timestamp, f.reason);
        }
        if (!loaded.failures.empty() && !cfg_.pipeline.allow_partial) {
            RequestContext ctx;
            ctx.bbox = query.bbox();
            ctx.time_range = query.time();
            ctx.collection_id = collection_id;
            throw LoadError(std::to_string(loaded.failures.size()) +
                                " scene(s) failed and partial stacks are not accepted",
                            ctx, loaded.failures);
        }
        events_.phase_end(run_id, phase, region.name, loaded.failures.empty() ? "ok" : "partial",
                          {{"scenes", loaded.stack.size()}, {"failures", loaded.failures.size()}});

        const io::RasterExporter exporter(io::ExportOptions{cfg_.output.tile_size, cfg_.output.compression});
        std::mutex report_mutex;

        // Writes `count` files in parallel; a failed file is recorded and skipped
        auto export_files = [&](const std::string& kind, size_t count,
                                const std::function<Timestamp(size_t)>& timestamp_of,
                                const std::function<fs::path(size_t)>& path_of,
                                const std::function<void(size_t, const fs::path&)>& write) {
            const int workers = core::compute_io_worker_count(cfg_.output.parallel_exports, count);
            core::run_parallel(count, workers, [&](size_t i) {
                check_stop(stop_flag);
                const fs::path path = path_of(i);
                try {
                    write(i, path);
                    ExportedFile file{region.name, kind, timestamp_of(i), path, core::sha256_file(path)};
                    std::lock_guard<std::mutex> lock(report_mutex);
                    rr.files.push_back(std::move(file));
                } catch (const PanSeriesError& e) {
                    std::lock_guard<std::mutex> lock(report_mutex);
                    rr.export_errors.push_back(e.what());
                    events_.export_error(run_id, region.name, path.string(), e.what());
                }
            });
        };

        bool fusion_failed = false;
        std::optional<model::RasterStack> display_source;
        std::vector<std::string> display_bands{cfg_.pansharpen.red, cfg_.pansharpen.green,
                                               cfg_.pansharpen.blue};

        check_stop(stop_flag);
        phase = Phase::PANSHARPEN;
        events_.phase_start(run_id, phase, region.name);
        if (cfg_.pansharpen.enabled) {
            try {
                display_source = fusion::sharpen(loaded.stack, sharpen_params(cfg_.pansharpen),
                                                 cfg_.loader.parallel_workers);
                display_bands = display_source->band_names();
                events_.phase_end(run_id, phase, region.name, "ok");
            } catch (const FusionError& e) {
                fusion_failed = true;
                rr.error = e.what();
                events_.phase_end(run_id, phase, region.name, "error", {{"error", e.what()}});
            }
        } else {
            display_source = loaded.stack;
            events_.phase_end(run_id, phase, region.name, "skipped");
        }

        check_stop(stop_flag);
        phase = Phase::EXPORT_ANALYSIS;
        events_.phase_start(run_id, phase, region.name);
        if (cfg_.output.write_analysis) {
            const model::RasterStack& stack = loaded.stack;
            const std::vector<std::string> bands =
                cfg_.output.analysis_bands.empty() ? stack.band_names() : cfg_.output.analysis_bands;
            const size_t errors_before = rr.export_errors.size();
            export_files(
                "analysis", stack.size(),
                [&](size_t i) { return stack.scenes()[i].timestamp; },
                [&](size_t i) { return out_dir / io::analysis_filename(name, stack.scenes()[i].timestamp); },
                [&](size_t i, const fs::path& path) {
                    exporter.export_scene(stack.scenes()[i], stack.grid(), bands, stack.nodata(), path,
                                          cfg_.output.overwrite);
                });
            events_.phase_end(run_id, phase, region.name,
                              rr.export_errors.size() == errors_before ? "ok" : "partial");
        } else {
            events_.phase_end(run_id, phase, region.name, "skipped");
        }

        if (display_source && cfg_.output.write_display) {
            check_stop(stop_flag);
            phase = Phase::RESCALE;
            events_.phase_start(run_id, phase, region.name);
            const model::IntStack display =
                fusion::rescale(*display_source, cfg_.rescale.domain_max, cfg_.rescale.out_max);
            events_.phase_end(run_id, phase, region.name, "ok",
                              {{"element_type", data_type_to_string(display.element_type())}});

            check_stop(stop_flag);
            phase = Phase::EXPORT_DISPLAY;
            events_.phase_start(run_id, phase, region.name);
            const size_t errors_before = rr.export_errors.size();
            export_files(
                "display", display.size(),
                [&](size_t i) { return display.scenes()[i].timestamp; },
                [&](size_t i) { return out_dir / io::display_filename(name, display.scenes()[i].timestamp); },
                [&](size_t i, const fs::path& path) {
                    exporter.export_scene(display.scenes()[i], display.grid(), display_bands,
                                          display.element_type(), path, cfg_.output.overwrite);
                });
            events_.phase_end(run_id, phase, region.name,
                              rr.export_errors.size() == errors_before ? "ok" : "partial");
        } else {
            events_.phase_start(run_id, Phase::RESCALE, region.name);
            events_.phase_end(run_id, Phase::RESCALE, region.name, "skipped");
            events_.phase_start(run_id, Phase::EXPORT_DISPLAY, region.name);
            events_.phase_end(run_id, Phase::EXPORT_DISPLAY, region.name, "skipped");
        }

        std::sort(rr.files.begin(), rr.files.end(), [](const ExportedFile& a, const ExportedFile& b) {
            if (a.kind != b.kind) return a.kind < b.kind;
            return a.timestamp < b.timestamp;
        });
        const bool degraded = fusion_failed || !rr.scene_failures.empty() || !rr.export_errors.empty();
        rr.status = degraded ? "partial" : "ok";
    } catch (const StopRequested&) {
        throw;
    } catch (const std::exception& e) {
        events_.phase_end(run_id, phase, region.name, "error", {{"error", e.what()}});
        throw;
    }
}

fs::path write_manifest(const PipelineReport& report) {
    json files = json::array();
    json regions = json::array();
    for (const auto& r : report.regions) {
        json failures = json::array();
        for (const auto& f : r.scene_failures) {
            failures.push_back(failure_to_json(f));
        }
        regions.push_back({
            {"name", r.name},
            {"status", r.status},
            {"error", r.error},
            {"collection_id", r.collection_id},
            {"scenes_loaded", r.scenes_loaded},
            {"scene_failures", failures},
            {"export_errors", r.export_errors}
        });
        for (const auto& f : r.files) {
            files.push_back({
                {"region", f.region},
                {"kind", f.kind},
                {"date", format_date(f.timestamp)},
                {"file", f.path.filename().string()},
                {"sha256", f.sha256}
            });
        }
    }

    const json manifest = {
        {"run_id", report.run_id},
        {"created", core::get_iso_timestamp()},
        {"regions", regions},
        {"files", files}
    };
    const fs::path path = report.output_dir / "manifest.json";
    core::write_text(path, manifest.dump(2) + "\n");
    return path;
}

} // namespace pan_series::pipeline
