#include "pan_series/io/raster_exporter.hpp"
#include "pan_series/core/errors.hpp"

#include <atomic>
#include <iostream>
#include <system_error>

namespace pan_series::io {

namespace {

RequestContext scene_context(const Timestamp& ts) {
    RequestContext ctx;
    ctx.timestamp = ts;
    return ctx;
}

void check_target(const fs::path& path, bool overwrite, const RequestContext& ctx) {
    std::error_code ec;
    const fs::path parent = path.has_parent_path() ? path.parent_path() : fs::path(".");
    if (!fs::is_directory(parent, ec)) {
        throw ExportError("output directory does not exist: " + parent.string(), ctx);
    }
    if (fs::exists(path, ec)) {
        if (!overwrite) {
            throw ExportError("refusing to overwrite existing file " + path.string(), ctx);
        }
        if (fs::is_directory(path, ec)) {
            throw ExportError("target is a directory: " + path.string(), ctx);
        }
    }
}

fs::path temp_sibling(const fs::path& path) {
    static std::atomic<unsigned long> counter{0};
    fs::path tmp = path;
    tmp += ".partial" + std::to_string(counter.fetch_add(1));
    return tmp;
}

// Runs `write` against a temporary sibling and renames it over `path`
template <typename WriteFn>
void write_atomically(const fs::path& path, const RequestContext& ctx, WriteFn&& write) {
    const fs::path tmp = temp_sibling(path);
    std::error_code ec;
    try {
        write(tmp);
    } catch (const IOError& e) {
        fs::remove(tmp, ec);
        throw ExportError(std::string(e.what()), ctx);
    }
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw ExportError("cannot move " + tmp.string() + " to " + path.string() + ": " +
                              ec.message(),
                          ctx);
    }
    std::cerr << "[EXPORT] wrote " << path.string() << std::endl;
}

GeoTiffOptions tiff_options(const ExportOptions& options, const Timestamp& ts) {
    GeoTiffOptions out;
    out.tile_size = options.tile_size;
    out.compression = options.compression;
    out.metadata["ACQUISITION_DATE"] = format_date(ts);
    out.metadata["ACQUISITION_TIME"] = format_iso8601(ts);
    return out;
}

} // namespace

std::string analysis_filename(const std::string& region, const Timestamp& ts) {
    return region + "_" + format_date(ts) + ".tif";
}

std::string display_filename(const std::string& region, const Timestamp& ts) {
    return region + "_" + format_date(ts) + "_rgb.tif";
}

RasterExporter::RasterExporter(ExportOptions options) : options_(std::move(options)) {
    if (options_.tile_size < 16 || (options_.tile_size & (options_.tile_size - 1)) != 0) {
        throw ValidationError("tile_size must be a power of two >= 16");
    }
}

void RasterExporter::export_scene(const model::Scene& scene, const Grid& grid,
                                  const std::vector<std::string>& band_order,
                                  const std::map<std::string, float>& nodata,
                                  const fs::path& path, bool overwrite) const {
    const RequestContext ctx = scene_context(scene.timestamp);
    if (band_order.empty()) {
        throw ExportError("no bands selected for export", ctx);
    }
    check_target(path, overwrite, ctx);

    std::vector<const Matrix2Df*> bands;
    std::vector<float> nd;
    for (const auto& name : band_order) {
        auto it = scene.bands.find(name);
        if (it == scene.bands.end()) {
            throw ExportError("scene has no band '" + name + "'", ctx);
        }
        bands.push_back(&it->second);
        auto nit = nodata.find(name);
        nd.push_back(nit == nodata.end() ? 0.0f : nit->second);
    }

    const GeoTiffOptions opts = tiff_options(options_, scene.timestamp);
    write_atomically(path, ctx, [&](const fs::path& tmp) {
        write_geotiff_float(tmp, grid, band_order, bands, nd, opts);
    });
}

void RasterExporter::export_scene(const model::IntScene& scene, const Grid& grid,
                                  const std::vector<std::string>& band_order, DataType type,
                                  const fs::path& path, bool overwrite) const {
    const RequestContext ctx = scene_context(scene.timestamp);
    if (band_order.empty()) {
        throw ExportError("no bands selected for export", ctx);
    }
    if (type == DataType::FLOAT32) {
        throw ExportError("display export requires an integer element type", ctx);
    }
    check_target(path, overwrite, ctx);

    std::vector<const Matrix2Du16*> bands;
    for (const auto& name : band_order) {
        auto it = scene.bands.find(name);
        if (it == scene.bands.end()) {
            throw ExportError("scene has no band '" + name + "'", ctx);
        }
        bands.push_back(&it->second);
    }

    const GeoTiffOptions opts = tiff_options(options_, scene.timestamp);
    write_atomically(path, ctx, [&](const fs::path& tmp) {
        write_geotiff_uint(tmp, grid, band_order, bands, type, opts);
    });
}

} // namespace pan_series::io
