#pragma once

#include "pan_series/io/geotiff_io.hpp"
#include "pan_series/model/raster_stack.hpp"

#include <map>
#include <string>
#include <vector>

namespace pan_series::io {

// <region>_<YYYY-MM-DD>.tif
std::string analysis_filename(const std::string& region, const Timestamp& ts);
// <region>_<YYYY-MM-DD>_rgb.tif
std::string display_filename(const std::string& region, const Timestamp& ts);

struct ExportOptions {
    int tile_size = 512;
    std::string compression = "DEFLATE";
};

// Writes one georeferenced, tiled raster per scene. Every failure (existing
// target without overwrite, missing directory, GDAL write error) is reported
// as ExportError carrying the scene timestamp.
class RasterExporter {
public:
    explicit RasterExporter(ExportOptions options = {});

    // Float analysis variant. Bands are written in band_order.
    void export_scene(const model::Scene& scene, const Grid& grid,
                      const std::vector<std::string>& band_order,
                      const std::map<std::string, float>& nodata, const fs::path& path,
                      bool overwrite) const;

    // Integer display variant, stored as `type` (UINT8 or UINT16)
    void export_scene(const model::IntScene& scene, const Grid& grid,
                      const std::vector<std::string>& band_order, DataType type,
                      const fs::path& path, bool overwrite) const;

    const ExportOptions& options() const { return options_; }

private:
    ExportOptions options_;
};

} // namespace pan_series::io
