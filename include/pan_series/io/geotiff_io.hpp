#pragma once

#include "pan_series/core/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pan_series::io {

struct GeoTiffOptions {
    int tile_size = 512;
    std::string compression = "DEFLATE"; // NONE | LZW | DEFLATE
    std::map<std::string, std::string> metadata;
};

// Fully decoded raster, every band promoted to float
struct GeoTiffImage {
    Grid grid;
    DataType type = DataType::FLOAT32;
    std::vector<std::string> band_names;
    std::vector<Matrix2Df> bands;
    std::vector<std::optional<double>> nodata;
    std::map<std::string, std::string> metadata;
};

// Writes a tiled cloud-optimized GeoTIFF. Band i is named names[i]. Throws
// IOError when GDAL cannot create or fill the file.
void write_geotiff_float(const fs::path& path, const Grid& grid,
                         const std::vector<std::string>& names,
                         const std::vector<const Matrix2Df*>& bands,
                         const std::vector<float>& nodata, const GeoTiffOptions& options);

// Integer variant; `type` selects UINT8 or UINT16 storage.
void write_geotiff_uint(const fs::path& path, const Grid& grid,
                        const std::vector<std::string>& names,
                        const std::vector<const Matrix2Du16*>& bands, DataType type,
                        const GeoTiffOptions& options);

GeoTiffImage read_geotiff(const fs::path& path);

// Decodes an in-memory GeoTIFF (e.g. an HTTP response body)
GeoTiffImage decode_geotiff(const std::string& bytes);

} // namespace pan_series::io
