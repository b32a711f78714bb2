#include "pan_series/io/geotiff_io.hpp"
#include "pan_series/core/errors.hpp"
#include "pan_series/core/utils.hpp"

#include <cpl_conv.h>
#include <cpl_string.h>
#include <cpl_vsi.h>
#include <gdal_priv.h>
#include <ogr_spatialref.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>

namespace pan_series::io {

namespace {

struct DatasetCloser {
    void operator()(GDALDataset* ds) const {
        if (ds) GDALClose(GDALDataset::ToHandle(ds));
    }
};

using DatasetPtr = std::unique_ptr<GDALDataset, DatasetCloser>;

void ensure_gdal_registered() {
    static std::once_flag once;
    std::call_once(once, []() { GDALAllRegister(); });
}

GDALDataType to_gdal_type(DataType type) {
    switch (type) {
        case DataType::UINT8: return GDT_Byte;
        case DataType::UINT16: return GDT_UInt16;
        case DataType::FLOAT32: return GDT_Float32;
        default: return GDT_Float32;
    }
}

DataType from_gdal_type(GDALDataType type) {
    switch (type) {
        case GDT_Byte: return DataType::UINT8;
        case GDT_UInt16: return DataType::UINT16;
        default: return DataType::FLOAT32;
    }
}

std::string crs_to_wkt(const std::string& crs) {
    OGRSpatialReference srs;
    if (srs.SetFromUserInput(crs.c_str()) != OGRERR_NONE) {
        throw IOError("unsupported crs '" + crs + "'");
    }
    char* wkt = nullptr;
    if (srs.exportToWkt(&wkt) != OGRERR_NONE || !wkt) {
        CPLFree(wkt);
        throw IOError("cannot export crs '" + crs + "' to WKT");
    }
    std::string out(wkt);
    CPLFree(wkt);
    return out;
}

// "EPSG:<code>" when identifiable, the raw WKT otherwise
std::string wkt_to_crs(const char* wkt) {
    if (!wkt || !*wkt) {
        return "";
    }
    OGRSpatialReference srs;
    if (srs.importFromWkt(wkt) != OGRERR_NONE) {
        return wkt;
    }
    srs.AutoIdentifyEPSG();
    const char* name = srs.GetAuthorityName(nullptr);
    const char* code = srs.GetAuthorityCode(nullptr);
    if (name && code) {
        return std::string(name) + ":" + code;
    }
    return wkt;
}

DatasetPtr create_mem_dataset(const Grid& grid, int band_count, DataType type) {
    ensure_gdal_registered();
    GDALDriver* mem = GetGDALDriverManager()->GetDriverByName("MEM");
    if (!mem) {
        throw IOError("GDAL MEM driver not available");
    }
    DatasetPtr ds(mem->Create("", grid.cols, grid.rows, band_count, to_gdal_type(type), nullptr));
    if (!ds) {
        throw IOError(std::string("cannot allocate in-memory raster: ") + CPLGetLastErrorMsg());
    }
    double gt[6];
    std::copy(grid.transform.begin(), grid.transform.end(), gt);
    if (ds->SetGeoTransform(gt) != CE_None) {
        throw IOError("cannot set geotransform");
    }
    const std::string wkt = crs_to_wkt(grid.crs);
    if (ds->SetProjection(wkt.c_str()) != CE_None) {
        throw IOError("cannot set projection " + grid.crs);
    }
    return ds;
}

// COG driver when present, tiled GTiff otherwise
void copy_to_file(GDALDataset* src, const fs::path& path, const GeoTiffOptions& options) {
    const std::string block = std::to_string(options.tile_size);
    const std::string compression = core::to_upper(options.compression);

    GDALDriver* cog = GetGDALDriverManager()->GetDriverByName("COG");
    CPLStringList opts;
    GDALDriver* driver = nullptr;
    if (cog) {
        driver = cog;
        opts.SetNameValue("BLOCKSIZE", block.c_str());
        opts.SetNameValue("COMPRESS", compression.c_str());
        opts.SetNameValue("BIGTIFF", "IF_SAFER");
    } else {
        driver = GetGDALDriverManager()->GetDriverByName("GTiff");
        if (!driver) {
            throw IOError("neither the COG nor the GTiff GDAL driver is available");
        }
        opts.SetNameValue("TILED", "YES");
        opts.SetNameValue("BLOCKXSIZE", block.c_str());
        opts.SetNameValue("BLOCKYSIZE", block.c_str());
        opts.SetNameValue("COMPRESS", compression.c_str());
        opts.SetNameValue("BIGTIFF", "IF_SAFER");
    }

    DatasetPtr out(driver->CreateCopy(path.string().c_str(), src, FALSE, opts.List(), nullptr, nullptr));
    if (!out) {
        throw IOError("cannot write " + path.string() + ": " + CPLGetLastErrorMsg());
    }
    out->FlushCache();
}

void apply_metadata(GDALDataset* ds, const GeoTiffOptions& options) {
    for (const auto& [key, value] : options.metadata) {
        ds->SetMetadataItem(key.c_str(), value.c_str());
    }
}

GeoTiffImage read_dataset(GDALDataset* ds, const std::string& label) {
    GeoTiffImage img;
    img.grid.rows = ds->GetRasterYSize();
    img.grid.cols = ds->GetRasterXSize();

    double gt[6];
    if (ds->GetGeoTransform(gt) == CE_None) {
        std::copy(gt, gt + 6, img.grid.transform.begin());
    }
    img.grid.crs = wkt_to_crs(ds->GetProjectionRef());

    char** md = ds->GetMetadata();
    for (int i = 0; md && md[i]; ++i) {
        char* key = nullptr;
        const char* value = CPLParseNameValue(md[i], &key);
        if (key && value) {
            img.metadata[key] = value;
        }
        CPLFree(key);
    }

    const int n = ds->GetRasterCount();
    if (n < 1) {
        throw IOError(label + " has no raster bands");
    }
    for (int b = 1; b <= n; ++b) {
        GDALRasterBand* band = ds->GetRasterBand(b);
        if (b == 1) {
            img.type = from_gdal_type(band->GetRasterDataType());
        }

        Matrix2Df values(img.grid.rows, img.grid.cols);
        if (band->RasterIO(GF_Read, 0, 0, img.grid.cols, img.grid.rows, values.data(),
                           img.grid.cols, img.grid.rows, GDT_Float32, 0, 0) != CE_None) {
            throw IOError("cannot read band " + std::to_string(b) + " of " + label + ": " +
                          CPLGetLastErrorMsg());
        }
        img.bands.push_back(std::move(values));

        const char* desc = band->GetDescription();
        img.band_names.push_back((desc && *desc) ? desc : "band_" + std::to_string(b));

        int has_nodata = FALSE;
        const double nd = band->GetNoDataValue(&has_nodata);
        img.nodata.push_back(has_nodata ? std::optional<double>(nd) : std::nullopt);
    }
    return img;
}

} // namespace

void write_geotiff_float(const fs::path& path, const Grid& grid,
                         const std::vector<std::string>& names,
                         const std::vector<const Matrix2Df*>& bands,
                         const std::vector<float>& nodata, const GeoTiffOptions& options) {
    if (bands.empty() || names.size() != bands.size() || nodata.size() != bands.size()) {
        throw IOError("band, name and nodata lists must be non-empty and of equal length");
    }

    DatasetPtr ds = create_mem_dataset(grid, static_cast<int>(bands.size()), DataType::FLOAT32);
    for (size_t i = 0; i < bands.size(); ++i) {
        const Matrix2Df& m = *bands[i];
        if (m.rows() != grid.rows || m.cols() != grid.cols) {
            throw IOError("band '" + names[i] + "' does not match the output grid");
        }
        GDALRasterBand* band = ds->GetRasterBand(static_cast<int>(i) + 1);
        band->SetDescription(names[i].c_str());
        band->SetNoDataValue(nodata[i]);
        if (band->RasterIO(GF_Write, 0, 0, grid.cols, grid.rows, const_cast<float*>(m.data()),
                           grid.cols, grid.rows, GDT_Float32, 0, 0) != CE_None) {
            throw IOError("cannot fill band '" + names[i] + "': " + CPLGetLastErrorMsg());
        }
    }
    apply_metadata(ds.get(), options);
    copy_to_file(ds.get(), path, options);
}

void write_geotiff_uint(const fs::path& path, const Grid& grid,
                        const std::vector<std::string>& names,
                        const std::vector<const Matrix2Du16*>& bands, DataType type,
                        const GeoTiffOptions& options) {
    if (bands.empty() || names.size() != bands.size()) {
        throw IOError("band and name lists must be non-empty and of equal length");
    }
    if (type == DataType::FLOAT32) {
        throw IOError("integer writer cannot store FLOAT32");
    }

    DatasetPtr ds = create_mem_dataset(grid, static_cast<int>(bands.size()), type);
    for (size_t i = 0; i < bands.size(); ++i) {
        const Matrix2Du16& m = *bands[i];
        if (m.rows() != grid.rows || m.cols() != grid.cols) {
            throw IOError("band '" + names[i] + "' does not match the output grid");
        }
        GDALRasterBand* band = ds->GetRasterBand(static_cast<int>(i) + 1);
        band->SetDescription(names[i].c_str());
        if (band->RasterIO(GF_Write, 0, 0, grid.cols, grid.rows, const_cast<uint16_t*>(m.data()),
                           grid.cols, grid.rows, GDT_UInt16, 0, 0) != CE_None) {
            throw IOError("cannot fill band '" + names[i] + "': " + CPLGetLastErrorMsg());
        }
    }
    if (bands.size() == 3) {
        ds->GetRasterBand(1)->SetColorInterpretation(GCI_RedBand);
        ds->GetRasterBand(2)->SetColorInterpretation(GCI_GreenBand);
        ds->GetRasterBand(3)->SetColorInterpretation(GCI_BlueBand);
    }
    apply_metadata(ds.get(), options);
    copy_to_file(ds.get(), path, options);
}

GeoTiffImage read_geotiff(const fs::path& path) {
    ensure_gdal_registered();
    DatasetPtr ds(GDALDataset::FromHandle(GDALOpen(path.string().c_str(), GA_ReadOnly)));
    if (!ds) {
        throw IOError("cannot open " + path.string() + ": " + CPLGetLastErrorMsg());
    }
    return read_dataset(ds.get(), path.string());
}

GeoTiffImage decode_geotiff(const std::string& bytes) {
    ensure_gdal_registered();
    static std::atomic<unsigned long> counter{0};
    const std::string name = "/vsimem/pan_series_" + std::to_string(counter.fetch_add(1)) + ".tif";

    VSILFILE* fp = VSIFileFromMemBuffer(name.c_str(),
                                        reinterpret_cast<GByte*>(const_cast<char*>(bytes.data())),
                                        static_cast<vsi_l_offset>(bytes.size()), FALSE);
    if (!fp) {
        throw IOError("cannot map response body into /vsimem/");
    }
    VSIFCloseL(fp);

    struct Unlink {
        std::string name;
        ~Unlink() { VSIUnlink(name.c_str()); }
    } unlink_guard{name};

    DatasetPtr ds(GDALDataset::FromHandle(GDALOpen(name.c_str(), GA_ReadOnly)));
    if (!ds) {
        throw IOError(std::string("response is not a readable GeoTIFF: ") + CPLGetLastErrorMsg());
    }
    return read_dataset(ds.get(), "response body");
}

} // namespace pan_series::io
